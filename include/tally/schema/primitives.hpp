#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tally::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using asset_id_t = hash32_t;
using vault_id_t = hash32_t;
using stake_id_t = hash32_t;
using epoch_t = uint64_t;
using basis_points_t = uint32_t;

/// Custodied principal and accrued points share one 64-bit unit domain.
using amount_t = uint64_t;
/// Intermediate type for products of amounts, rates and epoch counts.
using wide_amount_t = boost::multiprecision::uint256_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

using named_signer_t = hash32_t;  // Identity without a verifiable key
using signer_id_t = std::variant<ed25519_signer_id, named_signer_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using signature_t = std::variant<ed25519_signature_t>;

/// Stable 32-byte account identifier for a signer, used as owner/recipient.
account_id_t to_account_id(const signer_id_t& signer);

}  // namespace tally::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
