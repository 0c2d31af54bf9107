#pragma once

#include <tally/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tally::testing {

inline tally::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tally::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline tally::schema::named_signer_t make_named_signer_id(const uint8_t seed) {
  auto named = tally::schema::named_signer_t{};
  named[0] = seed;
  return named;
}

inline tally::schema::signer_id_t make_named_signer(const uint8_t seed) {
  return tally::schema::signer_id_t{make_named_signer_id(seed)};
}

inline tally::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = tally::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tally::testing
