#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <tally/schema/vault_state.hpp>
#include <optional>

namespace tally::custody {

/// Custody object for one asset type.
///
/// The wrapped balance changes only through the checked operations below.
/// Every operation either applies completely or leaves the vault untouched
/// and returns the reason. Invariants held after every call:
///
///   balance == total_deposited - total_withdrawn
///   attributed_principal <= balance
///
/// `total_deposited` is a lifetime counter in the same 64-bit range as the
/// balance, so `deposit` reports `overflow` once cumulative deposits would
/// pass 2^64 - 1, even when the current balance is small.
class escrow_vault final {
 public:
  explicit escrow_vault(tally::schema::vault_state_t state);

  static escrow_vault create(
      const tally::schema::vault_id_t& vault_id,
      const tally::schema::asset_id_t& asset_id,
      const tally::schema::account_id_t& creator,
      tally::schema::epoch_t epoch,
      std::optional<tally::schema::bytes_t> label = std::nullopt);

  tally::schema::transaction_error_code deposit(
      const tally::schema::asset_id_t& asset_id,
      tally::schema::amount_t amount);

  /// Withdraw from the unattributed part of the balance.
  tally::schema::transaction_error_code withdraw(tally::schema::amount_t amount);

  /// Mark `principal` of the balance as backing a newly opened stake.
  tally::schema::transaction_error_code attribute(
      tally::schema::amount_t principal);

  /// Undo `attribute` for a stake being closed. The principal stays in the
  /// balance until withdrawn.
  tally::schema::transaction_error_code release(
      tally::schema::amount_t principal);

  /// Succeeds only when the vault holds nothing.
  tally::schema::transaction_error_code destroy_empty() const;

  tally::schema::amount_t total_value() const;
  tally::schema::amount_t free_balance() const;
  bool conserved() const;

  const tally::schema::vault_state_t& state() const;

 private:
  tally::schema::vault_state_t state_;
};

}  // namespace tally::custody
