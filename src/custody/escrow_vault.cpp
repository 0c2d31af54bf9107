#include <spdlog/spdlog.h>
#include <tally/custody/escrow_vault.hpp>
#include <limits>
#include <utility>

using tally::schema::amount_t;
using tally::schema::transaction_error_code;

namespace {

bool add_would_overflow(amount_t lhs, amount_t rhs) {
  return rhs > std::numeric_limits<amount_t>::max() - lhs;
}

}  // namespace

namespace tally::custody {

escrow_vault::escrow_vault(tally::schema::vault_state_t state)
    : state_{std::move(state)} {}

escrow_vault escrow_vault::create(const tally::schema::vault_id_t& vault_id,
                                  const tally::schema::asset_id_t& asset_id,
                                  const tally::schema::account_id_t& creator,
                                  tally::schema::epoch_t epoch,
                                  std::optional<tally::schema::bytes_t> label) {
  return escrow_vault{tally::schema::vault_state_t{
      .vault_id = vault_id,
      .asset_id = asset_id,
      .creator = creator,
      .created_epoch = epoch,
      .label = std::move(label)}};
}

transaction_error_code escrow_vault::deposit(
    const tally::schema::asset_id_t& asset_id,
    amount_t amount) {
  if (amount == 0) {
    return transaction_error_code::zero_deposit;
  }
  if (asset_id != state_.asset_id) {
    return transaction_error_code::asset_mismatch;
  }
  if (add_would_overflow(state_.balance, amount) ||
      add_would_overflow(state_.total_deposited, amount)) {
    return transaction_error_code::overflow;
  }
  state_.balance += amount;
  state_.total_deposited += amount;
  return transaction_error_code::ok;
}

transaction_error_code escrow_vault::withdraw(amount_t amount) {
  if (amount == 0) {
    return transaction_error_code::zero_deposit;
  }
  if (amount > state_.balance) {
    return transaction_error_code::insufficient_funds;
  }
  // Principal attributed to active stakes is not available to withdraw.
  if (state_.balance - amount < state_.attributed_principal) {
    spdlog::debug("Withdraw of {} would dip into {} attributed principal",
                  amount, state_.attributed_principal);
    return transaction_error_code::insufficient_funds;
  }
  if (add_would_overflow(state_.total_withdrawn, amount)) {
    return transaction_error_code::overflow;
  }
  state_.balance -= amount;
  state_.total_withdrawn += amount;
  return transaction_error_code::ok;
}

transaction_error_code escrow_vault::attribute(amount_t principal) {
  if (principal == 0) {
    return transaction_error_code::zero_deposit;
  }
  if (add_would_overflow(state_.attributed_principal, principal)) {
    return transaction_error_code::overflow;
  }
  if (state_.attributed_principal + principal > state_.balance) {
    return transaction_error_code::insufficient_funds;
  }
  state_.attributed_principal += principal;
  ++state_.active_stakes;
  return transaction_error_code::ok;
}

transaction_error_code escrow_vault::release(amount_t principal) {
  if (principal > state_.attributed_principal || state_.active_stakes == 0) {
    spdlog::error("Vault attribution underflow: releasing {} of {}", principal,
                  state_.attributed_principal);
    return transaction_error_code::insufficient_funds;
  }
  state_.attributed_principal -= principal;
  --state_.active_stakes;
  return transaction_error_code::ok;
}

transaction_error_code escrow_vault::destroy_empty() const {
  if (state_.balance != 0) {
    return transaction_error_code::vault_not_empty;
  }
  return transaction_error_code::ok;
}

amount_t escrow_vault::total_value() const {
  return state_.balance;
}

amount_t escrow_vault::free_balance() const {
  return state_.balance - state_.attributed_principal;
}

bool escrow_vault::conserved() const {
  return state_.total_deposited >= state_.total_withdrawn &&
         state_.balance == state_.total_deposited - state_.total_withdrawn &&
         state_.attributed_principal <= state_.balance;
}

const tally::schema::vault_state_t& escrow_vault::state() const {
  return state_;
}

}  // namespace tally::custody
