#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <tally/blake3/hash.hpp>
#include <tally/common/critical.hpp>
#include <tally/config/rate_config.hpp>
#include <tally/crypto/verify.hpp>
#include <tally/custody/escrow_vault.hpp>
#include <tally/execution/engine.hpp>
#include <tally/ledger/stake_ledger.hpp>
#include <tally/ledger/view_projector.hpp>
#include <tally/schema/key/engine_keys.hpp>
#include <tally/schema/ledger_event_type.hpp>
#include <tally/schema/query_error_code.hpp>
#include <tuple>
#include <utility>

using namespace tally::schema;

namespace {

using tally::execution::encoder_t;
using tally::execution::storage_t;
using tally::execution::write_overlay;

constexpr auto kCheckTxCodespace = std::string_view{"tally.checktx"};
constexpr auto kExecuteCodespace = std::string_view{"tally.execute"};
constexpr auto kQueryCodespace = std::string_view{"tally.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return tally::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(encoder_t& encoder,
                                                const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto decoded = encoder.try_decode<transaction_t>(raw_tx);
  if (!decoded) {
    error = "malformed transaction encoding";
  }
  return decoded;
}

transaction_result_t make_error(transaction_error_code code,
                                std::string info,
                                std::string_view codespace) {
  return transaction_result_t{.code = static_cast<uint32_t>(code),
                              .log = std::string{to_string(code)},
                              .info = std::move(info),
                              .codespace = std::string{codespace}};
}

std::string hex(const hash32_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

template <typename T>
std::optional<T> load(encoder_t& encoder,
                      const write_overlay& state,
                      const bytes_t& key) {
  auto raw = state.get(view(key));
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder.try_decode<T>(view(*raw));
  if (!decoded) {
    tally::common::critical("failed to decode persisted state value");
  }
  return decoded;
}

template <typename T>
void store(encoder_t& encoder,
           write_overlay& state,
           bytes_t key,
           const T& value) {
  state.put(std::move(key), encoder.encode(value));
}

transaction_event_t make_event(
    ledger_event_type_t type,
    std::vector<std::pair<std::string, std::string>> attributes) {
  auto event = transaction_event_t{.type = std::string{to_string(type)}};
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(transaction_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = true});
  }
  return event;
}

std::vector<history_entry_t> collect_history(const storage_t& storage,
                                             encoder_t& encoder,
                                             uint64_t from_height,
                                             uint64_t to_height) {
  auto prefix =
      tally::schema::key::make_prefix_key(encoder, key::kHistoryPrefix);
  auto rows = storage.list_by_prefix(view(prefix));
  auto entries = std::vector<history_entry_t>{};
  for (const auto& [row_key, row_value] : rows) {
    auto parsed = key::parse_history_key(encoder, view(row_key));
    if (!parsed || parsed->first < from_height || parsed->first > to_height) {
      continue;
    }
    auto entry = encoder.try_decode<history_entry_t>(view(row_value));
    if (!entry) {
      spdlog::warn("Skipping undecodable history row at height {} index {}",
                   parsed->first, parsed->second);
      continue;
    }
    entries.push_back(std::move(*entry));
  }
  // SCALE integers are little-endian, so key order is not numeric order.
  std::sort(std::begin(entries), std::end(entries),
            [](const history_entry_t& lhs, const history_entry_t& rhs) {
              return std::tie(lhs.height, lhs.index) <
                     std::tie(rhs.height, rhs.index);
            });
  return entries;
}

std::vector<event_record_t> collect_events(const storage_t& storage,
                                           encoder_t& encoder,
                                           uint64_t from_id,
                                           uint64_t to_id) {
  auto prefix = tally::schema::key::make_prefix_key(encoder, key::kEventPrefix);
  auto rows = storage.list_by_prefix(view(prefix));
  auto records = std::vector<event_record_t>{};
  for (const auto& [row_key, row_value] : rows) {
    auto event_id = key::parse_event_key(encoder, view(row_key));
    if (!event_id || *event_id < from_id || *event_id > to_id) {
      continue;
    }
    auto record = encoder.try_decode<event_record_t>(view(row_value));
    if (!record) {
      spdlog::warn("Skipping undecodable event record {}", *event_id);
      continue;
    }
    records.push_back(std::move(*record));
  }
  std::sort(std::begin(records), std::end(records),
            [](const event_record_t& lhs, const event_record_t& rhs) {
              return lhs.event_id < rhs.event_id;
            });
  return records;
}

}  // namespace

namespace tally::execution {

bytes_t make_signing_payload(const transaction_t& tx) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const genesis_config_t& genesis,
               bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      block_overlay_{[this](const bytes_view_t& key) {
        return storage_.get_raw(key);
      }},
      require_strict_crypto_{require_strict_crypto} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_) {
    if (!tally::crypto::available()) {
      tally::common::critical("OpenSSL ed25519 support is unavailable");
    }
    signature_verifier_ = tally::crypto::verify_signature;
  } else {
    spdlog::warn("Strict crypto disabled; signatures are accepted unverified");
  }
  capability_verifier_ = [this](const signer_id_t& signer,
                                capability_t capability) {
    return has_capability(signer, capability);
  };

  load_persisted_state();
  load_or_init_genesis(genesis);
  spdlog::info("Execution engine ready at height {} epoch {} (chain {})",
               last_committed_height_, last_committed_epoch_, hex(chain_id_));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error(transaction_error_code::invalid_transaction,
                      decode_error, kCheckTxCodespace);
  }
  auto committed =
      write_overlay{[this](const bytes_view_t& key) {
        return storage_.get_raw(key);
      }};
  return validate_transaction(*maybe_tx, kCheckTxCodespace, committed);
}

block_result_t engine::finalize_block(uint64_t height,
                                      epoch_t epoch,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  block_overlay_.clear();
  pending_height_.reset();

  if (static_cast<int64_t>(height) <= last_committed_height_) {
    spdlog::error("Rejecting block at height {}; already committed {}", height,
                  last_committed_height_);
    for (size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(make_error(
          transaction_error_code::invalid_transaction,
          "block height " + std::to_string(height) + " already committed",
          kExecuteCodespace));
    }
    result.state_root = last_committed_state_root_;
    return result;
  }

  auto epoch_regressed = epoch < last_committed_epoch_;
  if (epoch_regressed) {
    spdlog::warn("Block {} carries epoch {} behind committed epoch {}", height,
                 epoch, last_committed_epoch_);
  }
  auto block_epoch = epoch_regressed ? last_committed_epoch_ : epoch;
  auto rolling_root = last_committed_state_root_;

  for (size_t i = 0; i < txs.size(); ++i) {
    auto index = static_cast<uint32_t>(i);
    auto tx_result = transaction_result_t{};
    if (epoch_regressed) {
      tx_result = make_error(transaction_error_code::epoch_regression,
                             "block epoch " + std::to_string(epoch) +
                                 " precedes committed epoch " +
                                 std::to_string(last_committed_epoch_),
                             kExecuteCodespace);
    } else {
      auto decode_error = std::string{};
      auto maybe_tx = decode_transaction(encoder_, view(txs[i]), decode_error);
      if (!maybe_tx) {
        tx_result = make_error(transaction_error_code::invalid_transaction,
                               decode_error, kExecuteCodespace);
      } else {
        tx_result =
            validate_transaction(*maybe_tx, kExecuteCodespace, block_overlay_);
        if (tx_result.code == 0) {
          auto tx_state = write_overlay{[this](const bytes_view_t& key) {
            return block_overlay_.get(key);
          }};
          active_state_ = &tx_state;
          tx_result = execute_operation(*maybe_tx, tx_state, block_epoch);
          active_state_ = nullptr;
          if (tx_result.code == 0) {
            record_events(tx_result.events, tx_state, height, index,
                          block_epoch);
            tx_state.merge_into(block_overlay_);
            rolling_root = fold_state_root(rolling_root, txs[i], height, i);
          } else {
            spdlog::debug("Transaction {} in block {} failed: {} ({})", index,
                          height, tx_result.log, tx_result.info);
          }
          // The nonce is consumed even when execution fails.
          store(encoder_, block_overlay_,
                key::make_nonce_key(encoder_, maybe_tx->signer),
                maybe_tx->nonce);
        }
      }
    }

    store(encoder_, block_overlay_, key::make_history_key(encoder_, height, index),
          history_entry_t{.height = height,
                          .index = index,
                          .code = tx_result.code,
                          .tx = txs[i]});
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_epoch_ = block_epoch;
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {} at epoch {} with {} transaction(s)", height,
               block_epoch, txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_.has_value()) {
    storage_.commit(block_overlay_.entries(),
                    tally::storage::committed_state{
                        .height = *pending_height_,
                        .epoch = pending_epoch_,
                        .state_root = pending_state_root_});
    last_committed_height_ = *pending_height_;
    last_committed_epoch_ = pending_epoch_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_.reset();
    block_overlay_.clear();
    spdlog::info("Committed height {} epoch {} root {}", last_committed_height_,
                 last_committed_epoch_, hex(last_committed_state_root_));
  }

  return commit_result_t{.committed_height = last_committed_height_,
                         .committed_epoch = last_committed_epoch_,
                         .state_root = last_committed_state_root_};
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_epoch = last_committed_epoch_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto fail = [&](query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    return result;
  };
  auto committed = write_overlay{[this](const bytes_view_t& key) {
    return storage_.get_raw(key);
  }};

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_epoch_,
                   last_committed_state_root_, chain_id_});
    return result;
  }

  if (path == "/state/config") {
    auto config = load<rate_config_t>(encoder_, committed,
                                      key::make_rate_config_key(encoder_));
    if (!config) {
      return fail(query_error_code::not_found, "rate config not found");
    }
    result.value = encoder_.encode(*config);
    return result;
  }

  if (path == "/state/mode") {
    auto mode = load<protocol_mode_state_t>(
                    encoder_, committed, key::make_protocol_mode_key(encoder_))
                    .value_or(protocol_mode_state_t{});
    result.value = encoder_.encode(mode);
    return result;
  }

  if (path == "/state/vault" || path == "/view/vault") {
    auto vault_id = encoder_.try_decode<vault_id_t>(data);
    if (!vault_id) {
      return fail(query_error_code::invalid_key, "expected vault id");
    }
    auto vault = load<vault_state_t>(encoder_, committed,
                                     key::make_vault_key(encoder_, *vault_id));
    if (!vault) {
      return fail(query_error_code::not_found, "vault not found");
    }
    result.value = path == "/state/vault"
                       ? encoder_.encode(*vault)
                       : encoder_.encode(tally::ledger::project(
                             *vault, last_committed_epoch_));
    return result;
  }

  if (path == "/state/stake") {
    auto stake_id = encoder_.try_decode<stake_id_t>(data);
    if (!stake_id) {
      return fail(query_error_code::invalid_key, "expected stake id");
    }
    auto stake = load<stake_state_t>(encoder_, committed,
                                     key::make_stake_key(encoder_, *stake_id));
    if (!stake) {
      return fail(query_error_code::not_found, "stake not found");
    }
    result.value = encoder_.encode(*stake);
    return result;
  }

  if (path == "/view/stake") {
    auto request = encoder_.try_decode<std::tuple<stake_id_t, epoch_t>>(data);
    if (!request) {
      return fail(query_error_code::invalid_key, "expected (stake id, epoch)");
    }
    auto stake = load<stake_state_t>(
        encoder_, committed, key::make_stake_key(encoder_, std::get<0>(*request)));
    if (!stake) {
      return fail(query_error_code::not_found, "stake not found");
    }
    auto config = load<rate_config_t>(encoder_, committed,
                                      key::make_rate_config_key(encoder_));
    if (!config) {
      return fail(query_error_code::not_found, "rate config not found");
    }
    auto projection =
        tally::ledger::project(*stake, *config, std::get<1>(*request));
    if (!projection) {
      return fail(query_error_code::projection_overflow,
                  "projected points overflow");
    }
    result.value = encoder_.encode(*projection);
    return result;
  }

  if (path == "/state/nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return fail(query_error_code::invalid_key, "expected signer id");
    }
    auto nonce = load<uint64_t>(encoder_, committed,
                                key::make_nonce_key(encoder_, *signer))
                     .value_or(0);
    result.value = encoder_.encode(nonce);
    return result;
  }

  if (path == "/state/capability") {
    auto request =
        encoder_.try_decode<std::tuple<account_id_t, capability_t>>(data);
    if (!request) {
      return fail(query_error_code::invalid_key,
                  "expected (account id, capability)");
    }
    auto assignment = load<capability_assignment_state_t>(
        encoder_, committed,
        key::make_capability_key(encoder_, std::get<0>(*request),
                                 std::get<1>(*request)));
    if (!assignment) {
      return fail(query_error_code::not_found, "capability not assigned");
    }
    result.value = encoder_.encode(*assignment);
    return result;
  }

  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key, "expected (from, to) heights");
    }
    result.value = encoder_.encode(collect_history(
        storage_, encoder_, std::get<0>(*range), std::get<1>(*range)));
    return result;
  }

  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key, "expected (from, to) ids");
    }
    result.value = encoder_.encode(collect_events(
        storage_, encoder_, std::get<0>(*range), std::get<1>(*range)));
    return result;
  }

  return fail(query_error_code::unsupported_path,
              "unsupported query path " + std::string{path});
}

std::vector<history_entry_t> engine::history(uint64_t from_height,
                                             uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return collect_history(storage_, encoder_, from_height, to_height);
}

std::vector<event_record_t> engine::events(uint64_t from_id,
                                           uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return collect_events(storage_, encoder_, from_id, to_id);
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

void engine::set_capability_verifier(capability_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  capability_verifier_ = std::move(verifier);
}

transaction_result_t engine::validate_transaction(const transaction_t& tx,
                                                  std::string_view codespace,
                                                  const write_overlay& state) {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error(transaction_error_code::invalid_chain_id,
                      "chain id mismatch", codespace);
  }

  auto stored_nonce =
      load<uint64_t>(encoder_, state, key::make_nonce_key(encoder_, tx.signer))
          .value_or(0);
  if (tx.nonce != stored_nonce + 1) {
    return make_error(transaction_error_code::invalid_nonce,
                      "expected nonce " + std::to_string(stored_nonce + 1),
                      codespace);
  }

  if (signature_verifier_) {
    auto payload = make_signing_payload(tx);
    if (!signature_verifier_(view(payload), tx.signer, tx.signature)) {
      return make_error(transaction_error_code::signature_verification_failed,
                        "signature does not match signer", codespace);
    }
  }

  return transaction_result_t{.codespace = std::string{codespace}};
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               write_overlay& state,
                                               epoch_t epoch) {
  auto result = transaction_result_t{.codespace =
                                         std::string{kExecuteCodespace}};
  auto events = std::vector<transaction_event_t>{};
  auto caller = to_account_id(tx.signer);
  auto caller_hex = hex(caller);

  auto fail = [&](transaction_error_code code, std::string info) {
    result = make_error(code, std::move(info), kExecuteCodespace);
  };
  auto authorized = [&](capability_t capability) {
    if (capability_verifier_ && capability_verifier_(tx.signer, capability)) {
      return true;
    }
    fail(transaction_error_code::unauthorized,
         "signer lacks " + std::string{to_string(capability)} + " capability");
    return false;
  };
  auto running = [&]() {
    auto mode = load<protocol_mode_state_t>(
        encoder_, state, key::make_protocol_mode_key(encoder_));
    if (mode && mode->paused) {
      fail(transaction_error_code::protocol_paused,
           "value-moving operations are paused");
      return false;
    }
    return true;
  };
  auto load_config = [&]() {
    auto config = load<rate_config_t>(encoder_, state,
                                      key::make_rate_config_key(encoder_));
    if (!config) {
      tally::common::critical("rate config missing from state");
    }
    return *config;
  };

  std::visit(
      overloaded{
          [&](const create_vault_t& payload) {
            if (!authorized(capability_t::governance)) {
              return;
            }
            auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
            if (state.get(view(vault_key))) {
              fail(transaction_error_code::vault_exists, hex(payload.vault_id));
              return;
            }
            auto vault = tally::custody::escrow_vault::create(
                payload.vault_id, payload.asset_id, caller, epoch,
                payload.label);
            store(encoder_, state, std::move(vault_key), vault.state());
            events.push_back(make_event(ledger_event_type_t::vault_created,
                                        {{"vault_id", hex(payload.vault_id)},
                                         {"asset_id", hex(payload.asset_id)},
                                         {"creator", caller_hex}}));
          },
          [&](const deposit_t& payload) {
            if (!running()) {
              return;
            }
            auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
            auto stored = load<vault_state_t>(encoder_, state, vault_key);
            if (!stored) {
              fail(transaction_error_code::vault_missing,
                   hex(payload.vault_id));
              return;
            }
            auto vault = tally::custody::escrow_vault{std::move(*stored)};
            if (auto code = vault.deposit(payload.asset_id, payload.amount);
                code != transaction_error_code::ok) {
              fail(code, "deposit of " + std::to_string(payload.amount));
              return;
            }
            store(encoder_, state, std::move(vault_key), vault.state());
            events.push_back(
                make_event(ledger_event_type_t::deposited,
                           {{"vault_id", hex(payload.vault_id)},
                            {"amount", std::to_string(payload.amount)},
                            {"by", caller_hex}}));
          },
          [&](const withdraw_t& payload) {
            if (!running() || !authorized(capability_t::custody_operator)) {
              return;
            }
            auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
            auto stored = load<vault_state_t>(encoder_, state, vault_key);
            if (!stored) {
              fail(transaction_error_code::vault_missing,
                   hex(payload.vault_id));
              return;
            }
            auto vault = tally::custody::escrow_vault{std::move(*stored)};
            if (auto code = vault.withdraw(payload.amount);
                code != transaction_error_code::ok) {
              fail(code, "withdraw of " + std::to_string(payload.amount) +
                             " with free balance " +
                             std::to_string(vault.free_balance()));
              return;
            }
            store(encoder_, state, std::move(vault_key), vault.state());
            events.push_back(
                make_event(ledger_event_type_t::withdrawn,
                           {{"vault_id", hex(payload.vault_id)},
                            {"amount", std::to_string(payload.amount)},
                            {"by", caller_hex},
                            {"recipient", hex(payload.recipient)}}));
          },
          [&](const destroy_vault_t& payload) {
            if (!authorized(capability_t::governance)) {
              return;
            }
            auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
            auto stored = load<vault_state_t>(encoder_, state, vault_key);
            if (!stored) {
              fail(transaction_error_code::vault_missing,
                   hex(payload.vault_id));
              return;
            }
            auto vault = tally::custody::escrow_vault{std::move(*stored)};
            if (auto code = vault.destroy_empty();
                code != transaction_error_code::ok) {
              fail(code, "balance " + std::to_string(vault.total_value()));
              return;
            }
            state.erase(std::move(vault_key));
            events.push_back(make_event(ledger_event_type_t::vault_destroyed,
                                        {{"vault_id", hex(payload.vault_id)},
                                         {"by", caller_hex}}));
          },
          [&](const open_stake_t& payload) {
            if (!running()) {
              return;
            }
            auto vault_key = key::make_vault_key(encoder_, payload.vault_id);
            auto stored = load<vault_state_t>(encoder_, state, vault_key);
            if (!stored) {
              fail(transaction_error_code::vault_missing,
                   hex(payload.vault_id));
              return;
            }
            auto stake_id =
                tally::ledger::make_stake_id(payload.vault_id, caller, tx.nonce);
            auto stake_key = key::make_stake_key(encoder_, stake_id);
            if (state.get(view(stake_key))) {
              fail(transaction_error_code::stake_exists, hex(stake_id));
              return;
            }
            auto vault = tally::custody::escrow_vault{std::move(*stored)};
            auto stake = stake_state_t{};
            if (auto code = tally::ledger::open_stake(
                    vault, stake_id, caller, payload.asset_id,
                    payload.principal, epoch, payload.lock_epochs, stake);
                code != transaction_error_code::ok) {
              fail(code, "open stake of " + std::to_string(payload.principal));
              return;
            }
            store(encoder_, state, std::move(vault_key), vault.state());
            store(encoder_, state, std::move(stake_key), stake);
            events.push_back(
                make_event(ledger_event_type_t::deposited,
                           {{"vault_id", hex(payload.vault_id)},
                            {"amount", std::to_string(payload.principal)},
                            {"by", caller_hex}}));
            events.push_back(make_event(
                ledger_event_type_t::stake_opened,
                {{"stake_id", hex(stake_id)},
                 {"vault_id", hex(payload.vault_id)},
                 {"principal", std::to_string(payload.principal)},
                 {"owner", caller_hex},
                 {"epoch", std::to_string(epoch)},
                 {"unlock_epoch", std::to_string(stake.unlock_epoch)}}));
            result.data = encoder_.encode(stake_id);
          },
          [&](const settle_stake_t& payload) {
            auto stake_key = key::make_stake_key(encoder_, payload.stake_id);
            auto stake = load<stake_state_t>(encoder_, state, stake_key);
            if (!stake) {
              fail(transaction_error_code::stake_missing,
                   hex(payload.stake_id));
              return;
            }
            auto previous_epoch = stake->last_settled_epoch;
            auto settlement = tally::ledger::settlement_t{};
            if (auto code =
                    tally::ledger::settle(*stake, load_config(), epoch, settlement);
                code != transaction_error_code::ok) {
              fail(code, "settle at epoch " + std::to_string(epoch));
              return;
            }
            if (stake->last_settled_epoch == previous_epoch) {
              result.info = "already settled at epoch " + std::to_string(epoch);
              return;
            }
            store(encoder_, state, std::move(stake_key), *stake);
            events.push_back(make_event(
                ledger_event_type_t::stake_settled,
                {{"stake_id", hex(payload.stake_id)},
                 {"delta_points", std::to_string(settlement.delta_points)},
                 {"total_points", std::to_string(settlement.total_points)},
                 {"epoch", std::to_string(settlement.epoch)}}));
          },
          [&](const close_stake_t& payload) {
            if (!running()) {
              return;
            }
            auto stake_key = key::make_stake_key(encoder_, payload.stake_id);
            auto stake = load<stake_state_t>(encoder_, state, stake_key);
            if (!stake) {
              fail(transaction_error_code::stake_missing,
                   hex(payload.stake_id));
              return;
            }
            auto vault_key = key::make_vault_key(encoder_, stake->vault_id);
            auto stored = load<vault_state_t>(encoder_, state, vault_key);
            if (!stored) {
              fail(transaction_error_code::vault_missing,
                   hex(stake->vault_id));
              return;
            }
            auto vault = tally::custody::escrow_vault{std::move(*stored)};
            auto previous_epoch = stake->last_settled_epoch;
            auto settlement = tally::ledger::settlement_t{};
            if (auto code = tally::ledger::close(*stake, vault, load_config(),
                                                 caller, epoch, settlement);
                code != transaction_error_code::ok) {
              fail(code, "close at epoch " + std::to_string(epoch) +
                             " (unlock epoch " +
                             std::to_string(stake->unlock_epoch) + ")");
              return;
            }
            auto recipient = payload.recipient.value_or(stake->owner);
            store(encoder_, state, std::move(vault_key), vault.state());
            store(encoder_, state, std::move(stake_key), *stake);
            if (stake->last_settled_epoch != previous_epoch) {
              events.push_back(make_event(
                  ledger_event_type_t::stake_settled,
                  {{"stake_id", hex(payload.stake_id)},
                   {"delta_points", std::to_string(settlement.delta_points)},
                   {"total_points", std::to_string(settlement.total_points)},
                   {"epoch", std::to_string(settlement.epoch)}}));
            }
            events.push_back(make_event(
                ledger_event_type_t::stake_closed,
                {{"stake_id", hex(payload.stake_id)},
                 {"final_points", std::to_string(stake->accrued_points)},
                 {"epoch", std::to_string(epoch)}}));
            events.push_back(
                make_event(ledger_event_type_t::withdrawn,
                           {{"vault_id", hex(stake->vault_id)},
                            {"amount", std::to_string(stake->principal)},
                            {"by", caller_hex},
                            {"recipient", hex(recipient)}}));
          },
          [&](const set_rate_t& payload) {
            if (!authorized(capability_t::governance)) {
              return;
            }
            auto config = load_config();
            auto previous = config.apy_basis_points;
            if (auto code =
                    tally::config::set_rate(config, payload.apy_basis_points);
                code != transaction_error_code::ok) {
              fail(code, std::to_string(payload.apy_basis_points) +
                             " bps exceeds max " +
                             std::to_string(config.max_apy_basis_points));
              return;
            }
            store(encoder_, state, key::make_rate_config_key(encoder_), config);
            events.push_back(make_event(
                ledger_event_type_t::rate_updated,
                {{"old", std::to_string(previous)},
                 {"new", std::to_string(config.apy_basis_points)},
                 {"by", caller_hex}}));
          },
          [&](const set_paused_t& payload) {
            if (!authorized(capability_t::governance)) {
              return;
            }
            store(encoder_, state, key::make_protocol_mode_key(encoder_),
                  protocol_mode_state_t{.paused = payload.paused,
                                        .reason = payload.reason});
            events.push_back(make_event(
                ledger_event_type_t::mode_changed,
                {{"paused", payload.paused ? "true" : "false"},
                 {"by", caller_hex}}));
          },
          [&](const upsert_capability_t& payload) {
            if (!authorized(capability_t::governance)) {
              return;
            }
            store(encoder_, state,
                  key::make_capability_key(encoder_, payload.subject,
                                           payload.capability),
                  payload);
            events.push_back(make_event(
                ledger_event_type_t::capability_updated,
                {{"subject", hex(payload.subject)},
                 {"capability", std::string{to_string(payload.capability)}},
                 {"enabled", payload.enabled ? "true" : "false"},
                 {"by", caller_hex}}));
          }},
      tx.payload);

  if (result.code == 0) {
    result.events = std::move(events);
  }
  return result;
}

void engine::record_events(const std::vector<transaction_event_t>& events,
                           write_overlay& state,
                           uint64_t height,
                           uint32_t index,
                           epoch_t epoch) {
  if (events.empty()) {
    return;
  }
  auto sequence_key = key::make_event_sequence_key(encoder_);
  auto next_id = load<uint64_t>(encoder_, state, sequence_key).value_or(1);
  for (const auto& event : events) {
    store(encoder_, state, key::make_event_key(encoder_, next_id),
          event_record_t{.event_id = next_id,
                         .height = height,
                         .tx_index = index,
                         .epoch = epoch,
                         .event = event});
    ++next_id;
  }
  store(encoder_, state, std::move(sequence_key), next_id);
}

bool engine::has_capability(const signer_id_t& signer,
                            capability_t capability) const {
  auto capability_key =
      key::make_capability_key(encoder_, to_account_id(signer), capability);
  auto assignment =
      active_state_ != nullptr
          ? load<capability_assignment_state_t>(encoder_, *active_state_,
                                                capability_key)
          : storage_.get<capability_assignment_state_t>(encoder_,
                                                        view(capability_key));
  return assignment.has_value() && assignment->enabled;
}

void engine::load_or_init_genesis(const genesis_config_t& genesis) {
  auto genesis_key = key::make_genesis_key(encoder_);
  if (auto stored = storage_.get<genesis_config_t>(encoder_, view(genesis_key))) {
    chain_id_ = stored->chain_id;
    if (stored->chain_id != genesis.chain_id) {
      spdlog::warn("Configured chain id {} differs from stored {}; using stored",
                   hex(genesis.chain_id), hex(stored->chain_id));
    }
    return;
  }

  if (tally::config::validate_genesis(genesis.rate) !=
      transaction_error_code::ok) {
    spdlog::error(
        "Invalid genesis rate: apy={} bps max={} bps epochs_per_year={}",
        genesis.rate.apy_basis_points, genesis.rate.max_apy_basis_points,
        genesis.rate.epochs_per_year);
    tally::common::critical("invalid genesis rate configuration");
  }
  if (genesis.governance.empty()) {
    spdlog::warn("Genesis governance roster is empty");
  }

  auto state = write_overlay{write_overlay::reader_t{}};
  store(encoder_, state, std::move(genesis_key), genesis);
  store(encoder_, state, key::make_rate_config_key(encoder_), genesis.rate);
  store(encoder_, state, key::make_protocol_mode_key(encoder_),
        protocol_mode_state_t{});
  auto grant = [&](const account_id_t& subject, capability_t capability) {
    store(encoder_, state,
          key::make_capability_key(encoder_, subject, capability),
          capability_assignment_state_t{
              .subject = subject, .capability = capability, .enabled = true});
  };
  for (const auto& subject : genesis.governance) {
    grant(subject, capability_t::governance);
  }
  for (const auto& subject : genesis.custody_operators) {
    grant(subject, capability_t::custody_operator);
  }

  storage_.commit(state.entries(),
                  tally::storage::committed_state{
                      .height = last_committed_height_,
                      .epoch = last_committed_epoch_,
                      .state_root = last_committed_state_root_});
  chain_id_ = genesis.chain_id;
  spdlog::info("Initialized genesis state: apy={} bps, {} governance account(s)",
               genesis.rate.apy_basis_points, genesis.governance.size());
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_epoch_ = committed->epoch;
    last_committed_state_root_ = committed->state_root;
  } else {
    last_committed_state_root_ = make_zero_hash();
  }
}

}  // namespace tally::execution
