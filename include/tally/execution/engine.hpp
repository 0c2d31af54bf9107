#pragma once

#include <tally/execution/capability_verifier.hpp>
#include <tally/execution/signature_verifier.hpp>
#include <tally/execution/write_overlay.hpp>
#include <tally/schema/app_info.hpp>
#include <tally/schema/block_result.hpp>
#include <tally/schema/commit_result.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/event_record.hpp>
#include <tally/schema/genesis_config.hpp>
#include <tally/schema/history_entry.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/query_result.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <tally/schema/transaction_result.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::execution {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;
using storage_t = tally::storage::storage<tally::storage::rocksdb_storage_tag>;

/// Bytes a signer signs: the SCALE encoding of every envelope field except
/// the signature itself.
tally::schema::bytes_t make_signing_payload(
    const tally::schema::transaction_t& tx);

/// Deterministic custody and points-accrual state machine.
///
/// The engine validates transaction envelopes, checks capabilities, executes
/// vault and stake operations, and persists state, history and events. Each
/// transaction runs against its own write overlay and only reaches the block
/// when it succeeds. Nothing reaches disk before `commit()`.
class engine final {
 public:
  /// Open the engine over `storage`.
  ///
  /// On an empty database `genesis` is validated and written as the initial
  /// state; otherwise the stored genesis wins and `genesis` is ignored.
  /// `require_strict_crypto` selects OpenSSL ed25519 verification as the
  /// default signature check; when false signatures are accepted unless a
  /// verifier is installed.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  const tally::schema::genesis_config_t& genesis,
                  bool require_strict_crypto = true);

  /// Decode and validate the envelope against committed state (CheckTx
  /// semantics). Never mutates state.
  tally::schema::transaction_result_t check_transaction(
      const tally::schema::bytes_view_t& raw_tx);

  /// Execute a block at `epoch` and compute its candidate state_root.
  ///
  /// Transactions are processed in order; per-tx results are returned even
  /// on failures. A block whose epoch precedes the committed epoch rejects
  /// every transaction.
  tally::schema::block_result_t finalize_block(
      uint64_t height,
      tally::schema::epoch_t epoch,
      const std::vector<tally::schema::bytes_t>& txs);

  /// Persist the last finalized block in one atomic write.
  tally::schema::commit_result_t commit();

  tally::schema::app_info_t info() const;

  /// Execute a read-path query by route against committed state.
  tally::schema::query_result_t query(std::string_view path,
                                      const tally::schema::bytes_view_t& data);

  /// Committed history entries with height in [from_height, to_height].
  std::vector<tally::schema::history_entry_t> history(uint64_t from_height,
                                                      uint64_t to_height) const;

  /// Committed event records with id in [from_id, to_id].
  std::vector<tally::schema::event_record_t> events(uint64_t from_id,
                                                    uint64_t to_id) const;

  const tally::schema::hash32_t& chain_id() const;

  void set_signature_verifier(signature_verifier_t verifier);
  void set_capability_verifier(capability_verifier_t verifier);

 private:
  /// Validate version, chain id, nonce and signature. Nonces are read through
  /// `state`, so block-local nonce bumps are visible.
  tally::schema::transaction_result_t validate_transaction(
      const tally::schema::transaction_t& tx,
      std::string_view codespace,
      const write_overlay& state);

  /// Execute a validated payload against `state`.
  tally::schema::transaction_result_t execute_operation(
      const tally::schema::transaction_t& tx,
      write_overlay& state,
      tally::schema::epoch_t epoch);

  /// Assign event ids and stage `event_record_t` rows into `state`.
  void record_events(
      const std::vector<tally::schema::transaction_event_t>& events,
      write_overlay& state,
      uint64_t height,
      uint32_t index,
      tally::schema::epoch_t epoch);

  /// Roster lookup used by the default capability verifier.
  bool has_capability(const tally::schema::signer_id_t& signer,
                      tally::schema::capability_t capability) const;

  /// Write genesis state on first start, or load the stored chain id.
  void load_or_init_genesis(const tally::schema::genesis_config_t& genesis);
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  int64_t last_committed_height_{};
  tally::schema::epoch_t last_committed_epoch_{};
  tally::schema::hash32_t last_committed_state_root_{};
  std::optional<int64_t> pending_height_;
  tally::schema::epoch_t pending_epoch_{};
  tally::schema::hash32_t pending_state_root_{};
  write_overlay block_overlay_;
  const write_overlay* active_state_{nullptr};
  tally::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  capability_verifier_t capability_verifier_;
};

}  // namespace tally::execution
