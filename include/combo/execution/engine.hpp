#pragma once

#include <combo/schema/block_result.hpp>
#include <combo/schema/combo_event.hpp>
#include <combo/schema/encoding/scale/encoder.hpp>
#include <combo/schema/history_entry.hpp>
#include <combo/schema/primitives.hpp>
#include <combo/schema/query_result.hpp>
#include <combo/schema/transaction.hpp>
#include <combo/schema/transaction_result.hpp>
#include <combo/storage/rocksdb/storage.hpp>
#include <combo/store/allocator.hpp>
#include <combo/store/record_store.hpp>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace combo::execution {

/// Chain id used when none is configured: blake3("combo-devnet").
combo::schema::hash32_t default_chain_id();

struct engine_options final {
  combo::schema::hash32_t chain_id{default_chain_id()};
};

/// Host-side state machine around the combo record store.
///
/// The engine decodes transactions, dispatches their payloads to the record
/// store, persists history and events, and exposes committed state through
/// query routes. Calls are serialized by a single mutex.
class engine final {
 public:
  /// Construct the engine with encoder/storage backends and runtime options.
  ///
  /// Loads the last committed height and state root from storage.
  explicit engine(
      combo::schema::encoding::encoder<
          combo::schema::encoding::scale_encoder_tag>& encoder,
      combo::storage::storage<combo::storage::rocksdb_storage_tag>& storage,
      engine_options options = {});

  /// Admit a transaction (decode, version, chain id, stateless guards).
  ///
  /// Does not mutate application state.
  combo::schema::transaction_result_t check_transaction(
      const combo::schema::bytes_view_t& raw_tx);

  /// Execute a block in order at `block_time` and compute its state root.
  ///
  /// Per-tx results are returned even on failures; failed transactions leave
  /// no state change and do not contribute to the state root.
  combo::schema::block_result_t finalize_block(
      uint64_t height,
      combo::schema::unix_timestamp_t block_time,
      const std::vector<combo::schema::bytes_t>& txs);

  /// Persist the latest finalized height and state root.
  combo::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  combo::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  combo::schema::query_result_t query(std::string_view path,
                                      const combo::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range.
  std::vector<combo::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Return event log rows in the inclusive event id range.
  std::vector<combo::schema::event_record_t> events(uint64_t from_id,
                                                    uint64_t to_id) const;

  /// Fund an identity outside of block execution (genesis allocation).
  void credit(const combo::schema::account_id_t& account,
              combo::schema::lamports_t lamports);

  const combo::schema::hash32_t& chain_id() const { return chain_id_; }

 private:
  /// Validate the envelope; code 0 when the transaction may execute.
  combo::schema::transaction_result_t validate_transaction(
      const combo::schema::transaction_t& tx,
      std::string_view codespace) const;

  /// Dispatch a validated payload to the record store.
  combo::schema::transaction_result_t execute_operation(
      const combo::schema::transaction_t& tx);

  /// Append emitted events to the event log and mirror them on `result`.
  void flush_events(uint64_t height,
                    uint32_t tx_index,
                    combo::schema::transaction_result_t& result);

  void load_persisted_state();

  mutable std::mutex mutex_;
  combo::schema::encoding::encoder<combo::schema::encoding::scale_encoder_tag>&
      encoder_;
  combo::storage::storage<combo::storage::rocksdb_storage_tag>& storage_;
  combo::schema::hash32_t chain_id_;
  combo::store::allocator accounts_;
  combo::store::record_store records_;
  std::vector<combo::schema::combo_event_t> emitted_;
  combo::schema::unix_timestamp_t current_block_time_{};
  int64_t last_committed_height_{};
  combo::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  combo::schema::hash32_t pending_state_root_{};
};

}  // namespace combo::execution
