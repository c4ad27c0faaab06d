#pragma once

#include <combo/execution/engine.hpp>
#include <combo/schema/primitives.hpp>
#include <combo/storage/rocksdb/storage.hpp>
#include <combo/store/allocator.hpp>
#include <combo/testing/common.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace combo::testing {

/// Engine over a throwaway RocksDB directory, removed on destruction.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{combo::storage::make_storage<
            combo::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  combo::storage::storage<combo::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  combo::execution::engine& engine() { return engine_; }

  combo::schema::hash32_t chain_id() const { return engine_.chain_id(); }

  /// Credit `account` with enough value for `count` record deposits.
  void fund(const combo::schema::account_id_t& account, uint64_t count = 1) {
    engine_.credit(account, combo::store::minimum_balance(
                                combo::store::kComboAccountSpace) *
                                count);
  }

  /// Finalize and commit one block of transactions built from payloads.
  combo::schema::block_result_t apply(
      const uint64_t height,
      const combo::schema::unix_timestamp_t block_time,
      const combo::schema::account_id_t& signer,
      const std::vector<combo::schema::transaction_payload_t>& payloads) {
    auto txs = std::vector<combo::schema::bytes_t>{};
    for (const auto& payload : payloads) {
      txs.push_back(encode_tx(make_tx(chain_id(), signer, payload)));
    }
    auto block = engine_.finalize_block(height, block_time, txs);
    engine_.commit();
    return block;
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  combo::storage::storage<combo::storage::rocksdb_storage_tag> storage_;
  combo::execution::engine engine_;
};

}  // namespace combo::testing
