#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <combo/common/critical.hpp>
#include <combo/schema/encoding/scale/encoder.hpp>
#include <combo/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace combo::storage {

namespace detail {

using encoder_t =
    combo::schema::encoding::encoder<combo::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline combo::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const combo::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const combo::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const combo::schema::bytes_view_t& key,
           const T& value);

  void erase(const combo::schema::bytes_view_t& key);
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const combo::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const combo::schema::bytes_view_t& key) const {
  if (!database) {
    combo::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      combo::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(combo::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const combo::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    combo::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(combo::schema::bytes_view_t{encoded_value.data(),
                                                   encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    combo::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::erase(
    const combo::schema::bytes_view_t& key) {
  if (!database) {
    combo::common::critical("RocksDB database is not initialized");
  }
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}",
                  status.ToString());
    combo::common::critical("Failed to delete value from RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    combo::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    combo::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, combo::schema::hash32_t>>(
          combo::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    combo::common::critical("failed to decode committed state");
  }

  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    combo::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                    std::string{detail::kCommittedHeightKey},
                    std::string{reinterpret_cast<const char*>(encoded.data()),
                                encoded.size()});
  if (!state_status.ok()) {
    combo::common::critical("failed to persist committed height");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const combo::schema::bytes_view_t& prefix) const {
  if (!database) {
    combo::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    combo::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace combo::storage
