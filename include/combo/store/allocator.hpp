#pragma once

#include <spdlog/spdlog.h>
#include <combo/common/critical.hpp>
#include <combo/schema/account.hpp>
#include <combo/schema/combo_error_code.hpp>
#include <combo/schema/encoding/scale/encoder.hpp>
#include <combo/schema/key/engine_keys.hpp>
#include <combo/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace combo::store {

using encoder_t =
    combo::schema::encoding::encoder<combo::schema::encoding::scale_encoder_tag>;
using storage_t = combo::storage::storage<combo::storage::rocksdb_storage_tag>;

/// Fixed allocation size of a combo record account.
inline constexpr uint32_t kComboAccountSpace = 256;

inline constexpr uint64_t kAccountStorageOverhead = 128;
inline constexpr uint64_t kLamportsPerByteYear = 3480;
inline constexpr uint64_t kExemptionThresholdYears = 2;

/// Deposit an allocation of `space` bytes must hold.
constexpr combo::schema::lamports_t minimum_balance(const uint32_t space) {
  return (kAccountStorageOverhead + space) * kLamportsPerByteYear *
         kExemptionThresholdYears;
}

/// Storage allocation layer over the account keyspace.
///
/// Provides create-if-absent, mutate-in-place and reclaim-to-destination
/// over fixed-size serialized records. Accounts whose value drops to zero
/// and that hold no allocation are removed.
class allocator final {
 public:
  allocator(encoder_t& encoder, storage_t& storage);

  std::optional<combo::schema::account_t> load(
      const combo::schema::address_t& address) const;

  combo::schema::lamports_t balance(
      const combo::schema::address_t& address) const;

  /// Add value to an identity, creating it when absent.
  void credit(const combo::schema::address_t& address,
              combo::schema::lamports_t lamports);

  /// Allocate `space` bytes at `address`, funded by `payer`.
  ///
  /// Fails with record_exists when `address` already holds an allocation and
  /// insufficient_funds when `payer` cannot cover `minimum_balance(space)`.
  /// Nothing is written on failure.
  std::optional<combo::schema::combo_error_code> allocate(
      const combo::schema::account_id_t& payer,
      const combo::schema::address_t& address,
      uint32_t space);

  /// Decode the allocation's data as `T`; std::nullopt when unallocated or
  /// when the data does not decode.
  template <typename T>
  std::optional<T> read(const combo::schema::address_t& address) const;

  /// Serialize `value` into an existing allocation.
  template <typename T>
  void write(const combo::schema::address_t& address, const T& value);

  /// Move the whole value of the allocation at `address` to `destination`
  /// and vacate the slot.
  std::optional<combo::schema::combo_error_code> reclaim(
      const combo::schema::address_t& address,
      const combo::schema::account_id_t& destination);

  /// Addresses of every account holding an allocation.
  std::vector<combo::schema::address_t> allocated_addresses() const;

 private:
  void save(const combo::schema::address_t& address,
            const combo::schema::account_t& account);

  encoder_t& encoder_;
  storage_t& storage_;
};

template <typename T>
std::optional<T> allocator::read(
    const combo::schema::address_t& address) const {
  auto account = load(address);
  if (!account || account->space == 0 || account->data.empty()) {
    return std::nullopt;
  }
  return encoder_.try_decode<T>(
      combo::schema::bytes_view_t{account->data.data(), account->data.size()});
}

template <typename T>
void allocator::write(const combo::schema::address_t& address,
                      const T& value) {
  auto account = load(address);
  if (!account || account->space == 0) {
    combo::common::critical("write to an unallocated address");
  }
  auto encoded = encoder_.encode(value);
  if (encoded.size() > account->space) {
    spdlog::error("Encoded value of {} bytes exceeds allocation of {} bytes",
                  encoded.size(), account->space);
    combo::common::critical("encoded value exceeds allocation");
  }
  account->data = std::move(encoded);
  save(address, *account);
}

}  // namespace combo::store
