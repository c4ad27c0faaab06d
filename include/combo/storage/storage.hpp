#pragma once
#include <combo/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace combo::storage {

using key_value_entry_t =
    std::pair<combo::schema::bytes_t, combo::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  combo::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const combo::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const combo::schema::bytes_view_t& key,
           const T& value);

  /// Remove key; removing a missing key is not an error.
  void erase(const combo::schema::bytes_view_t& key);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const combo::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace combo::storage
