#pragma once

#include <array>
#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for account state, history and the
// event log. Prefixes are raw bytes so RocksDB prefix iteration groups each
// keyspace; the suffix is the SCALE encoding of the id.
namespace combo::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 5> kEngineKeyspaces{
    kStatePrefix, kAccountKeyPrefix, kEventSeqKeyPrefix, kHistoryPrefix,
    kEventPrefix};

template <typename Encoder, typename T>
combo::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  auto key = combo::schema::make_bytes(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
combo::schema::bytes_t make_account_key(
    Encoder& encoder,
    const combo::schema::address_t& address) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, address);
}

template <typename Encoder>
combo::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix, std::string{"NEXT"});
}

template <typename Encoder>
combo::schema::bytes_t make_history_key(Encoder& encoder,
                                        uint64_t height,
                                        uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

template <typename Encoder>
combo::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
std::optional<combo::schema::address_t> parse_account_key(
    Encoder& encoder,
    const combo::schema::bytes_view_t& key) {
  if (key.size() < kAccountKeyPrefix.size() ||
      make_string_view(key.first(kAccountKeyPrefix.size())) !=
          kAccountKeyPrefix) {
    return std::nullopt;
  }
  return encoder.template try_decode<combo::schema::address_t>(
      key.subspan(kAccountKeyPrefix.size()));
}

}  // namespace combo::schema::key
