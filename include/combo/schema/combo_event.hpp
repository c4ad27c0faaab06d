#pragma once

#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: combo events.
// Notifications written to the append-only event log by the record store.
namespace combo::schema {

template <uint16_t Version>
struct combo_created;

template <>
struct combo_created<1> final {
  uint16_t version{1};
  address_t combo{};
  account_id_t owner{};
  uint8_t character_id{};
  uint32_t damage{};
  unix_timestamp_t timestamp{};
};

using combo_created_t = combo_created<1>;

template <uint16_t Version>
struct combo_verified;

template <>
struct combo_verified<1> final {
  uint16_t version{1};
  address_t combo{};
  uint8_t moves_count{};
  unix_timestamp_t timestamp{};
};

using combo_verified_t = combo_verified<1>;

using combo_event_t = std::variant<combo_created_t, combo_verified_t>;

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  combo_event_t event{};
};

using event_record_t = event_record<1>;

}  // namespace combo::schema
