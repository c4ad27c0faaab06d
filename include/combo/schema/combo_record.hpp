#pragma once

#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: combo record.
// One per owning identity, stored in the data of the account at the address
// derived from the owner. `fingerprint` certifies the creation fields and is
// never recomputed.
namespace combo::schema {

template <uint16_t Version>
struct combo_record;

template <>
struct combo_record<1> final {
  uint16_t version{1};
  account_id_t owner{};
  uint8_t character_id{};
  std::string name;
  uint32_t damage{};
  uint32_t meter_gain{};
  uint8_t move_count{};
  unix_timestamp_t created_at{};
  hash32_t fingerprint{};
  uint32_t verification_count{};
  std::optional<unix_timestamp_t> last_verified_at;
  uint8_t bump{};
};

using combo_record_t = combo_record<1>;

}  // namespace combo::schema
