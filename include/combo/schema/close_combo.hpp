#pragma once

#include <combo/schema/primitives.hpp>
#include <cstdint>

// Schema type: close combo.
// Instruction payload: owner-only destruction, reclaiming the record's
// allocation value to `destination`.
namespace combo::schema {

template <uint16_t Version>
struct close_combo;

template <>
struct close_combo<1> final {
  uint16_t version{1};
  address_t record{};
  account_id_t destination{};
};

using close_combo_t = close_combo<1>;

}  // namespace combo::schema
