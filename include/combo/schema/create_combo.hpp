#pragma once

#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: create combo.
// Instruction payload: the signer becomes the owner of a new record at its
// derived address.
namespace combo::schema {

template <uint16_t Version>
struct create_combo;

template <>
struct create_combo<1> final {
  uint16_t version{1};
  std::string name;
  uint32_t damage{};
  uint32_t meter_gain{};
  uint8_t move_count{};
  uint8_t character_id{};
};

using create_combo_t = create_combo<1>;

}  // namespace combo::schema
