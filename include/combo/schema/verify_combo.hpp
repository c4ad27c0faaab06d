#pragma once

#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: verify combo.
// Instruction payload: records a witnessed attempt of the combo at `record`.
namespace combo::schema {

template <uint16_t Version>
struct verify_combo;

template <>
struct verify_combo<1> final {
  uint16_t version{1};
  address_t record{};
  std::vector<move_id_t> moves;
};

using verify_combo_t = verify_combo<1>;

}  // namespace combo::schema
