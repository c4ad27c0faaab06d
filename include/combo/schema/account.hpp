#pragma once

#include <combo/schema/primitives.hpp>
#include <cstdint>

// Schema type: account.
// Allocation-layer row: value held at an address plus a fixed-size data
// region. Identities that only hold value have `space == 0`.
namespace combo::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  lamports_t lamports{};
  uint32_t space{};
  bytes_t data;
};

using account_t = account<1>;

}  // namespace combo::schema
