#pragma once
#include <combo/schema/close_combo.hpp>
#include <combo/schema/create_combo.hpp>
#include <combo/schema/primitives.hpp>
#include <combo/schema/verify_combo.hpp>
#include <variant>

namespace combo::schema {

using transaction_payload_t =
    std::variant<create_combo_t, verify_combo_t, close_combo_t>;

template <uint16_t Version>
struct transaction;

// `signer` is authenticated by the host before the transaction reaches the
// engine.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  account_id_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace combo::schema
