#pragma once

#include <combo/schema/combo_error_code.hpp>
#include <combo/schema/combo_record.hpp>
#include <combo/schema/create_combo.hpp>
#include <combo/schema/verify_combo.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// Precondition checks run at the top of each record store operation. Each
// returns the first violated rule, or std::nullopt when the request may
// proceed.
namespace combo::store {

inline constexpr size_t kMaxNameLength = 64;
inline constexpr uint32_t kMinDamage = 1;
inline constexpr uint32_t kMaxDamage = 1000;
inline constexpr uint32_t kMinMeterGain = 1;
inline constexpr uint32_t kMaxMeterGain = 100;
inline constexpr uint8_t kMinMoveCount = 1;
inline constexpr uint8_t kMaxMoveCount = 20;
inline constexpr size_t kMaxVerifyMoves = 20;

/// RFC 3629 UTF-8: no overlong forms, surrogates or code points past
/// U+10FFFF.
bool is_well_formed_utf8(std::string_view text);

/// invalid_transaction when the name is not well-formed UTF-8.
std::optional<combo::schema::combo_error_code> validate_name_encoding(
    const combo::schema::create_combo_t& request);

/// Checked in order: name length (bytes), damage, meter gain, move count.
std::optional<combo::schema::combo_error_code> validate_combo_data(
    const combo::schema::create_combo_t& request);

std::optional<combo::schema::combo_error_code> verify_move_sequence(
    const combo::schema::verify_combo_t& request);

std::optional<combo::schema::combo_error_code> only_owner(
    const combo::schema::combo_record_t& record,
    const combo::schema::account_id_t& caller);

}  // namespace combo::store
