#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema type: combo error code.
// Stable numeric failure taxonomy reported verbatim in transaction results.
// Codes 1..9 are envelope failures, 10..19 record guards, 20..29 failures
// surfaced by the allocation layer.
namespace combo::schema {

enum class combo_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  name_too_long = 10,
  invalid_damage = 11,
  invalid_meter_gain = 12,
  invalid_move_count = 13,
  too_many_moves = 14,
  unauthorized = 15,
  record_exists = 20,
  record_missing = 21,
  insufficient_funds = 22,
  invalid_destination = 23,
  verification_count_overflow = 24,
};

using combo_error_entry_t =
    std::tuple<combo_error_code, std::string_view, std::string_view>;

inline constexpr auto kComboErrorMappings = std::array{
    combo_error_entry_t{combo_error_code::invalid_transaction,
                        "invalid_transaction", "Invalid transaction"},
    combo_error_entry_t{combo_error_code::unsupported_transaction_version,
                        "unsupported_transaction_version",
                        "Unsupported transaction version"},
    combo_error_entry_t{combo_error_code::invalid_chain_id,
                        "invalid_chain_id", "Invalid chain id"},
    combo_error_entry_t{combo_error_code::name_too_long, "name_too_long",
                        "Combo name too long"},
    combo_error_entry_t{combo_error_code::invalid_damage, "invalid_damage",
                        "Invalid damage value"},
    combo_error_entry_t{combo_error_code::invalid_meter_gain,
                        "invalid_meter_gain", "Invalid meter gain value"},
    combo_error_entry_t{combo_error_code::invalid_move_count,
                        "invalid_move_count", "Invalid move count"},
    combo_error_entry_t{combo_error_code::too_many_moves, "too_many_moves",
                        "Too many moves"},
    combo_error_entry_t{combo_error_code::unauthorized, "unauthorized",
                        "Unauthorized"},
    combo_error_entry_t{combo_error_code::record_exists, "record_exists",
                        "Combo record already exists"},
    combo_error_entry_t{combo_error_code::record_missing, "record_missing",
                        "Combo record not found"},
    combo_error_entry_t{combo_error_code::insufficient_funds,
                        "insufficient_funds",
                        "Insufficient funds for allocation deposit"},
    combo_error_entry_t{combo_error_code::invalid_destination,
                        "invalid_destination",
                        "Destination cannot be the record itself"},
    combo_error_entry_t{combo_error_code::verification_count_overflow,
                        "verification_count_overflow",
                        "Verification count overflow"}};

inline constexpr std::string_view to_string(const combo_error_code value) {
  for (const auto& [code, name, message] : kComboErrorMappings) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

inline constexpr std::string_view describe(const combo_error_code value) {
  for (const auto& [code, name, message] : kComboErrorMappings) {
    if (code == value) {
      return message;
    }
  }
  return "Unknown error";
}

inline constexpr std::optional<combo_error_code> try_from_string(
    const std::string_view value) {
  for (const auto& [code, name, message] : kComboErrorMappings) {
    if (name == value) {
      return code;
    }
  }
  return std::nullopt;
}

inline constexpr uint32_t to_code(const combo_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace combo::schema
