#include <combo/store/guards.hpp>

#include <cstdint>

namespace combo::store {

bool is_well_formed_utf8(const std::string_view text) {
  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<uint8_t>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    auto length = size_t{0};
    auto min_second = uint8_t{0x80};
    auto max_second = uint8_t{0xBF};
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) {
        min_second = 0xA0;
      } else if (lead == 0xED) {
        max_second = 0x9F;
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) {
        min_second = 0x90;
      } else if (lead == 0xF4) {
        max_second = 0x8F;
      }
    } else {
      return false;
    }

    if (text.size() - i < length) {
      return false;
    }
    auto second = static_cast<uint8_t>(text[i + 1]);
    if (second < min_second || second > max_second) {
      return false;
    }
    for (size_t j = 2; j < length; ++j) {
      auto continuation = static_cast<uint8_t>(text[i + j]);
      if ((continuation & 0xC0u) != 0x80u) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

std::optional<combo::schema::combo_error_code> validate_name_encoding(
    const combo::schema::create_combo_t& request) {
  if (!is_well_formed_utf8(request.name)) {
    return combo::schema::combo_error_code::invalid_transaction;
  }
  return std::nullopt;
}

std::optional<combo::schema::combo_error_code> validate_combo_data(
    const combo::schema::create_combo_t& request) {
  if (request.name.size() > kMaxNameLength) {
    return combo::schema::combo_error_code::name_too_long;
  }
  if (request.damage < kMinDamage || request.damage > kMaxDamage) {
    return combo::schema::combo_error_code::invalid_damage;
  }
  if (request.meter_gain < kMinMeterGain ||
      request.meter_gain > kMaxMeterGain) {
    return combo::schema::combo_error_code::invalid_meter_gain;
  }
  if (request.move_count < kMinMoveCount ||
      request.move_count > kMaxMoveCount) {
    return combo::schema::combo_error_code::invalid_move_count;
  }
  return std::nullopt;
}

std::optional<combo::schema::combo_error_code> verify_move_sequence(
    const combo::schema::verify_combo_t& request) {
  if (request.moves.size() > kMaxVerifyMoves) {
    return combo::schema::combo_error_code::too_many_moves;
  }
  return std::nullopt;
}

std::optional<combo::schema::combo_error_code> only_owner(
    const combo::schema::combo_record_t& record,
    const combo::schema::account_id_t& caller) {
  if (record.owner != caller) {
    return combo::schema::combo_error_code::unauthorized;
  }
  return std::nullopt;
}

}  // namespace combo::store
