#pragma once

#include <combo/schema/encoding/scale/encoder.hpp>
#include <combo/schema/primitives.hpp>
#include <combo/schema/transaction.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace combo::testing {

using scale_encoder_t =
    combo::schema::encoding::encoder<combo::schema::encoding::scale_encoder_tag>;

inline combo::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = combo::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline combo::schema::transaction_t make_tx(
    const combo::schema::hash32_t& chain_id,
    const combo::schema::account_id_t& signer,
    combo::schema::transaction_payload_t payload) {
  return combo::schema::transaction_t{.version = 1,
                                      .chain_id = chain_id,
                                      .signer = signer,
                                      .payload = std::move(payload)};
}

inline combo::schema::bytes_t encode_tx(
    const combo::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline combo::schema::create_combo_t make_uppercut_combo() {
  return combo::schema::create_combo_t{.name = "uppercut_combo",
                                       .damage = 250,
                                       .meter_gain = 30,
                                       .move_count = 4,
                                       .character_id = 7};
}

}  // namespace combo::testing
