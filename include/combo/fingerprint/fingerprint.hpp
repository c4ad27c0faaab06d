#pragma once

#include <combo/schema/combo_record.hpp>
#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace combo::fingerprint {

/// Canonical preimage of a combo fingerprint.
///
/// Layout, in order: raw UTF-8 `name` bytes, `damage` as u32 little-endian,
/// `meter_gain` as u32 little-endian, `move_count` as one byte,
/// `character_id` as one byte. Downstream consumers compare fingerprints for
/// equality, so this layout is a portability contract.
combo::schema::bytes_t canonical_bytes(std::string_view name,
                                       uint32_t damage,
                                       uint32_t meter_gain,
                                       uint8_t move_count,
                                       uint8_t character_id);

/// SHA-256 of `canonical_bytes(...)`. Pure and deterministic.
combo::schema::hash32_t compute_fingerprint(std::string_view name,
                                            uint32_t damage,
                                            uint32_t meter_gain,
                                            uint8_t move_count,
                                            uint8_t character_id);

/// Fingerprint of the creation fields stored in `record`.
combo::schema::hash32_t compute_fingerprint(
    const combo::schema::combo_record_t& record);

/// True when `record.fingerprint` still certifies its creation fields.
bool matches(const combo::schema::combo_record_t& record);

}  // namespace combo::fingerprint
