#pragma once

#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <utility>

namespace combo::store {

/// Domain tag separating combo records from other derived keyspaces.
inline constexpr std::string_view kComboSeed{"combo"};
inline constexpr std::string_view kDerivationMarker{"ProgramDerivedAddress"};
inline constexpr uint8_t kCanonicalBump = 255;

/// Identity of the deployed combo program, mixed into every derivation.
const combo::schema::hash32_t& program_id();

/// blake3(seed | owner | bump | program_id | marker).
combo::schema::address_t derive_address(std::string_view seed,
                                        const combo::schema::account_id_t& owner,
                                        uint8_t bump,
                                        const combo::schema::hash32_t& program);

/// Address of the record owned by `owner`, with the bump it was derived at.
std::pair<combo::schema::address_t, uint8_t> find_record_address(
    const combo::schema::account_id_t& owner);

}  // namespace combo::store
