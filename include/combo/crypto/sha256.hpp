#pragma once

#include <combo/schema/primitives.hpp>

namespace combo::crypto {

/// SHA-256 (FIPS 180-4) digest of `message`.
combo::schema::hash32_t sha256(const combo::schema::bytes_view_t& message);

}  // namespace combo::crypto
