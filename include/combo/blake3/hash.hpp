#pragma once
#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace combo::blake3 {

combo::schema::hash32_t hash(const std::string_view& str);
combo::schema::hash32_t hash(const combo::schema::bytes_view_t& bytes);

}  // namespace combo::blake3
