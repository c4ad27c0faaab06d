#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace combo::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;  // Host-authenticated identity (public key)
using address_t = hash32_t;     // Derived storage location
using lamports_t = uint64_t;
using unix_timestamp_t = int64_t;
using move_id_t = uint8_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);

/// Parse 64 hex digits, optionally `0x` prefixed; critical on bad input.
hash32_t make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Lowercase hex, no prefix.
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

/// Standard alphabet with `=` padding.
std::string to_base64(const bytes_view_t& bytes);
/// Whitespace is ignored; critical on malformed input.
bytes_t from_base64(std::string_view encoded);

}  // namespace combo::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
