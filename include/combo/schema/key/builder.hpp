#pragma once
#include <combo/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace combo::schema::key {

/// Append-only byte buffer for canonical keys and hash preimages.
///
/// Integers are written little-endian at their full width.
struct builder final {
  combo::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  combo::schema::bytes_view_t view() const { return data; }

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    using unsigned_t = std::make_unsigned_t<T>;
    auto bits = static_cast<unsigned_t>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((bits >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace combo::schema::key
