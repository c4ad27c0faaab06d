#include <algorithm>
#include <combo/blake3/hash.hpp>
#include <combo/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace combo::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const combo::schema::hash32_t& hash) {
  return write(std::span<const uint8_t>{hash.data(), hash.size()});
}

builder& builder::hash(const std::string_view& str) {
  return write(combo::blake3::hash(str));
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  return write(combo::blake3::hash(bytes));
}
