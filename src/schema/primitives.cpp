#include <combo/common/critical.hpp>
#include <combo/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>

namespace combo::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> hex_value(const char c) {
  auto position =
      kHexDigits.find(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

std::optional<uint32_t> base64_value(const char c) {
  auto position = kBase64Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

hash32_t make_hash32(const std::string_view& hex) {
  auto digits = hex;
  if (digits.starts_with("0x") || digits.starts_with("0X")) {
    digits.remove_prefix(2);
  }
  auto hash = hash32_t{};
  if (digits.size() != hash.size() * 2) {
    combo::common::critical("make_hash32 expected 64 hex characters");
  }
  for (size_t i = 0; i < hash.size(); ++i) {
    auto high = hex_value(digits[2 * i]);
    auto low = hex_value(digits[(2 * i) + 1]);
    if (!high || !low) {
      combo::common::critical("make_hash32 found a non-hex character");
    }
    hash[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (size_t i = 0; i < bytes.size(); i += 3) {
    auto remaining = std::min<size_t>(3, bytes.size() - i);
    auto group = uint32_t{0};
    for (size_t j = 0; j < 3; ++j) {
      group <<= 8u;
      if (j < remaining) {
        group |= bytes[i + j];
      }
    }
    for (size_t j = 0; j < 4; ++j) {
      if (j <= remaining) {
        out.push_back(kBase64Alphabet[(group >> (18u - (6u * j))) & 0x3Fu]);
      } else {
        out.push_back('=');
      }
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto symbols = std::string{};
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(symbols), [](const char c) {
                 return std::isspace(static_cast<unsigned char>(c)) == 0;
               });
  if ((symbols.size() % 4) != 0) {
    combo::common::critical("base64 input length must be a multiple of 4");
  }

  auto out = bytes_t{};
  out.reserve((symbols.size() / 4) * 3);
  for (size_t i = 0; i < symbols.size(); i += 4) {
    auto last_group = (i + 4) == symbols.size();
    auto padding = size_t{0};
    auto group = uint32_t{0};
    for (size_t j = 0; j < 4; ++j) {
      auto c = symbols[i + j];
      group <<= 6u;
      if (c == '=') {
        // Padding only in the last two positions of the final group.
        if (!last_group || j < 2) {
          combo::common::critical("misplaced base64 padding");
        }
        ++padding;
        continue;
      }
      auto value = base64_value(c);
      if (!value || padding > 0) {
        combo::common::critical("invalid base64 input");
      }
      group |= *value;
    }
    for (size_t j = 0; j < 3 - padding; ++j) {
      out.push_back(static_cast<uint8_t>((group >> (16u - (8u * j))) & 0xFFu));
    }
  }
  return out;
}

}  // namespace combo::schema
