#include <gtest/gtest.h>
#include <combo/schema/primitives.hpp>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = combo::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(combo::schema::make_hash32(combo::schema::to_hex(hash)), hash);
}

TEST(primitives, make_hash32_accepts_uppercase_digits) {
  auto hash = combo::schema::make_hash32(std::string(64, 'F'));
  for (auto byte : hash) {
    EXPECT_EQ(byte, 0xFFu);
  }
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = combo::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_is_lowercase) {
  auto payload = combo::schema::bytes_t{0x00, 0x7F, 0xAB, 0xFF};
  EXPECT_EQ(combo::schema::to_hex(payload), "007fabff");
}

TEST(primitives, base64_matches_known_encodings) {
  auto encode = [](const std::string_view text) {
    return combo::schema::to_base64(combo::schema::make_bytes(text));
  };
  EXPECT_EQ(encode(""), "");
  EXPECT_EQ(encode("c"), "Yw==");
  EXPECT_EQ(encode("co"), "Y28=");
  EXPECT_EQ(encode("com"), "Y29t");
  EXPECT_EQ(encode("combo"), "Y29tYm8=");
}

TEST(primitives, from_base64_ignores_whitespace) {
  auto decoded = combo::schema::from_base64("Y29t\nYm8=");
  EXPECT_EQ(combo::schema::make_string_view(decoded), "combo");
  auto binary = combo::schema::bytes_t{0x00, 0xFB, 0xFF, 0x10};
  EXPECT_EQ(combo::schema::from_base64(combo::schema::to_base64(binary)),
            binary);
}
