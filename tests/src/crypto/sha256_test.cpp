#include <combo/crypto/sha256.hpp>
#include <gtest/gtest.h>

#include <string_view>

TEST(sha256, matches_fips_vectors) {
  EXPECT_EQ(combo::schema::to_hex(combo::crypto::sha256(
                combo::schema::make_bytes(std::string_view{"abc"}))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(combo::schema::to_hex(combo::crypto::sha256({})),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
