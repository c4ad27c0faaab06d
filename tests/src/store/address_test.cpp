#include <combo/store/address.hpp>
#include <combo/testing/common.hpp>
#include <gtest/gtest.h>

TEST(address, record_address_is_deterministic_per_owner) {
  auto owner = combo::testing::make_hash(1);
  auto [first, bump] = combo::store::find_record_address(owner);
  auto [second, bump_again] = combo::store::find_record_address(owner);
  EXPECT_EQ(first, second);
  EXPECT_EQ(bump, combo::store::kCanonicalBump);
  EXPECT_EQ(bump_again, bump);
  EXPECT_NE(first, owner);
}

TEST(address, owners_map_to_distinct_addresses) {
  auto [a, bump_a] = combo::store::find_record_address(combo::testing::make_hash(1));
  auto [b, bump_b] = combo::store::find_record_address(combo::testing::make_hash(2));
  EXPECT_NE(a, b);
}

TEST(address, every_seed_component_participates) {
  auto owner = combo::testing::make_hash(1);
  auto program = combo::store::program_id();
  auto base = combo::store::derive_address(combo::store::kComboSeed, owner,
                                           combo::store::kCanonicalBump, program);
  EXPECT_EQ(base, combo::store::find_record_address(owner).first);
  EXPECT_NE(base, combo::store::derive_address("other", owner,
                                               combo::store::kCanonicalBump,
                                               program));
  EXPECT_NE(base, combo::store::derive_address(combo::store::kComboSeed, owner,
                                               254, program));
  EXPECT_NE(base, combo::store::derive_address(combo::store::kComboSeed, owner,
                                               combo::store::kCanonicalBump,
                                               combo::testing::make_hash(9)));
}
