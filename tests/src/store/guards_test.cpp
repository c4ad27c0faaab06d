#include <combo/store/guards.hpp>
#include <combo/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

using combo::schema::combo_error_code;
using combo::store::is_well_formed_utf8;
using combo::store::validate_combo_data;
using combo::store::validate_name_encoding;

TEST(guards, accepts_boundary_values) {
  auto request = combo::testing::make_uppercut_combo();
  EXPECT_FALSE(validate_combo_data(request).has_value());

  request.name = std::string(64, 'a');
  request.damage = 1000;
  request.meter_gain = 100;
  request.move_count = 20;
  EXPECT_FALSE(validate_combo_data(request).has_value());

  request.name.clear();
  request.damage = 1;
  request.meter_gain = 1;
  request.move_count = 1;
  EXPECT_FALSE(validate_combo_data(request).has_value());
}

TEST(guards, rejects_each_field_out_of_range) {
  auto request = combo::testing::make_uppercut_combo();
  request.name = std::string(65, 'a');
  EXPECT_EQ(validate_combo_data(request), combo_error_code::name_too_long);

  request = combo::testing::make_uppercut_combo();
  request.damage = 0;
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_damage);
  request.damage = 1001;
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_damage);

  request = combo::testing::make_uppercut_combo();
  request.meter_gain = 0;
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_meter_gain);
  request.meter_gain = 101;
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_meter_gain);

  request = combo::testing::make_uppercut_combo();
  request.move_count = 0;
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_move_count);
  request.move_count = 21;
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_move_count);
}

TEST(guards, name_limit_counts_bytes_not_characters) {
  auto request = combo::testing::make_uppercut_combo();
  // 22 three-byte characters: 66 bytes.
  request.name.clear();
  for (int i = 0; i < 22; ++i) {
    request.name += "\xE2\x98\x85";
  }
  EXPECT_EQ(validate_combo_data(request), combo_error_code::name_too_long);
}

TEST(guards, first_violation_wins) {
  auto request = combo::schema::create_combo_t{.name = std::string(65, 'a'),
                                               .damage = 0,
                                               .meter_gain = 0,
                                               .move_count = 0,
                                               .character_id = 0};
  EXPECT_EQ(validate_combo_data(request), combo_error_code::name_too_long);
  request.name = "ok";
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_damage);
  request.damage = 5;
  EXPECT_EQ(validate_combo_data(request), combo_error_code::invalid_meter_gain);
}

TEST(guards, verify_allows_up_to_twenty_moves) {
  auto request = combo::schema::verify_combo_t{};
  EXPECT_FALSE(combo::store::verify_move_sequence(request).has_value());
  request.moves.assign(20, 1);
  EXPECT_FALSE(combo::store::verify_move_sequence(request).has_value());
  request.moves.push_back(1);
  EXPECT_EQ(combo::store::verify_move_sequence(request),
            combo_error_code::too_many_moves);
}

TEST(guards, only_owner_compares_identities) {
  auto record = combo::schema::combo_record_t{};
  record.owner = combo::testing::make_hash(1);
  EXPECT_FALSE(
      combo::store::only_owner(record, combo::testing::make_hash(1)).has_value());
  EXPECT_EQ(combo::store::only_owner(record, combo::testing::make_hash(2)),
            combo_error_code::unauthorized);
}

TEST(guards, utf8_accepts_well_formed_names) {
  EXPECT_TRUE(is_well_formed_utf8(""));
  EXPECT_TRUE(is_well_formed_utf8("uppercut_combo"));
  EXPECT_TRUE(is_well_formed_utf8("\xC3\xA9"));
  EXPECT_TRUE(is_well_formed_utf8("\xE2\x98\x85 star"));
  EXPECT_TRUE(is_well_formed_utf8("\xF0\x9F\x94\xA5"));
  EXPECT_TRUE(is_well_formed_utf8("\xF4\x8F\xBF\xBF"));
}

TEST(guards, utf8_rejects_malformed_sequences) {
  EXPECT_FALSE(is_well_formed_utf8("\xff\xfe"));
  EXPECT_FALSE(is_well_formed_utf8("\xff\xfe\xc3"));
  EXPECT_FALSE(is_well_formed_utf8("abc\xC3"));
  EXPECT_FALSE(is_well_formed_utf8("\x80"));
  EXPECT_FALSE(is_well_formed_utf8("\xC0\xAF"));
  EXPECT_FALSE(is_well_formed_utf8("\xE0\x80\xAF"));
  EXPECT_FALSE(is_well_formed_utf8("\xED\xA0\x80"));
  EXPECT_FALSE(is_well_formed_utf8("\xF4\x90\x80\x80"));
  EXPECT_FALSE(is_well_formed_utf8("\xE2\x98"));
  EXPECT_FALSE(is_well_formed_utf8("\xE2\x28\xA1"));
}

TEST(guards, malformed_name_is_an_invalid_transaction) {
  auto request = combo::testing::make_uppercut_combo();
  EXPECT_FALSE(validate_name_encoding(request).has_value());

  request.name = "\xff\xfe";
  EXPECT_EQ(validate_name_encoding(request),
            combo_error_code::invalid_transaction);
}
