#include <gtest/gtest.h>
#include <combo/schema/combo_error_code.hpp>

#include <set>
#include <string_view>

TEST(combo_error_code, guard_kinds_keep_their_messages) {
  using combo::schema::combo_error_code;
  EXPECT_EQ(combo::schema::describe(combo_error_code::name_too_long),
            "Combo name too long");
  EXPECT_EQ(combo::schema::describe(combo_error_code::invalid_damage),
            "Invalid damage value");
  EXPECT_EQ(combo::schema::describe(combo_error_code::invalid_meter_gain),
            "Invalid meter gain value");
  EXPECT_EQ(combo::schema::describe(combo_error_code::invalid_move_count),
            "Invalid move count");
  EXPECT_EQ(combo::schema::describe(combo_error_code::too_many_moves),
            "Too many moves");
  EXPECT_EQ(combo::schema::describe(combo_error_code::unauthorized),
            "Unauthorized");
}

TEST(combo_error_code, codes_and_names_are_distinct) {
  auto codes = std::set<uint32_t>{};
  auto names = std::set<std::string_view>{};
  for (const auto& [code, name, message] :
       combo::schema::kComboErrorMappings) {
    EXPECT_NE(combo::schema::to_code(code), 0u);
    codes.insert(combo::schema::to_code(code));
    names.insert(name);
  }
  EXPECT_EQ(codes.size(), combo::schema::kComboErrorMappings.size());
  EXPECT_EQ(names.size(), combo::schema::kComboErrorMappings.size());
}

TEST(combo_error_code, names_parse_back) {
  auto parsed = combo::schema::try_from_string("too_many_moves");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, combo::schema::combo_error_code::too_many_moves);
  EXPECT_FALSE(combo::schema::try_from_string("not_an_error").has_value());
}
