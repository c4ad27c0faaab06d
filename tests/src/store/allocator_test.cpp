#include <combo/schema/combo_record.hpp>
#include <combo/store/allocator.hpp>
#include <combo/testing/store_fixture.hpp>
#include <gtest/gtest.h>

using combo::schema::combo_error_code;
using combo::store::kComboAccountSpace;
using combo::store::minimum_balance;
using combo::testing::make_hash;

TEST(allocator, deposit_for_record_space) {
  EXPECT_EQ(minimum_balance(0), 890880u);
  EXPECT_EQ(minimum_balance(kComboAccountSpace), 2672640u);
}

TEST(allocator, credit_creates_and_accumulates) {
  auto fixture = combo::testing::store_fixture{"combo_allocator_credit"};
  auto& accounts = fixture.accounts();
  EXPECT_EQ(accounts.balance(make_hash(1)), 0u);
  accounts.credit(make_hash(1), 5);
  accounts.credit(make_hash(1), 7);
  EXPECT_EQ(accounts.balance(make_hash(1)), 12u);
  auto account = accounts.load(make_hash(1));
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->space, 0u);
}

TEST(allocator, allocate_debits_payer_and_holds_deposit) {
  auto fixture = combo::testing::store_fixture{"combo_allocator_allocate"};
  auto& accounts = fixture.accounts();
  auto payer = make_hash(1);
  auto address = make_hash(100);
  auto deposit = minimum_balance(kComboAccountSpace);
  accounts.credit(payer, deposit + 10);

  EXPECT_FALSE(accounts.allocate(payer, address, kComboAccountSpace));
  EXPECT_EQ(accounts.balance(payer), 10u);
  EXPECT_EQ(accounts.balance(address), deposit);
  EXPECT_EQ(accounts.load(address)->space, kComboAccountSpace);
  EXPECT_EQ(accounts.allocated_addresses().size(), 1u);

  EXPECT_EQ(accounts.allocate(payer, address, kComboAccountSpace),
            combo_error_code::record_exists);
}

TEST(allocator, allocate_without_funds_changes_nothing) {
  auto fixture = combo::testing::store_fixture{"combo_allocator_unfunded"};
  auto& accounts = fixture.accounts();
  auto payer = make_hash(1);
  accounts.credit(payer, minimum_balance(kComboAccountSpace) - 1);

  EXPECT_EQ(accounts.allocate(payer, make_hash(100), kComboAccountSpace),
            combo_error_code::insufficient_funds);
  EXPECT_EQ(accounts.balance(payer), minimum_balance(kComboAccountSpace) - 1);
  EXPECT_FALSE(accounts.load(make_hash(100)).has_value());
  EXPECT_EQ(accounts.allocate(make_hash(2), make_hash(101), kComboAccountSpace),
            combo_error_code::insufficient_funds);
}

TEST(allocator, allocate_keeps_value_already_sent_to_address) {
  auto fixture = combo::testing::store_fixture{"combo_allocator_prefunded"};
  auto& accounts = fixture.accounts();
  auto payer = make_hash(1);
  auto address = make_hash(100);
  accounts.credit(payer, minimum_balance(kComboAccountSpace));
  accounts.credit(address, 3);

  EXPECT_FALSE(accounts.allocate(payer, address, kComboAccountSpace));
  EXPECT_EQ(accounts.balance(address), minimum_balance(kComboAccountSpace) + 3);
  EXPECT_FALSE(accounts.load(payer).has_value());
}

TEST(allocator, write_and_read_records) {
  auto fixture = combo::testing::store_fixture{"combo_allocator_rw"};
  auto& accounts = fixture.accounts();
  auto payer = make_hash(1);
  auto address = make_hash(100);
  accounts.credit(payer, minimum_balance(kComboAccountSpace));
  ASSERT_FALSE(accounts.allocate(payer, address, kComboAccountSpace));
  EXPECT_FALSE(accounts.read<combo::schema::combo_record_t>(address));

  auto record = combo::schema::combo_record_t{};
  record.owner = payer;
  record.name = std::string(64, 'n');
  record.damage = 1000;
  record.last_verified_at = 1;
  accounts.write(address, record);

  auto loaded = accounts.read<combo::schema::combo_record_t>(address);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->owner, payer);
  EXPECT_EQ(loaded->name, record.name);
  EXPECT_EQ(loaded->last_verified_at, record.last_verified_at);
  EXPECT_LE(accounts.load(address)->data.size(), kComboAccountSpace);
}

TEST(allocator, reclaim_moves_value_and_vacates_slot) {
  auto fixture = combo::testing::store_fixture{"combo_allocator_reclaim"};
  auto& accounts = fixture.accounts();
  auto payer = make_hash(1);
  auto address = make_hash(100);
  auto destination = make_hash(50);
  auto deposit = minimum_balance(kComboAccountSpace);
  accounts.credit(payer, deposit);
  ASSERT_FALSE(accounts.allocate(payer, address, kComboAccountSpace));

  EXPECT_EQ(accounts.reclaim(address, address),
            combo_error_code::invalid_destination);
  EXPECT_EQ(accounts.balance(address), deposit);

  EXPECT_FALSE(accounts.reclaim(address, destination));
  EXPECT_EQ(accounts.balance(destination), deposit);
  EXPECT_FALSE(accounts.load(address).has_value());
  EXPECT_TRUE(accounts.allocated_addresses().empty());

  EXPECT_EQ(accounts.reclaim(address, destination),
            combo_error_code::record_missing);
}
