#include <gtest/gtest.h>
#include <waybill/schema/limits.hpp>
#include <waybill/testing/ledger_fixture.hpp>

#include <string>

using namespace waybill::schema;

TEST(admin_control, owner_comes_from_configuration_on_first_open) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_admin_owner"};
  auto& admin = fixture.context().admin();
  EXPECT_EQ(admin.owner(), "owner");
  EXPECT_TRUE(admin.is_owner("owner"));
  EXPECT_FALSE(admin.is_owner("someone"));
  EXPECT_FALSE(admin.is_paused());
}

TEST(admin_control, only_owner_may_pause_and_unpause) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_admin_pause"};
  auto& admin = fixture.context().admin();

  auto rejected = admin.pause("intruder");
  EXPECT_EQ(rejected.code, ledger_error_code::unauthorized);
  EXPECT_EQ(rejected.codespace, "waybill.ledger");
  EXPECT_FALSE(admin.is_paused());

  EXPECT_TRUE(admin.pause("owner").ok());
  EXPECT_TRUE(admin.is_paused());
  EXPECT_TRUE(admin.pause("owner").ok());
  EXPECT_TRUE(admin.is_paused());

  EXPECT_EQ(admin.unpause("intruder").code, ledger_error_code::unauthorized);
  EXPECT_TRUE(admin.is_paused());
  EXPECT_TRUE(admin.unpause("owner").ok());
  EXPECT_FALSE(admin.is_paused());
}

TEST(admin_control, over_long_caller_is_rejected_first) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_admin_long"};
  auto result =
      fixture.context().admin().pause(std::string(kMaxIdentityLength + 1, 'x'));
  EXPECT_EQ(result.code, ledger_error_code::value_too_long);
}

TEST(admin_control, persisted_owner_and_pause_flag_win_over_configuration) {
  auto fixture = waybill::testing::ledger_fixture{"waybill_admin_reopen"};
  ASSERT_TRUE(fixture.context().admin().pause("owner").ok());

  fixture.reopen(waybill::ledger::ledger_options{.owner = "usurper"});
  EXPECT_EQ(fixture.context().admin().owner(), "owner");
  EXPECT_TRUE(fixture.context().admin().is_paused());

  fixture.reopen(waybill::ledger::ledger_options{});
  EXPECT_EQ(fixture.context().admin().owner(), "owner");
}
