#include <gtest/gtest.h>
#include "core/config.hh"

namespace escrow {
namespace {

TEST(ProtocolConfigTest, DefaultsAreValid) {
    ProtocolConfig config;
    EXPECT_TRUE(config.validate().empty());
    EXPECT_EQ(config.foundation_fee_percent, 3);
    EXPECT_EQ(config.operations_fee_percent, 2);
    EXPECT_EQ(config.reveal_delay_blocks, 5);
    EXPECT_EQ(config.reveal_window_blocks, 200);
}

TEST(ProtocolConfigTest, FeesMustLeaveAPool) {
    ProtocolConfig config;
    config.foundation_fee_percent = 60;
    config.operations_fee_percent = 40;
    EXPECT_FALSE(config.validate().empty());
}

TEST(ProtocolConfigTest, PercentagesBounded) {
    ProtocolConfig config;
    config.lottery_winner_percent = 101;
    EXPECT_FALSE(config.validate().empty());

    config = ProtocolConfig{};
    config.timeout_slash_percent = 150;
    EXPECT_FALSE(config.validate().empty());

    config = ProtocolConfig{};
    config.seller_deposit_percent = 100;
    EXPECT_TRUE(config.validate().empty());
}

TEST(ProtocolConfigTest, RevealWindowMustStayReadable) {
    ProtocolConfig config;
    config.reveal_window_blocks = ENTROPY_HISTORY_BLOCKS;
    EXPECT_FALSE(config.validate().empty());

    config.reveal_window_blocks = ENTROPY_HISTORY_BLOCKS - 1;
    EXPECT_TRUE(config.validate().empty());
}

TEST(ProtocolConfigTest, ZeroTimingRejected) {
    ProtocolConfig config;
    config.reveal_delay_blocks = 0;
    EXPECT_FALSE(config.validate().empty());

    config = ProtocolConfig{};
    config.reveal_window_blocks = 0;
    EXPECT_FALSE(config.validate().empty());

    config = ProtocolConfig{};
    config.confirm_window = timestamp_t{0};
    EXPECT_FALSE(config.validate().empty());
}

TEST(ProtocolConfigTest, EmptyScopeRejected) {
    ProtocolConfig config;
    config.app_scope.clear();
    EXPECT_FALSE(config.validate().empty());
}

}  // namespace
}  // namespace escrow
