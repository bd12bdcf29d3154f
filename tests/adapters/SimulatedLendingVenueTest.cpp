/**
 * @file SimulatedLendingVenueTest.cpp
 * @brief Unit tests for SimulatedLendingVenue interest accrual
 */

#include <gtest/gtest.h>
#include "adapters/secondary/venues/SimulatedLendingVenue.hpp"
#include "mocks/ManualClock.hpp"

using namespace treasury;
using namespace treasury::adapters::secondary;
using namespace treasury::tests;
using domain::AssetId;
using domain::STABLE_UNIT;

class SimulatedLendingVenueTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        custody_ = std::make_shared<SimulatedCustody>();
        venue_ = std::make_shared<SimulatedLendingVenue>(custody_, clock_, 500);

        custody_->credit("saver", AssetId::STABLE, 1000 * STABLE_UNIT);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<SimulatedCustody> custody_;
    std::shared_ptr<SimulatedLendingVenue> venue_;
};

TEST_F(SimulatedLendingVenueTest, Supply_MovesFundsToVenue) {
    venue_->supply(AssetId::STABLE, 1000 * STABLE_UNIT, "saver");

    EXPECT_EQ(venue_->balanceOf(AssetId::STABLE, "saver"), 1000 * STABLE_UNIT);
    EXPECT_EQ(custody_->balanceOf("saver", AssetId::STABLE), 0u);
    EXPECT_EQ(custody_->balanceOf("lending-venue", AssetId::STABLE), 1000 * STABLE_UNIT);
}

TEST_F(SimulatedLendingVenueTest, BalanceOf_AfterYear_AccruesApy) {
    venue_->supply(AssetId::STABLE, 1000 * STABLE_UNIT, "saver");
    clock_->advance(static_cast<domain::UnixSeconds>(domain::SECONDS_PER_YEAR));

    EXPECT_EQ(venue_->balanceOf(AssetId::STABLE, "saver"), 1050 * STABLE_UNIT);
}

TEST_F(SimulatedLendingVenueTest, Withdraw_IncludesInterest) {
    venue_->supply(AssetId::STABLE, 1000 * STABLE_UNIT, "saver");
    clock_->advance(static_cast<domain::UnixSeconds>(domain::SECONDS_PER_YEAR));

    auto withdrawn = venue_->withdraw(AssetId::STABLE, 2000 * STABLE_UNIT, "saver");

    EXPECT_EQ(withdrawn, 1050 * STABLE_UNIT);
    EXPECT_EQ(custody_->balanceOf("saver", AssetId::STABLE), 1050 * STABLE_UNIT);
    EXPECT_EQ(venue_->balanceOf(AssetId::STABLE, "saver"), 0u);
}

TEST_F(SimulatedLendingVenueTest, Withdraw_LiquidityCap_DeliversPartially) {
    venue_->supply(AssetId::STABLE, 1000 * STABLE_UNIT, "saver");
    venue_->setLiquidityCap(100 * STABLE_UNIT);

    EXPECT_EQ(venue_->withdraw(AssetId::STABLE, 500 * STABLE_UNIT, "saver"), 100 * STABLE_UNIT);
    EXPECT_EQ(venue_->balanceOf(AssetId::STABLE, "saver"), 900 * STABLE_UNIT);
}

TEST_F(SimulatedLendingVenueTest, TinyBalance_InterestAccumulatesOverTime) {
    custody_->credit("dust", AssetId::STABLE, 100);
    venue_->supply(AssetId::STABLE, 100, "dust");

    clock_->advance(60);
    EXPECT_EQ(venue_->balanceOf(AssetId::STABLE, "dust"), 100u);

    clock_->advance(static_cast<domain::UnixSeconds>(domain::SECONDS_PER_YEAR));
    EXPECT_EQ(venue_->balanceOf(AssetId::STABLE, "dust"), 105u);
}

TEST_F(SimulatedLendingVenueTest, AddYield_CreditsPosition) {
    venue_->supply(AssetId::STABLE, 1000 * STABLE_UNIT, "saver");
    venue_->addYield("saver", 7 * STABLE_UNIT);

    EXPECT_EQ(venue_->balanceOf(AssetId::STABLE, "saver"), 1007 * STABLE_UNIT);
}

TEST_F(SimulatedLendingVenueTest, NonStableAsset_Rejected) {
    custody_->credit("saver", AssetId::VOLATILE, 100);

    EXPECT_THROW(venue_->supply(AssetId::VOLATILE, 100, "saver"), domain::ValidationError);
    EXPECT_THROW(venue_->withdraw(AssetId::VOLATILE, 100, "saver"), domain::ValidationError);
    EXPECT_EQ(venue_->balanceOf(AssetId::VOLATILE, "saver"), 0u);
}

TEST_F(SimulatedLendingVenueTest, FailNextCall_VenueFailureOnce) {
    venue_->failNextCall();

    EXPECT_THROW(venue_->supply(AssetId::STABLE, STABLE_UNIT, "saver"), domain::ExecutionError);
    EXPECT_NO_THROW(venue_->supply(AssetId::STABLE, STABLE_UNIT, "saver"));
}
