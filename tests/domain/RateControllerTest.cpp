/**
 * @file RateControllerTest.cpp
 * @brief Unit tests for RateController and fixed-point helpers
 */

#include <gtest/gtest.h>
#include "domain/RateController.hpp"
#include "domain/Amount.hpp"

using namespace treasury;
using namespace treasury::domain;

class RateControllerTest : public ::testing::Test {
protected:
    RateParams params_;     // 800 / 2000 / 100 / 2500

    static constexpr Price TARGET = 100 * PRICE_UNIT;
};

// ============================================================================
// variableRate
// ============================================================================

TEST_F(RateControllerTest, VariableRate_AtPeg_ReturnsBaseRate) {
    EXPECT_EQ(RateController::variableRate(TARGET, TARGET, params_), 800u);
}

TEST_F(RateControllerTest, VariableRate_TenPercentBelowPeg_Returns1000) {
    // отклонение 1000 bps * 20% = +200 bps
    EXPECT_EQ(RateController::variableRate(TARGET, 90 * PRICE_UNIT, params_), 1000u);
}

TEST_F(RateControllerTest, VariableRate_HalfBelowPeg_AddsSensitivityShare) {
    // отклонение 5000 bps * 20% = +1000 bps
    auto rate = RateController::variableRate(TARGET, 50 * PRICE_UNIT, params_);

    EXPECT_EQ(rate, 1800u);
    EXPECT_LE(rate, params_.maxRateBps);
}

TEST_F(RateControllerTest, VariableRate_DeepBelowPeg_ClampedToMax) {
    EXPECT_EQ(RateController::variableRate(TARGET, 10 * PRICE_UNIT, params_), 2500u);
}

TEST_F(RateControllerTest, VariableRate_SlightlyAbovePeg_ReducesRate) {
    // +10% -> скидка 200 bps
    EXPECT_EQ(RateController::variableRate(TARGET, 110 * PRICE_UNIT, params_), 600u);
}

TEST_F(RateControllerTest, VariableRate_FarAbovePeg_FallsToMin) {
    EXPECT_EQ(RateController::variableRate(TARGET, 200 * PRICE_UNIT, params_), 100u);
}

TEST_F(RateControllerTest, VariableRate_AdjustmentEqualsBase_FallsToMin) {
    // +40% -> скидка ровно 800 bps
    EXPECT_EQ(RateController::variableRate(TARGET, 140 * PRICE_UNIT, params_), 100u);
}

TEST_F(RateControllerTest, VariableRate_NeverOutsideBounds) {
    for (Price market = PRICE_UNIT; market <= 300 * PRICE_UNIT; market += 7 * PRICE_UNIT) {
        auto rate = RateController::variableRate(TARGET, market, params_);
        EXPECT_GE(rate, params_.minRateBps) << "market=" << market;
        EXPECT_LE(rate, params_.maxRateBps) << "market=" << market;
    }
}

TEST_F(RateControllerTest, VariableRate_MonotonicInMarketPrice) {
    std::uint64_t previous = RateController::variableRate(TARGET, PRICE_UNIT, params_);
    for (Price market = 2 * PRICE_UNIT; market <= 300 * PRICE_UNIT; market += PRICE_UNIT) {
        auto rate = RateController::variableRate(TARGET, market, params_);
        EXPECT_LE(rate, previous) << "market=" << market;
        previous = rate;
    }
}

TEST_F(RateControllerTest, VariableRate_ZeroMarketPrice_ThrowsInvalidPrice) {
    try {
        RateController::variableRate(TARGET, 0, params_);
        FAIL() << "Expected OracleError";
    } catch (const OracleError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidPrice);
        EXPECT_EQ(e.category(), ErrorCategory::ORACLE);
    }
}

TEST_F(RateControllerTest, VariableRate_NegativeTarget_Throws) {
    EXPECT_THROW(RateController::variableRate(-1, TARGET, params_), OracleError);
}

TEST_F(RateControllerTest, VariableRate_MisconfiguredBase_StillClamped) {
    // base выше max: результат всё равно в [min, max]
    auto rate = RateController::variableRate(TARGET, 150 * PRICE_UNIT, 5000, 2000, 100, 2500);
    EXPECT_EQ(rate, 2500u);
}

// ============================================================================
// epochDividend
// ============================================================================

TEST_F(RateControllerTest, EpochDividend_OneWeekAtBaseRate_Truncates) {
    // 1M USDC * 8% * 7/365
    auto dividend = RateController::epochDividend(1000000 * STABLE_UNIT, 800, 7 * 24 * 60 * 60);
    EXPECT_EQ(dividend, 1534246575u);
}

TEST_F(RateControllerTest, EpochDividend_FullYear_EqualsRateShare) {
    auto dividend = RateController::epochDividend(1000 * STABLE_UNIT, 1800, SECONDS_PER_YEAR);
    EXPECT_EQ(dividend, 180 * STABLE_UNIT);
}

TEST_F(RateControllerTest, EpochDividend_ZeroInputs_ReturnsZero) {
    EXPECT_EQ(RateController::epochDividend(0, 800, 604800), 0u);
    EXPECT_EQ(RateController::epochDividend(STABLE_UNIT, 0, 604800), 0u);
    EXPECT_EQ(RateController::epochDividend(STABLE_UNIT, 800, 0), 0u);
}

TEST_F(RateControllerTest, EpochDividend_DustBalance_RoundsToZero) {
    EXPECT_EQ(RateController::epochDividend(1, 2500, 604800), 0u);
}

// ============================================================================
// collateralRatio
// ============================================================================

TEST_F(RateControllerTest, CollateralRatio_NoLiabilities_Infinite) {
    EXPECT_EQ(RateController::collateralRatio(100, 100, 0), INFINITE_RATIO);
}

TEST_F(RateControllerTest, CollateralRatio_FullyBacked_EqualsPrecision) {
    EXPECT_EQ(RateController::collateralRatio(800, 200, 1000), PRECISION);
}

TEST_F(RateControllerTest, CollateralRatio_HalfBacked) {
    EXPECT_EQ(RateController::collateralRatio(250, 250, 1000), PRECISION / 2);
}

TEST_F(RateControllerTest, CollateralRatio_HugeSurplus_Saturates) {
    auto ratio = RateController::collateralRatio(std::numeric_limits<Amount>::max(), 0, 1);
    EXPECT_EQ(ratio, INFINITE_RATIO);
}

// ============================================================================
// validate
// ============================================================================

TEST_F(RateControllerTest, Validate_Defaults_Accepted) {
    EXPECT_NO_THROW(RateController::validate(params_));
}

TEST_F(RateControllerTest, Validate_MinAboveBase_Throws) {
    params_.minRateBps = 900;
    EXPECT_THROW(RateController::validate(params_), ValidationError);
}

TEST_F(RateControllerTest, Validate_MaxAboveBasis_Throws) {
    params_.maxRateBps = BASIS + 1;
    EXPECT_THROW(RateController::validate(params_), ValidationError);
}

TEST_F(RateControllerTest, Validate_AllEqual_Accepted) {
    params_ = RateParams{500, 0, 500, 500};
    EXPECT_NO_THROW(RateController::validate(params_));
}

// ============================================================================
// Fixed-point helpers
// ============================================================================

TEST(FixedPointTest, MulDiv_WideIntermediate_DoesNotOverflow) {
    Amount big = std::numeric_limits<Amount>::max();
    EXPECT_EQ(mulDiv(big, 1000, 1000), big);
}

TEST(FixedPointTest, MulDivUp_RoundsUpOnRemainder) {
    EXPECT_EQ(mulDiv(10, 1, 3), 3u);
    EXPECT_EQ(mulDivUp(10, 1, 3), 4u);
    EXPECT_EQ(mulDivUp(9, 1, 3), 3u);
}

TEST(FixedPointTest, MulDiv_ResultTooWide_ThrowsOverflow) {
    try {
        mulDiv(std::numeric_limits<Amount>::max(), 2, 1);
        FAIL() << "Expected ExecutionError";
    } catch (const ExecutionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ArithmeticOverflow);
    }
}

TEST(FixedPointTest, MulDiv_ZeroDivisor_Throws) {
    EXPECT_THROW(mulDiv(1, 1, 0), ExecutionError);
}

TEST(FixedPointTest, ConvertByPrice_StableToVolatile) {
    // 1000 USDC по $100000 за BTC = 0.01 BTC
    auto sats = convertByPrice(1000 * STABLE_UNIT, PRICE_UNIT, STABLE_DECIMALS,
                               100000 * PRICE_UNIT, VOLATILE_DECIMALS);
    EXPECT_EQ(sats, VOLATILE_UNIT / 100);
}

TEST(FixedPointTest, ConvertByPrice_RoundUpOnlyWithRemainder) {
    auto down = convertByPrice(1, 97000 * PRICE_UNIT, VOLATILE_DECIMALS, PRICE_UNIT, STABLE_DECIMALS);
    auto up = convertByPrice(1, 97000 * PRICE_UNIT, VOLATILE_DECIMALS, PRICE_UNIT, STABLE_DECIMALS, true);
    EXPECT_EQ(down, 970u);
    EXPECT_EQ(up, 970u);

    auto inexact = convertByPrice(1, PRICE_UNIT, STABLE_DECIMALS, 97000 * PRICE_UNIT, VOLATILE_DECIMALS, true);
    EXPECT_EQ(inexact, 1u);
}

TEST(FixedPointTest, SaturatingSub_NeverNegative) {
    EXPECT_EQ(saturatingSub(5, 7), 0u);
    EXPECT_EQ(saturatingSub(7, 5), 2u);
}
