#pragma once

#include "ports/input/IReserveStrategy.hpp"
#include <gmock/gmock.h>

namespace treasury::tests {

/**
 * @brief GMock реализация IReserveStrategy
 */
class MockReserveStrategy : public ports::input::IReserveStrategy {
public:
    MOCK_METHOD(void, deploy, (const domain::CallContext& ctx, domain::Amount amount), (override));
    MOCK_METHOD(domain::Amount, withdraw, (const domain::CallContext& ctx, domain::Amount amount), (override));
    MOCK_METHOD(void, rebalance, (const domain::CallContext& ctx, bool sellVolatile, domain::Amount amount), (override));
    MOCK_METHOD(domain::Amount, harvestYield, (const domain::CallContext& ctx), (override));

    MOCK_METHOD(domain::Amount, emergencyWithdraw,
                (const domain::CallContext& ctx, const std::string& recipient, bool liquidateVolatile), (override));
    MOCK_METHOD(void, setAllocation, (const domain::CallContext& ctx, const domain::Allocation& allocation), (override));
    MOCK_METHOD(void, setMaxSlippage, (const domain::CallContext& ctx, std::uint64_t maxSlippageBps), (override));
    MOCK_METHOD(void, setBreakerConfig,
                (const domain::CallContext& ctx, std::uint64_t thresholdBps, domain::UnixSeconds windowSeconds), (override));
    MOCK_METHOD(void, resetCircuitBreaker, (const domain::CallContext& ctx), (override));

    MOCK_METHOD(domain::Amount, totalValue, (), (override));
    MOCK_METHOD(domain::Amount, volatileValue, (), (override));
    MOCK_METHOD(domain::Amount, cashReserveValue, (), (override));
    MOCK_METHOD(domain::Amount, freeStableBalance, (), (override));
    MOCK_METHOD(domain::Amount, volatileHeld, (), (const, override));
    MOCK_METHOD(bool, circuitBreakerTripped, (), (const, override));
    MOCK_METHOD(domain::StrategyState, state, (), (const, override));
    MOCK_METHOD(std::string, account, (), (const, override));
};

} // namespace treasury::tests
