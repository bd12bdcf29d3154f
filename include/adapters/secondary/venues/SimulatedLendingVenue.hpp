// include/adapters/secondary/venues/SimulatedLendingVenue.hpp
#pragma once

#include "ports/output/ILendingVenue.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/venues/SimulatedCustody.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>

namespace treasury::adapters::secondary {

/**
 * @brief Lending-площадка с линейным начислением процентов по часам
 *
 * Размещённые средства лежат на счёте "lending-venue" в custody,
 * начисленные проценты выпускаются туда же. Принимает только стабильный
 * актив.
 */
class SimulatedLendingVenue : public ports::output::ILendingVenue {
public:
    SimulatedLendingVenue(
        std::shared_ptr<SimulatedCustody> custody,
        std::shared_ptr<ports::output::IClock> clock,
        std::uint64_t apyBps = 500)
        : custody_(std::move(custody))
        , clock_(std::move(clock))
        , apyBps_(apyBps)
    {
        std::cout << "[SimulatedLendingVenue] Created, apy=" << apyBps_ << " bps" << std::endl;
    }

    void supply(domain::AssetId asset, domain::Amount amount, const std::string& beneficiary) override {
        requireStable(asset);
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNext_) {
            failNext_ = false;
            throw domain::ExecutionError(domain::ErrorCode::VenueFailure, "lending venue unavailable");
        }
        auto& position = accrue(beneficiary);
        custody_->transfer(asset, beneficiary, VENUE_ACCOUNT, amount);
        position.balance += amount;
        std::cout << "[SimulatedLendingVenue] " << beneficiary << " supplied " << amount << std::endl;
    }

    domain::Amount withdraw(domain::AssetId asset, domain::Amount amount, const std::string& recipient) override {
        requireStable(asset);
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNext_) {
            failNext_ = false;
            throw domain::ExecutionError(domain::ErrorCode::VenueFailure, "lending venue unavailable");
        }
        auto& position = accrue(recipient);
        auto actual = std::min({amount, position.balance, liquidityCap_});
        if (actual > 0) {
            custody_->transfer(asset, VENUE_ACCOUNT, recipient, actual);
            position.balance -= actual;
        }
        std::cout << "[SimulatedLendingVenue] " << recipient << " withdrew " << actual
                  << " of " << amount << " requested" << std::endl;
        return actual;
    }

    domain::Amount balanceOf(domain::AssetId asset, const std::string& account) override {
        if (asset != domain::AssetId::STABLE) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return accrue(account).balance;
    }

    // Методы для тестов

    /**
     * @brief Начислить проценты вручную, независимо от часов
     */
    void addYield(const std::string& account, domain::Amount amount) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& position = accrue(account);
        custody_->credit(VENUE_ACCOUNT, domain::AssetId::STABLE, amount);
        position.balance += amount;
    }

    /**
     * @brief Ограничить доступную к выводу ликвидность за один вызов
     */
    void setLiquidityCap(domain::Amount cap) {
        std::lock_guard<std::mutex> lock(mutex_);
        liquidityCap_ = cap;
    }

    void failNextCall() {
        std::lock_guard<std::mutex> lock(mutex_);
        failNext_ = true;
    }

private:
    struct Position {
        domain::Amount balance = 0;
        domain::UnixSeconds lastAccrual = 0;
    };

    inline static const std::string VENUE_ACCOUNT = "lending-venue";

    std::shared_ptr<SimulatedCustody> custody_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::uint64_t apyBps_;

    std::mutex mutex_;
    std::map<std::string, Position> positions_;
    domain::Amount liquidityCap_ = std::numeric_limits<domain::Amount>::max();
    bool failNext_ = false;

    static void requireStable(domain::AssetId asset) {
        if (asset != domain::AssetId::STABLE) {
            throw domain::ValidationError(domain::ErrorCode::InvalidParameter,
                "lending venue accepts only the stable asset");
        }
    }

    // Вызывается под mutex_
    Position& accrue(const std::string& account) {
        auto now = clock_->now();
        auto& position = positions_[account];
        if (position.lastAccrual == 0 || position.balance == 0) {
            position.lastAccrual = now;
            return position;
        }

        auto elapsed = now - position.lastAccrual;
        if (elapsed <= 0) {
            return position;
        }

        auto interest = domain::mulDiv(position.balance, apyBps_ * static_cast<std::uint64_t>(elapsed),
                                       domain::BASIS * domain::SECONDS_PER_YEAR);
        // Пока процент округляется в ноль, время копится
        if (interest > 0) {
            custody_->credit(VENUE_ACCOUNT, domain::AssetId::STABLE, interest);
            position.balance += interest;
            position.lastAccrual = now;
        }
        return position;
    }
};

} // namespace treasury::adapters::secondary
