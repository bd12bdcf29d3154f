// include/adapters/secondary/venues/SimulatedCustody.hpp
#pragma once

#include "ports/output/IAssetCustody.hpp"
#include "domain/TreasuryError.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <utility>

namespace treasury::adapters::secondary {

/**
 * @brief In-memory учёт токенов по счетам
 *
 * credit()/debit() выпускают и сжигают токены: так симулированные
 * площадки и тесты пополняют счета без отдельного эмитента.
 */
class SimulatedCustody : public ports::output::IAssetCustody {
public:
    domain::Amount balanceOf(const std::string& account, domain::AssetId asset) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find({account, asset});
        return it != balances_.end() ? it->second : 0;
    }

    void transfer(domain::AssetId asset, const std::string& from,
                  const std::string& to, domain::Amount amount) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& source = balances_[{from, asset}];
        if (source < amount) {
            throw domain::StateError(domain::ErrorCode::InsufficientBalance,
                from + " holds " + std::to_string(source) + " " + domain::toString(asset)
                + ", transfer of " + std::to_string(amount) + " requested");
        }
        if (failTransfersTo_ == to) {
            throw domain::ExecutionError(domain::ErrorCode::VenueFailure,
                "custody rejected transfer to " + to);
        }
        source -= amount;
        balances_[{to, asset}] += amount;
    }

    void credit(const std::string& account, domain::AssetId asset, domain::Amount amount) {
        std::lock_guard<std::mutex> lock(mutex_);
        balances_[{account, asset}] += amount;
    }

    void debit(const std::string& account, domain::AssetId asset, domain::Amount amount) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& balance = balances_[{account, asset}];
        if (balance < amount) {
            throw domain::StateError(domain::ErrorCode::InsufficientBalance,
                account + " cannot burn " + std::to_string(amount));
        }
        balance -= amount;
    }

    /**
     * @brief Отказывать во всех переводах на счёт (пустая строка снимает отказ)
     */
    void failTransfersTo(const std::string& account) {
        std::lock_guard<std::mutex> lock(mutex_);
        failTransfersTo_ = account;
    }

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, domain::AssetId>, domain::Amount> balances_;
    std::string failTransfersTo_;
};

} // namespace treasury::adapters::secondary
