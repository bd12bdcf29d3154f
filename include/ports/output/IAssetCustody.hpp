#pragma once

#include "domain/Amount.hpp"
#include "domain/enums/AssetId.hpp"
#include <string>

namespace treasury::ports::output {

/**
 * @brief Учёт токенов по счетам (система записи для балансов)
 *
 * Свободный остаток хранилища и стратегии — это их балансы здесь.
 */
class IAssetCustody {
public:
    virtual ~IAssetCustody() = default;

    virtual domain::Amount balanceOf(const std::string& account, domain::AssetId asset) = 0;

    /**
     * @throws domain::StateError(InsufficientBalance) если на from не хватает средств
     */
    virtual void transfer(domain::AssetId asset, const std::string& from,
                          const std::string& to, domain::Amount amount) = 0;
};

} // namespace treasury::ports::output
