#pragma once

#include "domain/Amount.hpp"
#include "domain/enums/AssetId.hpp"
#include <string>

namespace treasury::ports::output {

/**
 * @brief Lending-площадка (денежный резерв)
 *
 * Баланс растёт со временем на начисленные проценты.
 */
class ILendingVenue {
public:
    virtual ~ILendingVenue() = default;

    /**
     * @brief Разместить amount со счёта beneficiary в custody
     */
    virtual void supply(domain::AssetId asset, domain::Amount amount, const std::string& beneficiary) = 0;

    /**
     * @brief Вывести amount на счёт recipient (баланс списывается с recipient)
     * @return Фактически выведенное количество (может быть меньше запрошенного)
     */
    virtual domain::Amount withdraw(domain::AssetId asset, domain::Amount amount, const std::string& recipient) = 0;

    /**
     * @brief Живой баланс с процентами
     */
    virtual domain::Amount balanceOf(domain::AssetId asset, const std::string& account) = 0;
};

} // namespace treasury::ports::output
