#pragma once

#include <cstdint>

namespace treasury::domain {

/**
 * @brief Разбиение капитала между волатильным резервом и денежным резервом
 *
 * Сумма всегда равна BASIS (10000).
 */
struct Allocation {
    std::uint64_t volatileBps = 8000;   ///< 80% в волатильный актив
    std::uint64_t cashBps = 2000;       ///< 20% в lending-площадку
};

} // namespace treasury::domain
