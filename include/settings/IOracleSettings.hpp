#pragma once

#include "domain/Amount.hpp"
#include "domain/enums/AssetId.hpp"

namespace treasury::settings {

class IOracleSettings {
public:
    virtual ~IOracleSettings() = default;

    /// Максимальный возраст цены для актива, секунды
    virtual domain::UnixSeconds getMaxAge(domain::AssetId asset) const = 0;
};

} // namespace treasury::settings
