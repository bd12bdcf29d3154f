#pragma once

#include <stdexcept>
#include <string>

namespace treasury::domain {

/**
 * @brief Коды ошибок казначейского хранилища
 *
 * Каждый отказ имеет собственный код, чтобы внешний мониторинг мог
 * отличить "подождать и повторить" (EpochNotElapsed) от "позвать человека"
 * (CircuitBreakerActive).
 */
enum class ErrorCode {
    // ValidationError
    ZeroAmount,
    ZeroShares,
    DepositTooSmall,
    DepositTooLarge,
    DepositCapExceeded,
    InvalidParameter,
    InvalidRecipient,

    // StateError
    EpochNotElapsed,
    MintingPaused,
    RedeemingPaused,
    CircuitBreakerActive,
    InsufficientReserve,
    InsufficientShares,
    InsufficientLiquidity,
    InsufficientBalance,
    Unauthorized,
    Reentrancy,
    StrategyNotSet,

    // OracleError
    StalePrice,
    InvalidPrice,
    PriceUnavailable,

    // ExecutionError
    SlippageExceeded,
    DeadlineExpired,
    VenueFailure,
    ArithmeticOverflow
};

/**
 * @brief Категория ошибки (таксономия отказов)
 */
enum class ErrorCategory {
    VALIDATION,
    STATE,
    ORACLE,
    EXECUTION
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::ZeroAmount:            return "ZeroAmount";
        case ErrorCode::ZeroShares:            return "ZeroShares";
        case ErrorCode::DepositTooSmall:       return "DepositTooSmall";
        case ErrorCode::DepositTooLarge:       return "DepositTooLarge";
        case ErrorCode::DepositCapExceeded:    return "DepositCapExceeded";
        case ErrorCode::InvalidParameter:      return "InvalidParameter";
        case ErrorCode::InvalidRecipient:      return "InvalidRecipient";
        case ErrorCode::EpochNotElapsed:       return "EpochNotElapsed";
        case ErrorCode::MintingPaused:         return "MintingPaused";
        case ErrorCode::RedeemingPaused:       return "RedeemingPaused";
        case ErrorCode::CircuitBreakerActive:  return "CircuitBreakerActive";
        case ErrorCode::InsufficientReserve:   return "InsufficientReserve";
        case ErrorCode::InsufficientShares:    return "InsufficientShares";
        case ErrorCode::InsufficientLiquidity: return "InsufficientLiquidity";
        case ErrorCode::InsufficientBalance:   return "InsufficientBalance";
        case ErrorCode::Unauthorized:          return "Unauthorized";
        case ErrorCode::Reentrancy:            return "Reentrancy";
        case ErrorCode::StrategyNotSet:        return "StrategyNotSet";
        case ErrorCode::StalePrice:            return "StalePrice";
        case ErrorCode::InvalidPrice:          return "InvalidPrice";
        case ErrorCode::PriceUnavailable:      return "PriceUnavailable";
        case ErrorCode::SlippageExceeded:      return "SlippageExceeded";
        case ErrorCode::DeadlineExpired:       return "DeadlineExpired";
        case ErrorCode::VenueFailure:          return "VenueFailure";
        case ErrorCode::ArithmeticOverflow:    return "ArithmeticOverflow";
    }
    return "Unknown";
}

inline std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION: return "VALIDATION";
        case ErrorCategory::STATE:      return "STATE";
        case ErrorCategory::ORACLE:     return "ORACLE";
        case ErrorCategory::EXECUTION:  return "EXECUTION";
    }
    return "UNKNOWN";
}

/**
 * @brief Базовое исключение казначейства
 *
 * Любой отказ ограничен вызвавшей его операцией: состояние до вызова
 * остаётся неизменным.
 */
class TreasuryError : public std::runtime_error {
public:
    TreasuryError(ErrorCode code, const std::string& message)
        : std::runtime_error(toString(code) + ": " + message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

    virtual ErrorCategory category() const = 0;

private:
    ErrorCode code_;
};

/**
 * @brief Неверный параметр, нарушение лимита, нулевая сумма
 */
class ValidationError : public TreasuryError {
public:
    using TreasuryError::TreasuryError;
    ErrorCategory category() const override { return ErrorCategory::VALIDATION; }
};

/**
 * @brief Операция недопустима в текущем состоянии (пауза, эпоха, предохранитель)
 */
class StateError : public TreasuryError {
public:
    using TreasuryError::TreasuryError;
    ErrorCategory category() const override { return ErrorCategory::STATE; }
};

/**
 * @brief Устаревшая или некорректная цена оракула
 */
class OracleError : public TreasuryError {
public:
    using TreasuryError::TreasuryError;
    ErrorCategory category() const override { return ErrorCategory::ORACLE; }
};

/**
 * @brief Сбой внешней площадки (swap, lending) или арифметики
 */
class ExecutionError : public TreasuryError {
public:
    using TreasuryError::TreasuryError;
    ErrorCategory category() const override { return ErrorCategory::EXECUTION; }
};

} // namespace treasury::domain
