#pragma once

#include <string>
#include <stdexcept>

namespace issuer::domain {

/**
 * @brief Статус проводки
 */
enum class TransactionStatus {
    CAPTURED,  ///< Списание по холду
    POSTED     ///< Проведена в учёте
};

inline std::string toString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::CAPTURED: return "CAPTURED";
        case TransactionStatus::POSTED:   return "POSTED";
    }
    return "UNKNOWN";
}

inline TransactionStatus transactionStatusFromString(const std::string& str) {
    if (str == "CAPTURED") return TransactionStatus::CAPTURED;
    if (str == "POSTED")   return TransactionStatus::POSTED;
    throw std::invalid_argument("Unknown TransactionStatus: " + str);
}

} // namespace issuer::domain
