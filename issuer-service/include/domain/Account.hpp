#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace issuer::domain {

/**
 * @brief Счёт держателя карты
 *
 * Суммы хранятся в минорных единицах (центы, копейки).
 *
 * Инварианты:
 * - availableBalance >= 0, holdBalance >= 0
 * - холд атомарно переносит сумму из available в hold
 * - списание и отмена холда атомарно выводят сумму из hold
 */
struct Account {
    std::string id;                ///< UUID счёта
    std::string coreAccountId;     ///< Идентификатор в АБС (совпадает с id для локальных счетов)
    std::string currency;          ///< ISO 4217, верхний регистр
    int64_t availableBalance = 0;  ///< Доступно для авторизаций
    int64_t holdBalance = 0;       ///< Заблокировано под открытые холды
    Timestamp createdAt;

    Account() = default;

    Account(
        const std::string& id,
        const std::string& currency,
        int64_t availableBalance
    ) : id(id), coreAccountId(id), currency(currency),
        availableBalance(availableBalance), holdBalance(0),
        createdAt(Timestamp::now()) {}

    /**
     * @brief Общий баланс = available + hold
     */
    int64_t total() const {
        return availableBalance + holdBalance;
    }
};

} // namespace issuer::domain
