#pragma once

#include "enums/AuthStatus.hpp"
#include "enums/HoldOutcome.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace issuer::domain {

/**
 * @brief Авторизация (холд средств)
 *
 * Не более одной строки на (cardId, stan), если stan задан.
 * Строка меняется ровно один раз: списание, отмена или истечение.
 */
struct Authorization {
    std::string id;
    std::string accountId;
    std::string cardId;
    int64_t amount = 0;                       ///< > 0, минорные единицы
    std::string currency;
    AuthStatus status = AuthStatus::AUTHORIZED;
    std::string approvalCode;
    std::string authorizationCode;
    std::optional<int> stan;                  ///< System Trace Audit Number (DE11)
    std::string merchantName;
    std::string mcc;
    std::optional<Timestamp> holdExpiresAt;
    Timestamp createdAt;
};

/**
 * @brief Параметры атомарной постановки холда
 */
struct HoldRequest {
    std::string accountId;
    std::string cardId;
    int64_t amount = 0;
    std::string currency;
    std::string approvalCode;
    std::string authorizationCode;
    std::string merchantName;
    std::string mcc;
    std::optional<int> stan;
    std::optional<Timestamp> holdExpiresAt;
};

/**
 * @brief Результат постановки холда
 *
 * При DUPLICATE коды взяты из ранее сохранённой авторизации.
 */
struct HoldResult {
    HoldOutcome outcome = HoldOutcome::HELD;
    std::string authId;
    std::string approvalCode;
    std::string authorizationCode;

    bool isDuplicate() const { return outcome == HoldOutcome::DUPLICATE; }

    bool isSuccess() const {
        return outcome == HoldOutcome::HELD || outcome == HoldOutcome::DUPLICATE;
    }
};

} // namespace issuer::domain
