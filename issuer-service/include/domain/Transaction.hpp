#pragma once

#include "enums/TransactionStatus.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace issuer::domain {

/**
 * @brief Проводка, создаётся при списании холда. Неизменяема.
 */
struct Transaction {
    std::string id;
    std::string accountId;
    std::string cardId;
    std::optional<std::string> authId;   ///< Ссылка на авторизацию
    int64_t amount = 0;                  ///< != 0
    std::string currency;
    TransactionStatus status = TransactionStatus::CAPTURED;
    std::optional<Timestamp> postedAt;
    Timestamp createdAt;
};

} // namespace issuer::domain
