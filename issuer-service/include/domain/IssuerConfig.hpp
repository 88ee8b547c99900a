#pragma once

#include <cstdint>
#include <string>

namespace issuer::domain {

/**
 * @brief Параметры выпуска карт и авторизаций для IssuerService
 */
struct IssuerConfig {
    std::string binPrefix = "421234";      ///< некорректный BIN заменяется на 421234
    std::string cardProduct = "debit";
    int64_t holdTtlSeconds = 604800;       ///< 7 дней
    int dcvvStepSeconds = 30;
};

} // namespace issuer::domain
