#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace issuer::domain {

/**
 * @brief Данные карты из запроса на авторизацию
 */
struct CardData {
    std::string pan;
    std::string expiryYymm;
    std::string cvv;
};

struct Merchant {
    std::string name;
    std::string mcc;
};

/**
 * @brief Запрос на авторизацию от транспортного слоя (HTTP / ISO 8583)
 */
struct AuthorizationRequest {
    int64_t amount = 0;
    std::string currency;
    CardData card;
    Merchant merchant;
    std::optional<int> stan;   ///< Ключ идемпотентности, nullopt если не передан
};

/**
 * @brief Ответ на авторизацию
 *
 * Отказ передаётся кодом ответа, а не исключением.
 */
struct AuthorizationResponse {
    std::string authorizationCode;
    std::string approvalCode;
};

/**
 * @brief Запрос на открытие счёта
 */
struct CreateAccountRequest {
    int64_t balance = 0;
    std::string currency;
};

} // namespace issuer::domain
