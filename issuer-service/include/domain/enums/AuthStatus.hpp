#pragma once

#include <string>
#include <stdexcept>

namespace issuer::domain {

/**
 * @brief Статус авторизации (холда)
 *
 * AUTHORIZED -> CAPTURED (полное списание)
 * AUTHORIZED -> REVERSED (отмена или истечение холда)
 */
enum class AuthStatus {
    AUTHORIZED,
    CAPTURED,
    REVERSED
};

inline std::string toString(AuthStatus status) {
    switch (status) {
        case AuthStatus::AUTHORIZED: return "AUTHORIZED";
        case AuthStatus::CAPTURED:   return "CAPTURED";
        case AuthStatus::REVERSED:   return "REVERSED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AuthStatus authStatusFromString(const std::string& str) {
    if (str == "AUTHORIZED") return AuthStatus::AUTHORIZED;
    if (str == "CAPTURED")   return AuthStatus::CAPTURED;
    if (str == "REVERSED")   return AuthStatus::REVERSED;
    throw std::invalid_argument("Unknown AuthStatus: " + str);
}

/**
 * @brief Является ли статус финальным
 */
inline bool isFinalStatus(AuthStatus status) {
    return status != AuthStatus::AUTHORIZED;
}

} // namespace issuer::domain
