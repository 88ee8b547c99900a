#pragma once

#include <string>
#include <stdexcept>

namespace issuer::domain {

/**
 * @brief Жизненный цикл карты
 */
enum class CardStatus {
    ISSUED,   ///< Выпущена, ещё не активирована
    ACTIVE,   ///< Активна
    FROZEN,   ///< Временно заморожена держателем
    LOST,     ///< Утеряна
    STOLEN,   ///< Украдена
    CLOSED    ///< Закрыта
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(CardStatus status) {
    switch (status) {
        case CardStatus::ISSUED: return "ISSUED";
        case CardStatus::ACTIVE: return "ACTIVE";
        case CardStatus::FROZEN: return "FROZEN";
        case CardStatus::LOST:   return "LOST";
        case CardStatus::STOLEN: return "STOLEN";
        case CardStatus::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline CardStatus cardStatusFromString(const std::string& str) {
    if (str == "ISSUED") return CardStatus::ISSUED;
    if (str == "ACTIVE") return CardStatus::ACTIVE;
    if (str == "FROZEN") return CardStatus::FROZEN;
    if (str == "LOST")   return CardStatus::LOST;
    if (str == "STOLEN") return CardStatus::STOLEN;
    if (str == "CLOSED") return CardStatus::CLOSED;
    throw std::invalid_argument("Unknown CardStatus: " + str);
}

/**
 * @brief Можно ли авторизовать операцию по карте в данном статусе
 */
inline bool canAuthorize(CardStatus status) {
    return status == CardStatus::ISSUED || status == CardStatus::ACTIVE;
}

} // namespace issuer::domain
