#pragma once

#include "enums/CardStatus.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace issuer::domain {

/**
 * @brief Карта в том виде, в каком она хранится в реестре
 *
 * PAN в открытом виде не хранится: только HMAC-хэш (panHash, hex),
 * BIN и последние 4 цифры.
 */
struct Card {
    std::string id;                       ///< UUID карты
    std::string accountId;                ///< FK на accounts
    std::string bin;                      ///< Префикс PAN (6/8/9 цифр)
    std::string last4;                    ///< Последние 4 цифры PAN
    std::string expiryYymm;               ///< Срок действия, YYMM
    CardStatus status = CardStatus::ISSUED;
    std::string panHash;                  ///< HMAC-SHA256(pepper, PAN), hex
    std::optional<std::string> panToken;  ///< Непрозрачный токен (если есть)
    std::optional<std::string> cardholderName;  ///< Имя для эмбоссирования, задаётся после выпуска
    Timestamp createdAt;
};

/**
 * @brief Новая карта для сохранения: PAN передаётся репозиторию один раз,
 * репозиторий сам считает хэш
 */
struct NewCard {
    std::string id;
    std::string accountId;
    std::string bin;          ///< пусто: первые 6 цифр PAN
    std::string pan;
    std::string expiryYymm;
    CardStatus status = CardStatus::ISSUED;
};

/**
 * @brief Результат выпуска карты для клиента
 *
 * Единственное место, где PAN и CVV возвращаются в открытом виде.
 */
struct IssuedCard {
    std::string id;
    std::string accountId;
    std::string pan;
    std::string maskedPan;
    std::string expiryMmyy;   ///< Клиентский формат срока
    std::string cardFace;     ///< MM/YY
    std::string cvv;
    CardStatus status = CardStatus::ISSUED;
};

/**
 * @brief Карта после записи имени держателя и готовая надпись для эмбоссирования
 */
struct EmbossedCard {
    Card card;
    std::string cardFace;     ///< "MM/YY NAME"
};

} // namespace issuer::domain
