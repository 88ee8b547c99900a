#pragma once

#include <string>

namespace issuer::domain {

/**
 * @brief Результат атомарной постановки холда
 *
 * Бизнес-исходы возвращаются значением, а не исключением:
 * инфраструктурные ошибки (таймаут, соединение) пробрасываются отдельно.
 */
enum class HoldOutcome {
    HELD,                  ///< Средства захолдированы, создана авторизация
    DUPLICATE,             ///< Повтор (card, STAN) с теми же параметрами
    INSUFFICIENT_FUNDS,    ///< available_balance < amount
    IDEMPOTENCY_MISMATCH   ///< Повтор STAN с другой суммой или валютой
};

inline std::string toString(HoldOutcome outcome) {
    switch (outcome) {
        case HoldOutcome::HELD:                 return "HELD";
        case HoldOutcome::DUPLICATE:            return "DUPLICATE";
        case HoldOutcome::INSUFFICIENT_FUNDS:   return "INSUFFICIENT_FUNDS";
        case HoldOutcome::IDEMPOTENCY_MISMATCH: return "IDEMPOTENCY_MISMATCH";
    }
    return "UNKNOWN";
}

} // namespace issuer::domain
