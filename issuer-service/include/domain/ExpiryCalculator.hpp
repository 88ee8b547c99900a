#pragma once

#include "domain/TimeZone.hpp"
#include <chrono>
#include <map>
#include <string>

namespace issuer::domain {

/**
 * @brief Конфигурация расчёта срока действия карт
 *
 * Передаётся в конструктор ExpiryCalculator явно, глобального состояния нет.
 */
struct ExpirySettings {
    TimeZone zone = TimeZone::utc();
    std::map<std::string, int> productYears{{"credit", 3}, {"debit", 5}};  ///< ключи в нижнем регистре
    int defaultYears = 5;
};

/**
 * @brief Срок действия карты: выпуск + N лет → YYMM / MMYY / MM/YY,
 * конец месяца, проверка истечения и окна перевыпуска
 *
 * Карта действует до последней наносекунды месяца YYMM в настроенном поясе.
 */
class ExpiryCalculator {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit ExpiryCalculator(ExpirySettings settings = {});

    /**
     * @brief Срок действия продукта в годах
     *
     * override > 0 побеждает, затем таблица продуктов (без учёта регистра),
     * затем defaultYears.
     */
    int yearsForProduct(const std::string& product, int override = 0) const;

    std::string yymm(TimePoint issue, int years) const;
    std::string mmyy(TimePoint issue, int years) const;
    std::string cardFace(TimePoint issue, int years) const;

    /**
     * @brief Последний момент месяца YYMM: полночь первого числа следующего
     * месяца минус 1 нс
     * @throws ValidationException
     */
    TimePoint parseYymmEndOfMonth(const std::string& yymm) const;
    TimePoint parseYymmEndOfMonth(const std::string& yymm, const TimeZone& zone) const;

    /**
     * @brief at строго позже конца месяца
     */
    bool isExpired(const std::string& yymm, TimePoint at) const;
    bool isExpired(const std::string& yymm, TimePoint at, const TimeZone& zone) const;

    /**
     * @brief at в [end - windowDays, end] включительно
     */
    bool reissueDue(const std::string& yymm, TimePoint at, int windowDays) const;
    bool reissueDue(const std::string& yymm, TimePoint at, const TimeZone& zone, int windowDays) const;

    /**
     * @brief "MM/YY" или "MMYY" → YYMM
     * @throws ValidationException
     */
    static std::string parseCardFace(const std::string& face);

    /**
     * @brief Надпись на лицевой стороне: "MM/YY" и имя держателя через пробел
     * @throws ValidationException
     */
    static std::string faceImprint(const std::string& yymm, const std::string& cardholderName = "");

    /**
     * @throws ValidationException если не 4 цифры или месяц вне 01..12
     */
    static void validateYymm(const std::string& yymm);

    const TimeZone& zone() const { return settings_.zone; }

private:
    struct YearMonth {
        int year;   ///< yy, 0..99
        int month;  ///< 1..12
    };

    YearMonth expiryYearMonth(TimePoint issue, int years) const;

    ExpirySettings settings_;
};

} // namespace issuer::domain
