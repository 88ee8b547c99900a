#pragma once

#include <boost/date_time/local_time/local_time.hpp>
#include <chrono>
#include <string>

namespace issuer::domain {

/**
 * @brief Часовой пояс по POSIX TZ правилу ("UTC0", "MSK+3",
 * "AEST+10AEDT,M10.1.0,M4.1.0/3")
 *
 * Знак смещения как в boost::local_time: восток от UTC положительный,
 * в отличие от переменной TZ.
 *
 * Обёртка над boost::local_time::posix_time_zone: правила перехода на летнее
 * время учитываются без изменения глобальной переменной TZ.
 */
class TimeZone {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    struct LocalDate {
        int year = 1970;
        int month = 1;
        int day = 1;
    };

    /**
     * @throws ValidationException если правило не разбирается
     */
    explicit TimeZone(const std::string& posixRule = "UTC0");

    static TimeZone utc() { return TimeZone("UTC0"); }

    const std::string& rule() const { return rule_; }

    /**
     * @brief Локальная календарная дата момента времени
     */
    LocalDate localDate(TimePoint at) const;

    /**
     * @brief UTC-момент локальной полуночи указанной даты
     *
     * Если полночь попадает в переход на летнее время, используется
     * стандартное смещение пояса.
     */
    TimePoint localMidnight(int year, int month, int day) const;

    /**
     * @brief То же, для boost-даты (удобно для календарной арифметики)
     */
    TimePoint localMidnight(const boost::gregorian::date& date) const;

private:
    std::string rule_;
    boost::local_time::time_zone_ptr zone_;
};

} // namespace issuer::domain
