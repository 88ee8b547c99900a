#include "domain/TimeZone.hpp"
#include "domain/Exceptions.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>
#include <exception>

namespace issuer::domain {

namespace lt = boost::local_time;
namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

TimeZone::TimeZone(const std::string& posixRule)
    : rule_(posixRule)
{
    if (posixRule.empty()) {
        throw ValidationException("time zone rule is empty");
    }
    try {
        zone_ = boost::make_shared<lt::posix_time_zone>(posixRule);
    } catch (const std::exception& e) {
        throw ValidationException("invalid POSIX time zone '" + posixRule + "': " + e.what());
    }
}

TimeZone::LocalDate TimeZone::localDate(TimePoint at) const {
    auto seconds = std::chrono::floor<std::chrono::seconds>(at).time_since_epoch().count();
    pt::ptime utc = pt::from_time_t(static_cast<std::time_t>(seconds));
    lt::local_date_time local(utc, zone_);
    gr::date d = local.local_time().date();
    return LocalDate{
        static_cast<int>(d.year()),
        static_cast<int>(d.month()),
        static_cast<int>(d.day())
    };
}

TimeZone::TimePoint TimeZone::localMidnight(int year, int month, int day) const {
    try {
        return localMidnight(gr::date(
            static_cast<unsigned short>(year),
            static_cast<unsigned short>(month),
            static_cast<unsigned short>(day)));
    } catch (const std::out_of_range& e) {
        throw ValidationException(std::string("invalid calendar date: ") + e.what());
    }
}

TimeZone::TimePoint TimeZone::localMidnight(const gr::date& date) const {
    lt::local_date_time local(date, pt::time_duration(0, 0, 0), zone_,
                              lt::local_date_time::NOT_DATE_TIME_ON_ERROR);

    pt::ptime utc;
    if (local.is_not_a_date_time()) {
        // Полночь несуществующая или неоднозначная
        utc = pt::ptime(date) - zone_->base_utc_offset();
    } else {
        utc = local.utc_time();
    }

    return std::chrono::system_clock::from_time_t(pt::to_time_t(utc));
}

} // namespace issuer::domain
