#include "domain/ExpiryCalculator.hpp"
#include "domain/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace issuer::domain {

namespace {

std::string twoDigits(int v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d", v);
    return buf;
}

bool allDigits(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

ExpiryCalculator::ExpiryCalculator(ExpirySettings settings)
    : settings_(std::move(settings))
{
    std::map<std::string, int> lowered;
    for (const auto& [product, years] : settings_.productYears) {
        std::string key = product;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        lowered[key] = years;
    }
    settings_.productYears = std::move(lowered);
}

int ExpiryCalculator::yearsForProduct(const std::string& product, int override) const {
    if (override > 0) {
        return override;
    }
    std::string key = product;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = settings_.productYears.find(key);
    if (it != settings_.productYears.end()) {
        return it->second;
    }
    return settings_.defaultYears;
}

ExpiryCalculator::YearMonth ExpiryCalculator::expiryYearMonth(TimePoint issue, int years) const {
    auto local = settings_.zone.localDate(issue);
    return YearMonth{(local.year + years) % 100, local.month};
}

std::string ExpiryCalculator::yymm(TimePoint issue, int years) const {
    auto ym = expiryYearMonth(issue, years);
    return twoDigits(ym.year) + twoDigits(ym.month);
}

std::string ExpiryCalculator::mmyy(TimePoint issue, int years) const {
    auto ym = expiryYearMonth(issue, years);
    return twoDigits(ym.month) + twoDigits(ym.year);
}

std::string ExpiryCalculator::cardFace(TimePoint issue, int years) const {
    auto ym = expiryYearMonth(issue, years);
    return twoDigits(ym.month) + "/" + twoDigits(ym.year);
}

ExpiryCalculator::TimePoint ExpiryCalculator::parseYymmEndOfMonth(const std::string& yymm) const {
    return parseYymmEndOfMonth(yymm, settings_.zone);
}

ExpiryCalculator::TimePoint ExpiryCalculator::parseYymmEndOfMonth(
    const std::string& yymm, const TimeZone& zone) const
{
    validateYymm(yymm);
    int year = 2000 + std::stoi(yymm.substr(0, 2));
    int month = std::stoi(yymm.substr(2, 2));

    // Первое число следующего месяца
    if (++month > 12) {
        month = 1;
        ++year;
    }
    return zone.localMidnight(year, month, 1) - std::chrono::nanoseconds(1);
}

bool ExpiryCalculator::isExpired(const std::string& yymm, TimePoint at) const {
    return isExpired(yymm, at, settings_.zone);
}

bool ExpiryCalculator::isExpired(const std::string& yymm, TimePoint at, const TimeZone& zone) const {
    return at > parseYymmEndOfMonth(yymm, zone);
}

bool ExpiryCalculator::reissueDue(const std::string& yymm, TimePoint at, int windowDays) const {
    return reissueDue(yymm, at, settings_.zone, windowDays);
}

bool ExpiryCalculator::reissueDue(const std::string& yymm, TimePoint at,
                                  const TimeZone& zone, int windowDays) const
{
    const TimePoint end = parseYymmEndOfMonth(yymm, zone);

    // Начало окна: то же локальное время windowDays календарных дней назад
    int year = 2000 + std::stoi(yymm.substr(0, 2));
    int month = std::stoi(yymm.substr(2, 2));
    if (++month > 12) {
        month = 1;
        ++year;
    }
    boost::gregorian::date firstNext(
        static_cast<unsigned short>(year), static_cast<unsigned short>(month), 1);
    const TimePoint start =
        zone.localMidnight(firstNext - boost::gregorian::days(windowDays)) - std::chrono::nanoseconds(1);

    return at >= start && at <= end;
}

std::string ExpiryCalculator::faceImprint(const std::string& yymm, const std::string& cardholderName) {
    validateYymm(yymm);
    std::string face = yymm.substr(2, 2) + "/" + yymm.substr(0, 2);
    if (!cardholderName.empty()) {
        face += " " + cardholderName;
    }
    return face;
}

std::string ExpiryCalculator::parseCardFace(const std::string& face) {
    std::string s;
    for (char c : face) {
        if (c == '/' || std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        s.push_back(c);
    }
    if (s.size() != 4) {
        throw ValidationException("card face must be MM/YY or MMYY");
    }
    if (!allDigits(s)) {
        throw ValidationException("card face must be digits");
    }
    int mm = std::stoi(s.substr(0, 2));
    if (mm < 1 || mm > 12) {
        throw ValidationException("month must be 01..12");
    }
    return s.substr(2, 2) + s.substr(0, 2);
}

void ExpiryCalculator::validateYymm(const std::string& yymm) {
    if (yymm.size() != 4) {
        throw ValidationException("expiry must be YYMM (4 digits)");
    }
    if (!allDigits(yymm)) {
        throw ValidationException("expiry must be digits: YYMM");
    }
    int mm = (yymm[2] - '0') * 10 + (yymm[3] - '0');
    if (mm < 1 || mm > 12) {
        throw ValidationException("expiry month must be 01..12");
    }
}

} // namespace issuer::domain
