/**
 * @file ExpiryCalculatorTest.cpp
 * @brief Unit tests for ExpiryCalculator and TimeZone
 */

#include <gtest/gtest.h>
#include "domain/ExpiryCalculator.hpp"
#include "domain/Exceptions.hpp"

using namespace issuer::domain;
using namespace std::chrono;

namespace {

system_clock::time_point utcAt(int y, int m, int d, int hh = 0, int mm = 0) {
    return TimeZone::utc().localMidnight(y, m, d) + hours(hh) + minutes(mm);
}

} // namespace

class ExpiryCalculatorTest : public ::testing::Test {
protected:
    ExpiryCalculator calc_;
};

// ============================================================================
// FORMATTING
// ============================================================================

TEST_F(ExpiryCalculatorTest, Format_OneYear) {
    auto issue = utcAt(2029, 12, 15, 10);
    EXPECT_EQ(calc_.yymm(issue, 1), "3012");
    EXPECT_EQ(calc_.mmyy(issue, 1), "1230");
    EXPECT_EQ(calc_.cardFace(issue, 1), "12/30");
}

TEST_F(ExpiryCalculatorTest, Format_LeapDayIssue) {
    auto issue = utcAt(2028, 2, 29, 12);
    EXPECT_EQ(calc_.yymm(issue, 3), "3102");
}

TEST_F(ExpiryCalculatorTest, Format_UsesLocalDate) {
    ExpirySettings settings;
    settings.zone = TimeZone("MSK+3");
    ExpiryCalculator msk(settings);

    // 22:00 UTC 31 декабря = 01:00 MSK 1 января
    auto issue = utcAt(2029, 12, 31, 22);
    EXPECT_EQ(calc_.yymm(issue, 1), "3012");
    EXPECT_EQ(msk.yymm(issue, 1), "3101");
}

// ============================================================================
// PRODUCT YEARS
// ============================================================================

TEST_F(ExpiryCalculatorTest, YearsForProduct_Defaults) {
    EXPECT_EQ(calc_.yearsForProduct("credit"), 3);
    EXPECT_EQ(calc_.yearsForProduct("CREDIT"), 3);
    EXPECT_EQ(calc_.yearsForProduct("debit"), 5);
    EXPECT_EQ(calc_.yearsForProduct("prepaid"), 5);
}

TEST_F(ExpiryCalculatorTest, YearsForProduct_OverrideWins) {
    EXPECT_EQ(calc_.yearsForProduct("credit", 7), 7);
    EXPECT_EQ(calc_.yearsForProduct("credit", 0), 3);
    EXPECT_EQ(calc_.yearsForProduct("credit", -1), 3);
}

TEST_F(ExpiryCalculatorTest, YearsForProduct_CustomTable) {
    ExpirySettings settings;
    settings.productYears = {{"Prepaid", 2}};
    settings.defaultYears = 4;
    ExpiryCalculator custom(settings);

    EXPECT_EQ(custom.yearsForProduct("prepaid"), 2);
    EXPECT_EQ(custom.yearsForProduct("credit"), 4);
}

// ============================================================================
// END OF MONTH / EXPIRY
// ============================================================================

TEST_F(ExpiryCalculatorTest, EndOfMonth_February) {
    EXPECT_EQ(calc_.parseYymmEndOfMonth("3002"), utcAt(2030, 3, 1) - nanoseconds(1));
    EXPECT_EQ(calc_.parseYymmEndOfMonth("2902"), utcAt(2029, 3, 1) - nanoseconds(1));
}

TEST_F(ExpiryCalculatorTest, EndOfMonth_December) {
    EXPECT_EQ(calc_.parseYymmEndOfMonth("3012"), utcAt(2031, 1, 1) - nanoseconds(1));
}

TEST_F(ExpiryCalculatorTest, IsExpired_Boundary) {
    auto end = calc_.parseYymmEndOfMonth("3002");
    EXPECT_FALSE(calc_.isExpired("3002", end));
    EXPECT_TRUE(calc_.isExpired("3002", end + nanoseconds(1)));
    EXPECT_FALSE(calc_.isExpired("3002", utcAt(2030, 2, 28, 23, 59)));
    EXPECT_TRUE(calc_.isExpired("3002", utcAt(2030, 3, 1)));
}

TEST_F(ExpiryCalculatorTest, IsExpired_RespectsZone) {
    TimeZone msk("MSK+3");

    // Конец 3004 в MSK: 2030-05-01 00:00 MSK = 2030-04-30 21:00 UTC
    EXPECT_EQ(calc_.parseYymmEndOfMonth("3004", msk), utcAt(2030, 4, 30, 21) - nanoseconds(1));
    EXPECT_FALSE(calc_.isExpired("3004", utcAt(2030, 4, 30, 20, 59), msk));
    EXPECT_TRUE(calc_.isExpired("3004", utcAt(2030, 4, 30, 21), msk));
    EXPECT_FALSE(calc_.isExpired("3004", utcAt(2030, 4, 30, 22)));
}

TEST_F(ExpiryCalculatorTest, IsExpired_PastCard) {
    EXPECT_TRUE(calc_.isExpired("2001", system_clock::now()));
    EXPECT_FALSE(calc_.isExpired("9912", system_clock::now()));
}

TEST_F(ExpiryCalculatorTest, InvalidYymm_Throws) {
    EXPECT_THROW(calc_.parseYymmEndOfMonth("0000"), ValidationException);
    EXPECT_THROW(calc_.parseYymmEndOfMonth("3013"), ValidationException);
    EXPECT_THROW(calc_.parseYymmEndOfMonth("30a1"), ValidationException);
    EXPECT_THROW(calc_.parseYymmEndOfMonth("301"), ValidationException);
    EXPECT_THROW(calc_.isExpired("3000", system_clock::now()), ValidationException);
}

// ============================================================================
// REISSUE WINDOW
// ============================================================================

TEST_F(ExpiryCalculatorTest, ReissueDue_Window) {
    EXPECT_FALSE(calc_.reissueDue("3012", utcAt(2030, 12, 1, 12), 30));
    EXPECT_TRUE(calc_.reissueDue("3012", utcAt(2030, 12, 2), 30));
    EXPECT_TRUE(calc_.reissueDue("3012", calc_.parseYymmEndOfMonth("3012"), 30));
    EXPECT_FALSE(calc_.reissueDue("3012", utcAt(2031, 1, 1), 30));
}

// ============================================================================
// CARD FACE
// ============================================================================

TEST_F(ExpiryCalculatorTest, ParseCardFace) {
    EXPECT_EQ(ExpiryCalculator::parseCardFace("10/30"), "3010");
    EXPECT_EQ(ExpiryCalculator::parseCardFace("1030"), "3010");
    EXPECT_EQ(ExpiryCalculator::parseCardFace(" 01 / 29 "), "2901");
}

TEST_F(ExpiryCalculatorTest, ParseCardFace_Invalid) {
    EXPECT_THROW(ExpiryCalculator::parseCardFace("13/30"), ValidationException);
    EXPECT_THROW(ExpiryCalculator::parseCardFace("00/30"), ValidationException);
    EXPECT_THROW(ExpiryCalculator::parseCardFace("1/30"), ValidationException);
    EXPECT_THROW(ExpiryCalculator::parseCardFace("ab/cd"), ValidationException);
}

TEST_F(ExpiryCalculatorTest, FaceImprint) {
    EXPECT_EQ(ExpiryCalculator::faceImprint("3012"), "12/30");
    EXPECT_EQ(ExpiryCalculator::faceImprint("2901", "JOHN DOE"), "01/29 JOHN DOE");
    EXPECT_THROW(ExpiryCalculator::faceImprint("3013", "JOHN DOE"), ValidationException);
}

// ============================================================================
// TIME ZONE
// ============================================================================

TEST(TimeZoneTest, Utc_Midnight) {
    auto midnight = TimeZone::utc().localMidnight(1970, 1, 2);
    EXPECT_EQ(duration_cast<seconds>(midnight.time_since_epoch()).count(), 86400);
}

TEST(TimeZoneTest, Dst_OffsetsDiffer) {
    TimeZone eastern("EST-5EDT,M3.2.0,M11.1.0");

    EXPECT_EQ(eastern.localMidnight(2030, 1, 1), utcAt(2030, 1, 1, 5));
    EXPECT_EQ(eastern.localMidnight(2029, 7, 1), utcAt(2029, 7, 1, 4));
}

TEST(TimeZoneTest, LocalDate_CrossesDay) {
    TimeZone msk("MSK+3");
    auto date = msk.localDate(utcAt(2029, 12, 31, 22));
    EXPECT_EQ(date.year, 2030);
    EXPECT_EQ(date.month, 1);
    EXPECT_EQ(date.day, 1);
}

TEST(TimeZoneTest, EmptyRule_Throws) {
    EXPECT_THROW(TimeZone(""), ValidationException);
}
