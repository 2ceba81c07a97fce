#include <limits>

#include <gtest/gtest.h>
#include <tempo.hpp>

using namespace tempo::detail;

class TimeMathTest : public ::testing::Test {
protected:
    static constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();
    static constexpr int64_t I64_MAX = std::numeric_limits<int64_t>::max();
    static constexpr int64_t I64_MIN = std::numeric_limits<int64_t>::min();
};

// ==============================================================================
// Checked Arithmetic
// ==============================================================================

TEST_F(TimeMathTest, CheckedUnsigned) {
    EXPECT_EQ(checked_mul(uint64_t{6}, uint64_t{7}), 42U);
    EXPECT_EQ(checked_add(U64_MAX - 1, uint64_t{1}), U64_MAX);
    EXPECT_FALSE(checked_add(U64_MAX, uint64_t{1}).has_value());
    EXPECT_FALSE(checked_mul(U64_MAX / 2 + 1, uint64_t{2}).has_value());
}

TEST_F(TimeMathTest, CheckedSigned) {
    EXPECT_EQ(checked_mul(int64_t{-6}, int64_t{7}), -42);
    EXPECT_FALSE(checked_add(I64_MAX, int64_t{1}).has_value());
    EXPECT_FALSE(checked_add(I64_MIN, int64_t{-1}).has_value());
    EXPECT_FALSE(checked_mul(I64_MIN, int64_t{-1}).has_value());
}

TEST_F(TimeMathTest, CarryNanos) {
    auto carried = carry_nanos(5, 2'500'000'000ULL);
    ASSERT_TRUE(carried.has_value());
    EXPECT_EQ(carried->first, 7U);
    EXPECT_EQ(carried->second, 500'000'000U);

    EXPECT_FALSE(carry_nanos(U64_MAX, NANOS_PER_SEC).has_value());
    EXPECT_TRUE(carry_nanos(U64_MAX, NANOS_PER_SEC - 1).has_value());
}

// ==============================================================================
// Floor Division
// ==============================================================================

TEST_F(TimeMathTest, FloorDivMod) {
    EXPECT_EQ(floor_div(7, 2), 3);
    EXPECT_EQ(floor_div(-7, 2), -4);
    EXPECT_EQ(floor_mod(-7, 2), 1);
    EXPECT_EQ(floor_div(-86'400, 86'400), -1);
    EXPECT_EQ(floor_mod(-86'400, 86'400), 0);
    EXPECT_EQ(floor_mod(-1, 86'400), 86'399);
}

TEST_F(TimeMathTest, FloorModExtremes) {
    EXPECT_EQ(floor_div(I64_MIN, 86'400), -106'751'991'167'301);
    EXPECT_EQ(floor_mod(I64_MIN, 86'400), 30'592);
    EXPECT_EQ(floor_div(I64_MAX, 86'400), 106'751'991'167'300);
    EXPECT_EQ(floor_mod(I64_MAX, 86'400), 55'807);
}

// ==============================================================================
// Calendar
// ==============================================================================

TEST_F(TimeMathTest, LeapYears) {
    EXPECT_TRUE(is_leap_year(2000));
    EXPECT_TRUE(is_leap_year(2016));
    EXPECT_FALSE(is_leap_year(1900));
    EXPECT_FALSE(is_leap_year(2015));
    EXPECT_TRUE(is_leap_year(0));
    EXPECT_TRUE(is_leap_year(-4));

    EXPECT_EQ(days_in_month(2016, 2), 29U);
    EXPECT_EQ(days_in_month(2015, 2), 28U);
    EXPECT_EQ(days_in_month(2015, 4), 30U);
    EXPECT_EQ(days_in_month(2015, 12), 31U);
}

TEST_F(TimeMathTest, DaysFromCivil) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11'017);
    EXPECT_EQ(days_from_civil(2018, 10, 11), 17'815);
    EXPECT_EQ(days_from_civil(10000, 1, 1), 2'932'897);
}

TEST_F(TimeMathTest, CivilFromDaysInverts) {
    for (int64_t days : {int64_t{-719'468}, int64_t{-1}, int64_t{0}, int64_t{11'017},
                         int64_t{17'815}, int64_t{2'932'897}, int64_t{106'751'991'167'300},
                         int64_t{-106'751'991'167'301}}) {
        const CivilDate date = civil_from_days(days);
        EXPECT_EQ(days_from_civil(date.year, date.month, date.day), days) << "days " << days;
    }

    const CivilDate epoch = civil_from_days(0);
    EXPECT_EQ(epoch.year, 1970);
    EXPECT_EQ(epoch.month, 1U);
    EXPECT_EQ(epoch.day, 1U);

    const CivilDate year_zero = civil_from_days(-719'468);
    EXPECT_EQ(year_zero.year, 0);
    EXPECT_EQ(year_zero.month, 3U);
    EXPECT_EQ(year_zero.day, 1U);
}
