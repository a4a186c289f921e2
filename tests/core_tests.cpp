#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "datatypes.hpp"
#include "exceptions.hpp"
#include "price_series.hpp"
#include "utils.hpp"
#include "test_support.hpp"

using test_support::day;
using test_support::makeBar;

// --- utils ---

TEST(UtilsTest, ParsesDateOnlyAsMidnightUtc) {
    auto ts = core::utils::stringToTimestamp("2024-01-01");
    EXPECT_EQ(core::utils::toEpochSeconds(ts), 1704067200);
    EXPECT_EQ(core::utils::timestampToString(ts), "2024-01-01T00:00:00Z");
}

TEST(UtilsTest, ParsesDateTimeWithZuluAndSpaceSeparator) {
    auto a = core::utils::stringToTimestamp("2024-03-05T14:30:00Z");
    auto b = core::utils::stringToTimestamp("2024-03-05 14:30:00");
    EXPECT_EQ(a, b);
    EXPECT_EQ(core::utils::timestampToString(a), "2024-03-05T14:30:00Z");
}

TEST(UtilsTest, AppliesTimezoneOffset) {
    auto local = core::utils::stringToTimestamp("2024-01-01T05:30:00+05:30");
    auto utc = core::utils::stringToTimestamp("2024-01-01T00:00:00Z");
    EXPECT_EQ(local, utc);

    auto west = core::utils::stringToTimestamp("2023-12-31T19:00:00-05:00");
    EXPECT_EQ(west, utc);
}

TEST(UtilsTest, KeepsFractionalSeconds) {
    auto ts = core::utils::stringToTimestamp("2024-01-01T00:00:00.250Z");
    auto base = core::utils::stringToTimestamp("2024-01-01T00:00:00Z");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(ts - base).count(), 250);
}

TEST(UtilsTest, RejectsGarbage) {
    EXPECT_THROW(core::utils::stringToTimestamp("not a date"), std::runtime_error);
    EXPECT_THROW(core::utils::stringToTimestamp("2024-01-01T10:00:00X"), std::runtime_error);
}

TEST(UtilsTest, EpochRoundTripAndDateString) {
    auto ts = core::utils::fromEpochSeconds(1704067200 + 86400 * 31);
    EXPECT_EQ(core::utils::toEpochSeconds(ts), 1704067200 + 86400 * 31);
    EXPECT_EQ(core::utils::timestampToDateString(ts), "2024-02-01");
}

TEST(UtilsTest, YearsBetweenUsesJulianYear) {
    auto start = day(0);
    auto end = start + std::chrono::hours(24) * 365 + std::chrono::hours(6);
    EXPECT_NEAR(core::utils::yearsBetween(start, end), 1.0, 1e-12);
    EXPECT_LT(core::utils::yearsBetween(end, start), 0.0);
}

// --- datatypes ---

TEST(DatatypesTest, ExitReasonNamesRoundTrip) {
    for (auto reason : {core::ExitReason::Signal, core::ExitReason::StopLoss,
                        core::ExitReason::TakeProfit, core::ExitReason::EndOfData}) {
        EXPECT_EQ(core::exitReasonFromString(core::toString(reason)), reason);
    }
    EXPECT_EQ(core::toString(core::ExitReason::EndOfData), "end_of_data");
    EXPECT_THROW(core::exitReasonFromString("margin_call"), std::invalid_argument);
}

TEST(DatatypesTest, SignalFactoriesCarryNoLevels) {
    auto s = core::Signal::enterShort();
    EXPECT_EQ(s.action, core::SignalAction::EnterShort);
    EXPECT_FALSE(s.stop_loss_price.has_value());
    EXPECT_FALSE(s.take_profit_price.has_value());
    EXPECT_EQ(core::Signal::hold().action, core::SignalAction::Hold);
}

// --- exceptions ---

TEST(ExceptionsTest, CarryStructuredContext) {
    core::InsufficientDataError insufficient(50, 20);
    EXPECT_EQ(insufficient.requiredBars(), 50u);
    EXPECT_EQ(insufficient.availableBars(), 20u);
    EXPECT_NE(std::string(insufficient.what()).find("50"), std::string::npos);

    core::InvalidParameterError invalid("fast_period", "must be below slow_period");
    EXPECT_EQ(invalid.parameter(), "fast_period");

    core::DataIntegrityError integrity(7, "bad bar");
    EXPECT_EQ(integrity.barIndex(), 7u);

    const core::BacktesterException& base = integrity;
    EXPECT_NE(std::string(base.what()).find("bar 7"), std::string::npos);
}

// --- PriceSeries / BarWindow ---

class PriceSeriesTest : public ::testing::Test {
protected:
    core::PriceSeries series_ = test_support::seriesFromCloses({10.0, 11.0, 12.0, 13.0, 14.0}, "BTC-USD", "1d");
};

TEST_F(PriceSeriesTest, WindowExposesOnlyBarsUpToIndex) {
    auto window = series_.windowUpTo(2);
    EXPECT_EQ(window.size(), 3u);
    EXPECT_DOUBLE_EQ(window.back().close, 12.0);
    EXPECT_THROW(window.at(3), std::out_of_range);
    EXPECT_THROW(series_.windowUpTo(5), std::out_of_range);
}

TEST_F(PriceSeriesTest, WindowClosesAndTail) {
    auto window = series_.windowUpTo(4);
    EXPECT_EQ(window.closes(2), (std::vector<double>{13.0, 14.0}));
    EXPECT_EQ(window.closes().size(), 5u);

    auto tail = window.tail(3);
    EXPECT_EQ(tail.size(), 3u);
    EXPECT_DOUBLE_EQ(tail[0].close, 12.0);
    EXPECT_EQ(window.tail(10).size(), 5u);
}

TEST_F(PriceSeriesTest, ValidSeriesPassesValidation) {
    EXPECT_NO_THROW(series_.validate());
    EXPECT_NO_THROW(core::PriceSeries().validate());
}

TEST_F(PriceSeriesTest, SliceIsInclusive) {
    auto sliced = series_.slice(day(1), day(3));
    ASSERT_EQ(sliced.size(), 3u);
    EXPECT_DOUBLE_EQ(sliced[0].close, 11.0);
    EXPECT_DOUBLE_EQ(sliced[2].close, 13.0);
    EXPECT_EQ(sliced.getSymbol(), "BTC-USD");
    EXPECT_EQ(sliced.getInterval(), "1d");
}

TEST(PriceSeriesValidationTest, RejectsNonIncreasingTimestamps) {
    auto series = test_support::seriesFromBars({
        makeBar(0, 10, 10, 10, 10),
        makeBar(1, 10, 10, 10, 10),
        makeBar(1, 10, 10, 10, 10)});
    try {
        series.validate();
        FAIL() << "Expected DataIntegrityError";
    } catch (const core::DataIntegrityError& e) {
        EXPECT_EQ(e.barIndex(), 2u);
    }
}

TEST(PriceSeriesValidationTest, RejectsNanAndNonPositivePrices) {
    auto nan_series = test_support::seriesFromBars({
        makeBar(0, 10, 10, 10, 10),
        makeBar(1, 10, 10, 10, std::numeric_limits<double>::quiet_NaN())});
    EXPECT_THROW(nan_series.validate(), core::DataIntegrityError);

    auto zero_series = test_support::seriesFromBars({makeBar(0, 0.0, 10, 1, 5)});
    EXPECT_THROW(zero_series.validate(), core::DataIntegrityError);
}

TEST(PriceSeriesValidationTest, RejectsInvertedRangeAndNegativeVolume) {
    auto inverted = test_support::seriesFromBars({makeBar(0, 10, 9, 11, 10)});
    EXPECT_THROW(inverted.validate(), core::DataIntegrityError);

    auto negative_volume = test_support::seriesFromBars({makeBar(0, 10, 11, 9, 10, -1.0)});
    EXPECT_THROW(negative_volume.validate(), core::DataIntegrityError);
}
