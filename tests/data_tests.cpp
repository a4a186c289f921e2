#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "exceptions.hpp"
#include "csv_bar_reader.hpp"
#include "bar_cache.hpp"
#include "test_support.hpp"

using data::BarCache;
using data::CsvBarReader;
using data::CsvReadOptions;
using test_support::day;

namespace {

    core::PriceSeries readString(const std::string& text, CsvReadOptions options = {}) {
        std::istringstream in(text);
        return CsvBarReader(options).read(in, "SYM", "1d", "mem");
    }

} // namespace

// --- CSV ---

TEST(CsvBarReaderTest, ReadsHeaderInAnyOrderAndCase) {
    auto series = readString(
        "Close,Volume,DATE,Open,High,Low\n"
        "101.5,2000,2024-01-01,100,102,99\n"
        "103,2500,2024-01-02,101.5,104,101\n");

    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.getSymbol(), "SYM");
    EXPECT_EQ(series.getInterval(), "1d");
    EXPECT_EQ(series[0].timestamp, day(0));
    EXPECT_DOUBLE_EQ(series[0].open, 100.0);
    EXPECT_DOUBLE_EQ(series[0].high, 102.0);
    EXPECT_DOUBLE_EQ(series[0].low, 99.0);
    EXPECT_DOUBLE_EQ(series[0].close, 101.5);
    EXPECT_DOUBLE_EQ(series[0].volume, 2000.0);
    EXPECT_EQ(series[1].timestamp, day(1));
    EXPECT_DOUBLE_EQ(series[1].close, 103.0);
}

TEST(CsvBarReaderTest, HeaderlessInputUsesPositionalColumns) {
    auto series = readString(
        "2024-01-01,10,11,9,10.5,100\r\n"
        "\n"
        "2024-01-02,10.5,12,10,11.5,150\r\n");

    ASSERT_EQ(series.size(), 2u);
    EXPECT_DOUBLE_EQ(series[0].open, 10.0);
    EXPECT_DOUBLE_EQ(series[1].close, 11.5);
    EXPECT_DOUBLE_EQ(series[1].volume, 150.0);
}

TEST(CsvBarReaderTest, AcceptsEpochSecondsAndDateTimes) {
    auto series = readString(
        "timestamp,open,high,low,close,volume\n"
        "1704067200,1,1,1,1,0\n"
        "2024-01-02T00:00:00Z,1,1,1,1,0\n");

    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series[0].timestamp, day(0));
    EXPECT_EQ(series[1].timestamp, day(1));
}

TEST(CsvBarReaderTest, MalformedRowReportsSourceAndLine) {
    try {
        readString(
            "date,open,high,low,close,volume\n"
            "2024-01-01,1,1,1,1,0\n"
            "2024-01-02,abc,1,1,1,0\n");
        FAIL() << "expected DataLoadException";
    } catch (const core::DataLoadException& e) {
        EXPECT_NE(std::string(e.what()).find("mem:3"), std::string::npos) << e.what();
    }
}

TEST(CsvBarReaderTest, ShortRowIsMalformed) {
    EXPECT_THROW(readString("2024-01-01,1,1,1\n"), core::DataLoadException);
}

TEST(CsvBarReaderTest, SkipsInvalidRowsWhenAsked) {
    CsvReadOptions options;
    options.skip_invalid_rows = true;
    auto series = readString(
        "date,open,high,low,close,volume\n"
        "2024-01-01,1,1,1,1,0\n"
        "not-a-date,1,1,1,1,0\n"
        "2024-01-03,2,2,2,2,0\n",
        options);

    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series[1].timestamp, day(2));
}

TEST(CsvBarReaderTest, HonorsDelimiter) {
    CsvReadOptions options;
    options.delimiter = ';';
    auto series = readString("date;open;high;low;close;volume\n2024-01-01;1;2;0.5;1.5;10\n", options);
    ASSERT_EQ(series.size(), 1u);
    EXPECT_DOUBLE_EQ(series[0].high, 2.0);
}

TEST(CsvBarReaderTest, HeaderMissingColumnThrows) {
    EXPECT_THROW(readString("date,open,high,low,close\n2024-01-01,1,1,1,1\n"), core::DataLoadException);
}

TEST(CsvBarReaderTest, MissingFileThrows) {
    test_support::TempPath missing("missing_csv");
    EXPECT_THROW(CsvBarReader().readFile(missing.str(), "SYM", "1d"), core::DataLoadException);
}

// --- bar cache ---

class BarCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = day(100);
        cache_ = std::make_unique<BarCache>(db_.str(), std::chrono::hours(1), [this] {
            if (clock_fails_) {
                throw std::runtime_error("clock unavailable");
            }
            return now_;
        });
        ASSERT_TRUE(cache_->connect());
        ASSERT_TRUE(cache_->initializeSchema());
    }

    void advance(std::chrono::seconds by) { now_ += by; }

    test_support::TempPath db_{"bar_cache.db"};
    core::Timestamp now_;
    bool clock_fails_ = false;
    std::unique_ptr<BarCache> cache_;
    core::PriceSeries series_ = test_support::seriesFromCloses({10, 11, 12, 13, 14}, "ABC", "1d");
};

TEST_F(BarCacheTest, StoreThenLoadReturnsSameBars) {
    cache_->store(series_);
    auto loaded = cache_->load("ABC", "1d");

    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), series_.size());
    EXPECT_EQ(loaded->getSymbol(), "ABC");
    for (std::size_t i = 0; i < series_.size(); ++i) {
        EXPECT_EQ((*loaded)[i].timestamp, series_[i].timestamp);
        EXPECT_DOUBLE_EQ((*loaded)[i].close, series_[i].close);
        EXPECT_DOUBLE_EQ((*loaded)[i].volume, series_[i].volume);
    }
    EXPECT_TRUE(cache_->isFresh("ABC", "1d"));
}

TEST_F(BarCacheTest, UnknownKeyIsMiss) {
    cache_->store(series_);
    EXPECT_FALSE(cache_->load("ABC", "1h").has_value());
    EXPECT_FALSE(cache_->load("XYZ", "1d").has_value());
    EXPECT_FALSE(cache_->isFresh("XYZ", "1d"));
}

TEST_F(BarCacheTest, StaleEntryIsNeverServed) {
    cache_->store(series_);
    advance(std::chrono::minutes(59));
    EXPECT_TRUE(cache_->load("ABC", "1d").has_value());

    advance(std::chrono::minutes(1));
    EXPECT_FALSE(cache_->isFresh("ABC", "1d"));
    EXPECT_FALSE(cache_->load("ABC", "1d").has_value());

    // Removed on the stale read, so nothing is left to purge
    EXPECT_EQ(cache_->purgeExpired(), 0u);
}

TEST_F(BarCacheTest, StoreReplacesAndRestampsEntry) {
    cache_->store(series_);
    advance(std::chrono::minutes(50));
    cache_->store(test_support::seriesFromCloses({20, 21}, "ABC", "1d"));
    advance(std::chrono::minutes(50));

    auto loaded = cache_->load("ABC", "1d");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 2u);
    EXPECT_DOUBLE_EQ((*loaded)[1].close, 21.0);
}

TEST_F(BarCacheTest, InvalidateRemovesEntry) {
    cache_->store(series_);
    cache_->invalidate("ABC", "1d");
    EXPECT_FALSE(cache_->load("ABC", "1d").has_value());
}

TEST_F(BarCacheTest, PurgeExpiredCountsStaleEntries) {
    cache_->store(series_);
    cache_->store(test_support::seriesFromCloses({1, 2, 3}, "DEF", "1d"));
    advance(std::chrono::minutes(30));
    cache_->store(test_support::seriesFromCloses({1, 2, 3}, "GHI", "1d"));
    advance(std::chrono::minutes(40));

    EXPECT_EQ(cache_->purgeExpired(), 2u);
    EXPECT_TRUE(cache_->isFresh("GHI", "1d"));
    EXPECT_FALSE(cache_->isFresh("ABC", "1d"));
}

TEST_F(BarCacheTest, RangeLoadIsInclusive) {
    cache_->store(series_);
    auto loaded = cache_->load("ABC", "1d", day(1), day(3));

    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 3u);
    EXPECT_EQ((*loaded)[0].timestamp, day(1));
    EXPECT_EQ((*loaded)[2].timestamp, day(3));
}

TEST_F(BarCacheTest, EntriesSurviveReconnect) {
    cache_->store(series_);
    cache_->disconnect();
    EXPECT_FALSE(cache_->isConnected());
    EXPECT_THROW(cache_->load("ABC", "1d"), core::DataLoadException);

    ASSERT_TRUE(cache_->connect());
    auto loaded = cache_->load("ABC", "1d");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->size(), series_.size());
}

TEST_F(BarCacheTest, SubSecondBarsKeepTheirOwnRows) {
    core::Bar first = test_support::makeBar(0, 10, 10, 10, 10);
    core::Bar second = test_support::makeBar(0, 11, 11, 11, 11);
    first.timestamp += std::chrono::milliseconds(250);
    second.timestamp += std::chrono::milliseconds(750);
    cache_->store(test_support::seriesFromBars({first, second}, "TICK", "500ms"));

    auto loaded = cache_->load("TICK", "500ms");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 2u);
    EXPECT_EQ((*loaded)[0].timestamp, first.timestamp);
    EXPECT_EQ((*loaded)[1].timestamp, second.timestamp);
    EXPECT_DOUBLE_EQ((*loaded)[1].close, 11.0);
}

TEST_F(BarCacheTest, RejectsTimestampsFinerThanMilliseconds) {
    core::Bar bar = test_support::makeBar(0, 10, 10, 10, 10);
    bar.timestamp += std::chrono::microseconds(1500);
    EXPECT_THROW(cache_->store(test_support::seriesFromBars({bar}, "TICK", "1us")), core::DataLoadException);
    EXPECT_FALSE(cache_->load("TICK", "1us").has_value());
}

TEST_F(BarCacheTest, EntryFromAnotherSourceIsMissed) {
    cache_->store(series_, "prices/abc_v1.csv");
    ASSERT_EQ(cache_->sourceOf("ABC", "1d"), std::optional<std::string>("prices/abc_v1.csv"));

    EXPECT_TRUE(cache_->loadFromSource("ABC", "1d", "prices/abc_v1.csv").has_value());
    EXPECT_FALSE(cache_->loadFromSource("ABC", "1d", "prices/abc_v2.csv").has_value());

    // The mismatched entry was dropped, not left for the old source
    EXPECT_FALSE(cache_->load("ABC", "1d").has_value());
    EXPECT_FALSE(cache_->sourceOf("ABC", "1d").has_value());
}

TEST_F(BarCacheTest, FailedStoreRollsBackAndLeavesCacheUsable) {
    cache_->store(series_);

    clock_fails_ = true;
    EXPECT_THROW(cache_->store(test_support::seriesFromCloses({20, 21}, "ABC", "1d")), std::runtime_error);
    clock_fails_ = false;

    // Earlier entry survives the aborted replacement
    auto loaded = cache_->load("ABC", "1d");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->size(), series_.size());

    // No transaction was left open on the connection
    EXPECT_NO_THROW(cache_->store(test_support::seriesFromCloses({20, 21}, "ABC", "1d")));
    EXPECT_EQ(cache_->load("ABC", "1d")->size(), 2u);
}

TEST(BarCacheConstructionTest, NegativeTtlThrows) {
    test_support::TempPath db("bar_cache_ttl.db");
    EXPECT_THROW({ BarCache cache(db.str(), std::chrono::seconds(-1)); }, std::invalid_argument);
}

TEST(BarCacheConstructionTest, ZeroTtlMakesEveryEntryStale) {
    test_support::TempPath db("bar_cache_zero.db");
    BarCache cache(db.str(), std::chrono::seconds(0), [] { return day(0); });
    ASSERT_TRUE(cache.connect());
    ASSERT_TRUE(cache.initializeSchema());

    cache.store(test_support::seriesFromCloses({1, 2}, "ABC", "1d"));
    EXPECT_FALSE(cache.load("ABC", "1d").has_value());
}
