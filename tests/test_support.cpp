#include "test_support.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <utility>

namespace test_support {

    namespace {
        constexpr std::int64_t kFirstDay = 1704067200; // 2024-01-01T00:00:00Z
        std::atomic<int> temp_counter{0};
    } // namespace

    core::Timestamp day(int index) {
        return core::utils::fromEpochSeconds(kFirstDay + static_cast<std::int64_t>(index) * 86400);
    }

    core::Bar makeBar(int day_index, double open, double high, double low, double close, double volume) {
        core::Bar bar;
        bar.timestamp = day(day_index);
        bar.open = open;
        bar.high = high;
        bar.low = low;
        bar.close = close;
        bar.volume = volume;
        return bar;
    }

    core::PriceSeries seriesFromCloses(const std::vector<double>& closes,
                                       const std::string& symbol,
                                       const std::string& interval)
    {
        core::TimeSeries<core::Bar> bars;
        bars.reserve(closes.size());
        for (std::size_t i = 0; i < closes.size(); ++i) {
            double c = closes[i];
            bars.push_back(makeBar(static_cast<int>(i), c, c, c, c));
        }
        return core::PriceSeries(symbol, interval, std::move(bars));
    }

    core::PriceSeries seriesFromBars(std::vector<core::Bar> bars,
                                     const std::string& symbol,
                                     const std::string& interval)
    {
        return core::PriceSeries(symbol, interval, std::move(bars));
    }

    std::vector<double> linearCloses(std::size_t count, double start, double step) {
        std::vector<double> closes;
        closes.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            closes.push_back(start + step * static_cast<double>(i));
        }
        return closes;
    }

    std::vector<double> zigZagCloses(std::size_t count, double base, double amplitude, std::size_t cycle) {
        std::vector<double> closes;
        closes.reserve(count);
        const std::size_t half = cycle / 2 == 0 ? 1 : cycle / 2;
        for (std::size_t i = 0; i < count; ++i) {
            std::size_t phase = i % (2 * half);
            double t = phase < half ? static_cast<double>(phase) / half
                                    : static_cast<double>(2 * half - phase) / half;
            closes.push_back(base + amplitude * (2.0 * t - 1.0));
        }
        return closes;
    }

    TempPath::TempPath(const std::string& stem) {
        auto dir = std::filesystem::temp_directory_path();
        path_ = (dir / (stem + "_" + std::to_string(temp_counter.fetch_add(1)) + "_" +
                        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))).string();
    }

    TempPath::~TempPath() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

} // namespace test_support
