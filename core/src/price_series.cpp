#include "price_series.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace core {

    const Bar& BarWindow::at(std::size_t index) const {
        if (index >= size_) {
            throw std::out_of_range(fmt::format("Bar index {} is beyond the current window of {} bars.", index, size_));
        }
        return bars_[index];
    }

    std::vector<double> BarWindow::closes(std::size_t count) const {
        std::size_t first = (count >= size_) ? 0 : size_ - count;
        std::vector<double> result;
        result.reserve(size_ - first);
        for (std::size_t i = first; i < size_; ++i) {
            result.push_back(bars_[i].close);
        }
        return result;
    }

    PriceSeries::PriceSeries(std::string symbol, std::string interval, TimeSeries<Bar> bars)
        : symbol_(std::move(symbol)), interval_(std::move(interval)), bars_(std::move(bars)) {}

    BarWindow PriceSeries::windowUpTo(std::size_t index) const {
        if (index >= bars_.size()) {
            throw std::out_of_range(fmt::format("Window end {} is beyond series of {} bars.", index, bars_.size()));
        }
        return BarWindow(bars_.data(), index + 1);
    }

    void PriceSeries::validate() const {
        auto valid_price = [](double p) { return std::isfinite(p) && p > 0.0; };

        for (std::size_t i = 0; i < bars_.size(); ++i) {
            const Bar& bar = bars_[i];
            if (!valid_price(bar.open) || !valid_price(bar.high) ||
                !valid_price(bar.low) || !valid_price(bar.close)) {
                throw DataIntegrityError(i, fmt::format(
                    "non-finite or non-positive price (O={} H={} L={} C={}) at {}",
                    bar.open, bar.high, bar.low, bar.close, utils::timestampToString(bar.timestamp)));
            }
            if (bar.high < bar.low) {
                throw DataIntegrityError(i, fmt::format("high {} below low {}", bar.high, bar.low));
            }
            if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
                throw DataIntegrityError(i, fmt::format("invalid volume {}", bar.volume));
            }
            if (i > 0 && !(bars_[i - 1].timestamp < bar.timestamp)) {
                throw DataIntegrityError(i, fmt::format(
                    "timestamp {} does not follow {}",
                    utils::timestampToString(bar.timestamp),
                    utils::timestampToString(bars_[i - 1].timestamp)));
            }
        }
    }

    PriceSeries PriceSeries::slice(Timestamp start, Timestamp end) const {
        TimeSeries<Bar> selected;
        for (const auto& bar : bars_) {
            if (bar.timestamp >= start && bar.timestamp <= end) {
                selected.push_back(bar);
            }
        }
        return PriceSeries(symbol_, interval_, std::move(selected));
    }

} // namespace core
