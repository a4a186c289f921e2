#pragma once

#include "datatypes.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace core {

    // Read-only view over the bars [0, size) of a series. A strategy only ever
    // receives one of these, so it cannot address bars beyond the current step.
    class BarWindow {
    public:
        BarWindow(const Bar* bars, std::size_t size) : bars_(bars), size_(size) {}

        std::size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }

        // Throws std::out_of_range past the current step
        const Bar& at(std::size_t index) const;
        const Bar& operator[](std::size_t index) const { return bars_[index]; }
        const Bar& back() const { return bars_[size_ - 1]; }

        const Bar* begin() const { return bars_; }
        const Bar* end() const { return bars_ + size_; }

        // Close prices of the trailing `count` bars (all bars if count >= size)
        std::vector<double> closes(std::size_t count) const;
        std::vector<double> closes() const { return closes(size_); }

        // The trailing `count` bars (the whole window if count >= size)
        BarWindow tail(std::size_t count) const {
            return count >= size_ ? *this : BarWindow(bars_ + (size_ - count), count);
        }

    private:
        const Bar* bars_;
        std::size_t size_;
    };

    // Ordered bars for one symbol and one interval
    class PriceSeries {
    public:
        PriceSeries() = default;
        PriceSeries(std::string symbol, std::string interval, TimeSeries<Bar> bars);

        const std::string& getSymbol() const { return symbol_; }
        const std::string& getInterval() const { return interval_; }
        const TimeSeries<Bar>& getBars() const { return bars_; }
        std::size_t size() const { return bars_.size(); }
        bool empty() const { return bars_.empty(); }
        const Bar& operator[](std::size_t index) const { return bars_[index]; }

        // Bars [0, index]. Throws std::out_of_range if index >= size().
        BarWindow windowUpTo(std::size_t index) const;

        // Throws DataIntegrityError on duplicate/decreasing timestamps,
        // non-finite or non-positive prices, high < low, or negative volume.
        void validate() const;

        // Bars whose timestamps fall in [start, end], same symbol/interval
        PriceSeries slice(Timestamp start, Timestamp end) const;

    private:
        std::string symbol_;
        std::string interval_;
        TimeSeries<Bar> bars_;
    };

} // namespace core
