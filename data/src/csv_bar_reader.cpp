#include "csv_bar_reader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace data {

    namespace {

        enum Column { kTime = 0, kOpen, kHigh, kLow, kClose, kVolume, kColumnCount };

        std::string trim(const std::string& s) {
            auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
            auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
            if (begin >= end) {
                return std::string();
            }
            std::string out(begin, end);
            if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
                out = out.substr(1, out.size() - 2);
            }
            return out;
        }

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::vector<std::string> split(const std::string& line, char delimiter) {
            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string field;
            while (std::getline(ss, field, delimiter)) {
                fields.push_back(trim(field));
            }
            if (!line.empty() && line.back() == delimiter) {
                fields.emplace_back();
            }
            return fields;
        }

        bool isAllDigits(const std::string& s) {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
        }

        core::Timestamp parseTimestamp(const std::string& field) {
            // Bare integers of epoch length are seconds since 1970
            if (isAllDigits(field) && field.size() >= 9) {
                return core::utils::fromEpochSeconds(std::stoll(field));
            }
            return core::utils::stringToTimestamp(field);
        }

        double parseNumber(const std::string& field, const char* column) {
            std::size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(field, &consumed);
            } catch (const std::exception&) {
                throw std::invalid_argument(fmt::format("{} '{}' is not a number", column, field));
            }
            if (consumed != field.size()) {
                throw std::invalid_argument(fmt::format("{} '{}' is not a number", column, field));
            }
            return value;
        }

        // Header name to column position. False if no field names a known column.
        bool mapHeader(const std::vector<std::string>& fields, std::array<int, kColumnCount>& positions) {
            positions.fill(-1);
            for (std::size_t i = 0; i < fields.size(); ++i) {
                std::string name = toLower(fields[i]);
                int pos = static_cast<int>(i);
                if (name == "date" || name == "timestamp" || name == "time" || name == "datetime") positions[kTime] = pos;
                else if (name == "open") positions[kOpen] = pos;
                else if (name == "high") positions[kHigh] = pos;
                else if (name == "low") positions[kLow] = pos;
                else if (name == "close") positions[kClose] = pos;
                else if (name == "volume") positions[kVolume] = pos;
            }
            return std::any_of(positions.begin(), positions.end(), [](int p) { return p >= 0; });
        }

    } // namespace

    CsvBarReader::CsvBarReader(CsvReadOptions options) : options_(std::move(options)) {}

    core::PriceSeries CsvBarReader::readFile(const std::string& path,
                                             const std::string& symbol,
                                             const std::string& interval) const
    {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw core::DataLoadException(fmt::format("Cannot open CSV file '{}'.", path));
        }
        core::logging::getLogger()->info("Loading {} {} bars from {}", symbol, interval, path);
        return read(file, symbol, interval, path);
    }

    core::PriceSeries CsvBarReader::read(std::istream& input,
                                         const std::string& symbol,
                                         const std::string& interval,
                                         const std::string& source_name) const
    {
        auto logger = core::logging::getLogger();
        core::TimeSeries<core::Bar> bars;
        std::array<int, kColumnCount> positions{kTime, kOpen, kHigh, kLow, kClose, kVolume};
        bool first_row = true;
        std::size_t line_number = 0;
        std::size_t skipped = 0;
        std::string line;

        while (std::getline(input, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (trim(line).empty()) {
                continue;
            }
            std::vector<std::string> fields = split(line, options_.delimiter);

            if (first_row) {
                first_row = false;
                std::array<int, kColumnCount> header_positions;
                if (mapHeader(fields, header_positions)) {
                    for (int c = 0; c < kColumnCount; ++c) {
                        if (header_positions[c] < 0) {
                            throw core::DataLoadException(fmt::format(
                                "{}: header is missing a required column (need date, open, high, low, close, volume).",
                                source_name));
                        }
                    }
                    positions = header_positions;
                    continue;
                }
            }

            try {
                int needed = *std::max_element(positions.begin(), positions.end()) + 1;
                if (static_cast<int>(fields.size()) < needed) {
                    throw std::invalid_argument(fmt::format("expected at least {} fields, found {}", needed, fields.size()));
                }
                core::Bar bar;
                bar.timestamp = parseTimestamp(fields[positions[kTime]]);
                bar.open = parseNumber(fields[positions[kOpen]], "open");
                bar.high = parseNumber(fields[positions[kHigh]], "high");
                bar.low = parseNumber(fields[positions[kLow]], "low");
                bar.close = parseNumber(fields[positions[kClose]], "close");
                bar.volume = fields[positions[kVolume]].empty() ? 0.0 : parseNumber(fields[positions[kVolume]], "volume");
                bars.push_back(bar);
            } catch (const std::exception& e) {
                if (!options_.skip_invalid_rows) {
                    throw core::DataLoadException(fmt::format("{}:{}: {}", source_name, line_number, e.what()));
                }
                ++skipped;
                logger->warn("{}:{}: skipping row ({})", source_name, line_number, e.what());
            }
        }

        if (skipped > 0) {
            logger->warn("{}: skipped {} malformed rows.", source_name, skipped);
        }
        logger->debug("{}: read {} bars for {} ({}).", source_name, bars.size(), symbol, interval);
        return core::PriceSeries(symbol, interval, std::move(bars));
    }

} // namespace data
