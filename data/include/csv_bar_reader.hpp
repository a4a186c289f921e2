#pragma once

#include <string>
#include <istream>

#include "datatypes.hpp"
#include "price_series.hpp"

namespace data {

    struct CsvReadOptions {
        char delimiter = ',';
        // Log and drop malformed rows instead of throwing
        bool skip_invalid_rows = false;
    };

    // Reads OHLCV bars from CSV. A header row is detected automatically and
    // columns are matched by name (date|timestamp|time|datetime, open, high,
    // low, close, volume, case-insensitive). Without a header the first six
    // columns are taken in that order. Timestamps may be ISO-8601 dates or
    // date-times, or integral epoch seconds.
    class CsvBarReader {
    public:
        explicit CsvBarReader(CsvReadOptions options = {});

        // Throws core::DataLoadException if the file cannot be opened or a row is malformed
        core::PriceSeries readFile(const std::string& path,
                                   const std::string& symbol,
                                   const std::string& interval) const;

        core::PriceSeries read(std::istream& input,
                               const std::string& symbol,
                               const std::string& interval,
                               const std::string& source_name = "<stream>") const;

    private:
        CsvReadOptions options_;
    };

} // namespace data
