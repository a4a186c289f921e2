#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <cstddef>
#include <cstdint>

#include <sqlite3.h>

#include "datatypes.hpp"
#include "price_series.hpp"

namespace data {

// SQLite store of bar series keyed by (symbol, interval). Each entry remembers
// when it was written and which source it was read from; an entry older than
// the TTL is stale and never served. Bar timestamps are stored as epoch
// milliseconds.
class BarCache {
public:
    using Clock = std::function<core::Timestamp()>;

    // Throws std::invalid_argument for a negative TTL
    BarCache(const std::string& db_path,
             std::chrono::seconds ttl,
             Clock clock = [] { return std::chrono::system_clock::now(); });
    ~BarCache();

    BarCache(const BarCache&) = delete;
    BarCache& operator=(const BarCache&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    std::chrono::seconds getTtl() const { return ttl_; }

    // Replaces the entry for the series' symbol/interval and stamps it with
    // the current clock time and `source`. Throws core::DataLoadException on
    // SQLite errors or bar timestamps finer than a millisecond.
    void store(const core::PriceSeries& series, const std::string& source = std::string());

    // The cached series if present and fresh. A stale entry is removed.
    // Throws core::DataLoadException on SQLite errors.
    std::optional<core::PriceSeries> load(const std::string& symbol, const std::string& interval);

    // Same, restricted to bars in [start, end]
    std::optional<core::PriceSeries> load(const std::string& symbol,
                                          const std::string& interval,
                                          core::Timestamp start,
                                          core::Timestamp end);

    // Like load(), but an entry recorded from a different source is removed and missed
    std::optional<core::PriceSeries> loadFromSource(const std::string& symbol,
                                                    const std::string& interval,
                                                    const std::string& source);

    // Source recorded with the entry, fresh or not
    std::optional<std::string> sourceOf(const std::string& symbol, const std::string& interval);

    bool isFresh(const std::string& symbol, const std::string& interval);

    void invalidate(const std::string& symbol, const std::string& interval);

    // Removes every stale entry; returns how many were removed
    std::size_t purgeExpired();

private:
    std::string database_path_;
    std::chrono::seconds ttl_;
    Clock clock_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;

    bool executeSQL(const std::string& sql);
    void requireConnection(const char* operation) const;
    std::optional<std::int64_t> cachedAt(const std::string& symbol, const std::string& interval);
    bool expired(std::int64_t cached_at) const;
    void removeEntry(const std::string& symbol, const std::string& interval);
    std::optional<core::PriceSeries> loadBetween(const std::string& symbol,
                                                 const std::string& interval,
                                                 std::int64_t start_ms,
                                                 std::int64_t end_ms);
    core::TimeSeries<core::Bar> queryBars(const std::string& symbol,
                                          const std::string& interval,
                                          std::int64_t start_ms,
                                          std::int64_t end_ms);
};

} // namespace data
