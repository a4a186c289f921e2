#include "bar_cache.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace data
{

    namespace
    {

        // Finalizes the prepared statement on scope exit
        class Statement
        {
        public:
            Statement(sqlite3* db, const char* sql) : db_(db)
            {
                int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
                if (rc != SQLITE_OK)
                {
                    std::string message = sqlite3_errmsg(db_);
                    sqlite3_finalize(stmt_);
                    stmt_ = nullptr;
                    throw core::DataLoadException(fmt::format("Failed to prepare SQL statement [{}]: {}", rc, message));
                }
            }
            ~Statement() { sqlite3_finalize(stmt_); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            sqlite3_stmt* get() const { return stmt_; }

            void bindText(int index, const std::string& value)
            {
                sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
            }
            void bindInt64(int index, std::int64_t value) { sqlite3_bind_int64(stmt_, index, value); }
            void bindDouble(int index, double value) { sqlite3_bind_double(stmt_, index, value); }

            // Runs a statement that returns no rows
            void execute(const char* what)
            {
                int rc = sqlite3_step(stmt_);
                if (rc != SQLITE_DONE)
                {
                    throw core::DataLoadException(fmt::format("Failed to {} [{}]: {}", what, rc, sqlite3_errmsg(db_)));
                }
                sqlite3_reset(stmt_);
                sqlite3_clear_bindings(stmt_);
            }

        private:
            sqlite3* db_;
            sqlite3_stmt* stmt_ = nullptr;
        };

    } // namespace

    BarCache::BarCache(const std::string& db_path, std::chrono::seconds ttl, Clock clock)
        : database_path_(db_path), ttl_(ttl), clock_(std::move(clock))
    {
        if (ttl_.count() < 0)
        {
            throw std::invalid_argument("Bar cache TTL must not be negative.");
        }
        if (!clock_)
        {
            throw std::invalid_argument("Bar cache needs a clock.");
        }
        core::logging::getLogger()->debug("BarCache created for path: {} (ttl {}s)", db_path, ttl_.count());
    }

    BarCache::~BarCache()
    {
        disconnect();
    }

    bool BarCache::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to bar cache {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Opening bar cache: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                db_ ? sqlite3_errmsg(db_) : "out of memory");
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        return true;
    }

    void BarCache::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Unfinalized statements keep the handle alive
            core::logging::getLogger()->error("Error closing bar cache: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool BarCache::isConnected() const
    {
        return connected_ && db_ != nullptr;
    }

    bool BarCache::executeSQL(const std::string& sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: bar cache is not connected.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL: {}", sql);

        char* error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool BarCache::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: bar cache is not connected.");
            return false;
        }

        const std::string create_entries_sql = R"(
        CREATE TABLE IF NOT EXISTS cache_entries (
            symbol TEXT NOT NULL,
            interval TEXT NOT NULL,
            cached_at INTEGER NOT NULL, -- epoch seconds
            source TEXT NOT NULL DEFAULT '', -- where the bars were read from
            PRIMARY KEY (symbol, interval)
        );
    )";

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS cached_bars (
            symbol TEXT NOT NULL,
            interval TEXT NOT NULL,
            timestamp_ms INTEGER NOT NULL, -- epoch milliseconds
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume REAL,
            PRIMARY KEY (symbol, interval, timestamp_ms)
        );
    )";

        bool success = true;
        success &= executeSQL(create_entries_sql);
        success &= executeSQL(create_bars_sql);

        if (!success)
        {
            core::logging::getLogger()->error("Bar cache schema initialization failed.");
        }
        return success;
    }

    void BarCache::requireConnection(const char* operation) const
    {
        if (!isConnected())
        {
            throw core::DataLoadException(fmt::format("Cannot {}: bar cache '{}' is not connected.", operation, database_path_));
        }
    }

    bool BarCache::expired(std::int64_t cached_at) const
    {
        std::int64_t now = core::utils::toEpochSeconds(clock_());
        return now - cached_at >= ttl_.count();
    }

    std::optional<std::int64_t> BarCache::cachedAt(const std::string& symbol, const std::string& interval)
    {
        Statement stmt(db_, "SELECT cached_at FROM cache_entries WHERE symbol = ? AND interval = ?;");
        stmt.bindText(1, symbol);
        stmt.bindText(2, interval);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
        {
            return sqlite3_column_int64(stmt.get(), 0);
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Failed to read cache entry [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return std::nullopt;
    }

    void BarCache::removeEntry(const std::string& symbol, const std::string& interval)
    {
        Statement delete_bars(db_, "DELETE FROM cached_bars WHERE symbol = ? AND interval = ?;");
        delete_bars.bindText(1, symbol);
        delete_bars.bindText(2, interval);
        delete_bars.execute("delete cached bars");

        Statement delete_entry(db_, "DELETE FROM cache_entries WHERE symbol = ? AND interval = ?;");
        delete_entry.bindText(1, symbol);
        delete_entry.bindText(2, interval);
        delete_entry.execute("delete cache entry");
    }

    void BarCache::store(const core::PriceSeries& series, const std::string& source)
    {
        requireConnection("store bars");
        auto logger = core::logging::getLogger();

        // Rows are keyed by millisecond; finer stamps would collide silently
        for (std::size_t i = 0; i < series.size(); ++i)
        {
            const core::Timestamp& ts = series[i].timestamp;
            if (core::utils::fromEpochMillis(core::utils::toEpochMillis(ts)) != ts)
            {
                throw core::DataLoadException(fmt::format(
                    "Cannot cache {} ({}): bar {} at {} has sub-millisecond precision.",
                    series.getSymbol(), series.getInterval(), i, core::utils::timestampToString(ts)));
            }
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            throw core::DataLoadException("Failed to begin transaction for storing bars.");
        }

        try
        {
            removeEntry(series.getSymbol(), series.getInterval());

            Statement insert(db_, R"(
INSERT OR REPLACE INTO cached_bars
(symbol, interval, timestamp_ms, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)");
            for (const auto& bar : series.getBars())
            {
                insert.bindText(1, series.getSymbol());
                insert.bindText(2, series.getInterval());
                insert.bindInt64(3, core::utils::toEpochMillis(bar.timestamp));
                insert.bindDouble(4, bar.open);
                insert.bindDouble(5, bar.high);
                insert.bindDouble(6, bar.low);
                insert.bindDouble(7, bar.close);
                insert.bindDouble(8, bar.volume);
                insert.execute("insert bar");
            }

            Statement entry(db_, "INSERT INTO cache_entries (symbol, interval, cached_at, source) VALUES (?, ?, ?, ?);");
            entry.bindText(1, series.getSymbol());
            entry.bindText(2, series.getInterval());
            entry.bindInt64(3, core::utils::toEpochSeconds(clock_()));
            entry.bindText(4, source);
            entry.execute("insert cache entry");
        }
        catch (...)
        {
            if (!executeSQL("ROLLBACK;"))
            {
                logger->error("Rollback failed after bar cache write error.");
            }
            throw;
        }

        if (!executeSQL("COMMIT;"))
        {
            executeSQL("ROLLBACK;");
            throw core::DataLoadException("Failed to commit stored bars.");
        }
        logger->info("Cached {} bars for {} ({}).", series.size(), series.getSymbol(), series.getInterval());
    }

    core::TimeSeries<core::Bar> BarCache::queryBars(const std::string& symbol,
                                                    const std::string& interval,
                                                    std::int64_t start_ms,
                                                    std::int64_t end_ms)
    {
        Statement stmt(db_, R"(
            SELECT timestamp_ms, open, high, low, close, volume
            FROM cached_bars
            WHERE symbol = ? AND interval = ? AND timestamp_ms >= ? AND timestamp_ms <= ?
            ORDER BY timestamp_ms ASC;
        )");
        stmt.bindText(1, symbol);
        stmt.bindText(2, interval);
        stmt.bindInt64(3, start_ms);
        stmt.bindInt64(4, end_ms);

        core::TimeSeries<core::Bar> bars;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            core::Bar bar;
            bar.timestamp = core::utils::fromEpochMillis(sqlite3_column_int64(stmt.get(), 0));
            bar.open = sqlite3_column_double(stmt.get(), 1);
            bar.high = sqlite3_column_double(stmt.get(), 2);
            bar.low = sqlite3_column_double(stmt.get(), 3);
            bar.close = sqlite3_column_double(stmt.get(), 4);
            bar.volume = sqlite3_column_double(stmt.get(), 5);
            bars.push_back(bar);
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Error stepping through cached bars [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return bars;
    }

    std::optional<core::PriceSeries> BarCache::load(const std::string& symbol, const std::string& interval)
    {
        return loadBetween(symbol, interval,
                           std::numeric_limits<std::int64_t>::min(),
                           std::numeric_limits<std::int64_t>::max());
    }

    std::optional<core::PriceSeries> BarCache::load(const std::string& symbol,
                                                    const std::string& interval,
                                                    core::Timestamp start,
                                                    core::Timestamp end)
    {
        return loadBetween(symbol, interval, core::utils::toEpochMillis(start), core::utils::toEpochMillis(end));
    }

    std::optional<core::PriceSeries> BarCache::loadBetween(const std::string& symbol,
                                                           const std::string& interval,
                                                           std::int64_t start_ms,
                                                           std::int64_t end_ms)
    {
        requireConnection("load bars");
        auto logger = core::logging::getLogger();

        auto cached_at = cachedAt(symbol, interval);
        if (!cached_at)
        {
            logger->debug("Bar cache miss for {} ({}).", symbol, interval);
            return std::nullopt;
        }
        if (expired(*cached_at))
        {
            logger->info("Bar cache entry for {} ({}) expired; removing it.", symbol, interval);
            invalidate(symbol, interval);
            return std::nullopt;
        }

        core::TimeSeries<core::Bar> bars = queryBars(symbol, interval, start_ms, end_ms);
        logger->debug("Bar cache hit for {} ({}): {} bars.", symbol, interval, bars.size());
        return core::PriceSeries(symbol, interval, std::move(bars));
    }

    std::optional<core::PriceSeries> BarCache::loadFromSource(const std::string& symbol,
                                                              const std::string& interval,
                                                              const std::string& source)
    {
        requireConnection("load bars");
        auto cached_source = sourceOf(symbol, interval);
        if (cached_source && *cached_source != source)
        {
            core::logging::getLogger()->info("Bar cache entry for {} ({}) came from '{}', not '{}'; removing it.",
                symbol, interval, *cached_source, source);
            invalidate(symbol, interval);
            return std::nullopt;
        }
        return load(symbol, interval);
    }

    std::optional<std::string> BarCache::sourceOf(const std::string& symbol, const std::string& interval)
    {
        requireConnection("read entry source");
        Statement stmt(db_, "SELECT source FROM cache_entries WHERE symbol = ? AND interval = ?;");
        stmt.bindText(1, symbol);
        stmt.bindText(2, interval);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
        {
            const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
            return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
        }
        if (rc != SQLITE_DONE)
        {
            throw core::DataLoadException(fmt::format("Failed to read cache entry source [{}]: {}", rc, sqlite3_errmsg(db_)));
        }
        return std::nullopt;
    }

    bool BarCache::isFresh(const std::string& symbol, const std::string& interval)
    {
        requireConnection("check freshness");
        auto cached_at = cachedAt(symbol, interval);
        return cached_at && !expired(*cached_at);
    }

    void BarCache::invalidate(const std::string& symbol, const std::string& interval)
    {
        requireConnection("invalidate entry");
        removeEntry(symbol, interval);
    }

    std::size_t BarCache::purgeExpired()
    {
        requireConnection("purge entries");

        std::vector<std::pair<std::string, std::string>> stale;
        {
            Statement stmt(db_, "SELECT symbol, interval, cached_at FROM cache_entries;");
            int rc;
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
            {
                if (expired(sqlite3_column_int64(stmt.get(), 2)))
                {
                    stale.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0)),
                                       reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1)));
                }
            }
            if (rc != SQLITE_DONE)
            {
                throw core::DataLoadException(fmt::format("Error scanning cache entries [{}]: {}", rc, sqlite3_errmsg(db_)));
            }
        }

        for (const auto& key : stale)
        {
            removeEntry(key.first, key.second);
        }
        if (!stale.empty())
        {
            core::logging::getLogger()->info("Purged {} expired bar cache entries.", stale.size());
        }
        return stale.size();
    }

} // namespace data
