/**
 * @file table_provider.hpp
 * @brief Reference table sources and the process-wide table cache
 *
 * A TableProvider hands out individual tables; load_reference_tables()
 * assembles them into the immutable ReferenceTables bundle shared by all
 * case runs. TableCache loads each distinct set of sources once.
 */

#ifndef LOSSCALC_TABLE_PROVIDER_HPP
#define LOSSCALC_TABLE_PROVIDER_HPP

#include "reference_tables.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace losscalc {

/**
 * @brief Location and citation label of one table file
 */
struct TableSource {
    std::string path;               ///< File path, optionally prefixed with "local://"
    std::string label;              ///< Source label used in citations

    TableSource() = default;
    TableSource(const std::string& path_, const std::string& label_)
        : path(path_), label(label_) {}
};

/**
 * @brief Every table file a run may need
 */
struct TableSources {
    TableSource life_table;
    std::map<std::string, TableSource> worklife_tables;     ///< Keyed by table name
    TableSource wage_growth;
    std::map<std::string, TableSource> discount_series;     ///< Keyed by series name

    /**
     * @brief Default layout of a tables directory
     *
     * life_table.csv, worklife_default.csv, wage_growth.csv and
     * discount_treasury_1y.csv under dir.
     */
    static TableSources from_directory(const std::string& dir);

    /// Stable identity of this set of sources, used as the cache key
    std::string key() const;
};

/// Strip an optional "local://" scheme
std::string strip_local_scheme(const std::string& path);

/**
 * @brief Abstract source of reference tables
 */
class TableProvider {
public:
    virtual ~TableProvider() = default;

    virtual LifeTable load_life_table() const = 0;
    virtual WorkLifeTable load_worklife_table(const std::string& name) const = 0;
    virtual WageGrowthTable load_wage_growth_table() const = 0;
    virtual DiscountRateSeries load_discount_series(const std::string& name) const = 0;

    virtual std::vector<std::string> worklife_table_names() const = 0;
    virtual std::vector<std::string> discount_series_names() const = 0;
};

/**
 * @brief TableProvider reading the CSV files named by TableSources
 *
 * Each load opens, reads and closes its file. Unknown table names throw
 * TableLookupError; unreadable or malformed files throw ConfigParseError.
 */
class CsvTableProvider : public TableProvider {
public:
    explicit CsvTableProvider(TableSources sources);

    LifeTable load_life_table() const override;
    WorkLifeTable load_worklife_table(const std::string& name) const override;
    WageGrowthTable load_wage_growth_table() const override;
    DiscountRateSeries load_discount_series(const std::string& name) const override;

    std::vector<std::string> worklife_table_names() const override;
    std::vector<std::string> discount_series_names() const override;

    const TableSources& sources() const { return sources_; }

private:
    TableSources sources_;
};

/**
 * @brief Load every table the provider offers into one immutable bundle
 */
std::shared_ptr<const ReferenceTables> load_reference_tables(const TableProvider& provider);

/**
 * @brief Cache statistics
 */
struct TableCacheStats {
    size_t hits;
    size_t misses;
    size_t entries;
};

/**
 * @brief Process-wide load-once cache of reference table bundles
 *
 * Keyed by TableSources::key(). The first request for a key loads the
 * tables; later requests share the same bundle. Loading happens under the
 * lock so concurrent first requests read the files once. Cached bundles
 * are immutable.
 */
class TableCache {
public:
    static TableCache& instance();

    // CSV tables named by sources, keyed by sources.key()
    std::shared_ptr<const ReferenceTables> get(const TableSources& sources);

    // Tables from any provider; key must identify what the provider loads
    std::shared_ptr<const ReferenceTables> get(const std::string& key, const TableProvider& provider);

    TableCacheStats stats() const;

    void clear();

private:
    TableCache();
    TableCache(const TableCache&) = delete;
    TableCache& operator=(const TableCache&) = delete;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const ReferenceTables>> bundles_;
    size_t hits_;
    size_t misses_;
};

} // namespace losscalc

#endif // LOSSCALC_TABLE_PROVIDER_HPP
