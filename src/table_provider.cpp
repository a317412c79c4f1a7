#include "table_provider.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <sstream>

namespace losscalc {

namespace {

const char* const LOCAL_SCHEME = "local://";

const TableSource& find_source(const std::map<std::string, TableSource>& sources,
                               const std::string& name, const std::string& what) {
    auto it = sources.find(name);
    if (it == sources.end()) {
        throw TableLookupError("tables", name, "no " + what + " named '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> names_of(const std::map<std::string, TableSource>& sources) {
    std::vector<std::string> names;
    names.reserve(sources.size());
    for (const auto& entry : sources) {
        names.push_back(entry.first);
    }
    return names;
}

void append_source(std::ostringstream& oss, const std::string& name, const TableSource& source) {
    oss << name << '=' << strip_local_scheme(source.path) << '|' << source.label << ';';
}

} // anonymous namespace

// ============================================================================
// TableSources
// ============================================================================

std::string strip_local_scheme(const std::string& path) {
    const std::string scheme(LOCAL_SCHEME);
    if (path.compare(0, scheme.size(), scheme) == 0) {
        return path.substr(scheme.size());
    }
    return path;
}

TableSources TableSources::from_directory(const std::string& dir) {
    std::string base = dir;
    if (!base.empty() && base.back() != '/') {
        base += '/';
    }

    TableSources sources;
    sources.life_table = TableSource(base + "life_table.csv", "US period life table");
    sources.worklife_tables[DEFAULT_WORKLIFE_TABLE] =
        TableSource(base + "worklife_default.csv", "Work-life participation factors");
    sources.wage_growth = TableSource(base + "wage_growth.csv", "Wage growth by SOC major group");
    sources.discount_series[DEFAULT_DISCOUNT_SERIES] =
        TableSource(base + "discount_treasury_1y.csv", "1-year Treasury constant maturity");
    return sources;
}

std::string TableSources::key() const {
    std::ostringstream oss;
    append_source(oss, "life", life_table);
    for (const auto& entry : worklife_tables) {
        append_source(oss, "worklife:" + entry.first, entry.second);
    }
    append_source(oss, "wage_growth", wage_growth);
    for (const auto& entry : discount_series) {
        append_source(oss, "discount:" + entry.first, entry.second);
    }
    return oss.str();
}

// ============================================================================
// CsvTableProvider
// ============================================================================

CsvTableProvider::CsvTableProvider(TableSources sources)
    : sources_(std::move(sources)) {}

LifeTable CsvTableProvider::load_life_table() const {
    return LifeTable::load_from_csv(strip_local_scheme(sources_.life_table.path),
                                    sources_.life_table.label);
}

WorkLifeTable CsvTableProvider::load_worklife_table(const std::string& name) const {
    const TableSource& source = find_source(sources_.worklife_tables, name, "work-life table");
    return WorkLifeTable::load_from_csv(strip_local_scheme(source.path), name, source.label);
}

WageGrowthTable CsvTableProvider::load_wage_growth_table() const {
    return WageGrowthTable::load_from_csv(strip_local_scheme(sources_.wage_growth.path),
                                          sources_.wage_growth.label);
}

DiscountRateSeries CsvTableProvider::load_discount_series(const std::string& name) const {
    const TableSource& source = find_source(sources_.discount_series, name, "discount series");
    return DiscountRateSeries::load_from_csv(strip_local_scheme(source.path), name, source.label);
}

std::vector<std::string> CsvTableProvider::worklife_table_names() const {
    return names_of(sources_.worklife_tables);
}

std::vector<std::string> CsvTableProvider::discount_series_names() const {
    return names_of(sources_.discount_series);
}

// ============================================================================
// Bundle loading
// ============================================================================

std::shared_ptr<const ReferenceTables> load_reference_tables(const TableProvider& provider) {
    std::map<std::string, WorkLifeTable> worklife;
    for (const auto& name : provider.worklife_table_names()) {
        worklife.emplace(name, provider.load_worklife_table(name));
    }

    std::map<std::string, DiscountRateSeries> discount;
    for (const auto& name : provider.discount_series_names()) {
        discount.emplace(name, provider.load_discount_series(name));
    }

    return std::make_shared<const ReferenceTables>(
        provider.load_life_table(),
        std::move(worklife),
        provider.load_wage_growth_table(),
        std::move(discount));
}

// ============================================================================
// TableCache
// ============================================================================

TableCache::TableCache() : hits_(0), misses_(0) {}

TableCache& TableCache::instance() {
    static TableCache cache;
    return cache;
}

std::shared_ptr<const ReferenceTables> TableCache::get(const TableSources& sources) {
    CsvTableProvider provider(sources);
    return get(sources.key(), provider);
}

std::shared_ptr<const ReferenceTables> TableCache::get(const std::string& key,
                                                       const TableProvider& provider) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = bundles_.find(key);
    if (it != bundles_.end()) {
        ++hits_;
        const ReferenceTables& cached = *it->second;
        Logger::get_instance().log_tables_loaded(key, cached.worklife_table_names().size(),
                                                 cached.discount_series_names().size(), true);
        return it->second;
    }

    ++misses_;
    auto bundle = load_reference_tables(provider);
    bundles_.emplace(key, bundle);
    Logger::get_instance().log_tables_loaded(key, bundle->worklife_table_names().size(),
                                             bundle->discount_series_names().size(), false);
    return bundle;
}

TableCacheStats TableCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return TableCacheStats{hits_, misses_, bundles_.size()};
}

void TableCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    bundles_.clear();
    hits_ = 0;
    misses_ = 0;
}

} // namespace losscalc
