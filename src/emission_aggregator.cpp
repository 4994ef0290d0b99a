#include "emission_aggregator.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>
#include <stdexcept>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void require_ordered(const Date& from, const Date& to)
{
    if (to < from)
        throw std::invalid_argument("from_date must be before or equal to to_date");
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string describe(const SummaryKey& key)
{
    std::string s = to_string(key.summary_type) + " " + key.from_date.to_string() + ".." + key.to_date.to_string();
    if (key.filter.scope)
        s += " scope=" + std::to_string(*key.filter.scope);
    if (key.filter.category)
        s += " category=" + std::to_string(*key.filter.category);
    if (key.filter.activity_type)
        s += " activity=" + to_string(*key.filter.activity_type);
    return s;
}

std::optional<Granularity> granularity_from_string(const std::string& name)
{
    const auto n = lower(name);
    if (n == "daily")
        return Granularity::Daily;
    if (n == "monthly")
        return Granularity::Monthly;
    return std::nullopt;
}

std::optional<BreakdownDimension> breakdown_dimension_from_string(const std::string& name)
{
    const auto n = lower(name);
    if (n == "scope")
        return BreakdownDimension::Scope;
    if (n == "category")
        return BreakdownDimension::Category;
    if (n == "activity")
        return BreakdownDimension::Activity;
    return std::nullopt;
}

EmissionAggregator::EmissionAggregator(IStore& store, std::function<std::int64_t()> clock)
    : store_(store), clock_(std::move(clock))
{
}

std::int64_t EmissionAggregator::now() const
{
    if (clock_)
        return clock_();
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

const std::vector<SummaryFilter>& EmissionAggregator::dimension_combinations()
{
    static const std::vector<SummaryFilter> kCombinations = []
    {
        const int kScopes[] = { ghg::kScope1, ghg::kScope2, ghg::kScope3 };

        std::vector<SummaryFilter> out;
        out.push_back(SummaryFilter{});
        for (const int scope : kScopes)
            out.push_back(SummaryFilter{ scope, std::nullopt, std::nullopt });
        for (const int category : { ghg::kCategoryPurchasedGoods, ghg::kCategoryBusinessTravel })
            out.push_back(SummaryFilter{ ghg::kScope3, category, std::nullopt });
        for (const auto type : all_activity_types())
            out.push_back(SummaryFilter{ std::nullopt, std::nullopt, type });
        for (const int scope : kScopes)
        {
            for (const auto type : all_activity_types())
                out.push_back(SummaryFilter{ scope, std::nullopt, type });
        }
        return out;
    }();
    return kCombinations;
}

std::optional<EmissionSummary> EmissionAggregator::upsert(const SummaryKey& key, bool* created)
{
    const auto totals = store_.aggregate_results(key.from_date, key.to_date, key.filter);
    if (totals.count == 0)
        return std::nullopt;

    const auto existing = store_.find_summary(key);
    const auto ts       = now();

    EmissionSummary s;
    if (existing)
    {
        s = *existing;
    }
    else
    {
        s.id            = generate_id();
        s.from_date     = key.from_date;
        s.to_date       = key.to_date;
        s.scope         = key.filter.scope;
        s.category      = key.filter.category;
        s.activity_type = key.filter.activity_type;
        s.summary_type  = key.summary_type;
        s.created_at    = ts;
    }
    s.total_co2e_tonnes = totals.total_co2e_tonnes.quantize(precision::kEmission);
    s.activity_count    = totals.count;
    s.updated_at        = ts;

    if (created != nullptr)
        *created = !existing;
    log_debug(std::string(existing ? "updated" : "created") + " summary " + describe(key) + ": " +
              s.total_co2e_tonnes.to_string() + " t over " + std::to_string(s.activity_count) + " result(s)");
    return store_.put_summary(s);
}

std::optional<EmissionSummary> EmissionAggregator::aggregate_period(const Date& from, const Date& to,
                                                                    const SummaryFilter& filter, SummaryType type)
{
    require_ordered(from, to);
    return upsert(SummaryKey{ from, to, filter, type }, nullptr);
}

std::vector<EmissionSummary> EmissionAggregator::aggregate_dimensions(const Date& from, const Date& to,
                                                                      SummaryType type, BackfillReport* report)
{
    std::vector<EmissionSummary> out;
    for (const auto& filter : dimension_combinations())
    {
        bool created = false;
        auto summary = upsert(SummaryKey{ from, to, filter, type }, &created);
        if (!summary)
            continue;
        if (report != nullptr)
            ++(created ? report->created : report->updated);
        out.push_back(std::move(*summary));
    }
    return out;
}

std::vector<EmissionSummary> EmissionAggregator::aggregate_daily(const Date& day)
{
    log_info("aggregating daily emissions for " + day.to_string());
    auto out = aggregate_dimensions(day, day, SummaryType::Daily, nullptr);
    log_info("stored " + std::to_string(out.size()) + " daily summaries for " + day.to_string());
    return out;
}

std::vector<EmissionSummary> EmissionAggregator::aggregate_monthly(int year, int month)
{
    if (month < 1 || month > 12)
        throw std::invalid_argument("month must be between 1 and 12");
    const auto from = Date::first_of_month(year, month);
    const auto to   = Date::last_of_month(year, month);

    log_info("aggregating monthly emissions for " + from.to_string().substr(0, 7));
    auto out = aggregate_dimensions(from, to, SummaryType::Monthly, nullptr);
    log_info("stored " + std::to_string(out.size()) + " monthly summaries for " + from.to_string().substr(0, 7));
    return out;
}

std::optional<EmissionSummary> EmissionAggregator::aggregate_custom(const Date& from, const Date& to,
                                                                    const SummaryFilter& filter)
{
    log_info("aggregating custom range " + describe(SummaryKey{ from, to, filter, SummaryType::Custom }));
    return aggregate_period(from, to, filter, SummaryType::Custom);
}

BackfillReport EmissionAggregator::backfill(const Date& from, const Date& to, Granularity granularity)
{
    require_ordered(from, to);
    log_info("backfilling " + std::string(granularity == Granularity::Daily ? "daily" : "monthly") +
             " summaries from " + from.to_string() + " to " + to.to_string());

    BackfillReport report;
    if (granularity == Granularity::Daily)
    {
        for (auto day = from; day <= to; day = day.add_days(1))
        {
            auto summaries = aggregate_dimensions(day, day, SummaryType::Daily, &report);
            std::move(summaries.begin(), summaries.end(), std::back_inserter(report.summaries));
            ++report.periods;
        }
    }
    else
    {
        int year  = from.year;
        int month = from.month;
        while (year < to.year || (year == to.year && month <= to.month))
        {
            auto summaries = aggregate_dimensions(Date::first_of_month(year, month), Date::last_of_month(year, month),
                                                  SummaryType::Monthly, &report);
            std::move(summaries.begin(), summaries.end(), std::back_inserter(report.summaries));
            ++report.periods;
            if (++month > 12)
            {
                month = 1;
                ++year;
            }
        }
    }

    log_info("backfill complete: " + std::to_string(report.periods) + " period(s), " +
             std::to_string(report.created) + " created, " + std::to_string(report.updated) + " updated");
    return report;
}

std::vector<EmissionSummary> SummaryQueries::summaries_in_range(const Date& from, const Date& to,
                                                                const SummaryFilter& filter) const
{
    require_ordered(from, to);
    auto out = store_.query_summaries(from, to, filter);
    if (out.empty())
        log_warn("no summaries found for " + from.to_string() + " to " + to.to_string() +
                 "; aggregation may not have run yet");
    return out;
}

SummaryTotal SummaryQueries::total_in_range(const Date& from, const Date& to, const SummaryFilter& filter,
                                            SummaryType type) const
{
    require_ordered(from, to);
    SummaryTotal total;
    for (const auto& s : store_.query_summaries(from, to, filter))
    {
        if (s.summary_type != type || !(s.filter() == filter))
            continue;
        total.total_co2e_tonnes += s.total_co2e_tonnes;
        total.total_activities += s.activity_count;
        ++total.summaries_aggregated;
    }
    return total;
}

std::vector<EmissionSummary> SummaryQueries::monthly_summaries(int year, int month, const SummaryFilter& filter) const
{
    if (month < 1 || month > 12)
        throw std::invalid_argument("month must be between 1 and 12");
    return store_.query_summaries(Date::first_of_month(year, month), Date::last_of_month(year, month), filter);
}

std::optional<EmissionSummary> SummaryQueries::latest_summary(const SummaryFilter& filter) const
{
    return store_.latest_summary(filter);
}

std::map<std::string, BreakdownEntry> SummaryQueries::breakdown(const Date& from, const Date& to,
                                                                BreakdownDimension dimension) const
{
    require_ordered(from, to);
    std::map<std::string, BreakdownEntry> out;
    for (const auto& s : store_.query_summaries(from, to, SummaryFilter{}))
    {
        if (s.summary_type != SummaryType::Daily)
            continue;

        std::string key;
        switch (dimension)
        {
        case BreakdownDimension::Scope:
            if (s.category || s.activity_type)
                continue;
            key = s.scope ? "Scope " + std::to_string(*s.scope) : "All Scopes";
            break;
        case BreakdownDimension::Category:
            if (s.activity_type || (s.scope && !s.category))
                continue;
            key = s.category ? "Category " + std::to_string(*s.category) + ": " + ghg::category_name(*s.category)
                             : "All Categories";
            break;
        case BreakdownDimension::Activity:
            if (s.scope || s.category)
                continue;
            key = s.activity_type ? to_string(*s.activity_type) : "All Activities";
            break;
        }

        auto& entry = out[key];
        entry.total_co2e_tonnes += s.total_co2e_tonnes;
        entry.activity_count += s.activity_count;
    }
    return out;
}
