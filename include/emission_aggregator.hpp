#pragma once
#include "models.hpp"
#include "storage.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class Granularity
{
    Daily,
    Monthly
};

// "daily" / "monthly"
std::optional<Granularity> granularity_from_string(const std::string& name);

struct BackfillReport
{
    std::vector<EmissionSummary> summaries;
    std::size_t                  periods = 0;
    std::size_t                  created = 0;
    std::size_t                  updated = 0;
};

/**
 * Recomputes EmissionSummary rows from stored results and upserts them on
 * (from_date, to_date, scope, category, activity_type, summary_type).
 *
 * A period with no results is NoData: nothing is written and the optional is empty.
 * Daily and monthly runs cover a fixed set of dimension combinations:
 *   overall, each scope, scope 3 x {category 1, category 6},
 *   each activity type, each scope x activity type.
 */
class EmissionAggregator
{
  public:
    explicit EmissionAggregator(IStore& store, std::function<std::int64_t()> clock = {});

    std::optional<EmissionSummary> aggregate_period(const Date& from, const Date& to, const SummaryFilter& filter = {},
                                                    SummaryType type = SummaryType::Daily);

    std::vector<EmissionSummary> aggregate_daily(const Date& day);
    std::vector<EmissionSummary> aggregate_monthly(int year, int month);

    // Tagged SummaryType::Custom.
    std::optional<EmissionSummary> aggregate_custom(const Date& from, const Date& to,
                                                    const SummaryFilter& filter = {});

    // Daily: every day of [from, to]. Monthly: every month from from's month to to's month.
    BackfillReport backfill(const Date& from, const Date& to, Granularity granularity);

    static const std::vector<SummaryFilter>& dimension_combinations();

  private:
    IStore&                       store_;
    std::function<std::int64_t()> clock_;

    std::int64_t now() const;

    std::optional<EmissionSummary> upsert(const SummaryKey& key, bool* created);
    std::vector<EmissionSummary>   aggregate_dimensions(const Date& from, const Date& to, SummaryType type,
                                                        BackfillReport* report);
};

enum class BreakdownDimension
{
    Scope,
    Category,
    Activity
};

// "scope" / "category" / "activity"
std::optional<BreakdownDimension> breakdown_dimension_from_string(const std::string& name);

struct SummaryTotal
{
    Decimal      total_co2e_tonnes{ 0, precision::kEmission };
    std::int64_t total_activities     = 0;
    std::size_t  summaries_aggregated = 0;
};

struct BreakdownEntry
{
    Decimal      total_co2e_tonnes{ 0, precision::kEmission };
    std::int64_t activity_count = 0;
};

// Read side: answers range queries from summary rows only, never from results.
class SummaryQueries
{
  public:
    explicit SummaryQueries(const IStore& store) : store_(store) {}

    // Rows inside [from, to]; unset filters match any value.
    std::vector<EmissionSummary> summaries_in_range(const Date& from, const Date& to,
                                                    const SummaryFilter& filter = {}) const;

    // Sums rows of exactly this dimension combination and summary type, so
    // overlapping rollups are not counted twice.
    SummaryTotal total_in_range(const Date& from, const Date& to, const SummaryFilter& filter = {},
                                SummaryType type = SummaryType::Daily) const;

    std::vector<EmissionSummary> monthly_summaries(int year, int month, const SummaryFilter& filter = {}) const;

    std::optional<EmissionSummary> latest_summary(const SummaryFilter& filter = {}) const;

    // Daily rows grouped by one dimension, e.g. "Scope 2", "Category 6: Business Travel",
    // "Electricity"; the unfiltered rows appear as "All Scopes" / "All Categories" / "All Activities".
    std::map<std::string, BreakdownEntry> breakdown(const Date& from, const Date& to,
                                                    BreakdownDimension dimension) const;

  private:
    const IStore& store_;
};
