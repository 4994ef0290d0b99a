#include "emission_calculator.hpp"

#include "logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <set>

namespace
{
// Points the service's tracked_objects() at a change set for the lifetime of a scope.
class TrackingScope
{
  public:
    TrackingScope(const ChangeSet*& slot, const ChangeSet& changes) : slot_(slot) { slot_ = &changes; }
    ~TrackingScope() { slot_ = nullptr; }

    TrackingScope(const TrackingScope&)            = delete;
    TrackingScope& operator=(const TrackingScope&) = delete;

  private:
    const ChangeSet*& slot_;
};

void record(BatchStatistics& stats, const EmissionResult& result)
{
    ++stats.total_processed;
    stats.total_co2e_tonnes += result.co2e_tonnes;
    auto& by_type = stats.by_activity_type[result.activity.type];
    ++by_type.count;
    by_type.total_co2e += result.co2e_tonnes;
}

std::string describe(const ActivityRef& ref)
{
    return to_string(ref.type) + " activity " + ref.id;
}
} // namespace

EmissionCalculationError::EmissionCalculationError(const ActivityRef& activity, const std::string& message,
                                                   const std::string& cause)
    : std::runtime_error("Failed to calculate emissions for " + describe(activity) + ": " + message +
                         (cause.empty() ? "" : "\nCaused by: " + cause)),
      activity_(activity), cause_(cause)
{
}

std::string format_success_rate(std::size_t processed, std::size_t total, const std::string& when_empty)
{
    if (total == 0)
        return when_empty;
    // hundredths of a percent, half-up
    const auto basis = (static_cast<unsigned long long>(processed) * 20000ULL + total) / (2ULL * total);
    char       buf[32];
    std::snprintf(buf, sizeof(buf), "%llu.%02llu%%", basis / 100, basis % 100);
    return buf;
}

CalculationOptions CalculationOptions::from_config(const AppConfig& cfg)
{
    CalculationOptions o;
    o.fuzzy_threshold      = cfg.fuzzy_threshold;
    o.batch_size           = cfg.batch_size;
    o.error_sample         = cfg.error_sample;
    o.legacy_pending_limit = cfg.legacy_pending_limit;
    return o;
}

EmissionCalculationService::EmissionCalculationService(IStore& store, CalculationOptions options)
    : EmissionCalculationService(store, std::move(options), CalculatorRegistry::defaults(store))
{
}

EmissionCalculationService::EmissionCalculationService(IStore& store, CalculationOptions options,
                                                       CalculatorRegistry calculators)
    : store_(store), options_(std::move(options)), calculators_(std::move(calculators))
{
    if (options_.fuzzy_threshold < 0 || options_.fuzzy_threshold > 100)
        throw std::invalid_argument("fuzzy threshold must be between 0 and 100");
    if (options_.batch_size == 0)
        throw std::invalid_argument("batch size must be at least 1");
}

std::int64_t EmissionCalculationService::now() const
{
    if (options_.clock)
        return options_.clock();
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

int EmissionCalculationService::threshold_or_default(std::optional<int> threshold) const
{
    const int t = threshold.value_or(options_.fuzzy_threshold);
    if (t < 0 || t > 100)
        throw std::invalid_argument("fuzzy threshold must be between 0 and 100");
    return t;
}

std::size_t EmissionCalculationService::tracked_objects() const
{
    return current_ == nullptr ? 0 : current_->size();
}

void EmissionCalculationService::note_tracked(const ChangeSet& changes)
{
    peak_tracked_ = std::max(peak_tracked_, changes.size());
}

std::optional<EmissionResult> EmissionCalculationService::calculate_into(ChangeSet& changes, const Activity& activity,
                                                                         int threshold, bool raise_on_error,
                                                                         bool skip_duplicate_check)
{
    const auto ref = activity.ref();

    if (!skip_duplicate_check)
    {
        if (const auto* staged = changes.find_staged(ref))
            return *staged;
        if (!changes.deletes_results_of(ref))
        {
            if (auto existing = store_.get_latest_result(ref))
            {
                log_debug(describe(ref) + " already has result " + existing->id);
                return existing;
            }
        }
    }

    log_info("calculating emissions for " + describe(ref));

    const auto* calculator = calculators_.find(ref.type);
    if (calculator == nullptr)
    {
        const auto msg = "no calculator found for activity type: " + to_string(ref.type);
        log_error(msg);
        if (raise_on_error)
            throw std::invalid_argument(msg);
        return std::nullopt;
    }

    try
    {
        Activity working = activity;
        auto     result  = calculator->calculate(working, threshold);
        if (!result)
        {
            if (raise_on_error)
                throw EmissionCalculationError(ref, "calculator returned no result, likely no matching emission "
                                                    "factor found");
            return std::nullopt;
        }

        const auto ts            = now();
        result->id               = generate_id();
        result->activity         = ref;
        result->calculation_date = Date::from_epoch_seconds(ts);
        result->created_at       = ts;
        result->updated_at       = ts;
        changes.stage_insert(*result);

        // persist fields the calculator derived (distance_km backfilled from miles)
        if (working.details != activity.details)
        {
            ActivityUpdate update{ ref, std::nullopt, ts };
            if (const auto* trip = std::get_if<AirTravel>(&working.details))
                update.distance_km = trip->distance_km;
            changes.stage_activity_update(update);
        }
        note_tracked(changes);
        return result;
    }
    catch (const EmissionCalculationError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        log_error("failed to calculate emissions for " + describe(ref) + ": " + e.what());
        if (raise_on_error)
            throw EmissionCalculationError(ref, "unexpected error during calculation", e.what());
        return std::nullopt;
    }
}

std::optional<EmissionResult> EmissionCalculationService::calculate_single(const Activity& activity,
                                                                           std::optional<int> fuzzy_threshold,
                                                                           bool raise_on_error,
                                                                           bool skip_duplicate_check)
{
    const int     threshold = threshold_or_default(fuzzy_threshold);
    ChangeSet     changes;
    TrackingScope scope(current_, changes);

    auto result = calculate_into(changes, activity, threshold, raise_on_error, skip_duplicate_check);
    if (changes.empty())
        return result;

    const auto report = store_.commit(changes);
    if (report.inactive_skipped > 0)
    {
        log_warn(describe(activity.ref()) + " was deleted during calculation, result discarded");
        return std::nullopt;
    }
    if (report.duplicates_skipped > 0)
    {
        // a concurrent writer stored a result first; that one is live
        log_warn(describe(activity.ref()) + " was calculated concurrently, keeping the stored result");
        return store_.get_latest_result(activity.ref());
    }
    return result;
}

BatchSummary EmissionCalculationService::calculate_batch(const std::vector<Activity>& activities,
                                                         std::optional<int> fuzzy_threshold, bool fail_fast)
{
    const int threshold = threshold_or_default(fuzzy_threshold);
    log_info("starting batch calculation for " + std::to_string(activities.size()) + " activities");

    BatchSummary  summary;
    ChangeSet     changes;
    TrackingScope scope(current_, changes);

    for (const auto& activity : activities)
    {
        if (fail_fast)
        {
            // an exception leaves `changes` uncommitted, so nothing of the batch is written
            auto result = calculate_into(changes, activity, threshold, true, false);
            summary.results.push_back(std::move(*result));
            continue;
        }

        try
        {
            auto result = calculate_into(changes, activity, threshold, true, false);
            summary.results.push_back(std::move(*result));
        }
        catch (const std::exception& e)
        {
            log_error("error processing " + describe(activity.ref()) + ": " + e.what());
            summary.errors.push_back(CalculationError{ activity.id, activity.type(), e.what() });
        }
    }

    const auto report = store_.commit(changes);
    if (report.duplicates_skipped > 0 || report.inactive_skipped > 0)
    {
        log_warn(std::to_string(report.duplicates_skipped) + " result(s) were stored concurrently and " +
                 std::to_string(report.inactive_skipped) + " belong to activities deleted meanwhile");
        std::vector<EmissionResult> stored_results;
        for (const auto& r : summary.results)
        {
            if (auto stored = store_.get_latest_result(r.activity))
                stored_results.push_back(std::move(*stored));
        }
        summary.results = std::move(stored_results);
    }

    auto& stats            = summary.statistics;
    stats.total_activities = activities.size();
    for (const auto& r : summary.results)
        record(stats, r);
    stats.total_errors = summary.errors.size();
    stats.success_rate = format_success_rate(stats.total_processed, stats.total_activities, "0.00%");

    log_info("batch calculation complete: " + std::to_string(stats.total_processed) + "/" +
             std::to_string(stats.total_activities) + " successful, " + stats.total_co2e_tonnes.to_string() +
             " tonnes CO2e total");
    return summary;
}

std::optional<EmissionResult> EmissionCalculationService::recalculate(const Activity& activity,
                                                                      std::optional<int> fuzzy_threshold)
{
    const int     threshold = threshold_or_default(fuzzy_threshold);
    const auto    ref       = activity.ref();
    ChangeSet     changes;
    TrackingScope scope(current_, changes);

    log_info("recalculating emissions for " + describe(ref));
    changes.stage_delete_results(ref);

    auto result = calculate_into(changes, activity, threshold, false, true);
    if (!result)
    {
        log_warn("recalculation failed for " + describe(ref) + ", previous result kept");
        return std::nullopt;
    }

    const auto report = store_.commit(changes);
    if (report.results_deleted > 0)
        log_info("deleted " + std::to_string(report.results_deleted) + " existing result(s)");
    return result;
}

std::optional<EmissionResult> EmissionCalculationService::calculate_by_ref(const ActivityRef& ref, bool recalculate,
                                                                           std::optional<int> fuzzy_threshold)
{
    auto activity = store_.get_activity(ref);
    if (!activity)
    {
        log_error("activity not found: " + describe(ref));
        return std::nullopt;
    }
    if (recalculate)
        return this->recalculate(*activity, fuzzy_threshold);
    return calculate_single(*activity, fuzzy_threshold);
}

SweepSummary EmissionCalculationService::calculate_all_pending(std::size_t batch_size, bool streaming)
{
    SweepOptions o;
    o.batch_size = batch_size;
    o.streaming  = streaming;
    return calculate_all_pending(o);
}

SweepSummary EmissionCalculationService::calculate_all_pending(const SweepOptions& options)
{
    const auto page_size = options.batch_size.value_or(options_.batch_size);
    if (page_size == 0)
        throw std::invalid_argument("batch size must be at least 1");

    if (options.streaming)
        return stream_pending(page_size, options);
    return load_pending(options_.fuzzy_threshold);
}

SweepSummary EmissionCalculationService::stream_pending(std::size_t page_size, const SweepOptions& options)
{
    const int threshold = options_.fuzzy_threshold;
    log_info("starting streaming calculation of pending activities (page size " + std::to_string(page_size) + ")");

    SweepSummary sweep;
    sweep.streaming = true;
    auto& stats     = sweep.statistics;
    peak_tracked_   = 0;

    for (const auto type : all_activity_types())
    {
        std::size_t offset = 0;
        while (!sweep.cancelled)
        {
            if (options.cancel && options.cancel())
            {
                log_info("pending calculation cancelled after " + std::to_string(sweep.pages) + " page(s)");
                sweep.cancelled = true;
                break;
            }

            auto page = store_.get_active_activities(type, offset, page_size);
            if (page.empty())
                break;

            PageReport report;
            report.type       = type;
            report.page_index = sweep.pages;
            report.offset     = offset;
            report.fetched    = page.size();
            offset += page.size();

            ChangeSet changes;
            {
                TrackingScope scope(current_, changes);
                for (const auto& activity : page)
                {
                    if (store_.has_result(activity.ref()))
                    {
                        ++sweep.skipped_existing;
                        continue;
                    }

                    ++stats.total_activities;
                    try
                    {
                        auto result = calculate_into(changes, activity, threshold, true, true);
                        record(stats, *result);
                        ++report.processed;
                    }
                    catch (const std::exception& e)
                    {
                        ++stats.total_errors;
                        ++report.errors;
                        if (sweep.errors.size() < options_.error_sample)
                            sweep.errors.push_back(CalculationError{ activity.id, type, e.what() });
                    }
                }

                report.tracked_at_commit = changes.size();
                const auto committed     = store_.commit(changes);
                if (committed.duplicates_skipped > 0)
                    log_warn(std::to_string(committed.duplicates_skipped) +
                             " result(s) in this page were stored concurrently and skipped");
                if (committed.inactive_skipped > 0)
                    log_warn(std::to_string(committed.inactive_skipped) +
                             " result(s) in this page belong to activities deleted meanwhile and were dropped");
            }

            // detach the page before fetching the next one
            changes.clear();
            report.tracked_after_detach = changes.size();
            const bool last_page        = page.size() < page_size;
            std::vector<Activity>().swap(page);

            ++sweep.pages;
            log_debug("committed page " + std::to_string(report.page_index) + " of " + to_string(type) + ": " +
                      std::to_string(report.processed) + " processed, " + std::to_string(report.errors) + " errors");
            if (options.on_page)
                options.on_page(report);

            if (last_page)
                break;
        }
        if (sweep.cancelled)
            break;
    }

    stats.success_rate = format_success_rate(stats.total_processed, stats.total_activities, "100.00%");
    sweep.peak_tracked = peak_tracked_;

    log_info("streaming calculation complete: " + std::to_string(stats.total_processed) + "/" +
             std::to_string(stats.total_activities) + " successful over " + std::to_string(sweep.pages) +
             " page(s), " + std::to_string(sweep.skipped_existing) + " already calculated");
    return sweep;
}

SweepSummary EmissionCalculationService::load_pending(int threshold)
{
    const auto limit = options_.legacy_pending_limit;
    log_warn("non-streaming pending calculation loads up to " + std::to_string(limit) +
             " records into memory; use streaming mode for large datasets");

    const auto              refs = store_.list_result_refs(limit);
    const std::set<ActivityRef> existing(refs.begin(), refs.end());

    std::vector<Activity> pending;
    for (const auto type : all_activity_types())
    {
        if (pending.size() >= limit)
            break;
        for (auto& activity : store_.get_active_activities(type, 0, limit))
        {
            if (existing.count(activity.ref()) > 0)
                continue;
            pending.push_back(std::move(activity));
            if (pending.size() >= limit)
                break;
        }
    }
    if (pending.size() >= limit)
        log_warn("pending activity cap of " + std::to_string(limit) + " reached; remaining activities left for "
                 "a later run");
    log_info("found " + std::to_string(pending.size()) + " pending activities");

    SweepSummary sweep;
    sweep.streaming = false;
    peak_tracked_   = 0;
    if (pending.empty())
    {
        sweep.statistics.success_rate = "100.00%";
        return sweep;
    }

    auto batch       = calculate_batch(pending, threshold, false);
    sweep.statistics = std::move(batch.statistics);
    sweep.errors     = std::move(batch.errors);
    sweep.pages      = 1;
    sweep.peak_tracked = peak_tracked_;
    return sweep;
}
