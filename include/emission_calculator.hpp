#pragma once
#include "calculators.hpp"
#include "config.hpp"
#include "models.hpp"
#include "storage.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Raised on fail-fast and raise-on-error paths. Carries the activity it failed for
 * and, for unexpected failures, the text of the original exception.
 */
class EmissionCalculationError : public std::runtime_error
{
  public:
    EmissionCalculationError(const ActivityRef& activity, const std::string& message, const std::string& cause = "");

    const ActivityRef& activity() const { return activity_; }
    const std::string& cause() const { return cause_; }

  private:
    ActivityRef activity_;
    std::string cause_;
};

// One failed activity of a batch or sweep.
struct CalculationError
{
    std::string  activity_id;
    ActivityType activity_type = ActivityType::Electricity;
    std::string  error;
};

struct TypeStatistics
{
    std::size_t count = 0;
    Decimal     total_co2e{ 0, precision::kEmission };
};

struct BatchStatistics
{
    std::size_t                            total_activities = 0;
    std::size_t                            total_processed  = 0;
    std::size_t                            total_errors     = 0;
    std::string                            success_rate     = "0.00%"; // "NN.NN%"
    Decimal                                total_co2e_tonnes{ 0, precision::kEmission };
    std::map<ActivityType, TypeStatistics> by_activity_type;
};

struct BatchSummary
{
    std::vector<EmissionResult>   results;
    BatchStatistics               statistics;
    std::vector<CalculationError> errors;
};

struct SweepSummary
{
    BatchStatistics               statistics;
    std::vector<CalculationError> errors; // first CalculationOptions::error_sample failures only
    bool                          streaming        = true;
    std::size_t                   pages            = 0;
    std::size_t                   skipped_existing = 0;
    bool                          cancelled        = false;
    std::size_t                   peak_tracked     = 0; // largest change set held at once
};

// Emitted after every committed page of a streaming sweep.
struct PageReport
{
    ActivityType type       = ActivityType::Electricity;
    std::size_t  page_index = 0;
    std::size_t  offset     = 0;
    std::size_t  fetched    = 0;
    std::size_t  processed  = 0;
    std::size_t  errors     = 0;
    std::size_t  tracked_at_commit = 0;
    std::size_t  tracked_after_detach = 0;
};

struct CalculationOptions
{
    int         fuzzy_threshold      = FactorMatcher::kDefaultThreshold;
    std::size_t batch_size           = 100;
    std::size_t error_sample         = 10;
    std::size_t legacy_pending_limit = 10000;
    // Epoch seconds; system clock when empty.
    std::function<std::int64_t()> clock;

    static CalculationOptions from_config(const AppConfig& cfg);
};

struct SweepOptions
{
    std::optional<std::size_t>              batch_size; // CalculationOptions::batch_size when empty
    bool                                    streaming = true;
    std::function<bool()>                   cancel;  // polled at page boundaries
    std::function<void(const PageReport&)>  on_page;
};

/**
 * Routes activities to their calculators and persists results, keeping at most one
 * live result per activity.
 *
 * Every entry point stages its writes in a ChangeSet and commits once:
 *   calculate_single    one commit per call
 *   calculate_batch     one commit per batch; fail_fast discards the batch on the first failure
 *   calculate_all_pending  one commit per page, page state detached before the next fetch
 */
class EmissionCalculationService
{
  public:
    explicit EmissionCalculationService(IStore& store, CalculationOptions options = {});
    EmissionCalculationService(IStore& store, CalculationOptions options, CalculatorRegistry calculators);

    // Returns the existing result unchanged unless skip_duplicate_check. With raise_on_error,
    // an unknown activity type throws std::invalid_argument and any other failure throws
    // EmissionCalculationError; otherwise failures yield an empty optional.
    std::optional<EmissionResult> calculate_single(const Activity& activity,
                                                   std::optional<int> fuzzy_threshold = std::nullopt,
                                                   bool raise_on_error = false, bool skip_duplicate_check = false);

    BatchSummary calculate_batch(const std::vector<Activity>& activities,
                                 std::optional<int> fuzzy_threshold = std::nullopt, bool fail_fast = false);

    // Replaces the activity's results. If the fresh calculation fails nothing is
    // written and the previous result stays.
    std::optional<EmissionResult> recalculate(const Activity& activity,
                                              std::optional<int> fuzzy_threshold = std::nullopt);

    // Looks the activity up through the store; missing or soft-deleted activities yield nothing.
    std::optional<EmissionResult> calculate_by_ref(const ActivityRef& ref, bool recalculate = false,
                                                   std::optional<int> fuzzy_threshold = std::nullopt);

    SweepSummary calculate_all_pending(const SweepOptions& options = {});
    SweepSummary calculate_all_pending(std::size_t batch_size, bool streaming);

    // Rows staged in the change set currently being built (0 between pages).
    std::size_t tracked_objects() const;
    // Largest change set seen; reset when a pending sweep starts.
    std::size_t peak_tracked_objects() const { return peak_tracked_; }

    const CalculationOptions& options() const { return options_; }

  private:
    IStore&            store_;
    CalculationOptions options_;
    CalculatorRegistry calculators_;
    const ChangeSet*   current_      = nullptr;
    std::size_t        peak_tracked_ = 0;

    std::int64_t now() const;
    int          threshold_or_default(std::optional<int> threshold) const;

    // Calculates into `changes` without committing. Returns the staged or already
    // stored result.
    std::optional<EmissionResult> calculate_into(ChangeSet& changes, const Activity& activity, int threshold,
                                                 bool raise_on_error, bool skip_duplicate_check);

    void note_tracked(const ChangeSet& changes);

    SweepSummary stream_pending(std::size_t page_size, const SweepOptions& options);
    SweepSummary load_pending(int threshold);
};

// processed / total as "NN.NN%", rounded half-up; `when_empty` if total is 0.
std::string format_success_rate(std::size_t processed, std::size_t total, const std::string& when_empty);
