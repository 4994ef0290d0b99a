#pragma once
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "models.hpp"

// Thrown when deleting an emission factor that results still reference.
class FactorInUseError : public std::runtime_error
{
  public:
    explicit FactorInUseError(const std::string& factor_id)
        : std::runtime_error("emission factor " + factor_id + " is referenced by emission results")
    {
    }
};

struct AggregateTotals
{
    Decimal      total_co2e_tonnes{ 0, precision::kEmission };
    std::int64_t count = 0;
};

struct CommitReport
{
    std::size_t results_inserted   = 0;
    std::size_t results_deleted    = 0;
    std::size_t activities_updated = 0;
    std::size_t duplicates_skipped = 0; // inserts rejected by the one-live-result-per-activity key
    std::size_t inactive_skipped   = 0; // inserts dropped because the activity was soft-deleted meanwhile
};

// Fields a calculator derives from an activity. Commit writes only these and
// leaves every other column (notably the soft-delete flag) as currently stored.
struct ActivityUpdate
{
    ActivityRef            ref;
    std::optional<Decimal> distance_km;
    std::int64_t           updated_at = 0;
};

/**
 * Pending writes of one batch or page. Nothing reaches the store until
 * IStore::commit(); dropping or clearing a ChangeSet discards the work.
 * Commit order: result deletions, result inserts, activity updates. Inserts and
 * updates for an activity that is soft-deleted by then are dropped.
 */
class ChangeSet
{
  public:
    void stage_delete_results(const ActivityRef& ref) { deletions_.push_back(ref); }
    void stage_insert(const EmissionResult& result) { inserts_.push_back(result); }
    void stage_activity_update(const ActivityUpdate& update) { activity_updates_.push_back(update); }

    const EmissionResult* find_staged(const ActivityRef& ref) const
    {
        for (const auto& r : inserts_)
        {
            if (r.activity == ref)
                return &r;
        }
        return nullptr;
    }

    bool deletes_results_of(const ActivityRef& ref) const
    {
        return std::find(deletions_.begin(), deletions_.end(), ref) != deletions_.end();
    }

    const std::vector<ActivityRef>&    deletions() const { return deletions_; }
    const std::vector<EmissionResult>& inserts() const { return inserts_; }
    const std::vector<ActivityUpdate>& activity_updates() const { return activity_updates_; }

    // Number of tracked objects (staged rows of any kind).
    std::size_t size() const { return deletions_.size() + inserts_.size() + activity_updates_.size(); }
    bool        empty() const { return size() == 0; }

    // Detach everything; releases the memory held for the staged rows.
    void clear()
    {
        std::vector<ActivityRef>().swap(deletions_);
        std::vector<EmissionResult>().swap(inserts_);
        std::vector<ActivityUpdate>().swap(activity_updates_);
    }

  private:
    std::vector<ActivityRef>    deletions_;
    std::vector<EmissionResult> inserts_;
    std::vector<ActivityUpdate> activity_updates_;
};

struct IStore
{
    virtual ~IStore() = default;

    // Emission factors (reference data)
    virtual void                          put_factor(const EmissionFactor& factor)                      = 0;
    virtual std::optional<EmissionFactor> get_factor(const std::string& id) const                       = 0;
    virtual std::vector<EmissionFactor>   get_factors_by_activity_type(ActivityType type) const         = 0;
    virtual std::vector<EmissionFactor>   get_all_factors() const                                       = 0;
    // Returns false if absent; throws FactorInUseError if any result references it.
    virtual bool delete_factor(const std::string& id) = 0;

    // Activities. Reads only see rows that are not soft-deleted.
    virtual void                    add_activity(const Activity& activity)                         = 0;
    virtual std::optional<Activity> get_activity(const ActivityRef& ref) const                     = 0;
    // Ordered by id so that offset pagination is stable.
    virtual std::vector<Activity> get_active_activities(ActivityType type, std::size_t offset,
                                                        std::size_t limit) const             = 0;
    virtual std::size_t           count_active_activities(ActivityType type) const           = 0;
    virtual bool                  soft_delete_activity(const ActivityRef& ref, std::int64_t now) = 0;
    virtual bool                  restore_activity(const ActivityRef& ref)                   = 0;

    // Emission results
    virtual bool                          has_result(const ActivityRef& ref) const                 = 0;
    virtual std::optional<EmissionResult> get_latest_result(const ActivityRef& ref) const          = 0;
    virtual std::vector<EmissionResult>   get_results_for_activity(const ActivityRef& ref) const   = 0;
    virtual std::vector<EmissionResult>   list_results(std::size_t offset, std::size_t limit) const = 0;
    virtual std::vector<EmissionResult>   list_low_confidence(const Decimal& below, std::size_t offset,
                                                              std::size_t limit) const             = 0;
    virtual std::vector<ActivityRef>      list_result_refs(std::size_t limit) const                = 0;
    virtual std::size_t                   count_results() const                                    = 0;
    virtual CommitReport                  commit(const ChangeSet& changes)                         = 0;

    // SUM(co2e_tonnes), COUNT(*) over results with calculation_date in [from, to], joined to their
    // factor for scope/category. Results of soft-deleted activities are excluded.
    virtual AggregateTotals aggregate_results(const Date& from, const Date& to,
                                              const SummaryFilter& filter) const = 0;

    // Emission summaries
    virtual std::optional<EmissionSummary> find_summary(const SummaryKey& key) const = 0;
    // Upsert keyed on EmissionSummary::key(); an existing row keeps its id and created_at.
    virtual EmissionSummary put_summary(const EmissionSummary& summary) = 0;
    // Rows with from_date >= from and to_date <= to, filters applied when set.
    virtual std::vector<EmissionSummary> query_summaries(const Date& from, const Date& to,
                                                         const SummaryFilter& filter) const = 0;
    // Row with the greatest to_date among those matching the set filters.
    virtual std::optional<EmissionSummary> latest_summary(const SummaryFilter& filter) const = 0;
    virtual std::size_t                    count_summaries() const                          = 0;

    virtual void clear_db() = 0;
};

class InMemoryStore : public IStore
{
  public:
    // Emission factors

    void put_factor(const EmissionFactor& factor) override
    {
        std::scoped_lock lk(mu_);
        factors_[factor.id] = factor;
    }

    std::optional<EmissionFactor> get_factor(const std::string& id) const override
    {
        std::scoped_lock lk(mu_);
        auto             it = factors_.find(id);
        if (it == factors_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<EmissionFactor> get_factors_by_activity_type(ActivityType type) const override
    {
        std::scoped_lock            lk(mu_);
        std::vector<EmissionFactor> out;
        for (const auto& [_, f] : factors_)
        {
            if (f.activity_type == type)
                out.push_back(f);
        }
        return out;
    }

    std::vector<EmissionFactor> get_all_factors() const override
    {
        std::scoped_lock            lk(mu_);
        std::vector<EmissionFactor> out;
        out.reserve(factors_.size());
        for (const auto& [_, f] : factors_)
            out.push_back(f);
        return out;
    }

    bool delete_factor(const std::string& id) override
    {
        std::scoped_lock lk(mu_);
        auto             it = factors_.find(id);
        if (it == factors_.end())
            return false;
        for (const auto& [_, r] : results_)
        {
            if (r.emission_factor_id == id)
                throw FactorInUseError(id);
        }
        factors_.erase(it);
        return true;
    }

    // Activities

    void add_activity(const Activity& activity) override
    {
        std::scoped_lock lk(mu_);
        activities_[activity.type()][activity.id] = activity;
    }

    std::optional<Activity> get_activity(const ActivityRef& ref) const override
    {
        std::scoped_lock lk(mu_);
        const auto*      a = find_activity(ref);
        if (a == nullptr || a->is_deleted)
            return std::nullopt;
        return *a;
    }

    std::vector<Activity> get_active_activities(ActivityType type, std::size_t offset,
                                                std::size_t limit) const override
    {
        std::scoped_lock      lk(mu_);
        std::vector<Activity> out;
        auto                  table = activities_.find(type);
        if (table == activities_.end())
            return out;
        std::size_t skipped = 0;
        for (const auto& [_, a] : table->second)
        {
            if (a.is_deleted)
                continue;
            if (skipped < offset)
            {
                ++skipped;
                continue;
            }
            if (out.size() >= limit)
                break;
            out.push_back(a);
        }
        return out;
    }

    std::size_t count_active_activities(ActivityType type) const override
    {
        std::scoped_lock lk(mu_);
        auto             table = activities_.find(type);
        if (table == activities_.end())
            return 0;
        return static_cast<std::size_t>(std::count_if(table->second.begin(), table->second.end(),
                                                      [](const auto& kv) { return !kv.second.is_deleted; }));
    }

    bool soft_delete_activity(const ActivityRef& ref, std::int64_t now) override
    {
        std::scoped_lock lk(mu_);
        auto*            a = find_activity(ref);
        if (a == nullptr || a->is_deleted)
            return false;
        a->is_deleted = true;
        a->deleted_at = now;
        a->updated_at = now;
        return true;
    }

    bool restore_activity(const ActivityRef& ref) override
    {
        std::scoped_lock lk(mu_);
        auto*            a = find_activity(ref);
        if (a == nullptr || !a->is_deleted)
            return false;
        a->is_deleted = false;
        a->deleted_at.reset();
        return true;
    }

    // Emission results

    bool has_result(const ActivityRef& ref) const override
    {
        std::scoped_lock lk(mu_);
        return live_result_.count(ref) > 0;
    }

    std::optional<EmissionResult> get_latest_result(const ActivityRef& ref) const override
    {
        std::scoped_lock lk(mu_);
        auto             it = live_result_.find(ref);
        if (it == live_result_.end())
            return std::nullopt;
        return results_.at(it->second);
    }

    std::vector<EmissionResult> get_results_for_activity(const ActivityRef& ref) const override
    {
        std::scoped_lock            lk(mu_);
        std::vector<EmissionResult> out;
        for (const auto& [_, r] : results_)
        {
            if (r.activity == ref)
                out.push_back(r);
        }
        return out;
    }

    std::vector<EmissionResult> list_results(std::size_t offset, std::size_t limit) const override
    {
        std::scoped_lock lk(mu_);
        return page_of(results_ordered_newest_first(), offset, limit);
    }

    std::vector<EmissionResult> list_low_confidence(const Decimal& below, std::size_t offset,
                                                    std::size_t limit) const override
    {
        std::scoped_lock            lk(mu_);
        std::vector<EmissionResult> matching;
        for (auto& r : results_ordered_newest_first())
        {
            if (r.confidence_score < below)
                matching.push_back(std::move(r));
        }
        return page_of(std::move(matching), offset, limit);
    }

    std::vector<ActivityRef> list_result_refs(std::size_t limit) const override
    {
        std::scoped_lock         lk(mu_);
        std::vector<ActivityRef> out;
        for (const auto& [ref, _] : live_result_)
        {
            if (out.size() >= limit)
                break;
            out.push_back(ref);
        }
        return out;
    }

    std::size_t count_results() const override
    {
        std::scoped_lock lk(mu_);
        return results_.size();
    }

    // Applied under one lock, so a commit is all-or-nothing for concurrent readers.
    CommitReport commit(const ChangeSet& changes) override
    {
        std::scoped_lock lk(mu_);
        CommitReport     report;

        for (const auto& ref : changes.deletions())
        {
            for (auto it = results_.begin(); it != results_.end();)
            {
                if (it->second.activity == ref)
                {
                    it = results_.erase(it);
                    ++report.results_deleted;
                }
                else
                {
                    ++it;
                }
            }
            live_result_.erase(ref);
        }

        for (const auto& r : changes.inserts())
        {
            const auto* activity = find_activity(r.activity);
            if (activity != nullptr && activity->is_deleted)
            {
                ++report.inactive_skipped;
                continue;
            }
            if (live_result_.count(r.activity) > 0)
            {
                // another writer got there first
                ++report.duplicates_skipped;
                continue;
            }
            results_[r.id]          = r;
            live_result_[r.activity] = r.id;
            ++report.results_inserted;
        }

        for (const auto& u : changes.activity_updates())
        {
            auto* existing = find_activity(u.ref);
            if (existing == nullptr || existing->is_deleted)
                continue;
            if (auto* trip = std::get_if<AirTravel>(&existing->details))
                trip->distance_km = u.distance_km;
            existing->updated_at = u.updated_at;
            ++report.activities_updated;
        }
        return report;
    }

    AggregateTotals aggregate_results(const Date& from, const Date& to,
                                      const SummaryFilter& filter) const override
    {
        std::scoped_lock lk(mu_);
        AggregateTotals  totals;
        for (const auto& [_, r] : results_)
        {
            if (r.calculation_date < from || r.calculation_date > to)
                continue;
            if (filter.activity_type && r.activity.type != *filter.activity_type)
                continue;
            const auto* activity = find_activity(r.activity);
            if (activity != nullptr && activity->is_deleted)
                continue;
            auto factor = factors_.find(r.emission_factor_id);
            if (factor == factors_.end())
                continue;
            if (filter.scope && factor->second.scope != *filter.scope)
                continue;
            if (filter.category && factor->second.category != filter.category)
                continue;
            totals.total_co2e_tonnes += r.co2e_tonnes;
            ++totals.count;
        }
        return totals;
    }

    // Emission summaries

    std::optional<EmissionSummary> find_summary(const SummaryKey& key) const override
    {
        std::scoped_lock lk(mu_);
        for (const auto& s : summaries_)
        {
            if (s.key() == key)
                return s;
        }
        return std::nullopt;
    }

    EmissionSummary put_summary(const EmissionSummary& summary) override
    {
        std::scoped_lock lk(mu_);
        for (auto& s : summaries_)
        {
            if (s.key() == summary.key())
            {
                s.total_co2e_tonnes = summary.total_co2e_tonnes;
                s.activity_count    = summary.activity_count;
                s.updated_at        = summary.updated_at;
                return s;
            }
        }
        summaries_.push_back(summary);
        return summary;
    }

    std::vector<EmissionSummary> query_summaries(const Date& from, const Date& to,
                                                 const SummaryFilter& filter) const override
    {
        std::scoped_lock             lk(mu_);
        std::vector<EmissionSummary> out;
        for (const auto& s : summaries_)
        {
            if (s.from_date >= from && s.to_date <= to && matches(s, filter))
                out.push_back(s);
        }
        std::sort(out.begin(), out.end(),
                  [](const EmissionSummary& a, const EmissionSummary& b) { return a.from_date < b.from_date; });
        return out;
    }

    std::optional<EmissionSummary> latest_summary(const SummaryFilter& filter) const override
    {
        std::scoped_lock       lk(mu_);
        const EmissionSummary* best = nullptr;
        for (const auto& s : summaries_)
        {
            if (!matches(s, filter))
                continue;
            if (best == nullptr || best->to_date < s.to_date)
                best = &s;
        }
        if (best == nullptr)
            return std::nullopt;
        return *best;
    }

    std::size_t count_summaries() const override
    {
        std::scoped_lock lk(mu_);
        return summaries_.size();
    }

    void clear_db() override
    {
        std::scoped_lock lk(mu_);
        factors_.clear();
        activities_.clear();
        results_.clear();
        live_result_.clear();
        summaries_.clear();
    }

  private:
    mutable std::mutex                                        mu_;
    std::map<std::string, EmissionFactor>                     factors_;
    std::map<ActivityType, std::map<std::string, Activity>>   activities_;
    std::unordered_map<std::string, EmissionResult>           results_;
    std::map<ActivityRef, std::string>                        live_result_; // activity -> result id
    std::vector<EmissionSummary>                              summaries_;

    const Activity* find_activity(const ActivityRef& ref) const
    {
        auto table = activities_.find(ref.type);
        if (table == activities_.end())
            return nullptr;
        auto it = table->second.find(ref.id);
        return it == table->second.end() ? nullptr : &it->second;
    }

    Activity* find_activity(const ActivityRef& ref)
    {
        return const_cast<Activity*>(static_cast<const InMemoryStore*>(this)->find_activity(ref));
    }

    std::vector<EmissionResult> results_ordered_newest_first() const
    {
        std::vector<EmissionResult> out;
        out.reserve(results_.size());
        for (const auto& [_, r] : results_)
            out.push_back(r);
        std::sort(out.begin(), out.end(), [](const EmissionResult& a, const EmissionResult& b)
                  { return a.created_at != b.created_at ? a.created_at > b.created_at : a.id < b.id; });
        return out;
    }

    static std::vector<EmissionResult> page_of(std::vector<EmissionResult> all, std::size_t offset,
                                               std::size_t limit)
    {
        if (offset >= all.size())
            return {};
        auto first = all.begin() + static_cast<std::ptrdiff_t>(offset);
        auto last  = all.size() - offset > limit ? first + static_cast<std::ptrdiff_t>(limit) : all.end();
        return std::vector<EmissionResult>(std::make_move_iterator(first), std::make_move_iterator(last));
    }

    static bool matches(const EmissionSummary& s, const SummaryFilter& filter)
    {
        if (filter.scope && s.scope != filter.scope)
            return false;
        if (filter.category && s.category != filter.category)
            return false;
        if (filter.activity_type && s.activity_type != filter.activity_type)
            return false;
        return true;
    }
};
