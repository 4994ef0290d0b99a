#pragma once
#include "storage.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/exception/operation_exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/index.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/uri.hpp>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * MongoDB-backed store.
 *
 * Collections: emission_factors, electricity_activities, air_travel_activities,
 * goods_services_activities, emission_results, emission_summaries.
 * Fixed-point values are stored as decimal strings, dates as "YYYY-MM-DD".
 * emission_results has a unique index on (activity_type, activity_id), which is what
 * keeps one live result per activity across processes.
 *
 * commit() applies its writes in order without a multi-document transaction.
 */
class MongoStore : public IStore
{
  public:
    explicit MongoStore(const std::string& uri, const std::string& dbname = "scopekeeper")
        : client_{ connect(uri) }, db_{ client_[dbname] }
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;

        mongocxx::options::index unique;
        unique.unique(true);
        db_["emission_results"].create_index(make_document(kvp("activity_type", 1), kvp("activity_id", 1)), unique);
        db_["emission_results"].create_index(make_document(kvp("calculation_date", 1)));
        db_["emission_results"].create_index(make_document(kvp("created_at", -1)));
        db_["emission_summaries"].create_index(make_document(kvp("from_date", 1), kvp("to_date", 1), kvp("scope", 1),
                                                             kvp("category", 1), kvp("activity_type", 1),
                                                             kvp("summary_type", 1)),
                                               unique);
    }

    // Emission factors

    void put_factor(const EmissionFactor& factor) override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        mongocxx::options::replace opts;
        opts.upsert(true);
        db_["emission_factors"].replace_one(make_document(kvp("_id", factor.id)), factor_doc(factor), opts);
    }

    std::optional<EmissionFactor> get_factor(const std::string& id) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        auto doc = db_["emission_factors"].find_one(make_document(kvp("_id", id)));
        if (!doc)
            return std::nullopt;
        return factor_from(doc->view());
    }

    std::vector<EmissionFactor> get_factors_by_activity_type(ActivityType type) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        std::vector<EmissionFactor> out;
        auto cursor = db_["emission_factors"].find(make_document(kvp("activity_type", static_cast<int>(type))));
        for (auto&& d : cursor)
            out.push_back(factor_from(d));
        return out;
    }

    std::vector<EmissionFactor> get_all_factors() const override
    {
        std::vector<EmissionFactor> out;
        auto                        cursor = db_["emission_factors"].find({});
        for (auto&& d : cursor)
            out.push_back(factor_from(d));
        return out;
    }

    bool delete_factor(const std::string& id) override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        if (db_["emission_results"].count_documents(make_document(kvp("emission_factor_id", id))) > 0)
            throw FactorInUseError(id);
        auto res = db_["emission_factors"].delete_one(make_document(kvp("_id", id)));
        return res && res->deleted_count() > 0;
    }

    // Activities

    void add_activity(const Activity& activity) override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        mongocxx::options::replace opts;
        opts.upsert(true);
        activities(activity.type()).replace_one(make_document(kvp("_id", activity.id)), activity_doc(activity), opts);
    }

    std::optional<Activity> get_activity(const ActivityRef& ref) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        auto doc = activities(ref.type).find_one(make_document(kvp("_id", ref.id), kvp("is_deleted", false)));
        if (!doc)
            return std::nullopt;
        return activity_from(ref.type, doc->view());
    }

    std::vector<Activity> get_active_activities(ActivityType type, std::size_t offset,
                                                std::size_t limit) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        std::vector<Activity>   out;
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("_id", 1)));
        opts.skip(static_cast<std::int64_t>(offset));
        opts.limit(static_cast<std::int64_t>(limit));
        auto cursor = activities(type).find(make_document(kvp("is_deleted", false)), opts);
        for (auto&& d : cursor)
            out.push_back(activity_from(type, d));
        return out;
    }

    std::size_t count_active_activities(ActivityType type) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        return static_cast<std::size_t>(activities(type).count_documents(make_document(kvp("is_deleted", false))));
    }

    bool soft_delete_activity(const ActivityRef& ref, std::int64_t now) override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        auto res = activities(ref.type).update_one(
            make_document(kvp("_id", ref.id), kvp("is_deleted", false)),
            make_document(kvp("$set", make_document(kvp("is_deleted", true), kvp("deleted_at", now),
                                                    kvp("updated_at", now)))));
        if (!res || res->modified_count() == 0)
            return false;
        mark_results_deleted(ref, true);
        return true;
    }

    bool restore_activity(const ActivityRef& ref) override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        auto res = activities(ref.type).update_one(
            make_document(kvp("_id", ref.id), kvp("is_deleted", true)),
            make_document(kvp("$set", make_document(kvp("is_deleted", false), kvp("deleted_at", bsoncxx::types::b_null{})))));
        if (!res || res->modified_count() == 0)
            return false;
        mark_results_deleted(ref, false);
        return true;
    }

    // Emission results

    bool has_result(const ActivityRef& ref) const override
    {
        return db_["emission_results"].count_documents(ref_filter(ref)) > 0;
    }

    std::optional<EmissionResult> get_latest_result(const ActivityRef& ref) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("created_at", -1)));
        auto doc = db_["emission_results"].find_one(ref_filter(ref), opts);
        if (!doc)
            return std::nullopt;
        return result_from(doc->view());
    }

    std::vector<EmissionResult> get_results_for_activity(const ActivityRef& ref) const override
    {
        std::vector<EmissionResult> out;
        auto                        cursor = db_["emission_results"].find(ref_filter(ref));
        for (auto&& d : cursor)
            out.push_back(result_from(d));
        return out;
    }

    std::vector<EmissionResult> list_results(std::size_t offset, std::size_t limit) const override
    {
        return find_results({}, offset, limit);
    }

    std::vector<EmissionResult> list_low_confidence(const Decimal& below, std::size_t offset,
                                                    std::size_t limit) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        // confidence < below  <=>  hundredths < ceil(below * 100)
        const auto   floor  = below.quantize(precision::kConfidence, Decimal::Rounding::Down);
        std::int64_t cutoff = floor.units() + (floor < below ? 1 : 0);
        return find_results(make_document(kvp("confidence_hundredths", make_document(kvp("$lt", cutoff)))), offset,
                            limit);
    }

    std::vector<ActivityRef> list_result_refs(std::size_t limit) const override
    {
        std::vector<ActivityRef> out;
        mongocxx::options::find  opts;
        opts.limit(static_cast<std::int64_t>(limit));
        auto cursor = db_["emission_results"].find({}, opts);
        for (auto&& d : cursor)
            out.push_back(ActivityRef{ static_cast<ActivityType>(d["activity_type"].get_int32().value),
                                       std::string{ d["activity_id"].get_string().value } });
        return out;
    }

    std::size_t count_results() const override
    {
        return static_cast<std::size_t>(db_["emission_results"].count_documents({}));
    }

    CommitReport commit(const ChangeSet& changes) override
    {
        CommitReport report;
        auto         results = db_["emission_results"];

        for (const auto& ref : changes.deletions())
        {
            auto res = results.delete_many(ref_filter(ref));
            if (res)
                report.results_deleted += static_cast<std::size_t>(res->deleted_count());
        }

        for (const auto& r : changes.inserts())
        {
            if (is_deleted(r.activity))
            {
                ++report.inactive_skipped;
                continue;
            }
            try
            {
                results.insert_one(result_doc(r, false));
                ++report.results_inserted;
            }
            catch (const mongocxx::operation_exception& e)
            {
                if (e.code().value() != kDuplicateKey)
                    throw;
                ++report.duplicates_skipped;
            }
        }

        for (const auto& u : changes.activity_updates())
        {
            using bsoncxx::builder::basic::kvp;
            using bsoncxx::builder::basic::make_document;
            bsoncxx::builder::basic::document set;
            if (u.ref.type == ActivityType::AirTravel)
                append_nullable_decimal(set, "distance_km", u.distance_km);
            set.append(kvp("updated_at", u.updated_at));

            // a concurrent soft delete wins: the filter no longer matches
            auto res = activities(u.ref.type)
                           .update_one(make_document(kvp("_id", u.ref.id), kvp("is_deleted", false)),
                                       make_document(kvp("$set", set.extract())));
            if (res && res->matched_count() > 0)
                ++report.activities_updated;
        }
        return report;
    }

    AggregateTotals aggregate_results(const Date& from, const Date& to,
                                      const SummaryFilter& filter) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;

        std::unordered_map<std::string, EmissionFactor> factors;
        for (auto& f : get_all_factors())
            factors.emplace(f.id, std::move(f));

        bsoncxx::builder::basic::document q;
        q.append(kvp("calculation_date",
                     make_document(kvp("$gte", from.to_string()), kvp("$lte", to.to_string()))));
        q.append(kvp("activity_deleted", false));
        if (filter.activity_type)
            q.append(kvp("activity_type", static_cast<int>(*filter.activity_type)));

        AggregateTotals totals;
        auto            cursor = db_["emission_results"].find(q.extract());
        for (auto&& d : cursor)
        {
            auto factor = factors.find(std::string{ d["emission_factor_id"].get_string().value });
            if (factor == factors.end())
                continue;
            if (filter.scope && factor->second.scope != *filter.scope)
                continue;
            if (filter.category && factor->second.category != filter.category)
                continue;
            totals.total_co2e_tonnes += Decimal::parse(std::string{ d["co2e_tonnes"].get_string().value });
            ++totals.count;
        }
        return totals;
    }

    // Emission summaries

    std::optional<EmissionSummary> find_summary(const SummaryKey& key) const override
    {
        auto doc = db_["emission_summaries"].find_one(key_filter(key));
        if (!doc)
            return std::nullopt;
        return summary_from(doc->view());
    }

    EmissionSummary put_summary(const EmissionSummary& summary) override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        const auto key = summary.key();

        mongocxx::options::update opts;
        opts.upsert(true);
        db_["emission_summaries"].update_one(
            key_filter(key),
            make_document(kvp("$set", make_document(kvp("total_co2e_tonnes", summary.total_co2e_tonnes.to_string()),
                                                    kvp("activity_count", summary.activity_count),
                                                    kvp("updated_at", summary.updated_at))),
                          kvp("$setOnInsert",
                              make_document(kvp("_id", summary.id), kvp("created_at", summary.created_at)))),
            opts);

        auto stored = find_summary(key);
        if (!stored)
            throw std::runtime_error("summary upsert did not persist");
        return *stored;
    }

    std::vector<EmissionSummary> query_summaries(const Date& from, const Date& to,
                                                 const SummaryFilter& filter) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        bsoncxx::builder::basic::document q;
        q.append(kvp("from_date", make_document(kvp("$gte", from.to_string()))));
        q.append(kvp("to_date", make_document(kvp("$lte", to.to_string()))));
        append_set_filters(q, filter);

        mongocxx::options::find opts;
        opts.sort(make_document(kvp("from_date", 1)));

        std::vector<EmissionSummary> out;
        auto                         cursor = db_["emission_summaries"].find(q.extract(), opts);
        for (auto&& d : cursor)
            out.push_back(summary_from(d));
        return out;
    }

    std::optional<EmissionSummary> latest_summary(const SummaryFilter& filter) const override
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        bsoncxx::builder::basic::document q;
        append_set_filters(q, filter);

        mongocxx::options::find opts;
        opts.sort(make_document(kvp("to_date", -1)));
        auto doc = db_["emission_summaries"].find_one(q.extract(), opts);
        if (!doc)
            return std::nullopt;
        return summary_from(doc->view());
    }

    std::size_t count_summaries() const override
    {
        return static_cast<std::size_t>(db_["emission_summaries"].count_documents({}));
    }

    void clear_db() override
    {
        for (const auto type : all_activity_types())
            activities(type).delete_many({});
        db_["emission_results"].delete_many({});
        db_["emission_summaries"].delete_many({});
        db_["emission_factors"].delete_many({});
    }

  private:
    static constexpr int kDuplicateKey = 11000;

    mongocxx::client   client_;
    mongocxx::database db_;

    // The driver allows one instance per process; it must outlive every client.
    static mongocxx::client connect(const std::string& uri)
    {
        static mongocxx::instance instance;
        return mongocxx::client{ mongocxx::uri{ uri } };
    }

    mongocxx::collection activities(ActivityType type) const
    {
        switch (type)
        {
        case ActivityType::Electricity:
            return db_["electricity_activities"];
        case ActivityType::AirTravel:
            return db_["air_travel_activities"];
        case ActivityType::GoodsServices:
            return db_["goods_services_activities"];
        }
        throw std::invalid_argument("unknown activity type");
    }

    static bsoncxx::document::value ref_filter(const ActivityRef& ref)
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        return make_document(kvp("activity_type", static_cast<int>(ref.type)), kvp("activity_id", ref.id));
    }

    template <typename T>
    static void append_nullable(bsoncxx::builder::basic::document& doc, const char* key, const std::optional<T>& v)
    {
        using bsoncxx::builder::basic::kvp;
        if (v)
            doc.append(kvp(key, *v));
        else
            doc.append(kvp(key, bsoncxx::types::b_null{}));
    }

    static void append_nullable_decimal(bsoncxx::builder::basic::document& doc, const char* key,
                                        const std::optional<Decimal>& v)
    {
        using bsoncxx::builder::basic::kvp;
        if (v)
            doc.append(kvp(key, v->to_string()));
        else
            doc.append(kvp(key, bsoncxx::types::b_null{}));
    }

    static void append_nullable_type(bsoncxx::builder::basic::document& doc, const std::optional<ActivityType>& t)
    {
        append_nullable(doc, "activity_type", t ? std::optional<int>(static_cast<int>(*t)) : std::nullopt);
    }

    static void append_set_filters(bsoncxx::builder::basic::document& doc, const SummaryFilter& filter)
    {
        using bsoncxx::builder::basic::kvp;
        if (filter.scope)
            doc.append(kvp("scope", *filter.scope));
        if (filter.category)
            doc.append(kvp("category", *filter.category));
        if (filter.activity_type)
            doc.append(kvp("activity_type", static_cast<int>(*filter.activity_type)));
    }

    static bsoncxx::document::value key_filter(const SummaryKey& key)
    {
        using bsoncxx::builder::basic::kvp;
        bsoncxx::builder::basic::document doc;
        doc.append(kvp("from_date", key.from_date.to_string()));
        doc.append(kvp("to_date", key.to_date.to_string()));
        append_nullable(doc, "scope", key.filter.scope);
        append_nullable(doc, "category", key.filter.category);
        append_nullable_type(doc, key.filter.activity_type);
        doc.append(kvp("summary_type", to_string(key.summary_type)));
        return doc.extract();
    }

    static bool is_null(const bsoncxx::document::element& e)
    {
        return !e || e.type() == bsoncxx::type::k_null;
    }

    static std::string str(const bsoncxx::document::element& e)
    {
        return is_null(e) ? std::string{} : std::string{ e.get_string().value };
    }

    static std::optional<int> opt_int(const bsoncxx::document::element& e)
    {
        if (is_null(e))
            return std::nullopt;
        return e.get_int32().value;
    }

    static std::optional<Decimal> opt_decimal(const bsoncxx::document::element& e)
    {
        if (is_null(e))
            return std::nullopt;
        return Decimal::parse(str(e));
    }

    static bsoncxx::document::value factor_doc(const EmissionFactor& f)
    {
        using bsoncxx::builder::basic::kvp;
        bsoncxx::builder::basic::document doc;
        doc.append(kvp("_id", f.id));
        doc.append(kvp("activity_type", static_cast<int>(f.activity_type)));
        doc.append(kvp("lookup_identifier", f.lookup_identifier));
        doc.append(kvp("unit", f.unit));
        doc.append(kvp("co2e_factor", f.co2e_factor.to_string()));
        doc.append(kvp("scope", f.scope));
        append_nullable(doc, "category", f.category);
        doc.append(kvp("source", f.source));
        doc.append(kvp("notes", f.notes));
        doc.append(kvp("created_at", f.created_at));
        doc.append(kvp("updated_at", f.updated_at));
        return doc.extract();
    }

    static EmissionFactor factor_from(const bsoncxx::document::view& d)
    {
        EmissionFactor f;
        f.id                = str(d["_id"]);
        f.activity_type     = static_cast<ActivityType>(d["activity_type"].get_int32().value);
        f.lookup_identifier = str(d["lookup_identifier"]);
        f.unit              = str(d["unit"]);
        f.co2e_factor       = Decimal::parse(str(d["co2e_factor"]));
        f.scope             = d["scope"].get_int32().value;
        f.category          = opt_int(d["category"]);
        f.source            = str(d["source"]);
        f.notes             = str(d["notes"]);
        f.created_at        = d["created_at"].get_int64().value;
        f.updated_at        = d["updated_at"].get_int64().value;
        return f;
    }

    static bsoncxx::document::value activity_doc(const Activity& a)
    {
        using bsoncxx::builder::basic::kvp;
        bsoncxx::builder::basic::document doc;
        doc.append(kvp("_id", a.id));
        doc.append(kvp("date", a.date.to_string()));
        doc.append(kvp("source_file", a.source_file));
        doc.append(kvp("raw_data", a.raw_data));
        doc.append(kvp("is_deleted", a.is_deleted));
        append_nullable(doc, "deleted_at", a.deleted_at);
        doc.append(kvp("created_at", a.created_at));
        doc.append(kvp("updated_at", a.updated_at));

        if (const auto* e = std::get_if<ElectricityUsage>(&a.details))
        {
            doc.append(kvp("country", e->country));
            doc.append(kvp("usage_kwh", e->usage_kwh.to_string()));
        }
        else if (const auto* t = std::get_if<AirTravel>(&a.details))
        {
            append_nullable_decimal(doc, "distance_miles", t->distance_miles);
            append_nullable_decimal(doc, "distance_km", t->distance_km);
            doc.append(kvp("flight_range", t->flight_range));
            doc.append(kvp("passenger_class", t->passenger_class));
        }
        else if (const auto* g = std::get_if<GoodsServices>(&a.details))
        {
            doc.append(kvp("supplier_category", g->supplier_category));
            doc.append(kvp("spend_amount", g->spend_amount.to_string()));
            doc.append(kvp("description", g->description));
        }
        return doc.extract();
    }

    static Activity activity_from(ActivityType type, const bsoncxx::document::view& d)
    {
        Activity a;
        a.id          = str(d["_id"]);
        a.date        = Date::parse(str(d["date"]));
        a.source_file = str(d["source_file"]);
        a.raw_data    = str(d["raw_data"]);
        a.is_deleted  = d["is_deleted"].get_bool().value;
        if (!is_null(d["deleted_at"]))
            a.deleted_at = d["deleted_at"].get_int64().value;
        a.created_at = d["created_at"].get_int64().value;
        a.updated_at = d["updated_at"].get_int64().value;

        switch (type)
        {
        case ActivityType::Electricity:
            a.details = ElectricityUsage{ str(d["country"]), Decimal::parse(str(d["usage_kwh"])) };
            break;
        case ActivityType::AirTravel:
            a.details = AirTravel{ opt_decimal(d["distance_miles"]), opt_decimal(d["distance_km"]),
                                   str(d["flight_range"]), str(d["passenger_class"]) };
            break;
        case ActivityType::GoodsServices:
            a.details = GoodsServices{ str(d["supplier_category"]), Decimal::parse(str(d["spend_amount"])),
                                       str(d["description"]) };
            break;
        }
        return a;
    }

    static bsoncxx::document::value result_doc(const EmissionResult& r, bool activity_deleted)
    {
        using bsoncxx::builder::basic::kvp;
        bsoncxx::builder::basic::document meta;
        for (const auto& [k, v] : r.calculation_metadata)
            meta.append(kvp(k, v));

        bsoncxx::builder::basic::document doc;
        doc.append(kvp("_id", r.id));
        doc.append(kvp("activity_type", static_cast<int>(r.activity.type)));
        doc.append(kvp("activity_id", r.activity.id));
        doc.append(kvp("activity_deleted", activity_deleted));
        doc.append(kvp("emission_factor_id", r.emission_factor_id));
        doc.append(kvp("co2e_tonnes", r.co2e_tonnes.to_string()));
        doc.append(kvp("confidence_score", r.confidence_score.to_string()));
        doc.append(kvp("confidence_hundredths", r.confidence_score.quantize(precision::kConfidence).units()));
        doc.append(kvp("calculation_metadata", meta.extract()));
        doc.append(kvp("calculation_date", r.calculation_date.to_string()));
        doc.append(kvp("created_at", r.created_at));
        doc.append(kvp("updated_at", r.updated_at));
        return doc.extract();
    }

    static EmissionResult result_from(const bsoncxx::document::view& d)
    {
        EmissionResult r;
        r.id                 = str(d["_id"]);
        r.activity           = ActivityRef{ static_cast<ActivityType>(d["activity_type"].get_int32().value),
                                            str(d["activity_id"]) };
        r.emission_factor_id = str(d["emission_factor_id"]);
        r.co2e_tonnes        = Decimal::parse(str(d["co2e_tonnes"]));
        r.confidence_score   = Decimal::parse(str(d["confidence_score"]));
        for (const auto& e : d["calculation_metadata"].get_document().value)
            r.calculation_metadata[std::string{ e.key() }] = std::string{ e.get_string().value };
        r.calculation_date = Date::parse(str(d["calculation_date"]));
        r.created_at       = d["created_at"].get_int64().value;
        r.updated_at       = d["updated_at"].get_int64().value;
        return r;
    }

    static EmissionSummary summary_from(const bsoncxx::document::view& d)
    {
        EmissionSummary s;
        s.id        = str(d["_id"]);
        s.from_date = Date::parse(str(d["from_date"]));
        s.to_date   = Date::parse(str(d["to_date"]));
        s.scope     = opt_int(d["scope"]);
        s.category  = opt_int(d["category"]);
        if (auto t = opt_int(d["activity_type"]))
            s.activity_type = static_cast<ActivityType>(*t);
        s.total_co2e_tonnes = Decimal::parse(str(d["total_co2e_tonnes"]));
        s.activity_count    = d["activity_count"].get_int64().value;
        s.summary_type      = summary_type_from_string(str(d["summary_type"])).value_or(SummaryType::Custom);
        s.created_at        = d["created_at"].get_int64().value;
        s.updated_at        = d["updated_at"].get_int64().value;
        return s;
    }

    std::vector<EmissionResult> find_results(bsoncxx::document::view_or_value filter, std::size_t offset,
                                             std::size_t limit) const
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("created_at", -1), kvp("_id", 1)));
        opts.skip(static_cast<std::int64_t>(offset));
        opts.limit(static_cast<std::int64_t>(limit));

        std::vector<EmissionResult> out;
        auto                        cursor = db_["emission_results"].find(std::move(filter), opts);
        for (auto&& d : cursor)
            out.push_back(result_from(d));
        return out;
    }

    bool is_deleted(const ActivityRef& ref) const
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        return activities(ref.type).count_documents(make_document(kvp("_id", ref.id), kvp("is_deleted", true))) > 0;
    }

    void mark_results_deleted(const ActivityRef& ref, bool deleted)
    {
        using bsoncxx::builder::basic::kvp;
        using bsoncxx::builder::basic::make_document;
        db_["emission_results"].update_many(ref_filter(ref),
                                            make_document(kvp("$set", make_document(kvp("activity_deleted", deleted)))));
    }
};
