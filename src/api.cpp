#include "api.hpp"

#include "emission_aggregator.hpp"
#include "emission_calculator.hpp"
#include "emission_factors.hpp"
#include "json_codec.hpp"
#include "logging.hpp"
#include "storage.hpp"

#include <algorithm>
#include <ctime>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using nlohmann::json;

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::int64_t now_epoch()
{
    return std::time(nullptr);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void json_response(httplib::Response& res, const json& j, int status = 200)
{
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static bool check_admin(const AppConfig& cfg, const httplib::Request& req)
{
    if (cfg.admin_api_key.empty())
        return true;
    auto it = req.headers.find("Authorization");
    if (it == req.headers.end())
        return false;
    const std::string prefix = "Bearer ";
    if (it->second.rfind(prefix, 0) != 0)
        return false;
    return it->second.substr(prefix.size()) == cfg.admin_api_key;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void unauthorized(httplib::Response& res)
{
    json_response(res, { { "error", "unauthorized" } }, 401);
}

// Runs a handler and maps what it throws onto an error response.
template <typename Fn>
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void guarded(const httplib::Request& req, httplib::Response& res, Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const json::exception& e)
    {
        json_response(res, { { "error", std::string("invalid JSON payload: ") + e.what() } }, 400);
    }
    catch (const std::invalid_argument& e)
    {
        json_response(res, { { "error", e.what() } }, 400);
    }
    catch (const FactorInUseError& e)
    {
        json_response(res, { { "error", e.what() } }, 409);
    }
    catch (const std::exception& e)
    {
        log_error(req.method + " " + req.path + " failed: " + e.what());
        json_response(res, { { "error", e.what() } }, 500);
    }
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static json parse_body(const httplib::Request& req)
{
    return json::parse(req.body.empty() ? std::string("{}") : req.body);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::optional<std::string> param(const httplib::Request& req, const char* name)
{
    if (!req.has_param(name))
        return std::nullopt;
    auto v = req.get_param_value(name);
    if (v.empty())
        return std::nullopt;
    return v;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static int to_int(const std::string& text, const char* name)
{
    std::size_t used = 0;
    int         v    = 0;
    try
    {
        v = std::stoi(text, &used);
    }
    catch (const std::logic_error&)
    {
        throw std::invalid_argument(std::string(name) + " must be an integer");
    }
    if (used != text.size())
        throw std::invalid_argument(std::string(name) + " must be an integer");
    return v;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::optional<int> int_param(const httplib::Request& req, const char* name)
{
    auto v = param(req, name);
    if (!v)
        return std::nullopt;
    return to_int(*v, name);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::size_t size_param(const httplib::Request& req, const char* name, std::size_t fallback)
{
    auto v = int_param(req, name);
    if (!v)
        return fallback;
    if (*v < 0)
        throw std::invalid_argument(std::string(name) + " must not be negative");
    return static_cast<std::size_t>(*v);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static bool bool_param(const httplib::Request& req, const char* name, bool fallback)
{
    auto v = param(req, name);
    if (!v)
        return fallback;
    return *v == "true" || *v == "1";
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static Date date_param(const httplib::Request& req, const char* name)
{
    auto v = param(req, name);
    if (!v)
        throw std::invalid_argument(std::string("missing query parameter ") + name);
    return Date::parse(*v);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static ActivityType activity_type_named(const std::string& name)
{
    auto type = activity_type_from_string(name);
    if (!type)
        throw std::invalid_argument("unknown activity type: " + name);
    return *type;
}

// scope, category and activity (or activity_type) query parameters
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static SummaryFilter filter_from_query(const httplib::Request& req)
{
    SummaryFilter filter;
    filter.scope    = int_param(req, "scope");
    filter.category = int_param(req, "category");
    auto activity   = param(req, "activity");
    if (!activity)
        activity = param(req, "activity_type");
    if (activity)
        filter.activity_type = activity_type_named(*activity);
    return filter;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static SummaryFilter filter_from_body(const json& body)
{
    SummaryFilter filter;
    if (body.contains("scope") && !body["scope"].is_null())
        filter.scope = body["scope"].get<int>();
    if (body.contains("category") && !body["category"].is_null())
        filter.category = body["category"].get<int>();
    if (body.contains("activity_type") && !body["activity_type"].is_null())
        filter.activity_type = body["activity_type"].get<ActivityType>();
    return filter;
}

// Searches every activity table for the id.
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::optional<ActivityRef> locate_activity(const IStore& store, const std::string& id)
{
    for (const auto type : all_activity_types())
    {
        ActivityRef ref{ type, id };
        if (store.get_activity(ref))
            return ref;
    }
    return std::nullopt;
}

// NOLINTNEXTLINE(-warnings-as-errors)
void configure_routes(httplib::Server& svr, IStore& store, const AppConfig& cfg) // NOLINT(readability-function-cognitive-complexity)
{
    // Health
    svr.Get("/health",
            [&](const httplib::Request&, httplib::Response& res)
            { json_response(res, { { "ok", true }, { "service", "scopekeeper" }, { "time", now_epoch() } }); });

    svr.Get("/",
            [&](const httplib::Request&, httplib::Response& res)
            {
                json_response(res, { { "service", "scopekeeper" },
                                     { "description", "GHG Protocol emissions calculation and aggregation" },
                                     { "health", "/health" },
                                     { "api", "/api/v1" } });
            });

    // Emission factors
    svr.Get("/api/v1/factors",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            auto type    = param(req, "activity_type");
                            auto factors = type ? store.get_factors_by_activity_type(activity_type_named(*type))
                                                : store.get_all_factors();
                            if (auto scope = int_param(req, "scope"))
                            {
                                factors.erase(std::remove_if(factors.begin(), factors.end(),
                                                             [&](const EmissionFactor& f) { return f.scope != *scope; }),
                                              factors.end());
                            }
                            json_response(res, factors);
                        });
            });

    svr.Post("/api/v1/factors",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 if (!check_admin(cfg, req))
                 {
                     unauthorized(res);
                     return;
                 }
                 guarded(req, res,
                         [&]
                         {
                             auto factor = parse_body(req).get<EmissionFactor>();
                             if (factor.id.empty())
                                 factor.id = default_factor_id(factor.activity_type, factor.lookup_identifier);
                             if (store.get_factor(factor.id))
                             {
                                 json_response(res, { { "error", "emission factor " + factor.id + " already exists" } },
                                               409);
                                 return;
                             }
                             factor.created_at = factor.updated_at = now_epoch();
                             store.put_factor(factor);
                             log_info("added emission factor " + factor.id);
                             json_response(res, factor, 201);
                         });
             });

    svr.Get(R"(/api/v1/factors/([A-Za-z0-9_\-]+))",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                auto factor = store.get_factor(req.matches[1].str());
                if (!factor)
                {
                    json_response(res, { { "error", "emission factor not found" } }, 404);
                    return;
                }
                json_response(res, *factor);
            });

    svr.Put(R"(/api/v1/factors/([A-Za-z0-9_\-]+))",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                if (!check_admin(cfg, req))
                {
                    unauthorized(res);
                    return;
                }
                guarded(req, res,
                        [&]
                        {
                            const std::string id       = req.matches[1].str();
                            auto              existing = store.get_factor(id);
                            if (!existing)
                            {
                                json_response(res, { { "error", "emission factor not found" } }, 404);
                                return;
                            }
                            json merged = *existing;
                            merged.update(parse_body(req));
                            merged["id"]         = id;
                            merged["created_at"] = existing->created_at;
                            merged["updated_at"] = now_epoch();

                            auto factor = merged.get<EmissionFactor>();
                            store.put_factor(factor);
                            log_info("updated emission factor " + id);
                            json_response(res, factor);
                        });
            });

    svr.Delete(R"(/api/v1/factors/([A-Za-z0-9_\-]+))",
               [&](const httplib::Request& req, httplib::Response& res)
               {
                   if (!check_admin(cfg, req))
                   {
                       unauthorized(res);
                       return;
                   }
                   guarded(req, res,
                           [&]
                           {
                               if (!store.delete_factor(req.matches[1].str()))
                               {
                                   json_response(res, { { "error", "emission factor not found" } }, 404);
                                   return;
                               }
                               json_response(res, { { "status", "deleted" } });
                           });
               });

    // Activities
    svr.Get(R"(/api/v1/activities/(electricity|air-travel|goods-services))",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            const auto type   = activity_type_named(req.matches[1].str());
                            const auto offset = size_param(req, "offset", 0);
                            const auto limit  = size_param(req, "limit", 100);
                            json_response(res, { { "items", store.get_active_activities(type, offset, limit) },
                                                 { "total", store.count_active_activities(type) },
                                                 { "offset", offset },
                                                 { "limit", limit } });
                        });
            });

    svr.Post(R"(/api/v1/activities/(electricity|air-travel|goods-services))",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 guarded(req, res,
                         [&]
                         {
                             auto activity = activity_from_json(parse_body(req), activity_type_named(req.matches[1].str()));
                             if (activity.id.empty())
                                 activity.id = generate_id();
                             activity.is_deleted = false;
                             activity.deleted_at.reset();
                             activity.created_at = activity.updated_at = now_epoch();
                             store.add_activity(activity);
                             json_response(res, activity, 201);
                         });
             });

    svr.Get(R"(/api/v1/activities/(electricity|air-travel|goods-services)/([A-Za-z0-9_\-]+))",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            auto activity = store.get_activity(
                                ActivityRef{ activity_type_named(req.matches[1].str()), req.matches[2].str() });
                            if (!activity)
                            {
                                json_response(res, { { "error", "activity not found" } }, 404);
                                return;
                            }
                            json_response(res, *activity);
                        });
            });

    svr.Delete(R"(/api/v1/activities/(electricity|air-travel|goods-services)/([A-Za-z0-9_\-]+))",
               [&](const httplib::Request& req, httplib::Response& res)
               {
                   guarded(req, res,
                           [&]
                           {
                               ActivityRef const ref{ activity_type_named(req.matches[1].str()), req.matches[2].str() };
                               if (!store.soft_delete_activity(ref, now_epoch()))
                               {
                                   json_response(res, { { "error", "activity not found" } }, 404);
                                   return;
                               }
                               json_response(res, { { "status", "deleted" } });
                           });
               });

    svr.Post(R"(/api/v1/activities/(electricity|air-travel|goods-services)/([A-Za-z0-9_\-]+)/restore)",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 guarded(req, res,
                         [&]
                         {
                             ActivityRef const ref{ activity_type_named(req.matches[1].str()), req.matches[2].str() };
                             if (!store.restore_activity(ref))
                             {
                                 json_response(res, { { "error", "no deleted activity with that id" } }, 404);
                                 return;
                             }
                             json_response(res, { { "status", "restored" } });
                         });
             });

    svr.Get(R"(/api/v1/activities/(electricity|air-travel|goods-services)/([A-Za-z0-9_\-]+)/results)",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            ActivityRef const ref{ activity_type_named(req.matches[1].str()), req.matches[2].str() };
                            json_response(res, store.get_results_for_activity(ref));
                        });
            });

    // Calculations
    svr.Post("/api/v1/calculations/calculate",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 guarded(req, res,
                         [&]
                         {
                             const auto body = parse_body(req);
                             if (!body.contains("activity_ids") || !body["activity_ids"].is_array())
                             {
                                 json_response(res, { { "error", "missing_activity_ids" } }, 400);
                                 return;
                             }
                             const bool         recalc    = body.value("recalculate", false);
                             std::optional<int> threshold;
                             if (body.contains("fuzzy_threshold"))
                                 threshold = body["fuzzy_threshold"].get<int>();

                             EmissionCalculationService service(store, CalculationOptions::from_config(cfg));
                             json                       results = json::array();
                             for (const auto& id_json : body["activity_ids"])
                             {
                                 const auto id  = id_json.get<std::string>();
                                 auto       ref = locate_activity(store, id);
                                 if (!ref)
                                 {
                                     log_warn("activity not found: " + id);
                                     continue;
                                 }
                                 if (auto result = service.calculate_by_ref(*ref, recalc, threshold))
                                     results.push_back(*result);
                             }
                             log_info("calculated emissions for " + std::to_string(results.size()) + " of " +
                                      std::to_string(body["activity_ids"].size()) + " requested activities");
                             json_response(res, results);
                         });
             });

    svr.Post("/api/v1/calculations/pending",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 if (!check_admin(cfg, req))
                 {
                     unauthorized(res);
                     return;
                 }
                 guarded(req, res,
                         [&]
                         {
                             SweepOptions options;
                             options.streaming = bool_param(req, "streaming", true);
                             if (auto size = int_param(req, "batch_size"))
                             {
                                 if (*size < 1)
                                     throw std::invalid_argument("batch_size must be at least 1");
                                 options.batch_size = static_cast<std::size_t>(*size);
                             }
                             EmissionCalculationService service(store, CalculationOptions::from_config(cfg));
                             json_response(res, service.calculate_all_pending(options));
                         });
             });

    svr.Get("/api/v1/results",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            json_response(res, { { "items", store.list_results(size_param(req, "offset", 0),
                                                                               size_param(req, "limit", 100)) },
                                                 { "total", store.count_results() } });
                        });
            });

    svr.Get("/api/v1/results/low-confidence",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            auto       text  = param(req, "threshold");
                            const auto below = text ? Decimal::parse(*text) : Decimal(80, precision::kConfidence);
                            json_response(res, store.list_low_confidence(below, size_param(req, "offset", 0),
                                                                         size_param(req, "limit", 100)));
                        });
            });

    // Aggregations
    svr.Post("/api/v1/aggregations/daily",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 if (!check_admin(cfg, req))
                 {
                     unauthorized(res);
                     return;
                 }
                 guarded(req, res,
                         [&]
                         {
                             auto text = param(req, "date");
                             if (!text)
                                 text = param(req, "target_date");
                             // yesterday by default
                             const Date day = text ? Date::parse(*text)
                                                   : Date::from_epoch_seconds(now_epoch()).add_days(-1);

                             EmissionAggregator aggregator(store);
                             auto               summaries = aggregator.aggregate_daily(day);
                             json_response(res, { { "success", true },
                                                  { "message", "aggregated emissions for " + day.to_string() },
                                                  { "summaries_created", summaries.size() },
                                                  { "summaries", summaries } });
                         });
             });

    svr.Post("/api/v1/aggregations/monthly",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 if (!check_admin(cfg, req))
                 {
                     unauthorized(res);
                     return;
                 }
                 guarded(req, res,
                         [&]
                         {
                             // last month by default
                             const auto today      = Date::from_epoch_seconds(now_epoch());
                             const auto last_month = today.add_days(-today.day);
                             const int year  = int_param(req, "year").value_or(last_month.year);
                             const int month = int_param(req, "month").value_or(last_month.month);

                             EmissionAggregator aggregator(store);
                             auto               summaries = aggregator.aggregate_monthly(year, month);
                             const auto         label     = Date::first_of_month(year, month).to_string().substr(0, 7);
                             json_response(res, { { "success", true },
                                                  { "message", "aggregated emissions for " + label },
                                                  { "summaries_created", summaries.size() },
                                                  { "summaries", summaries } });
                         });
             });

    svr.Post("/api/v1/aggregations/custom",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 if (!check_admin(cfg, req))
                 {
                     unauthorized(res);
                     return;
                 }
                 guarded(req, res,
                         [&]
                         {
                             const auto body = parse_body(req);
                             if (!body.contains("from_date") || !body.contains("to_date"))
                                 throw std::invalid_argument("from_date and to_date are required");
                             const auto from   = body["from_date"].get<Date>();
                             const auto to     = body["to_date"].get<Date>();
                             const auto filter = filter_from_body(body);

                             EmissionAggregator aggregator(store);
                             if (auto summary = aggregator.aggregate_custom(from, to, filter))
                             {
                                 json_response(res, *summary);
                                 return;
                             }

                             // nothing to aggregate: an unsaved zero summary
                             EmissionSummary empty;
                             empty.from_date         = from;
                             empty.to_date           = to;
                             empty.scope             = filter.scope;
                             empty.category          = filter.category;
                             empty.activity_type     = filter.activity_type;
                             empty.total_co2e_tonnes = Decimal(0, precision::kEmission);
                             empty.summary_type      = SummaryType::Custom;
                             json_response(res, empty);
                         });
             });

    svr.Post("/api/v1/aggregations/backfill",
             [&](const httplib::Request& req, httplib::Response& res)
             {
                 if (!check_admin(cfg, req))
                 {
                     unauthorized(res);
                     return;
                 }
                 guarded(req, res,
                         [&]
                         {
                             const auto from = date_param(req, "from_date");
                             const auto to   = date_param(req, "to_date");
                             const auto name = param(req, "aggregation_type").value_or("daily");
                             const auto granularity = granularity_from_string(name);
                             if (!granularity)
                                 throw std::invalid_argument("aggregation_type must be daily or monthly");

                             EmissionAggregator aggregator(store);
                             json_response(res, aggregator.backfill(from, to, *granularity));
                         });
             });

    // Summaries
    svr.Get("/api/v1/summaries",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            SummaryQueries const queries(store);
                            json_response(res, queries.summaries_in_range(date_param(req, "from_date"),
                                                                          date_param(req, "to_date"),
                                                                          filter_from_query(req)));
                        });
            });

    svr.Get("/api/v1/summaries/total",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            auto type = SummaryType::Daily;
                            if (auto name = param(req, "summary_type"))
                            {
                                auto parsed = summary_type_from_string(*name);
                                if (!parsed)
                                    throw std::invalid_argument("unknown summary_type: " + *name);
                                type = *parsed;
                            }
                            const auto from = date_param(req, "from_date");
                            const auto to   = date_param(req, "to_date");

                            SummaryQueries const queries(store);
                            json out       = queries.total_in_range(from, to, filter_from_query(req), type);
                            out["from_date"] = from;
                            out["to_date"]   = to;
                            json_response(res, out);
                        });
            });

    svr.Get(R"(/api/v1/summaries/monthly/(\d+)/(\d+))",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            SummaryQueries const queries(store);
                            json_response(res, queries.monthly_summaries(to_int(req.matches[1].str(), "year"),
                                                                         to_int(req.matches[2].str(), "month"),
                                                                         filter_from_query(req)));
                        });
            });

    svr.Get("/api/v1/summaries/latest",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            SummaryQueries const queries(store);
                            auto                 latest = queries.latest_summary(filter_from_query(req));
                            if (!latest)
                            {
                                json_response(res, { { "error", "no summaries found" } }, 404);
                                return;
                            }
                            json_response(res, *latest);
                        });
            });

    svr.Get("/api/v1/summaries/breakdown",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                guarded(req, res,
                        [&]
                        {
                            const auto name      = param(req, "breakdown_by").value_or("scope");
                            const auto dimension = breakdown_dimension_from_string(name);
                            if (!dimension)
                                throw std::invalid_argument("breakdown_by must be scope, category or activity");
                            const auto from = date_param(req, "from_date");
                            const auto to   = date_param(req, "to_date");

                            SummaryQueries const queries(store);
                            json                 groups = json::object();
                            for (const auto& [key, entry] : queries.breakdown(from, to, *dimension))
                                groups[key] = { { "total_co2e_tonnes", entry.total_co2e_tonnes },
                                                { "activity_count", entry.activity_count } };
                            json_response(res, { { "breakdown_by", name },
                                                 { "from_date", from },
                                                 { "to_date", to },
                                                 { "breakdown", groups } });
                        });
            });
}
