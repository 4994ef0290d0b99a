#include "json_codec.hpp"

#include <stdexcept>

using nlohmann::json;

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static Decimal decimal_at(const json& j, const char* key, int scale)
{
    return j.at(key).get<Decimal>().quantize(scale);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::optional<Decimal> optional_decimal(const json& j, const char* key, int scale)
{
    if (!j.contains(key) || j.at(key).is_null())
        return std::nullopt;
    return decimal_at(j, key, scale);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::optional<int> optional_int(const json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null())
        return std::nullopt;
    return j.at(key).get<int>();
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string string_or(const json& j, const char* key, const std::string& fallback = "")
{
    if (!j.contains(key) || j.at(key).is_null())
        return fallback;
    return j.at(key).get<std::string>();
}

template <typename T>
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static json nullable(const std::optional<T>& v)
{
    return v ? json(*v) : json(nullptr);
}

void to_json(json& j, const Decimal& d)
{
    j = d.to_string();
}

void from_json(const json& j, Decimal& d)
{
    if (j.is_string())
        d = Decimal::parse_formatted(j.get<std::string>());
    else if (j.is_number())
        d = Decimal::parse(j.dump());
    else
        throw std::invalid_argument("expected a decimal string or number, got " + j.dump());
}

void to_json(json& j, const Date& d)
{
    j = d.to_string();
}

void from_json(const json& j, Date& d)
{
    d = Date::parse(j.get<std::string>());
}

void to_json(json& j, ActivityType t)
{
    j = to_string(t);
}

void from_json(const json& j, ActivityType& t)
{
    const auto name = j.get<std::string>();
    auto       type = activity_type_from_string(name);
    if (!type)
        throw std::invalid_argument("unknown activity type: " + name);
    t = *type;
}

void to_json(json& j, const EmissionFactor& f)
{
    j = json{ { "id", f.id },
              { "activity_type", f.activity_type },
              { "lookup_identifier", f.lookup_identifier },
              { "unit", f.unit },
              { "co2e_factor", f.co2e_factor },
              { "scope", f.scope },
              { "category", nullable(f.category) },
              { "source", f.source },
              { "notes", f.notes },
              { "created_at", f.created_at },
              { "updated_at", f.updated_at } };
}

void from_json(const json& j, EmissionFactor& f)
{
    f.id                = string_or(j, "id");
    f.activity_type     = j.at("activity_type").get<ActivityType>();
    f.lookup_identifier = j.at("lookup_identifier").get<std::string>();
    f.unit              = j.at("unit").get<std::string>();
    f.co2e_factor       = decimal_at(j, "co2e_factor", precision::kFactor);
    f.scope             = j.at("scope").get<int>();
    f.category          = optional_int(j, "category");
    f.source            = string_or(j, "source");
    f.notes             = string_or(j, "notes");
    f.created_at        = j.value("created_at", static_cast<std::int64_t>(0));
    f.updated_at        = j.value("updated_at", static_cast<std::int64_t>(0));

    if (f.scope < ghg::kScope1 || f.scope > ghg::kScope3)
        throw std::invalid_argument("scope must be 1, 2 or 3");
    if (f.lookup_identifier.empty())
        throw std::invalid_argument("lookup_identifier must not be empty");
}

void to_json(json& j, const Activity& a)
{
    j = json{ { "id", a.id },
              { "activity_type", a.type() },
              { "date", a.date },
              { "source_file", a.source_file },
              { "raw_data", a.raw_data },
              { "is_deleted", a.is_deleted },
              { "deleted_at", nullable(a.deleted_at) },
              { "created_at", a.created_at },
              { "updated_at", a.updated_at } };

    if (const auto* e = std::get_if<ElectricityUsage>(&a.details))
    {
        j["country"]   = e->country;
        j["usage_kwh"] = e->usage_kwh;
    }
    else if (const auto* t = std::get_if<AirTravel>(&a.details))
    {
        j["distance_miles"]  = nullable(t->distance_miles);
        j["distance_km"]     = nullable(t->distance_km);
        j["flight_range"]    = t->flight_range;
        j["passenger_class"] = t->passenger_class;
    }
    else if (const auto* g = std::get_if<GoodsServices>(&a.details))
    {
        j["supplier_category"] = g->supplier_category;
        j["spend_amount"]      = g->spend_amount;
        j["description"]       = g->description;
    }
}

Activity activity_from_json(const json& j, ActivityType type)
{
    Activity a;
    a.id          = string_or(j, "id");
    a.date        = j.at("date").get<Date>();
    a.source_file = string_or(j, "source_file");
    a.raw_data    = string_or(j, "raw_data");
    a.is_deleted  = j.value("is_deleted", false);
    if (j.contains("deleted_at") && !j.at("deleted_at").is_null())
        a.deleted_at = j.at("deleted_at").get<std::int64_t>();
    a.created_at = j.value("created_at", static_cast<std::int64_t>(0));
    a.updated_at = j.value("updated_at", static_cast<std::int64_t>(0));

    switch (type)
    {
    case ActivityType::Electricity:
        a.details = ElectricityUsage{ j.at("country").get<std::string>(),
                                      decimal_at(j, "usage_kwh", precision::kUsageKwh) };
        break;
    case ActivityType::AirTravel:
        a.details = AirTravel{ optional_decimal(j, "distance_miles", precision::kDistance),
                               optional_decimal(j, "distance_km", precision::kDistance),
                               j.at("flight_range").get<std::string>(), j.at("passenger_class").get<std::string>() };
        break;
    case ActivityType::GoodsServices:
        a.details = GoodsServices{ j.at("supplier_category").get<std::string>(),
                                   decimal_at(j, "spend_amount", precision::kSpend), string_or(j, "description") };
        break;
    }
    return a;
}

void from_json(const json& j, Activity& a)
{
    a = activity_from_json(j, j.at("activity_type").get<ActivityType>());
}

void to_json(json& j, const EmissionResult& r)
{
    j = json{ { "id", r.id },
              { "activity_type", r.activity.type },
              { "activity_id", r.activity.id },
              { "emission_factor_id", r.emission_factor_id },
              { "co2e_tonnes", r.co2e_tonnes },
              { "confidence_score", r.confidence_score },
              { "calculation_metadata", r.calculation_metadata },
              { "calculation_date", r.calculation_date },
              { "created_at", r.created_at },
              { "updated_at", r.updated_at } };
}

void to_json(json& j, const EmissionSummary& s)
{
    j = json{ { "id", s.id.empty() ? json(nullptr) : json(s.id) },
              { "from_date", s.from_date },
              { "to_date", s.to_date },
              { "scope", nullable(s.scope) },
              { "category", nullable(s.category) },
              { "activity_type", nullable(s.activity_type) },
              { "total_co2e_tonnes", s.total_co2e_tonnes },
              { "activity_count", s.activity_count },
              { "summary_type", to_string(s.summary_type) },
              { "created_at", s.created_at },
              { "updated_at", s.updated_at } };
}

void to_json(json& j, const CalculationError& e)
{
    j = json{ { "activity_id", e.activity_id }, { "activity_type", e.activity_type }, { "error", e.error } };
}

void to_json(json& j, const BatchStatistics& s)
{
    json by_type = json::object();
    for (const auto& [type, stats] : s.by_activity_type)
        by_type[to_string(type)] = json{ { "count", stats.count }, { "total_co2e", stats.total_co2e } };

    j = json{ { "total_activities", s.total_activities },
              { "total_processed", s.total_processed },
              { "total_errors", s.total_errors },
              { "success_rate", s.success_rate },
              { "total_co2e_tonnes", s.total_co2e_tonnes },
              { "by_activity_type", by_type } };
}

void to_json(json& j, const BatchSummary& s)
{
    j = json{ { "results", s.results }, { "statistics", s.statistics }, { "errors", s.errors } };
}

void to_json(json& j, const SweepSummary& s)
{
    j = json{ { "statistics", s.statistics },
              { "errors", s.errors },
              { "streaming", s.streaming },
              { "pages", s.pages },
              { "skipped_existing", s.skipped_existing },
              { "cancelled", s.cancelled },
              { "peak_tracked", s.peak_tracked } };
}

void to_json(json& j, const SummaryTotal& t)
{
    j = json{ { "total_co2e_tonnes", t.total_co2e_tonnes },
              { "total_activities", t.total_activities },
              { "summaries_aggregated", t.summaries_aggregated } };
}

void to_json(json& j, const BackfillReport& r)
{
    j = json{ { "periods", r.periods },
              { "summaries_created", r.created },
              { "summaries_updated", r.updated },
              { "summaries", r.summaries } };
}
