#pragma once
#include "calendar.hpp"
#include "decimal.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

// Activity categories, in the same order as the ActivityDetails alternatives below.
enum class ActivityType
{
    Electricity   = 0,
    AirTravel     = 1,
    GoodsServices = 2
};

// Display names: "Electricity", "Air Travel", "Purchased Goods and Services"
const std::string& to_string(ActivityType type);

// Accepts display names and slugs ("electricity", "air_travel", "air-travel",
// "goods_services", "goods-services"), case-insensitively.
std::optional<ActivityType> activity_type_from_string(const std::string& name);

const std::array<ActivityType, 3>& all_activity_types();

// GHG Protocol scopes and the Scope 3 categories the system knows about.
namespace ghg
{
constexpr int kScope1 = 1;
constexpr int kScope2 = 2;
constexpr int kScope3 = 3;

constexpr int kCategoryPurchasedGoods = 1;
constexpr int kCategoryBusinessTravel = 6;

std::string category_name(int category); // "Purchased Goods and Services", "Business Travel", "Unknown"
} // namespace ghg

// Fractional digits of every persisted fixed-point field.
namespace precision
{
constexpr int kFactor     = 6;
constexpr int kEmission   = 7;
constexpr int kConfidence = 2;
constexpr int kUsageKwh   = 4;
constexpr int kDistance   = 2;
constexpr int kSpend      = 2;
} // namespace precision

/**
 * One row of the emission factor reference table.
 * co2e_factor is expressed in kg CO2e per `unit` (kWh, km, currency unit).
 */
struct EmissionFactor
{
    std::string        id;
    ActivityType       activity_type = ActivityType::Electricity;
    std::string        lookup_identifier; // e.g. "United Kingdom", "Short-haul, Economy class"
    std::string        unit;              // e.g. "kWh", "passenger.km", "GBP"
    Decimal            co2e_factor;       // 6 fractional digits
    int                scope = ghg::kScope2;
    std::optional<int> category;          // Scope 3 category, empty otherwise
    std::string        source;            // e.g. "DEFRA-2024"
    std::string        notes;
    std::int64_t       created_at = 0; // epoch seconds
    std::int64_t       updated_at = 0;
};

struct ElectricityUsage
{
    std::string country;
    Decimal     usage_kwh; // 4 fractional digits
};

struct AirTravel
{
    std::optional<Decimal> distance_miles; // 2 fractional digits
    std::optional<Decimal> distance_km;    // 2 fractional digits
    std::string            flight_range;    // "Domestic", "Short-haul", "Long-haul", ...
    std::string            passenger_class; // "Economy class", "Business class", ...
};

struct GoodsServices
{
    std::string supplier_category;
    Decimal     spend_amount; // 2 fractional digits
    std::string description;
};

bool operator==(const ElectricityUsage& a, const ElectricityUsage& b);
bool operator==(const AirTravel& a, const AirTravel& b);
bool operator==(const GoodsServices& a, const GoodsServices& b);
bool operator!=(const ElectricityUsage& a, const ElectricityUsage& b);
bool operator!=(const AirTravel& a, const AirTravel& b);
bool operator!=(const GoodsServices& a, const GoodsServices& b);

using ActivityDetails = std::variant<ElectricityUsage, AirTravel, GoodsServices>;

// Weak reference to an activity row: the tag picks the table, the id the row.
struct ActivityRef
{
    ActivityType type = ActivityType::Electricity;
    std::string  id;
};

bool operator==(const ActivityRef& a, const ActivityRef& b);
bool operator!=(const ActivityRef& a, const ActivityRef& b);
bool operator<(const ActivityRef& a, const ActivityRef& b);

struct Activity
{
    std::string                 id;
    Date                        date;
    std::string                 source_file;
    std::string                 raw_data;
    bool                        is_deleted = false;
    std::optional<std::int64_t> deleted_at;
    std::int64_t                created_at = 0;
    std::int64_t                updated_at = 0;
    ActivityDetails             details;

    ActivityType type() const { return static_cast<ActivityType>(details.index()); }
    ActivityRef  ref() const { return ActivityRef{ type(), id }; }
};

/**
 * Calculated emissions for one activity with the factor that produced them.
 * At most one live result exists per activity.
 */
struct EmissionResult
{
    std::string                        id;
    ActivityRef                        activity;
    std::string                        emission_factor_id;
    Decimal                            co2e_tonnes;      // 7 fractional digits
    Decimal                            confidence_score; // 2 fractional digits, 0..1
    std::map<std::string, std::string> calculation_metadata;
    Date                               calculation_date;
    std::int64_t                       created_at = 0;
    std::int64_t                       updated_at = 0;
};

enum class SummaryType
{
    Daily,
    Weekly,
    Monthly,
    Yearly,
    Custom
};

const std::string&         to_string(SummaryType type); // "daily", "weekly", ...
std::optional<SummaryType> summary_type_from_string(const std::string& name);

// Optional dimension filters shared by aggregation and summary queries.
struct SummaryFilter
{
    std::optional<int>          scope;
    std::optional<int>          category;
    std::optional<ActivityType> activity_type;
};

bool operator==(const SummaryFilter& a, const SummaryFilter& b);

// Identity of a summary row; upserts are keyed on it.
struct SummaryKey
{
    Date          from_date;
    Date          to_date;
    SummaryFilter filter;
    SummaryType   summary_type = SummaryType::Daily;
};

bool operator==(const SummaryKey& a, const SummaryKey& b);

struct EmissionSummary
{
    std::string                 id;
    Date                        from_date;
    Date                        to_date;
    std::optional<int>          scope;
    std::optional<int>          category;
    std::optional<ActivityType> activity_type;
    Decimal                     total_co2e_tonnes; // 7 fractional digits
    std::int64_t                activity_count = 0;
    SummaryType                 summary_type   = SummaryType::Daily;
    std::int64_t                created_at     = 0;
    std::int64_t                updated_at     = 0;

    SummaryKey    key() const;
    SummaryFilter filter() const { return SummaryFilter{ scope, category, activity_type }; }
};

// Random 32-hex-digit identifier for new rows.
std::string generate_id();
