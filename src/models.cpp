#include "models.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <random>
#include <sstream>
#include <tuple>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::string& to_string(ActivityType type)
{
    static const std::string kElectricity   = "Electricity";
    static const std::string kAirTravel     = "Air Travel";
    static const std::string kGoodsServices = "Purchased Goods and Services";
    switch (type)
    {
    case ActivityType::Electricity:
        return kElectricity;
    case ActivityType::AirTravel:
        return kAirTravel;
    case ActivityType::GoodsServices:
        return kGoodsServices;
    }
    return kElectricity;
}

std::optional<ActivityType> activity_type_from_string(const std::string& name)
{
    const auto n = lowercase(name);
    if (n == "electricity")
        return ActivityType::Electricity;
    if (n == "air travel" || n == "air_travel" || n == "air-travel")
        return ActivityType::AirTravel;
    if (n == "purchased goods and services" || n == "goods_services" || n == "goods-services")
        return ActivityType::GoodsServices;
    return std::nullopt;
}

const std::array<ActivityType, 3>& all_activity_types()
{
    static const std::array<ActivityType, 3> kTypes = { ActivityType::Electricity, ActivityType::AirTravel,
                                                        ActivityType::GoodsServices };
    return kTypes;
}

std::string ghg::category_name(int category)
{
    if (category == kCategoryPurchasedGoods)
        return "Purchased Goods and Services";
    if (category == kCategoryBusinessTravel)
        return "Business Travel";
    return "Unknown";
}

bool operator==(const ElectricityUsage& a, const ElectricityUsage& b)
{
    return a.country == b.country && a.usage_kwh == b.usage_kwh;
}

bool operator==(const AirTravel& a, const AirTravel& b)
{
    return a.distance_miles == b.distance_miles && a.distance_km == b.distance_km &&
           a.flight_range == b.flight_range && a.passenger_class == b.passenger_class;
}

bool operator==(const GoodsServices& a, const GoodsServices& b)
{
    return a.supplier_category == b.supplier_category && a.spend_amount == b.spend_amount &&
           a.description == b.description;
}

bool operator!=(const ElectricityUsage& a, const ElectricityUsage& b)
{
    return !(a == b);
}

bool operator!=(const AirTravel& a, const AirTravel& b)
{
    return !(a == b);
}

bool operator!=(const GoodsServices& a, const GoodsServices& b)
{
    return !(a == b);
}

bool operator==(const ActivityRef& a, const ActivityRef& b)
{
    return a.type == b.type && a.id == b.id;
}

bool operator!=(const ActivityRef& a, const ActivityRef& b)
{
    return !(a == b);
}

bool operator<(const ActivityRef& a, const ActivityRef& b)
{
    return std::tie(a.type, a.id) < std::tie(b.type, b.id);
}

const std::string& to_string(SummaryType type)
{
    static const std::string kNames[] = { "daily", "weekly", "monthly", "yearly", "custom" };
    return kNames[static_cast<int>(type)];
}

std::optional<SummaryType> summary_type_from_string(const std::string& name)
{
    const auto n = lowercase(name);
    if (n == "daily")
        return SummaryType::Daily;
    if (n == "weekly")
        return SummaryType::Weekly;
    if (n == "monthly")
        return SummaryType::Monthly;
    if (n == "yearly")
        return SummaryType::Yearly;
    if (n == "custom")
        return SummaryType::Custom;
    return std::nullopt;
}

bool operator==(const SummaryFilter& a, const SummaryFilter& b)
{
    return a.scope == b.scope && a.category == b.category && a.activity_type == b.activity_type;
}

bool operator==(const SummaryKey& a, const SummaryKey& b)
{
    return a.from_date == b.from_date && a.to_date == b.to_date && a.filter == b.filter &&
           a.summary_type == b.summary_type;
}

SummaryKey EmissionSummary::key() const
{
    return SummaryKey{ from_date, to_date, filter(), summary_type };
}

std::string generate_id()
{
    thread_local std::mt19937_64 engine{ std::random_device{}() };
    std::uniform_int_distribution<unsigned long long> dist(0, ULLONG_MAX);
    std::ostringstream oss;
    oss << std::hex;
    while (oss.str().size() < 32)
        oss << dist(engine);
    return oss.str().substr(0, 32);
}
