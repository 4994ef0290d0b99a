#pragma once

#include "emission_factors.hpp"
#include "models.hpp"
#include "storage.hpp"

#include <optional>
#include <string>

// Shared builders for the unit tests.

// 2024-11-24 00:00:00 UTC
constexpr std::int64_t kFixedNow = 1732406400;

inline Activity electricity_activity(const std::string& id, const std::string& country, const char* kwh)
{
    Activity a;
    a.id      = id;
    a.date    = Date(2024, 11, 20);
    a.details = ElectricityUsage{ country, Decimal::parse(kwh).quantize(precision::kUsageKwh) };
    return a;
}

inline Activity air_travel_activity(const std::string& id, std::optional<Decimal> miles, std::optional<Decimal> km,
                                    const std::string& flight_range, const std::string& passenger_class)
{
    Activity a;
    a.id      = id;
    a.date    = Date(2024, 11, 20);
    a.details = AirTravel{ miles, km, flight_range, passenger_class };
    return a;
}

inline Activity goods_activity(const std::string& id, const std::string& category, const char* spend)
{
    Activity a;
    a.id      = id;
    a.date    = Date(2024, 11, 20);
    a.details = GoodsServices{ category, Decimal::parse(spend).quantize(precision::kSpend), "" };
    return a;
}

inline Decimal distance(const char* text)
{
    return Decimal::parse(text).quantize(precision::kDistance);
}

inline void seed_default_factors(IStore& store)
{
    for (const auto& f : DefaultEmissionFactors::all())
        store.put_factor(f);
}

inline EmissionFactor make_factor(const std::string& id, ActivityType type, const std::string& identifier,
                                  const char* value, int scope = ghg::kScope2,
                                  std::optional<int> category = std::nullopt)
{
    EmissionFactor f;
    f.id                = id;
    f.activity_type     = type;
    f.lookup_identifier = identifier;
    f.unit              = "kWh";
    f.co2e_factor       = Decimal::parse(value).quantize(precision::kFactor);
    f.scope             = scope;
    f.category          = category;
    f.source            = "TEST";
    return f;
}
