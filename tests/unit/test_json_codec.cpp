#include "json_codec.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using nlohmann::json;

// ===== Scalars =====

TEST(JsonCodec, DecimalsAreWrittenAsText)
{
    json j = Decimal::parse("0.2070500");
    EXPECT_EQ(j, "0.2070500");

    EXPECT_EQ(json("1,250.50").get<Decimal>().to_string(), "1250.50");
    EXPECT_EQ(json(0.35).get<Decimal>().to_string(), "0.35");
    EXPECT_EQ(json(12).get<Decimal>(), Decimal::from_int(12));
    EXPECT_THROW(json(true).get<Decimal>(), std::invalid_argument);
}

TEST(JsonCodec, DatesAndActivityTypes)
{
    EXPECT_EQ(json(Date(2024, 2, 29)), "2024-02-29");
    EXPECT_EQ(json("2024-11-24").get<Date>(), Date(2024, 11, 24));
    EXPECT_THROW(json("24/11/2024").get<Date>(), std::invalid_argument);

    EXPECT_EQ(json(ActivityType::GoodsServices), "Purchased Goods and Services");
    EXPECT_EQ(json("air_travel").get<ActivityType>(), ActivityType::AirTravel);
    EXPECT_THROW(json("rail").get<ActivityType>(), std::invalid_argument);
}

// ===== Factors =====

TEST(JsonCodec, FactorRequiresValidScopeAndIdentifier)
{
    json j = { { "activity_type", "electricity" },
               { "lookup_identifier", "France" },
               { "unit", "kWh" },
               { "co2e_factor", "0.056" },
               { "scope", 2 },
               { "category", nullptr } };

    auto f = j.get<EmissionFactor>();
    EXPECT_TRUE(f.id.empty());
    EXPECT_EQ(f.co2e_factor.to_string(), "0.056000");
    EXPECT_FALSE(f.category.has_value());

    json back = f;
    EXPECT_TRUE(back["category"].is_null());
    EXPECT_EQ(back["activity_type"], "Electricity");

    j["scope"] = 0;
    EXPECT_THROW(j.get<EmissionFactor>(), std::invalid_argument);

    j["scope"]             = 2;
    j["lookup_identifier"] = "";
    EXPECT_THROW(j.get<EmissionFactor>(), std::invalid_argument);
}

// ===== Activities =====

TEST(JsonCodec, ActivityQuantitiesAreQuantized)
{
    json j = { { "id", "e1" }, { "date", "2024-11-20" }, { "country", "France" }, { "usage_kwh", "12.345678" } };
    auto a = activity_from_json(j, ActivityType::Electricity);
    EXPECT_EQ(a.type(), ActivityType::Electricity);
    EXPECT_EQ(std::get<ElectricityUsage>(a.details).usage_kwh.to_string(), "12.3457");

    json trip = { { "date", "2024-11-20" },
                  { "distance_miles", 100 },
                  { "flight_range", "Domestic" },
                  { "passenger_class", "Average passenger" } };
    auto t    = activity_from_json(trip, ActivityType::AirTravel);
    EXPECT_EQ(std::get<AirTravel>(t.details).distance_miles->to_string(), "100.00");
    EXPECT_FALSE(std::get<AirTravel>(t.details).distance_km.has_value());
}

TEST(JsonCodec, ActivityTypeComesFromPayloadWhenNotForced)
{
    json j = goods_activity("g1", "Furniture", "99.999");
    EXPECT_EQ(j["activity_type"], "Purchased Goods and Services");
    EXPECT_EQ(j["spend_amount"], "100.00");
    EXPECT_TRUE(j["deleted_at"].is_null());

    auto back = j.get<Activity>();
    EXPECT_EQ(back.type(), ActivityType::GoodsServices);
    EXPECT_EQ(std::get<GoodsServices>(back.details).supplier_category, "Furniture");
}

// ===== Results and summaries =====

TEST(JsonCodec, ResultCarriesActivityReference)
{
    EmissionResult r;
    r.id                              = "r1";
    r.activity                        = ActivityRef{ ActivityType::AirTravel, "a1" };
    r.co2e_tonnes                     = Decimal::parse("0.2901450");
    r.confidence_score                = Decimal::parse("0.90");
    r.calculation_metadata["unit"]    = "passenger.km";
    r.calculation_date                = Date(2024, 11, 24);

    json j = r;
    EXPECT_EQ(j["activity_type"], "Air Travel");
    EXPECT_EQ(j["activity_id"], "a1");
    EXPECT_EQ(j["co2e_tonnes"], "0.2901450");
    EXPECT_EQ(j["confidence_score"], "0.90");
    EXPECT_EQ(j["calculation_metadata"]["unit"], "passenger.km");
    EXPECT_EQ(j["calculation_date"], "2024-11-24");
}

TEST(JsonCodec, UnsavedSummaryHasNullId)
{
    EmissionSummary s;
    s.from_date         = Date(2024, 1, 1);
    s.to_date           = Date(2024, 1, 31);
    s.scope             = ghg::kScope3;
    s.total_co2e_tonnes = Decimal(0, precision::kEmission);
    s.summary_type      = SummaryType::Custom;

    json j = s;
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["scope"], 3);
    EXPECT_TRUE(j["category"].is_null());
    EXPECT_TRUE(j["activity_type"].is_null());
    EXPECT_EQ(j["summary_type"], "custom");
    EXPECT_EQ(j["total_co2e_tonnes"], "0.0000000");
}

TEST(JsonCodec, StatisticsGroupByDisplayName)
{
    BatchStatistics stats;
    stats.total_activities = 2;
    stats.total_processed  = 1;
    stats.total_errors     = 1;
    stats.success_rate     = "50.00%";
    stats.by_activity_type[ActivityType::Electricity].count = 1;

    json j = stats;
    EXPECT_EQ(j["success_rate"], "50.00%");
    EXPECT_EQ(j["by_activity_type"]["Electricity"]["count"], 1);
    EXPECT_EQ(j["by_activity_type"]["Electricity"]["total_co2e"], "0.0000000");

    BackfillReport report;
    report.periods = 3;
    report.created = 11;
    json jr        = report;
    EXPECT_EQ(jr["summaries_created"], 11);
    EXPECT_EQ(jr["summaries_updated"], 0);
    EXPECT_TRUE(jr["summaries"].is_array());
}
