#include "emission_calculator.hpp"

#include "test_fixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <memory>
#include <stdexcept>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

struct MockCalculator : public ICalculator
{
    MOCK_METHOD(ActivityType, activity_type, (), (const, override));
    MOCK_METHOD(std::optional<EmissionResult>, calculate, (Activity&, int), (const, override));
};

class EmissionCalculatorTest : public ::testing::Test
{
  protected:
    InMemoryStore store;
    std::int64_t  now = kFixedNow;

    void SetUp() override { seed_default_factors(store); }

    CalculationOptions options() const
    {
        CalculationOptions o;
        o.clock = [this] { return now; };
        return o;
    }

    EmissionCalculationService service() { return EmissionCalculationService(store, options()); }

    // `count` UK electricity activities, ids e000..e(count-1)
    void add_electricity(std::size_t count)
    {
        for (std::size_t i = 0; i < count; ++i)
        {
            char id[16];
            std::snprintf(id, sizeof(id), "e%03zu", i);
            store.add_activity(electricity_activity(id, "United Kingdom", "100"));
        }
    }
};

// ===== Single activity =====

TEST_F(EmissionCalculatorTest, CalculateSingleStoresResult)
{
    auto svc      = service();
    auto activity = electricity_activity("e1", "United Kingdom", "1000");
    store.add_activity(activity);

    auto r = svc.calculate_single(activity);
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->id.empty());
    EXPECT_EQ(r->co2e_tonnes.to_string(), "0.2070500");
    EXPECT_EQ(r->calculation_date, Date(2024, 11, 24));
    EXPECT_EQ(r->created_at, kFixedNow);

    auto stored = store.get_latest_result(activity.ref());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->id, r->id);
    EXPECT_EQ(store.count_results(), 1u);
}

TEST_F(EmissionCalculatorTest, CalculateSingleIsIdempotent)
{
    auto svc      = service();
    auto activity = electricity_activity("e1", "United Kingdom", "1000");
    store.add_activity(activity);

    auto first  = svc.calculate_single(activity);
    auto second = svc.calculate_single(activity);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->id, second->id);
    EXPECT_EQ(store.count_results(), 1u);
}

TEST_F(EmissionCalculatorTest, NoFactorYieldsNothingUnlessRaising)
{
    auto svc      = service();
    auto activity = electricity_activity("e1", "Atlantis", "1000");
    store.add_activity(activity);

    EXPECT_FALSE(svc.calculate_single(activity).has_value());
    EXPECT_EQ(store.count_results(), 0u);

    try
    {
        svc.calculate_single(activity, std::nullopt, true);
        FAIL() << "expected EmissionCalculationError";
    }
    catch (const EmissionCalculationError& e)
    {
        EXPECT_EQ(e.activity(), activity.ref());
        EXPECT_THAT(e.what(), ::testing::HasSubstr("e1"));
    }
}

TEST_F(EmissionCalculatorTest, BackfilledDistanceIsPersisted)
{
    auto svc      = service();
    auto activity = air_travel_activity("a1", distance("100"), std::nullopt, "Short-haul", "Economy class");
    store.add_activity(activity);

    ASSERT_TRUE(svc.calculate_single(activity).has_value());

    auto stored = store.get_activity(activity.ref());
    ASSERT_TRUE(stored.has_value());
    const auto& trip = std::get<AirTravel>(stored->details);
    ASSERT_TRUE(trip.distance_km.has_value());
    EXPECT_EQ(trip.distance_km->to_string(), "160.93");
}

TEST_F(EmissionCalculatorTest, ActivityDeletedAfterFetchStaysDeleted)
{
    auto svc = service();
    store.add_activity(air_travel_activity("a1", distance("500"), std::nullopt, "Short-haul", "Economy class"));

    auto page = store.get_active_activities(ActivityType::AirTravel, 0, 10);
    ASSERT_EQ(page.size(), 1u);
    ASSERT_TRUE(store.soft_delete_activity(page[0].ref(), now));

    EXPECT_FALSE(svc.calculate_single(page[0]).has_value());
    EXPECT_FALSE(store.get_activity(page[0].ref()).has_value());
    EXPECT_EQ(store.count_active_activities(ActivityType::AirTravel), 0u);
    EXPECT_EQ(store.count_results(), 0u);
}

TEST_F(EmissionCalculatorTest, BatchDropsResultsOfActivitiesDeletedMeanwhile)
{
    auto svc = service();
    const std::vector<Activity> batch = {
        electricity_activity("e1", "United Kingdom", "1000"),
        electricity_activity("e2", "United Kingdom", "1000"),
    };
    for (const auto& a : batch)
        store.add_activity(a);
    ASSERT_TRUE(store.soft_delete_activity(batch[1].ref(), now));

    auto summary = svc.calculate_batch(batch);
    ASSERT_EQ(summary.results.size(), 1u);
    EXPECT_EQ(summary.results[0].activity.id, "e1");
    EXPECT_EQ(summary.statistics.total_processed, 1u);
    EXPECT_EQ(store.count_results(), 1u);
    EXPECT_FALSE(store.has_result(batch[1].ref()));
}

TEST_F(EmissionCalculatorTest, UnknownActivityTypeRaisesInvalidArgument)
{
    EmissionCalculationService svc(store, options(), CalculatorRegistry{});
    auto                       activity = electricity_activity("e1", "United Kingdom", "1");

    EXPECT_FALSE(svc.calculate_single(activity).has_value());
    EXPECT_THROW(svc.calculate_single(activity, std::nullopt, true), std::invalid_argument);
}

TEST_F(EmissionCalculatorTest, UnexpectedCalculatorFailureKeepsCause)
{
    auto mock = std::make_shared<NiceMock<MockCalculator>>();
    ON_CALL(*mock, activity_type()).WillByDefault(Return(ActivityType::Electricity));
    EXPECT_CALL(*mock, calculate(_, 80)).WillRepeatedly(Throw(std::runtime_error("meter offline")));

    CalculatorRegistry registry;
    registry.add(mock);
    EmissionCalculationService svc(store, options(), registry);
    auto                       activity = electricity_activity("e1", "United Kingdom", "1");

    EXPECT_FALSE(svc.calculate_single(activity).has_value());
    try
    {
        svc.calculate_single(activity, std::nullopt, true);
        FAIL() << "expected EmissionCalculationError";
    }
    catch (const EmissionCalculationError& e)
    {
        EXPECT_EQ(e.cause(), "meter offline");
    }
    EXPECT_EQ(store.count_results(), 0u);
}

TEST_F(EmissionCalculatorTest, ThresholdOverrideIsPassedToCalculator)
{
    auto mock = std::make_shared<NiceMock<MockCalculator>>();
    ON_CALL(*mock, activity_type()).WillByDefault(Return(ActivityType::Electricity));
    EXPECT_CALL(*mock, calculate(_, 95)).WillOnce(Return(std::nullopt));

    CalculatorRegistry registry;
    registry.add(mock);
    EmissionCalculationService svc(store, options(), registry);

    EXPECT_FALSE(svc.calculate_single(electricity_activity("e1", "United Kingdom", "1"), 95).has_value());
    EXPECT_THROW(svc.calculate_single(electricity_activity("e1", "United Kingdom", "1"), 101), std::invalid_argument);
}

TEST_F(EmissionCalculatorTest, InvalidOptionsAreRejected)
{
    auto o            = options();
    o.fuzzy_threshold = 101;
    EXPECT_THROW((void)EmissionCalculationService(store, o), std::invalid_argument);

    o            = options();
    o.batch_size = 0;
    EXPECT_THROW((void)EmissionCalculationService(store, o), std::invalid_argument);
}

// ===== Recalculation =====

TEST_F(EmissionCalculatorTest, RecalculateReplacesTheResult)
{
    auto svc      = service();
    auto activity = electricity_activity("e1", "United Kingdom", "1000");
    store.add_activity(activity);
    auto first = svc.calculate_single(activity);
    ASSERT_TRUE(first.has_value());

    auto factor        = *store.get_factor(first->emission_factor_id);
    factor.co2e_factor = Decimal::parse("0.500000");
    store.put_factor(factor);

    auto second = svc.recalculate(activity);
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(second->id, first->id);
    EXPECT_EQ(second->co2e_tonnes.to_string(), "0.5000000");
    EXPECT_EQ(store.get_results_for_activity(activity.ref()).size(), 1u);
    EXPECT_EQ(store.get_latest_result(activity.ref())->id, second->id);
}

TEST_F(EmissionCalculatorTest, FailedRecalculationKeepsPreviousResult)
{
    auto svc      = service();
    auto activity = electricity_activity("e1", "United Kingdom", "1000");
    store.add_activity(activity);
    auto first = svc.calculate_single(activity);
    ASSERT_TRUE(first.has_value());

    std::get<ElectricityUsage>(activity.details).country = "Atlantis";
    EXPECT_FALSE(svc.recalculate(activity).has_value());

    auto kept = store.get_latest_result(activity.ref());
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(kept->id, first->id);
}

TEST_F(EmissionCalculatorTest, CalculateByRefSkipsMissingAndDeletedActivities)
{
    auto svc = service();
    EXPECT_FALSE(svc.calculate_by_ref(ActivityRef{ ActivityType::Electricity, "nope" }).has_value());

    auto activity = electricity_activity("e1", "United Kingdom", "1000");
    store.add_activity(activity);
    ASSERT_TRUE(store.soft_delete_activity(activity.ref(), kFixedNow));
    EXPECT_FALSE(svc.calculate_by_ref(activity.ref()).has_value());

    ASSERT_TRUE(store.restore_activity(activity.ref()));
    auto r = svc.calculate_by_ref(activity.ref());
    ASSERT_TRUE(r.has_value());

    auto again = svc.calculate_by_ref(activity.ref(), true);
    ASSERT_TRUE(again.has_value());
    EXPECT_NE(again->id, r->id);
    EXPECT_EQ(store.count_results(), 1u);
}

// ===== Batches =====

TEST_F(EmissionCalculatorTest, BatchCollectsPartialFailures)
{
    auto svc = service();
    const std::vector<Activity> batch = {
        electricity_activity("e1", "United Kingdom", "1000"),
        electricity_activity("e2", "Atlantis", "1000"),
        goods_activity("g1", "Furniture", "1000"),
    };
    for (const auto& a : batch)
        store.add_activity(a);

    auto summary = svc.calculate_batch(batch);
    EXPECT_EQ(summary.results.size(), 2u);
    ASSERT_EQ(summary.errors.size(), 1u);
    EXPECT_EQ(summary.errors[0].activity_id, "e2");
    EXPECT_EQ(summary.errors[0].activity_type, ActivityType::Electricity);

    const auto& stats = summary.statistics;
    EXPECT_EQ(stats.total_activities, 3u);
    EXPECT_EQ(stats.total_processed, 2u);
    EXPECT_EQ(stats.total_errors, 1u);
    EXPECT_EQ(stats.success_rate, "66.67%");
    EXPECT_EQ(stats.total_co2e_tonnes.to_string(), "0.5890500");
    EXPECT_EQ(stats.by_activity_type.at(ActivityType::Electricity).count, 1u);
    EXPECT_EQ(stats.by_activity_type.at(ActivityType::GoodsServices).total_co2e.to_string(), "0.3820000");
    EXPECT_EQ(store.count_results(), 2u);
}

TEST_F(EmissionCalculatorTest, FailFastBatchWritesNothing)
{
    auto svc = service();
    const std::vector<Activity> batch = {
        electricity_activity("e1", "United Kingdom", "1000"),
        electricity_activity("e2", "Atlantis", "1000"),
    };
    for (const auto& a : batch)
        store.add_activity(a);

    EXPECT_THROW(svc.calculate_batch(batch, std::nullopt, true), EmissionCalculationError);
    EXPECT_EQ(store.count_results(), 0u);
    EXPECT_EQ(svc.tracked_objects(), 0u);
}

TEST_F(EmissionCalculatorTest, EmptyBatchReportsZeroRate)
{
    auto summary = service().calculate_batch({});
    EXPECT_EQ(summary.statistics.total_activities, 0u);
    EXPECT_EQ(summary.statistics.success_rate, "0.00%");
}

TEST_F(EmissionCalculatorTest, BatchReusesExistingResults)
{
    auto svc      = service();
    auto activity = electricity_activity("e1", "United Kingdom", "1000");
    store.add_activity(activity);
    auto existing = svc.calculate_single(activity);
    ASSERT_TRUE(existing.has_value());

    auto summary = svc.calculate_batch({ activity });
    ASSERT_EQ(summary.results.size(), 1u);
    EXPECT_EQ(summary.results[0].id, existing->id);
    EXPECT_EQ(store.count_results(), 1u);
}

// ===== Pending sweep, streaming =====

TEST_F(EmissionCalculatorTest, StreamingSweepHoldsAtMostOnePage)
{
    add_electricity(25);
    auto svc = service();

    std::vector<PageReport> pages;
    SweepOptions            o;
    o.batch_size = 4;
    o.on_page    = [&](const PageReport& p)
    {
        EXPECT_EQ(svc.tracked_objects(), 0u);
        pages.push_back(p);
    };

    auto sweep = svc.calculate_all_pending(o);
    EXPECT_TRUE(sweep.streaming);
    EXPECT_FALSE(sweep.cancelled);
    EXPECT_EQ(sweep.pages, 7u);
    EXPECT_EQ(sweep.statistics.total_processed, 25u);
    EXPECT_EQ(sweep.statistics.success_rate, "100.00%");
    EXPECT_LE(sweep.peak_tracked, 4u);
    EXPECT_EQ(svc.peak_tracked_objects(), sweep.peak_tracked);
    EXPECT_EQ(store.count_results(), 25u);

    ASSERT_EQ(pages.size(), 7u);
    for (const auto& p : pages)
    {
        EXPECT_LE(p.tracked_at_commit, 4u);
        EXPECT_EQ(p.tracked_after_detach, 0u);
    }
    EXPECT_EQ(pages.back().fetched, 1u);
    EXPECT_EQ(pages.back().offset, 24u);
}

TEST_F(EmissionCalculatorTest, StreamingSweepStopsOnEmptyPage)
{
    add_electricity(8);
    auto sweep = service().calculate_all_pending(4, true);
    EXPECT_EQ(sweep.pages, 2u);
    EXPECT_EQ(sweep.statistics.total_processed, 8u);
}

TEST_F(EmissionCalculatorTest, StreamingSweepCoversEveryActivityType)
{
    store.add_activity(electricity_activity("e1", "United Kingdom", "1000"));
    store.add_activity(air_travel_activity("a1", std::nullopt, distance("500"), "Long-haul", "Business class"));
    store.add_activity(goods_activity("g1", "Furniture", "1000"));

    auto sweep = service().calculate_all_pending();
    EXPECT_EQ(sweep.pages, 3u);
    EXPECT_EQ(sweep.statistics.total_processed, 3u);
    EXPECT_EQ(sweep.statistics.by_activity_type.size(), 3u);
    EXPECT_EQ(sweep.statistics.total_co2e_tonnes.to_string(), "0.8791950");
}

TEST_F(EmissionCalculatorTest, StreamingSweepSkipsCalculatedAndDeletedActivities)
{
    add_electricity(6);
    auto svc = service();
    ASSERT_TRUE(svc.calculate_by_ref(ActivityRef{ ActivityType::Electricity, "e000" }).has_value());
    ASSERT_TRUE(svc.calculate_by_ref(ActivityRef{ ActivityType::Electricity, "e001" }).has_value());
    ASSERT_TRUE(store.soft_delete_activity(ActivityRef{ ActivityType::Electricity, "e005" }, kFixedNow));

    auto sweep = svc.calculate_all_pending(2, true);
    EXPECT_EQ(sweep.skipped_existing, 2u);
    EXPECT_EQ(sweep.statistics.total_activities, 3u);
    EXPECT_EQ(sweep.statistics.total_processed, 3u);
    EXPECT_FALSE(store.has_result(ActivityRef{ ActivityType::Electricity, "e005" }));
}

TEST_F(EmissionCalculatorTest, StreamingSweepKeepsOnlyAnErrorSample)
{
    for (int i = 0; i < 5; ++i)
        store.add_activity(electricity_activity("bad" + std::to_string(i), "Atlantis", "1"));
    store.add_activity(electricity_activity("good", "United Kingdom", "1"));

    auto o         = options();
    o.error_sample = 2;
    EmissionCalculationService svc(store, o);

    auto sweep = svc.calculate_all_pending(3, true);
    EXPECT_EQ(sweep.statistics.total_errors, 5u);
    EXPECT_EQ(sweep.errors.size(), 2u);
    EXPECT_EQ(sweep.statistics.total_processed, 1u);
    EXPECT_EQ(sweep.statistics.success_rate, "16.67%");
}

TEST_F(EmissionCalculatorTest, StreamingSweepCanBeCancelledBetweenPages)
{
    add_electricity(10);
    auto svc = service();

    std::size_t  committed = 0;
    SweepOptions o;
    o.batch_size = 4;
    o.on_page    = [&](const PageReport&) { ++committed; };
    o.cancel     = [&] { return committed >= 1; };

    auto sweep = svc.calculate_all_pending(o);
    EXPECT_TRUE(sweep.cancelled);
    EXPECT_EQ(sweep.pages, 1u);
    EXPECT_EQ(store.count_results(), 4u);

    // a later run picks up the rest
    auto rest = svc.calculate_all_pending(4, true);
    EXPECT_EQ(rest.skipped_existing, 4u);
    EXPECT_EQ(rest.statistics.total_processed, 6u);
    EXPECT_EQ(store.count_results(), 10u);
}

TEST_F(EmissionCalculatorTest, EmptySweepReportsFullRate)
{
    auto sweep = service().calculate_all_pending();
    EXPECT_EQ(sweep.pages, 0u);
    EXPECT_EQ(sweep.statistics.success_rate, "100.00%");
}

TEST_F(EmissionCalculatorTest, ZeroBatchSizeIsRejected)
{
    EXPECT_THROW(service().calculate_all_pending(0, true), std::invalid_argument);
}

// ===== Pending sweep, legacy =====

TEST_F(EmissionCalculatorTest, LegacySweepRunsOneBatch)
{
    add_electricity(5);
    auto svc = service();
    ASSERT_TRUE(svc.calculate_by_ref(ActivityRef{ ActivityType::Electricity, "e000" }).has_value());

    auto sweep = svc.calculate_all_pending(100, false);
    EXPECT_FALSE(sweep.streaming);
    EXPECT_EQ(sweep.pages, 1u);
    EXPECT_EQ(sweep.statistics.total_activities, 4u);
    EXPECT_EQ(sweep.statistics.total_processed, 4u);
    EXPECT_EQ(store.count_results(), 5u);
}

TEST_F(EmissionCalculatorTest, LegacySweepHonoursItsCap)
{
    add_electricity(5);
    auto o                 = options();
    o.legacy_pending_limit = 3;
    EmissionCalculationService svc(store, o);

    auto sweep = svc.calculate_all_pending(100, false);
    EXPECT_EQ(sweep.statistics.total_processed, 3u);
    EXPECT_EQ(store.count_results(), 3u);
}

TEST_F(EmissionCalculatorTest, LegacySweepWithNothingPending)
{
    auto sweep = service().calculate_all_pending(100, false);
    EXPECT_FALSE(sweep.streaming);
    EXPECT_EQ(sweep.statistics.success_rate, "100.00%");
}

// ===== Success rate =====

TEST(SuccessRate, FormatsHundredthsOfAPercent)
{
    EXPECT_EQ(format_success_rate(2, 3, "-"), "66.67%");
    EXPECT_EQ(format_success_rate(1, 3, "-"), "33.33%");
    EXPECT_EQ(format_success_rate(1, 8, "-"), "12.50%");
    EXPECT_EQ(format_success_rate(3, 3, "-"), "100.00%");
    EXPECT_EQ(format_success_rate(0, 0, "100.00%"), "100.00%");
}
