#include "storage.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>

class InMemoryStoreTest : public ::testing::Test
{
  protected:
    InMemoryStore store;

    static EmissionResult result(const std::string& id, const ActivityRef& ref, const std::string& factor_id,
                                 const char* tonnes, const char* confidence = "1.00", std::int64_t created = kFixedNow)
    {
        EmissionResult r;
        r.id                 = id;
        r.activity           = ref;
        r.emission_factor_id = factor_id;
        r.co2e_tonnes        = Decimal::parse(tonnes).quantize(precision::kEmission);
        r.confidence_score   = Decimal::parse(confidence).quantize(precision::kConfidence);
        r.calculation_date   = Date(2024, 11, 24);
        r.created_at         = created;
        r.updated_at         = created;
        return r;
    }

    void commit_result(const EmissionResult& r)
    {
        ChangeSet changes;
        changes.stage_insert(r);
        store.commit(changes);
    }
};

// ===== Factors =====

TEST_F(InMemoryStoreTest, FactorsAreKeyedById)
{
    store.put_factor(make_factor("f1", ActivityType::Electricity, "France", "0.05"));
    store.put_factor(make_factor("f2", ActivityType::GoodsServices, "Furniture", "0.38", ghg::kScope3, 1));
    store.put_factor(make_factor("f1", ActivityType::Electricity, "France", "0.06"));

    EXPECT_EQ(store.get_all_factors().size(), 2u);
    EXPECT_EQ(store.get_factor("f1")->co2e_factor.to_string(), "0.060000");
    EXPECT_FALSE(store.get_factor("nope").has_value());
    EXPECT_EQ(store.get_factors_by_activity_type(ActivityType::GoodsServices).size(), 1u);
    EXPECT_TRUE(store.get_factors_by_activity_type(ActivityType::AirTravel).empty());
}

TEST_F(InMemoryStoreTest, ReferencedFactorCannotBeDeleted)
{
    store.put_factor(make_factor("f1", ActivityType::Electricity, "France", "0.05"));
    store.put_factor(make_factor("f2", ActivityType::Electricity, "Spain", "0.15"));
    commit_result(result("r1", ActivityRef{ ActivityType::Electricity, "e1" }, "f1", "0.1"));

    EXPECT_THROW(store.delete_factor("f1"), FactorInUseError);
    EXPECT_TRUE(store.delete_factor("f2"));
    EXPECT_FALSE(store.delete_factor("f2"));
    EXPECT_TRUE(store.get_factor("f1").has_value());
}

// ===== Activities =====

TEST_F(InMemoryStoreTest, SoftDeleteHidesActivity)
{
    store.add_activity(electricity_activity("e1", "France", "10"));
    const ActivityRef ref{ ActivityType::Electricity, "e1" };

    ASSERT_TRUE(store.soft_delete_activity(ref, kFixedNow));
    EXPECT_FALSE(store.soft_delete_activity(ref, kFixedNow));
    EXPECT_FALSE(store.get_activity(ref).has_value());
    EXPECT_EQ(store.count_active_activities(ActivityType::Electricity), 0u);

    ASSERT_TRUE(store.restore_activity(ref));
    EXPECT_FALSE(store.restore_activity(ref));
    auto restored = store.get_activity(ref);
    ASSERT_TRUE(restored.has_value());
    EXPECT_FALSE(restored->is_deleted);
    EXPECT_FALSE(restored->deleted_at.has_value());
}

TEST_F(InMemoryStoreTest, ActivityIdsAreScopedByType)
{
    store.add_activity(electricity_activity("x", "France", "10"));
    store.add_activity(goods_activity("x", "Furniture", "10"));

    EXPECT_EQ(store.get_activity(ActivityRef{ ActivityType::Electricity, "x" })->type(), ActivityType::Electricity);
    EXPECT_EQ(store.get_activity(ActivityRef{ ActivityType::GoodsServices, "x" })->type(),
              ActivityType::GoodsServices);
    EXPECT_FALSE(store.get_activity(ActivityRef{ ActivityType::AirTravel, "x" }).has_value());
}

TEST_F(InMemoryStoreTest, ActivePagesAreOrderedById)
{
    for (const char* id : { "c", "a", "d", "b" })
        store.add_activity(electricity_activity(id, "France", "1"));
    store.soft_delete_activity(ActivityRef{ ActivityType::Electricity, "b" }, kFixedNow);

    auto first = store.get_active_activities(ActivityType::Electricity, 0, 2);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].id, "a");
    EXPECT_EQ(first[1].id, "c");

    auto rest = store.get_active_activities(ActivityType::Electricity, 2, 2);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].id, "d");

    EXPECT_TRUE(store.get_active_activities(ActivityType::Electricity, 3, 2).empty());
    EXPECT_TRUE(store.get_active_activities(ActivityType::AirTravel, 0, 2).empty());
}

// ===== Commit =====

TEST_F(InMemoryStoreTest, EmptyChangeSetCommitsNothing)
{
    ChangeSet changes;
    EXPECT_TRUE(changes.empty());
    auto report = store.commit(changes);
    EXPECT_EQ(report.results_inserted, 0u);
    EXPECT_EQ(report.results_deleted, 0u);
}

TEST_F(InMemoryStoreTest, SecondLiveResultIsSkipped)
{
    const ActivityRef ref{ ActivityType::Electricity, "e1" };
    ChangeSet         changes;
    changes.stage_insert(result("r1", ref, "f1", "0.1"));
    changes.stage_insert(result("r2", ref, "f1", "0.2"));
    EXPECT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes.find_staged(ref)->id, "r1");

    auto report = store.commit(changes);
    EXPECT_EQ(report.results_inserted, 1u);
    EXPECT_EQ(report.duplicates_skipped, 1u);
    EXPECT_EQ(store.get_latest_result(ref)->id, "r1");
    EXPECT_EQ(store.count_results(), 1u);
}

TEST_F(InMemoryStoreTest, DeletionsApplyBeforeInserts)
{
    const ActivityRef ref{ ActivityType::Electricity, "e1" };
    commit_result(result("old", ref, "f1", "0.1"));

    ChangeSet changes;
    changes.stage_delete_results(ref);
    changes.stage_insert(result("new", ref, "f1", "0.2"));
    EXPECT_TRUE(changes.deletes_results_of(ref));

    auto report = store.commit(changes);
    EXPECT_EQ(report.results_deleted, 1u);
    EXPECT_EQ(report.results_inserted, 1u);
    EXPECT_EQ(report.duplicates_skipped, 0u);
    EXPECT_EQ(store.get_latest_result(ref)->id, "new");
    EXPECT_EQ(store.get_results_for_activity(ref).size(), 1u);
}

TEST_F(InMemoryStoreTest, ActivityUpdatesWriteOnlyDerivedFields)
{
    auto activity        = air_travel_activity("a1", distance("100"), std::nullopt, "Domestic", "Average passenger");
    activity.source_file = "trips.csv";
    store.add_activity(activity);

    ChangeSet changes;
    changes.stage_activity_update(ActivityUpdate{ activity.ref(), distance("160.93"), kFixedNow });
    changes.stage_activity_update(ActivityUpdate{ ActivityRef{ ActivityType::AirTravel, "ghost" }, distance("1"), 0 });

    auto report = store.commit(changes);
    EXPECT_EQ(report.activities_updated, 1u);
    const auto stored = store.get_activity(activity.ref());
    ASSERT_TRUE(stored.has_value());
    const auto& trip = std::get<AirTravel>(stored->details);
    EXPECT_EQ(trip.distance_km->to_string(), "160.93");
    EXPECT_EQ(trip.distance_miles->to_string(), "100.00");
    EXPECT_EQ(stored->source_file, "trips.csv");
    EXPECT_EQ(stored->updated_at, kFixedNow);
}

TEST_F(InMemoryStoreTest, CommitKeepsSoftDeleteMadeAfterStaging)
{
    const auto activity = air_travel_activity("a1", distance("500"), std::nullopt, "Domestic", "Average passenger");
    store.add_activity(activity);

    ChangeSet changes;
    changes.stage_insert(result("r1", activity.ref(), "f1", "0.1"));
    changes.stage_activity_update(ActivityUpdate{ activity.ref(), distance("804.67"), kFixedNow });

    ASSERT_TRUE(store.soft_delete_activity(activity.ref(), kFixedNow));
    auto report = store.commit(changes);

    EXPECT_EQ(report.inactive_skipped, 1u);
    EXPECT_EQ(report.results_inserted, 0u);
    EXPECT_EQ(report.activities_updated, 0u);
    EXPECT_FALSE(store.get_activity(activity.ref()).has_value());
    EXPECT_FALSE(store.has_result(activity.ref()));
    EXPECT_EQ(store.count_active_activities(ActivityType::AirTravel), 0u);

    ASSERT_TRUE(store.restore_activity(activity.ref()));
    const auto restored = store.get_activity(activity.ref());
    EXPECT_FALSE(std::get<AirTravel>(restored->details).distance_km.has_value());
}

TEST_F(InMemoryStoreTest, ClearedChangeSetTracksNothing)
{
    ChangeSet changes;
    changes.stage_insert(result("r1", ActivityRef{ ActivityType::Electricity, "e1" }, "f1", "0.1"));
    changes.stage_delete_results(ActivityRef{ ActivityType::Electricity, "e2" });
    changes.clear();
    EXPECT_EQ(changes.size(), 0u);
    store.commit(changes);
    EXPECT_EQ(store.count_results(), 0u);
}

// ===== Result queries =====

TEST_F(InMemoryStoreTest, ResultsAreListedNewestFirst)
{
    commit_result(result("r1", ActivityRef{ ActivityType::Electricity, "e1" }, "f1", "0.1", "1.00", 100));
    commit_result(result("r2", ActivityRef{ ActivityType::Electricity, "e2" }, "f1", "0.1", "0.85", 300));
    commit_result(result("r3", ActivityRef{ ActivityType::Electricity, "e3" }, "f1", "0.1", "0.70", 200));

    auto page = store.list_results(0, 2);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].id, "r2");
    EXPECT_EQ(page[1].id, "r3");
    EXPECT_EQ(store.list_results(2, 2).size(), 1u);
    EXPECT_TRUE(store.list_results(5, 2).empty());

    auto low = store.list_low_confidence(Decimal::parse("0.80"), 0, 10);
    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].id, "r3");
    EXPECT_EQ(store.list_low_confidence(Decimal::parse("0.90"), 0, 10).size(), 2u);

    EXPECT_EQ(store.list_result_refs(10).size(), 3u);
    EXPECT_EQ(store.list_result_refs(1).size(), 1u);
}

TEST_F(InMemoryStoreTest, AggregateJoinsFactorScope)
{
    store.put_factor(make_factor("f-elec", ActivityType::Electricity, "France", "0.05"));
    store.put_factor(make_factor("f-goods", ActivityType::GoodsServices, "Furniture", "0.38", ghg::kScope3,
                                 ghg::kCategoryPurchasedGoods));
    store.add_activity(electricity_activity("e1", "France", "1"));
    store.add_activity(goods_activity("g1", "Furniture", "1"));
    commit_result(result("r1", ActivityRef{ ActivityType::Electricity, "e1" }, "f-elec", "0.25"));
    commit_result(result("r2", ActivityRef{ ActivityType::GoodsServices, "g1" }, "f-goods", "0.5"));

    const Date day(2024, 11, 24);
    auto       all = store.aggregate_results(day, day, SummaryFilter{});
    EXPECT_EQ(all.total_co2e_tonnes.to_string(), "0.7500000");
    EXPECT_EQ(all.count, 2);

    auto scope3 = store.aggregate_results(day, day, SummaryFilter{ ghg::kScope3, std::nullopt, std::nullopt });
    EXPECT_EQ(scope3.count, 1);

    auto category6 = store.aggregate_results(day, day, SummaryFilter{ ghg::kScope3, 6, std::nullopt });
    EXPECT_EQ(category6.count, 0);

    EXPECT_EQ(store.aggregate_results(Date(2024, 11, 25), Date(2024, 11, 30), SummaryFilter{}).count, 0);

    store.soft_delete_activity(ActivityRef{ ActivityType::GoodsServices, "g1" }, kFixedNow);
    EXPECT_EQ(store.aggregate_results(day, day, SummaryFilter{}).count, 1);
}

// ===== Summaries =====

TEST_F(InMemoryStoreTest, SummaryUpsertKeepsIdentity)
{
    EmissionSummary s;
    s.id                = "s1";
    s.from_date         = Date(2024, 11, 24);
    s.to_date           = Date(2024, 11, 24);
    s.total_co2e_tonnes = Decimal::parse("1.0").quantize(precision::kEmission);
    s.activity_count    = 1;
    s.created_at        = 100;
    store.put_summary(s);

    auto again              = s;
    again.id                = "s2";
    again.created_at        = 200;
    again.total_co2e_tonnes = Decimal::parse("2.0").quantize(precision::kEmission);
    auto stored             = store.put_summary(again);

    EXPECT_EQ(store.count_summaries(), 1u);
    EXPECT_EQ(stored.id, "s1");
    EXPECT_EQ(stored.created_at, 100);
    EXPECT_EQ(stored.total_co2e_tonnes.to_string(), "2.0000000");
    EXPECT_TRUE(store.find_summary(s.key()).has_value());

    auto monthly         = s;
    monthly.summary_type = SummaryType::Monthly;
    EXPECT_FALSE(store.find_summary(monthly.key()).has_value());
}

TEST_F(InMemoryStoreTest, LatestSummaryHonoursFilter)
{
    EmissionSummary a;
    a.id        = "a";
    a.from_date = a.to_date = Date(2024, 11, 1);
    a.scope     = ghg::kScope2;
    store.put_summary(a);

    EmissionSummary b;
    b.id        = "b";
    b.from_date = b.to_date = Date(2024, 11, 5);
    store.put_summary(b);

    EXPECT_EQ(store.latest_summary(SummaryFilter{})->id, "b");
    EXPECT_EQ(store.latest_summary(SummaryFilter{ ghg::kScope2, std::nullopt, std::nullopt })->id, "a");
    EXPECT_FALSE(store.latest_summary(SummaryFilter{ ghg::kScope1, std::nullopt, std::nullopt }).has_value());
}

TEST_F(InMemoryStoreTest, ClearDbEmptiesEverything)
{
    store.put_factor(make_factor("f1", ActivityType::Electricity, "France", "0.05"));
    store.add_activity(electricity_activity("e1", "France", "1"));
    commit_result(result("r1", ActivityRef{ ActivityType::Electricity, "e1" }, "f1", "0.1"));

    store.clear_db();
    EXPECT_TRUE(store.get_all_factors().empty());
    EXPECT_EQ(store.count_results(), 0u);
    EXPECT_EQ(store.count_active_activities(ActivityType::Electricity), 0u);
}
