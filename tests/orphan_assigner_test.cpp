#include "test_helpers.h"
#include "gatesense/discovery/OrphanAssigner.h"

using namespace gatesense;
using namespace gatesense::test;

class OrphanAssignerTest : public StoreTest {};

TEST_F(OrphanAssignerTest, AssignsNearestGateWithinBound) {
    AdaptiveThresholdConfig cfg;   // bound 50 m
    const Gate west = storeGate("West", venuePoint(0));
    const Gate east = storeGate("East", venuePoint(80));

    const int64_t near_west = storeScan(makeScan(0, venuePoint(10)));
    const int64_t near_east = storeScan(makeScan(0, venuePoint(65)));
    const int64_t far_away = storeScan(makeScan(0, venuePoint(400)));

    const OrphanReport report = OrphanAssigner(*db_, cfg).assignBatch("S1", 0);
    EXPECT_EQ(report.scanned, 3);
    EXPECT_EQ(report.assigned, 2);

    EXPECT_EQ(db_->getCheckin(near_west)->gate_id, west.id);
    EXPECT_EQ(db_->getCheckin(near_east)->gate_id, east.id);
    EXPECT_FALSE(db_->getCheckin(far_away)->gate_id.has_value());
}

TEST_F(OrphanAssignerTest, NeverAssignsBeyondTheBound) {
    AdaptiveThresholdConfig cfg;
    cfg.orphan_max_distance_meters = 30.0;
    const Gate gate = storeGate("Only", venuePoint(0));
    for (int d = 1; d <= 61; d += 5) storeScan(makeScan(0, venuePoint(d)));

    OrphanAssigner(*db_, cfg).assignBatch("S1", 0);

    for (const auto& e : db_->getOrphans("S1", 0, 1000)) {
        EXPECT_GT(haversineMeters(gate.centroid, toPoint(*e.location)), 30.0);
    }
    const auto traffic = db_->getGateTraffic("S1");
    ASSERT_TRUE(traffic.count(gate.id));
    EXPECT_EQ(traffic.at(gate.id).total, 6);   // 1..26 m
}

TEST_F(OrphanAssignerTest, NeverCreatesGates) {
    AdaptiveThresholdConfig cfg;
    for (int i = 0; i < 40; ++i) storeScan(makeScan(0, jitter(venuePoint(0), i)));

    const OrphanReport report = OrphanAssigner(*db_, cfg).assignBatch("S1", 0);
    EXPECT_EQ(report.assigned, 0);
    EXPECT_TRUE(db_->getGates("S1").empty());
    EXPECT_EQ(db_->getOrphans("S1", 0, 1000).size(), 40u);
}

TEST_F(OrphanAssignerTest, SkipsInactiveGates) {
    AdaptiveThresholdConfig cfg;
    Gate closed = storeGate("Closed", venuePoint(0));
    closed.status = GateStatus::Maintenance;
    ASSERT_TRUE(db_->updateGate(closed));
    storeScan(makeScan(0, venuePoint(3)));

    EXPECT_EQ(OrphanAssigner(*db_, cfg).assignBatch("S1", 0).assigned, 0);
}

TEST_F(OrphanAssignerTest, CursorWrapsAfterLastBatch) {
    AdaptiveThresholdConfig cfg;
    cfg.orphan_batch_size = 4;
    storeGate("Gate", venuePoint(0));
    for (int i = 0; i < 6; ++i) storeScan(makeScan(0, venuePoint(500 + i)));   // unassignable

    OrphanAssigner assigner(*db_, cfg);
    const OrphanReport first = assigner.runCheckpointed("S1");
    EXPECT_EQ(first.scanned, 4);
    EXPECT_NE(first.next_cursor, 0);

    const OrphanReport second = assigner.runCheckpointed("S1");
    EXPECT_EQ(second.scanned, 2);
    EXPECT_EQ(second.next_cursor, 0);

    const OrphanReport third = assigner.runCheckpointed("S1");
    EXPECT_EQ(third.scanned, 4);
}
