#include "test_helpers.h"
#include "gatesense/errors.hpp"
#include "gatesense/pipeline/GateService.h"

#include <algorithm>

using namespace gatesense;
using namespace gatesense::test;

class GateServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<GateDatabase>(":memory:");
        ASSERT_TRUE(db_->initialize());
        config_.db_path = ":memory:";
        service_ = std::make_unique<GateService>(*db_, config_);
    }

    CheckinInput scanAt(const GeoPoint& p, int minute, const std::string& category = "GENERAL") {
        CheckinInput in;
        in.session_id = "S1";
        in.wristband_id = "WB" + std::to_string(++wristbands_);
        in.category = category;
        in.timestamp = minuteStamp(18, minute);
        in.lat = p.lat;
        in.lon = p.lon;
        in.accuracy_m = 5.0;
        return in;
    }

    // `count` scans clustered tightly around `center`, one per minute
    void crowd(const GeoPoint& center, int count, const std::string& category = "GENERAL") {
        for (int i = 0; i < count; ++i) service_->ingest(scanAt(jitter(center, i), i, category));
    }

    ReviewAudit audit() const { return ReviewAudit{"ops", "same entrance", ""}; }

    std::unique_ptr<GateDatabase> db_;
    ServiceConfig config_;
    std::unique_ptr<GateService> service_;
    int wristbands_ = 0;
};

TEST_F(GateServiceTest, IngestRejectsIncompleteScans) {
    CheckinInput missing = scanAt(venuePoint(0), 0);
    missing.wristband_id.clear();
    EXPECT_THROW(service_->ingest(missing), std::invalid_argument);

    CheckinInput garbled = scanAt(venuePoint(0), 0);
    garbled.timestamp = "half past six";
    EXPECT_THROW(service_->ingest(garbled), std::invalid_argument);

    EXPECT_EQ(db_->getQualityStats("S1").total, 0);
}

TEST_F(GateServiceTest, ScanWithoutLocationIsStoredWithZeroWeight) {
    CheckinInput in = scanAt(venuePoint(0), 0);
    in.lat.reset();
    in.lon.reset();
    const IngestResult r = service_->ingest(in);
    EXPECT_GT(r.event_id, 0);
    EXPECT_DOUBLE_EQ(r.quality_weight, 0.0);
    EXPECT_FALSE(r.gate_id.has_value());
}

TEST_F(GateServiceTest, ScanWithoutAccuracyIsNeverGated) {
    const Gate gate = service_->createManualGate("S1", "Main Gate", venuePoint(0));

    CheckinInput unknown = scanAt(venuePoint(2), 0);
    unknown.accuracy_m.reset();
    const IngestResult r = service_->ingest(unknown);
    EXPECT_DOUBLE_EQ(r.quality_weight, 0.0);
    EXPECT_FALSE(r.gate_id.has_value());

    CheckinInput negative = scanAt(venuePoint(2), 1);
    negative.accuracy_m = -5.0;
    EXPECT_FALSE(service_->ingest(negative).gate_id.has_value());

    // backfill leaves them alone as well
    service_->runDiscoveryCycle("S1");
    EXPECT_EQ(db_->countCheckinsForGate(gate.id), 0);
    EXPECT_TRUE(db_->getBindingsForGate(gate.id).empty());
}

TEST_F(GateServiceTest, DiscoveryIsQueuedAtFirstMilestone) {
    for (int i = 0; i < 49; ++i) {
        EXPECT_FALSE(service_->ingest(scanAt(jitter(venuePoint(0), i), i)).discovery_scheduled);
    }
    EXPECT_TRUE(service_->ingest(scanAt(venuePoint(0), 49)).discovery_scheduled);
    // already queued
    EXPECT_FALSE(service_->ingest(scanAt(venuePoint(0), 50)).discovery_scheduled);
}

TEST_F(GateServiceTest, DiscoveredGateLearnsItsCategory) {
    crowd(venuePoint(0), 60);

    const DiscoveryResult r = service_->runDiscoveryCycle("S1");
    EXPECT_EQ(r.input_scans, 60);
    EXPECT_EQ(r.clusters, 1);
    EXPECT_EQ(r.materialize.created, 1);
    EXPECT_EQ(r.orphans.assigned, 60);
    EXPECT_EQ(r.learning.processed, 60);
    EXPECT_EQ(r.learning.promotions, 1);

    const auto gates = service_->listGates("S1");
    ASSERT_EQ(gates.size(), 1u);
    EXPECT_EQ(gates[0].gate.name, "Main Gate");
    EXPECT_EQ(gates[0].gate.derivation, DerivationMethod::Clustering);
    ASSERT_EQ(gates[0].bindings.size(), 1u);
    EXPECT_EQ(gates[0].bindings[0].category, "GENERAL");
    EXPECT_EQ(gates[0].bindings[0].status, BindingStatus::Enforced);

    const int64_t gate_id = gates[0].gate.id;
    EXPECT_EQ(service_->validate("S1", gate_id, "GENERAL").decision, ValidationDecision::Allow);
    EXPECT_EQ(service_->validate("S1", gate_id, "VIP").decision, ValidationDecision::FlagMismatch);
    EXPECT_EQ(service_->validate("S1", gate_id, "GENERAL", venuePoint(500)).decision,
              ValidationDecision::DenyOutOfRange);

    // new scans next to the gate are attached on arrival
    const IngestResult next = service_->ingest(scanAt(venuePoint(2), 61));
    ASSERT_TRUE(next.gate_id.has_value());
    EXPECT_EQ(*next.gate_id, gate_id);

    EXPECT_FALSE(service_->systemLog("S1").empty());
}

TEST_F(GateServiceTest, MismatchedScanCountsAsViolation) {
    crowd(venuePoint(0), 60);
    service_->runDiscoveryCycle("S1");
    const int64_t gate_id = service_->listGates("S1")[0].gate.id;

    CheckinInput vip = scanAt(venuePoint(1), 62, "VIP");
    vip.gate_id = gate_id;
    EXPECT_EQ(service_->validate("S1", gate_id, "VIP").decision, ValidationDecision::FlagMismatch);
    service_->ingest(vip);

    const LearnReport report = service_->runEnforcementCycle("S1");
    EXPECT_EQ(report.processed, 1);
    EXPECT_EQ(report.violations, 1);
    EXPECT_EQ(db_->getBinding(gate_id, "GENERAL")->status, BindingStatus::Enforced);
}

TEST_F(GateServiceTest, DryRunWritesNothing) {
    crowd(venuePoint(0), 60);

    const DiscoveryResult r = service_->runDiscoveryCycle("S1", true);
    EXPECT_TRUE(r.dry_run);
    EXPECT_EQ(r.materialize.created, 1);
    EXPECT_TRUE(service_->listGates("S1").empty());
    EXPECT_TRUE(service_->systemLog("S1").empty());
    EXPECT_FALSE(db_->getCheckpoint("S1", "discovery").has_value());
}

TEST_F(GateServiceTest, UnknownSessionIsNotFound) {
    EXPECT_THROW(service_->runDiscoveryCycle("nowhere"), NotFoundError);
    EXPECT_THROW(service_->runEnforcementCycle("nowhere"), NotFoundError);
    EXPECT_THROW(service_->runDuplicateDetection("nowhere"), NotFoundError);
    EXPECT_THROW(service_->deactivateSession("nowhere"), NotFoundError);
}

TEST_F(GateServiceTest, ManualGateCannotShareAnAnchor) {
    const Gate north = service_->createManualGate("S1", "North Entrance", venuePoint(0, 200));
    EXPECT_EQ(north.derivation, DerivationMethod::Manual);
    EXPECT_EQ(north.status, GateStatus::Active);
    EXPECT_THROW(service_->createManualGate("S1", "North Again", venuePoint(0, 200)), std::invalid_argument);
    EXPECT_THROW(service_->createManualGate("S1", "", venuePoint(0, 300)), std::invalid_argument);
    EXPECT_THROW(service_->createManualGate("S1", "Nowhere", GeoPoint{120.0, 0.0}), std::invalid_argument);
    EXPECT_EQ(service_->listGates("S1").size(), 1u);
}

TEST_F(GateServiceTest, RetiredGateRejectsEditsAndForwardsScans) {
    const Gate a = service_->createManualGate("S1", "Main Gate", venuePoint(0));
    const Gate b = service_->createManualGate("S1", "Main Gate 2", venuePoint(8));

    const MergeResult merged = service_->mergeGates(b.id, a.id, audit());
    EXPECT_EQ(merged.target_gate_id, a.id);

    EXPECT_THROW(service_->setGateStatus(b.id, GateStatus::Maintenance), StaleStateError);
    EXPECT_THROW(service_->mergeGates(b.id, a.id, audit()), StaleStateError);
    EXPECT_THROW(service_->renameGate(999, "Ghost"), NotFoundError);

    CheckinInput in = scanAt(venuePoint(8), 0);
    in.gate_id = b.id;
    const IngestResult r = service_->ingest(in);
    ASSERT_TRUE(r.gate_id.has_value());
    EXPECT_EQ(*r.gate_id, a.id);
}

TEST_F(GateServiceTest, MaintenanceGateDeniesCheckins) {
    const Gate gate = service_->createManualGate("S1", "East Gate", venuePoint(100));
    EXPECT_EQ(service_->validate("S1", gate.id, "GENERAL").decision, ValidationDecision::Allow);

    service_->setGateStatus(gate.id, GateStatus::Maintenance);
    EXPECT_EQ(service_->validate("S1", gate.id, "GENERAL").decision, ValidationDecision::DenyOutOfRange);
}

TEST_F(GateServiceTest, ResetRequiresAnUnboundBinding) {
    crowd(venuePoint(0), 30);
    service_->runDiscoveryCycle("S1");
    const int64_t gate_id = service_->listGates("S1")[0].gate.id;

    EXPECT_THROW(service_->resetBinding(gate_id, "GENERAL", "reopen"), StaleStateError);
    EXPECT_THROW(service_->resetBinding(gate_id, "VIP", "reopen"), NotFoundError);
    EXPECT_THROW(service_->unbindCategory(gate_id, "VIP", "wrong gate"), NotFoundError);

    service_->unbindCategory(gate_id, "GENERAL", "gate repurposed");
    EXPECT_EQ(db_->getBinding(gate_id, "GENERAL")->status, BindingStatus::Unbound);
    EXPECT_EQ(service_->validate("S1", gate_id, "VIP").decision, ValidationDecision::Allow);

    service_->resetBinding(gate_id, "GENERAL", "reopen");
    EXPECT_EQ(db_->getBinding(gate_id, "GENERAL")->status, BindingStatus::Probation);

    const auto history = service_->bindingHistory(gate_id, "GENERAL");
    ASSERT_GE(history.size(), 3u);
    EXPECT_EQ(history.back().to, BindingStatus::Probation);
}

TEST_F(GateServiceTest, ApprovingSuggestionTwiceIsStale) {
    crowd(venuePoint(0), 40);
    service_->runDiscoveryCycle("S1");
    const Gate second = service_->createManualGate("S1", "Main Gate 2", venuePoint(8));
    for (int i = 0; i < 20; ++i) {
        CheckinInput in = scanAt(venuePoint(8), i);
        in.gate_id = second.id;
        service_->ingest(in);
    }
    service_->runEnforcementCycle("S1");

    const DuplicateReport report = service_->runDuplicateDetection("S1");
    ASSERT_EQ(report.suggestions.size(), 1u);
    const int64_t id = report.suggestions[0].id;
    ASSERT_EQ(service_->listMerges("S1").size(), 1u);

    service_->approveMerge(id, audit());
    EXPECT_TRUE(service_->listMerges("S1").empty());
    EXPECT_EQ(service_->listMerges("S1", std::nullopt).size(), 1u);
    EXPECT_THROW(service_->approveMerge(id, audit()), StaleStateError);
    EXPECT_THROW(service_->rejectMerge(id, audit()), StaleStateError);
    EXPECT_THROW(service_->approveMerge(999, audit()), NotFoundError);
}

TEST_F(GateServiceTest, InvalidThresholdsAreRejected) {
    AdaptiveThresholdConfig cfg;
    cfg.soft_threshold = 0.9;
    cfg.hard_threshold = 0.5;
    EXPECT_THROW(service_->setThresholds("S1", cfg), ConfigValidationError);
    EXPECT_DOUBLE_EQ(service_->getThresholds("S1").hard_threshold, 0.80);

    cfg.hard_threshold = 0.95;
    service_->setThresholds("S1", cfg);
    EXPECT_DOUBLE_EQ(service_->getThresholds("S1").hard_threshold, 0.95);
}

TEST_F(GateServiceTest, DeactivatedSessionStopsScheduling) {
    db_->ensureSession("S1");
    service_->deactivateSession("S1");
    const auto active = service_->activeSessions();
    EXPECT_EQ(std::find(active.begin(), active.end(), "S1"), active.end());

    for (int i = 0; i < 60; ++i) {
        EXPECT_FALSE(service_->ingest(scanAt(jitter(venuePoint(0), i), i)).discovery_scheduled);
    }
    EXPECT_EQ(db_->getQualityStats("S1").total, 60);

    service_->activateSession("S1");
    const auto again = service_->activeSessions();
    EXPECT_NE(std::find(again.begin(), again.end(), "S1"), again.end());
}

TEST_F(GateServiceTest, QualityReportRatesAccuracy) {
    EXPECT_EQ(service_->qualityReport("S1").rating, "no_data");

    crowd(venuePoint(0), 10);
    const QualityReport q = service_->qualityReport("S1");
    EXPECT_EQ(q.stats.total, 10);
    EXPECT_DOUBLE_EQ(q.location_pct, 100.0);
    EXPECT_EQ(q.rating, "excellent");

    for (int i = 0; i < 30; ++i) {
        CheckinInput blind = scanAt(venuePoint(0), i);
        blind.lat.reset();
        blind.lon.reset();
        service_->ingest(blind);
    }
    EXPECT_LT(service_->qualityReport("S1").location_pct, 30.0);
    EXPECT_NE(service_->qualityReport("S1").recommendation.find("availability"), std::string::npos);
}

TEST_F(GateServiceTest, GateHealthListsWeakestFirst) {
    crowd(venuePoint(0), 60);
    service_->runDiscoveryCycle("S1");
    service_->createManualGate("S1", "Staff Door", venuePoint(0, 400));

    const auto health = service_->gateHealth("S1");
    ASSERT_EQ(health.size(), 2u);
    EXPECT_LE(health[0].health_score, health[1].health_score);

    const auto staff = std::find_if(health.begin(), health.end(),
                                    [](const GateHealthEntry& e) { return e.name == "Staff Door"; });
    ASSERT_NE(staff, health.end());
    EXPECT_EQ(staff->health_score, 65);
    EXPECT_EQ(staff->state, "WARNING");
    EXPECT_EQ(staff->checkins, 0);

    const auto main = std::find_if(health.begin(), health.end(),
                                   [](const GateHealthEntry& e) { return e.name == "Main Gate"; });
    ASSERT_NE(main, health.end());
    EXPECT_EQ(main->checkins, 60);
    EXPECT_EQ(main->last_scan_at, minuteStamp(18, 59));
}
