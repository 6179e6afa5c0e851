#include "test_helpers.h"
#include "gatesense/enforcement/ValidationService.h"

using namespace gatesense;
using namespace gatesense::test;

static CategoryBinding binding(int64_t gate_id, const std::string& category, BindingStatus status, double confidence) {
    CategoryBinding b;
    b.gate_id = gate_id;
    b.session_id = "S1";
    b.category = category;
    b.status = status;
    b.confidence = confidence;
    b.sample_count = 40;
    return b;
}

class EvaluateCheckinTest : public ::testing::Test {
protected:
    void SetUp() override {
        snap_.session_id = "S1";
        Gate g;
        g.id = 7;
        g.session_id = "S1";
        g.name = "Main Gate";
        g.centroid = venuePoint(0);
        g.spatial_variance_m2 = 4.0;
        g.status = GateStatus::Active;
        snap_.gates[g.id] = g;
        snap_.bindings[g.id].push_back(binding(7, "GENERAL", BindingStatus::Enforced, 0.95));
    }

    ValidationResult check(const std::string& category, std::optional<GeoPoint> where = std::nullopt,
                           int64_t gate_id = 7) {
        return evaluateCheckin(snap_, gate_id, category, where);
    }

    SessionSnapshot snap_;
};

TEST_F(EvaluateCheckinTest, EnforcedCategoryIsAllowed) {
    const auto r = check("GENERAL");
    EXPECT_EQ(r.decision, ValidationDecision::Allow);
    EXPECT_DOUBLE_EQ(r.confidence, 0.95);
    ASSERT_TRUE(r.binding_status.has_value());
    EXPECT_EQ(*r.binding_status, BindingStatus::Enforced);
}

TEST_F(EvaluateCheckinTest, UnknownCategoryAtEnforcedGateIsFlagged) {
    const auto r = check("VIP");
    EXPECT_EQ(r.decision, ValidationDecision::FlagMismatch);
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_FALSE(r.binding_status.has_value());
}

TEST_F(EvaluateCheckinTest, WeakProbationBindingIsStillFlagged) {
    snap_.bindings[7].push_back(binding(7, "VIP", BindingStatus::Probation, 0.3));
    EXPECT_EQ(check("VIP").decision, ValidationDecision::FlagMismatch);

    snap_.bindings[7].back().confidence = 0.75;
    const auto r = check("VIP");
    EXPECT_EQ(r.decision, ValidationDecision::Allow);
    EXPECT_EQ(*r.binding_status, BindingStatus::Probation);
}

TEST_F(EvaluateCheckinTest, UnenforcedGateAllowsEverything) {
    snap_.bindings[7].front().status = BindingStatus::Probation;
    EXPECT_EQ(check("VIP").decision, ValidationDecision::Allow);

    snap_.bindings[7].front().status = BindingStatus::Unbound;
    EXPECT_EQ(check("VIP").decision, ValidationDecision::Allow);
}

TEST_F(EvaluateCheckinTest, UnknownInactiveOrForeignGateIsDenied) {
    EXPECT_EQ(check("GENERAL", std::nullopt, 99).decision, ValidationDecision::DenyOutOfRange);

    snap_.gates[7].status = GateStatus::Maintenance;
    EXPECT_EQ(check("GENERAL").decision, ValidationDecision::DenyOutOfRange);

    snap_.gates[7].status = GateStatus::Active;
    snap_.gates[7].session_id = "S2";
    EXPECT_EQ(check("GENERAL").decision, ValidationDecision::DenyOutOfRange);
}

TEST_F(EvaluateCheckinTest, FarAwayScanIsDenied) {
    AdaptiveThresholdConfig cfg;   // radius 30 m, factor 3
    EXPECT_DOUBLE_EQ(acceptedRadiusMeters(snap_.gates[7], cfg), 30.0);

    EXPECT_EQ(check("GENERAL", venuePoint(50)).decision, ValidationDecision::Allow);
    EXPECT_EQ(check("GENERAL", venuePoint(120)).decision, ValidationDecision::DenyOutOfRange);

    snap_.gates[7].spatial_variance_m2 = 3600.0;   // radius 120 m
    EXPECT_EQ(check("GENERAL", venuePoint(120)).decision, ValidationDecision::Allow);
}

TEST_F(EvaluateCheckinTest, SameInputSameAnswer) {
    const auto first = check("VIP", venuePoint(10));
    for (int i = 0; i < 100; ++i) {
        const auto again = check("VIP", venuePoint(10));
        EXPECT_EQ(again.decision, first.decision);
        EXPECT_EQ(again.confidence, first.confidence);
        EXPECT_EQ(again.reason, first.reason);
    }
}

class ValidationServiceTest : public StoreTest {};

TEST_F(ValidationServiceTest, ServesFromSnapshotUntilRefreshed) {
    const Gate gate = storeGate("Main Gate", venuePoint(0));
    ASSERT_TRUE(db_->upsertBinding(binding(gate.id, "GENERAL", BindingStatus::Enforced, 0.95)));

    ValidationService service(*db_, [](const std::string&) { return AdaptiveThresholdConfig{}; });
    EXPECT_EQ(service.validate("S1", gate.id, "VIP").decision, ValidationDecision::FlagMismatch);
    ASSERT_NE(service.snapshot("S1"), nullptr);

    Gate closed = gate;
    closed.status = GateStatus::Maintenance;
    ASSERT_TRUE(db_->updateGate(closed));
    EXPECT_EQ(service.validate("S1", gate.id, "VIP").decision, ValidationDecision::FlagMismatch);

    service.refresh("S1");
    EXPECT_EQ(service.validate("S1", gate.id, "VIP").decision, ValidationDecision::DenyOutOfRange);

    service.drop("S1");
    EXPECT_EQ(service.snapshot("S1"), nullptr);
}

TEST_F(ValidationServiceTest, UnknownSessionIsDeniedWithoutCaching) {
    ValidationService service(*db_, [](const std::string&) { return AdaptiveThresholdConfig{}; });
    for (int i = 0; i < 3; ++i) {
        const auto r = service.validate("S" + std::to_string(100 + i), 1, "GENERAL");
        EXPECT_EQ(r.decision, ValidationDecision::DenyOutOfRange);
    }
    EXPECT_EQ(service.snapshot("S100"), nullptr);
    EXPECT_EQ(service.snapshot("S102"), nullptr);
}

TEST_F(ValidationServiceTest, EarlierBuildNeverReplacesNewerSnapshot) {
    ValidationService* service_ptr = nullptr;
    std::shared_ptr<const SessionSnapshot> inner;
    bool nested = false;

    // the first build is overtaken by a second one that starts and publishes while it is still reading
    ValidationService service(*db_, [&](const std::string& session_id) {
        if (!nested) {
            nested = true;
            inner = service_ptr->refresh(session_id);
        }
        return AdaptiveThresholdConfig{};
    });
    service_ptr = &service;

    const auto outer = service.refresh("S1");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(outer, inner);
    EXPECT_EQ(service.snapshot("S1"), inner);
    EXPECT_EQ(inner->generation, 2u);

    const auto later = service.refresh("S1");
    EXPECT_GT(later->generation, inner->generation);
    EXPECT_EQ(service.snapshot("S1"), later);
}
