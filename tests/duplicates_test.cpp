#include "test_helpers.h"
#include "gatesense/enforcement/BindingLearner.h"
#include "gatesense/enforcement/DuplicateDetector.h"
#include "gatesense/enforcement/GateMerger.h"
#include "gatesense/errors.hpp"

using namespace gatesense;
using namespace gatesense::test;

TEST(CosineSimilarity, Histograms) {
    std::array<int, 24> a{}, b{}, c{};
    a[18] = 30; a[19] = 20;
    b[18] = 15; b[19] = 10;
    c[9] = 5;
    EXPECT_NEAR(cosineSimilarity(a, b), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(cosineSimilarity(a, c), 0.0);
    EXPECT_DOUBLE_EQ(cosineSimilarity(a, std::array<int, 24>{}), 0.0);

    std::map<std::string, int> x{{"GENERAL", 10}}, y{{"GENERAL", 3}, {"VIP", 4}};
    EXPECT_NEAR(cosineSimilarity(x, y), 3.0 / 5.0, 1e-12);
}

class DuplicatesTest : public StoreTest {
protected:
    // `count` successful scans at the gate, spread over 18:00 and 19:00
    void traffic(const Gate& gate, int count, const std::string& category = "GENERAL") {
        for (int i = 0; i < count; ++i) {
            CheckinEvent e = makeScan(0, gate.centroid, category, 5.0, minuteStamp(18, (i * 7) % 120));
            e.gate_id = gate.id;
            storeScan(e);
        }
    }

    ReviewAudit audit_{"ops@venue", "same turnstile", ""};
};

TEST_F(DuplicatesTest, CloseGatesWithSameTrafficArePendingReview) {
    AdaptiveThresholdConfig cfg;
    const Gate a = storeGate("Main Gate", venuePoint(0));
    const Gate b = storeGate("Main Gate 2", venuePoint(8));
    traffic(a, 40);
    traffic(b, 20);

    const DuplicateReport report = DuplicateDetector(*db_, cfg).run("S1");
    EXPECT_EQ(report.pairs_checked, 1);
    ASSERT_EQ(report.suggested, 1);
    EXPECT_EQ(report.auto_applied, 0);

    const MergeSuggestion& s = report.suggestions.front();
    EXPECT_EQ(s.status, MergeStatus::Pending);
    EXPECT_EQ(s.target_gate_id, a.id);
    EXPECT_EQ(s.source_gate_id, b.id);
    EXPECT_NEAR(s.distance_m, 8.0, 0.1);
    EXPECT_GE(s.confidence, cfg.merge_review_threshold);
    EXPECT_LT(s.confidence, cfg.merge_auto_apply_threshold);
}

TEST_F(DuplicatesTest, DistantGatesAreNotCompared) {
    AdaptiveThresholdConfig cfg;
    traffic(storeGate("North", venuePoint(0)), 10);
    traffic(storeGate("South", venuePoint(0, -200)), 10);
    const DuplicateReport report = DuplicateDetector(*db_, cfg).run("S1");
    EXPECT_EQ(report.pairs_checked, 0);
    EXPECT_TRUE(db_->getMergeSuggestions("S1").empty());
}

TEST_F(DuplicatesTest, ReviewedSuggestionIsNeverReopened) {
    AdaptiveThresholdConfig cfg;
    traffic(storeGate("Main Gate", venuePoint(0)), 40);
    traffic(storeGate("Main Gate 2", venuePoint(8)), 20);

    DuplicateDetector detector(*db_, cfg);
    detector.run("S1");
    detector.run("S1");
    auto pending = db_->getMergeSuggestions("S1", MergeStatus::Pending);
    ASSERT_EQ(pending.size(), 1u);

    GateMerger(*db_, cfg).rejectSuggestion(pending[0].id, audit_);
    EXPECT_EQ(detector.run("S1").suggested, 0);
    EXPECT_TRUE(db_->getMergeSuggestions("S1", MergeStatus::Pending).empty());

    auto rejected = db_->getMergeSuggestion(pending[0].id);
    EXPECT_EQ(rejected->status, MergeStatus::Rejected);
    EXPECT_EQ(rejected->audit.reviewed_by, "ops@venue");
    EXPECT_FALSE(rejected->audit.reviewed_at.empty());
}

TEST_F(DuplicatesTest, NearIdenticalGatesAreAutoMergedWhenEnabled) {
    AdaptiveThresholdConfig cfg;
    cfg.auto_apply_merges = true;
    const Gate a = storeGate("Main Gate", venuePoint(0));
    const Gate b = storeGate("Main Gate 2", venuePoint(1));
    traffic(a, 30);
    traffic(b, 30);

    const DuplicateReport report = DuplicateDetector(*db_, cfg).run("S1");
    EXPECT_EQ(report.auto_applied, 1);
    ASSERT_EQ(report.suggestions.size(), 1u);
    EXPECT_EQ(report.suggestions[0].status, MergeStatus::AutoApplied);

    auto retired = db_->getGate(b.id);
    EXPECT_EQ(retired->status, GateStatus::Inactive);
    EXPECT_EQ(retired->merged_into, a.id);
    EXPECT_EQ(db_->countCheckinsForGate(a.id), 60);
}

TEST_F(DuplicatesTest, PairsAfterAutoMergeUseTheMergedGate) {
    AdaptiveThresholdConfig cfg;
    cfg.auto_apply_merges = true;
    cfg.merge_auto_apply_threshold = 0.8;
    const Gate a = storeGate("Main Gate", venuePoint(0), 40);
    const Gate b = storeGate("Main Gate 2", venuePoint(6), 20);
    const Gate c = storeGate("West Gate", venuePoint(-10), 40);
    traffic(a, 40);
    traffic(b, 20);
    traffic(c, 40);

    const DuplicateReport report = DuplicateDetector(*db_, cfg).run("S1");
    EXPECT_EQ(report.auto_applied, 1);
    EXPECT_EQ(db_->getGate(b.id)->merged_into, a.id);

    // a moved 2 m east when it absorbed b, so c is now 12 m away and below auto-apply
    const auto merged = db_->getGate(a.id);
    EXPECT_NEAR(haversineMeters(merged->centroid, venuePoint(2)), 0.0, 0.1);
    EXPECT_EQ(db_->getGate(c.id)->status, GateStatus::Active);

    const auto pending = db_->getMergeSuggestions("S1", MergeStatus::Pending);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].target_gate_id, a.id);
    EXPECT_EQ(pending[0].source_gate_id, c.id);
    EXPECT_NEAR(pending[0].distance_m, 12.0, 0.2);
    EXPECT_LT(pending[0].confidence, cfg.merge_auto_apply_threshold);
}

class MergeTest : public DuplicatesTest {};

TEST_F(MergeTest, NothingReferencesTheSourceAfterwards) {
    AdaptiveThresholdConfig cfg;
    const Gate a = storeGate("Main Gate", venuePoint(0), 40);
    const Gate b = storeGate("Main Gate 2", venuePoint(8), 20);
    traffic(a, 40);
    traffic(b, 15);
    traffic(b, 5, "VIP");
    BindingLearner(*db_, cfg).learnPending("S1");

    const MergeResult result = GateMerger(*db_, cfg).merge(b.id, a.id, audit_);
    EXPECT_EQ(result.events_repointed, 20);
    EXPECT_EQ(result.bindings_combined, 1);
    EXPECT_EQ(result.bindings_moved, 1);

    EXPECT_EQ(db_->countCheckinsForGate(b.id), 0);
    EXPECT_EQ(db_->countCheckinsForGate(a.id), 60);
    EXPECT_TRUE(db_->getBindingsForGate(b.id).empty());

    auto general = db_->getBinding(a.id, "GENERAL");
    ASSERT_TRUE(general.has_value());
    EXPECT_EQ(general->sample_count, 55);
    EXPECT_NEAR(general->confidence, 55.0 / 57.0, 1e-9);
    EXPECT_EQ(db_->getBinding(a.id, "VIP")->sample_count, 5);

    auto target = db_->getGate(a.id);
    EXPECT_EQ(target->sample_count, 60);
    EXPECT_NEAR(haversineMeters(target->centroid, venuePoint(8.0 / 3.0)), 0.0, 0.1);
    auto source = db_->getGate(b.id);
    EXPECT_EQ(source->status, GateStatus::Inactive);
    EXPECT_EQ(source->merged_into, a.id);
}

TEST_F(MergeTest, RetiredGateCannotBeMergedAgain) {
    AdaptiveThresholdConfig cfg;
    const Gate a = storeGate("Main Gate", venuePoint(0));
    const Gate b = storeGate("Main Gate 2", venuePoint(8));
    const Gate c = storeGate("Main Gate 3", venuePoint(-8));
    GateMerger merger(*db_, cfg);
    merger.merge(b.id, a.id, audit_);

    EXPECT_THROW(merger.merge(b.id, c.id, audit_), StaleStateError);
    EXPECT_THROW(merger.merge(c.id, b.id, audit_), StaleStateError);
    EXPECT_THROW(merger.merge(a.id, a.id, audit_), std::invalid_argument);
    EXPECT_THROW(merger.merge(999, a.id, audit_), NotFoundError);
}

TEST_F(MergeTest, ApprovingTwiceIsStale) {
    AdaptiveThresholdConfig cfg;
    traffic(storeGate("Main Gate", venuePoint(0)), 40);
    traffic(storeGate("Main Gate 2", venuePoint(8)), 20);
    const auto report = DuplicateDetector(*db_, cfg).run("S1");
    ASSERT_EQ(report.suggestions.size(), 1u);
    const int64_t id = report.suggestions[0].id;

    GateMerger merger(*db_, cfg);
    merger.applySuggestion(id, MergeStatus::Approved, audit_);
    EXPECT_EQ(db_->getMergeSuggestion(id)->status, MergeStatus::Approved);
    EXPECT_THROW(merger.applySuggestion(id, MergeStatus::Approved, audit_), StaleStateError);
    EXPECT_THROW(merger.rejectSuggestion(id, audit_), StaleStateError);
}

TEST_F(MergeTest, MergeClosesOtherSuggestionsOfTheSource) {
    AdaptiveThresholdConfig cfg;
    const Gate a = storeGate("A", venuePoint(0));
    const Gate b = storeGate("B", venuePoint(6));
    const Gate c = storeGate("C", venuePoint(12));
    traffic(a, 40);
    traffic(b, 10);
    traffic(c, 30);

    DuplicateDetector(*db_, cfg).run("S1");
    const auto pending = db_->getMergeSuggestions("S1", MergeStatus::Pending);
    ASSERT_GE(pending.size(), 2u);

    const MergeResult result = GateMerger(*db_, cfg).merge(b.id, a.id, audit_);
    EXPECT_GE(result.suggestions_rejected, 1);
    for (const auto& s : db_->getMergeSuggestions("S1", MergeStatus::Pending)) {
        EXPECT_NE(s.source_gate_id, b.id);
        EXPECT_NE(s.target_gate_id, b.id);
    }
}

TEST_F(MergeTest, FailedMergeLeavesNothingBehind) {
    AdaptiveThresholdConfig cfg;
    const Gate a = storeGate("Main Gate", venuePoint(0));
    Gate b = storeGate("Main Gate 2", venuePoint(8));
    traffic(b, 10);
    Gate closed = a;
    closed.status = GateStatus::Inactive;
    ASSERT_TRUE(db_->updateGate(closed));

    EXPECT_THROW(GateMerger(*db_, cfg).merge(b.id, a.id, audit_), StaleStateError);
    EXPECT_EQ(db_->countCheckinsForGate(b.id), 10);
    EXPECT_EQ(db_->getGate(b.id)->status, GateStatus::Active);
}
