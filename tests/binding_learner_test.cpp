#include "test_helpers.h"
#include "gatesense/enforcement/BindingLearner.h"

using namespace gatesense;
using namespace gatesense::test;

TEST(BindingConfidence, DominanceTimesEvidence) {
    EXPECT_DOUBLE_EQ(bindingConfidence(0, 0, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(bindingConfidence(10, 10, 2.0), 10.0 / 12.0);
    EXPECT_DOUBLE_EQ(bindingConfidence(30, 40, 2.0), 0.75 * 30.0 / 32.0);
    EXPECT_NEAR(bindingConfidence(1000, 1000, 2.0), 1.0, 0.01);
}

TEST(BindingConfidence, StrongestEnforcedTieBreaks) {
    CategoryBinding a; a.category = "B"; a.status = BindingStatus::Enforced; a.confidence = 0.9; a.sample_count = 50;
    CategoryBinding b; b.category = "A"; b.status = BindingStatus::Enforced; b.confidence = 0.9; b.sample_count = 50;
    CategoryBinding c; c.category = "C"; c.status = BindingStatus::Probation; c.confidence = 0.99;
    std::vector<CategoryBinding> bindings{a, b, c};
    ASSERT_NE(strongestEnforced(bindings), nullptr);
    EXPECT_EQ(strongestEnforced(bindings)->category, "A");

    bindings[0].sample_count = 51;
    EXPECT_EQ(strongestEnforced(bindings)->category, "B");
    EXPECT_EQ(strongestEnforced({c}), nullptr);
}

class BindingLearnerTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        gate_ = storeGate("Main Gate", venuePoint(0));
    }

    int64_t gatedScan(const std::string& category, int64_t gate_id = 0) {
        CheckinEvent e = makeScan(0, venuePoint(1), category);
        e.gate_id = gate_id ? gate_id : gate_.id;
        return storeScan(e);
    }

    BindingStatus statusOf(const std::string& category, int64_t gate_id = 0) {
        auto b = db_->getBinding(gate_id ? gate_id : gate_.id, category);
        EXPECT_TRUE(b.has_value());
        return b ? b->status : BindingStatus::Unbound;
    }

    AdaptiveThresholdConfig cfg_;
    Gate gate_;
};

TEST_F(BindingLearnerTest, ConsistentCategoryIsEnforced) {
    for (int i = 0; i < 60; ++i) gatedScan("GENERAL");

    const LearnReport report = BindingLearner(*db_, cfg_).learnPending("S1");
    EXPECT_EQ(report.processed, 60);
    EXPECT_EQ(report.promotions, 1);
    EXPECT_EQ(report.violations, 0);

    auto b = db_->getBinding(gate_.id, "GENERAL");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->status, BindingStatus::Enforced);
    EXPECT_EQ(b->sample_count, 60);
    EXPECT_NEAR(b->confidence, 60.0 / 62.0, 1e-9);
}

TEST_F(BindingLearnerTest, PromotionWaitsForEnoughSamples) {
    BindingLearner learner(*db_, cfg_);
    for (int i = 0; i < 19; ++i) learner.learnEvent(gatedScan("GENERAL"));
    EXPECT_EQ(statusOf("GENERAL"), BindingStatus::Probation);

    learner.learnEvent(gatedScan("GENERAL"));
    EXPECT_EQ(statusOf("GENERAL"), BindingStatus::Enforced);

    const auto history = db_->getTransitions(gate_.id, "GENERAL");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].from, BindingStatus::Probation);
    EXPECT_EQ(history[0].to, BindingStatus::Enforced);
}

TEST_F(BindingLearnerTest, RedeliveredEventIsLearnedOnce) {
    BindingLearner learner(*db_, cfg_);
    const int64_t id = gatedScan("GENERAL");
    EXPECT_TRUE(learner.learnEvent(id));
    EXPECT_FALSE(learner.learnEvent(id));
    EXPECT_EQ(db_->getBinding(gate_.id, "GENERAL")->sample_count, 1);

    EXPECT_EQ(learner.learnPending("S1").processed, 0);
    EXPECT_EQ(db_->getBinding(gate_.id, "GENERAL")->sample_count, 1);
}

TEST_F(BindingLearnerTest, UngatedAndFailedScansAreNotLearned) {
    BindingLearner learner(*db_, cfg_);
    const int64_t orphan = storeScan(makeScan(0, venuePoint(1)));
    CheckinEvent denied = makeScan(0, venuePoint(1));
    denied.gate_id = gate_.id;
    denied.outcome = CheckinOutcome::Denied;
    const int64_t denied_id = storeScan(denied);

    EXPECT_FALSE(learner.learnEvent(orphan));
    EXPECT_FALSE(learner.learnEvent(denied_id));
    EXPECT_TRUE(db_->getBindingsForGate(gate_.id).empty());
}

TEST_F(BindingLearnerTest, CompetingGatesSuppressConfidence) {
    const Gate other = storeGate("Side Gate", venuePoint(300));
    for (int i = 0; i < 10; ++i) {
        for (int j = 0; j < 3; ++j) gatedScan("GENERAL");
        gatedScan("GENERAL", other.id);
    }

    BindingLearner(*db_, cfg_).learnPending("S1");
    auto main = db_->getBinding(gate_.id, "GENERAL");
    auto side = db_->getBinding(other.id, "GENERAL");
    ASSERT_TRUE(main && side);
    EXPECT_NEAR(main->confidence, 0.75 * 30.0 / 32.0, 1e-9);
    EXPECT_NEAR(side->confidence, 0.25 * 10.0 / 12.0, 1e-9);
    EXPECT_EQ(main->status, BindingStatus::Probation);
    EXPECT_EQ(side->status, BindingStatus::Probation);
}

TEST_F(BindingLearnerTest, ViolationsAreChargedToTheEnforcedBinding) {
    for (int i = 0; i < 30; ++i) gatedScan("GENERAL");
    BindingLearner learner(*db_, cfg_);
    learner.learnPending("S1");
    ASSERT_EQ(statusOf("GENERAL"), BindingStatus::Enforced);

    learner.learnEvent(gatedScan("VIP"));
    auto general = db_->getBinding(gate_.id, "GENERAL");
    EXPECT_EQ(general->violation_count, 1);
    EXPECT_EQ(general->last_violation_at, "2026-03-01 18:00:00");
    EXPECT_EQ(statusOf("VIP"), BindingStatus::Probation);
    EXPECT_EQ(db_->getBinding(gate_.id, "VIP")->sample_count, 1);
}

TEST_F(BindingLearnerTest, SustainedViolationsDemote) {
    for (int i = 0; i < 30; ++i) gatedScan("GENERAL");
    BindingLearner learner(*db_, cfg_);
    learner.learnPending("S1");

    // ten different strangers: none of them ever becomes recognized
    for (int i = 0; i < 10; ++i) gatedScan("GUEST" + std::to_string(i));
    const LearnReport report = learner.learnPending("S1");
    EXPECT_EQ(report.violations, 10);
    EXPECT_EQ(report.demotions, 1);

    auto general = db_->getBinding(gate_.id, "GENERAL");
    EXPECT_EQ(general->status, BindingStatus::Probation);
    EXPECT_EQ(general->demotion_count, 1);
    EXPECT_EQ(general->violation_count, 0);

    // evidence brings it back
    learner.learnEvent(gatedScan("GENERAL"));
    EXPECT_EQ(statusOf("GENERAL"), BindingStatus::Enforced);
}

TEST_F(BindingLearnerTest, RepeatedDemotionsUnbind) {
    cfg_.max_demotions = 1;
    for (int i = 0; i < 30; ++i) gatedScan("GENERAL");
    BindingLearner learner(*db_, cfg_);
    learner.learnPending("S1");
    for (int i = 0; i < 10; ++i) gatedScan("GUEST" + std::to_string(i));
    const LearnReport report = learner.learnPending("S1");
    EXPECT_EQ(report.unbound, 1);
    EXPECT_EQ(statusOf("GENERAL"), BindingStatus::Unbound);

    // unbound bindings keep counting but are never enforced again on their own
    for (int i = 0; i < 40; ++i) gatedScan("GENERAL");
    learner.learnPending("S1");
    auto general = db_->getBinding(gate_.id, "GENERAL");
    EXPECT_EQ(general->status, BindingStatus::Unbound);
    EXPECT_EQ(general->sample_count, 70);
}

TEST_F(BindingLearnerTest, TransitionsNeverSkipAState) {
    cfg_.max_demotions = 2;
    BindingLearner learner(*db_, cfg_);
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 30; ++i) gatedScan("GENERAL");
        learner.learnPending("S1");
        for (int i = 0; i < 20; ++i) gatedScan("GUEST" + std::to_string(round) + "_" + std::to_string(i));
        learner.learnPending("S1");
    }

    const auto history = db_->getTransitions(gate_.id, "GENERAL");
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history.front().from, BindingStatus::Probation);
    for (size_t i = 0; i < history.size(); ++i) {
        const auto& t = history[i];
        if (i > 0) EXPECT_EQ(t.from, history[i - 1].to);
        EXPECT_FALSE(t.from == BindingStatus::Enforced && t.to == BindingStatus::Unbound);
        EXPECT_FALSE(t.from == BindingStatus::Unbound && t.to == BindingStatus::Enforced);
    }
    EXPECT_EQ(history.back().to, BindingStatus::Unbound);
}

TEST_F(BindingLearnerTest, OperatorUnbindAndReset) {
    for (int i = 0; i < 30; ++i) gatedScan("GENERAL");
    BindingLearner learner(*db_, cfg_);
    learner.learnPending("S1");

    EXPECT_FALSE(learner.resetToProbation(gate_.id, "GENERAL", "not unbound"));
    EXPECT_TRUE(learner.setUnbound(gate_.id, "GENERAL", "gate repurposed"));
    EXPECT_EQ(statusOf("GENERAL"), BindingStatus::Unbound);

    EXPECT_TRUE(learner.resetToProbation(gate_.id, "GENERAL", "back in use"));
    EXPECT_EQ(statusOf("GENERAL"), BindingStatus::Probation);
    EXPECT_FALSE(learner.setUnbound(gate_.id, "NOPE", "unknown"));

    const auto history = db_->getTransitions(gate_.id, "GENERAL");
    ASSERT_GE(history.size(), 3u);
    EXPECT_EQ(history.back().reason, "operator: back in use");
}
