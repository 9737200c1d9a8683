#include <gtest/gtest.h>
#include <incidentguard/incidentguard.hpp>

using namespace incidentguard;
using namespace std::chrono_literals;

// ===========================================================================
// Helpers
// ===========================================================================

static Finding make_finding(AgentRole role, double confidence, const std::string& action,
                            RoundNumber round = 1) {
    Finding f;
    f.role = role;
    f.incident_id = 7;
    f.round = round;
    f.confidence = confidence;
    f.action = action;
    f.evidence = "observed";
    return f;
}

static WeightTable four_agent_weights() {
    return {
        {AgentRole::Detection, 0.2},
        {AgentRole::Diagnosis, 0.4},
        {AgentRole::Prediction, 0.3},
        {AgentRole::Resolution, 0.1},
    };
}

static const Contribution* contribution_for(const ConsensusDecision& d, AgentRole role) {
    for (const auto& c : d.contributions) {
        if (c.role == role) return &c;
    }
    return nullptr;
}

class ConsensusEngineTest : public ::testing::Test {
protected:
    ConsensusConfig cfg;
    WeightTable weights = four_agent_weights();

    ConsensusEngine engine() const { return ConsensusEngine(cfg); }
};

// ===========================================================================
// Renormalization
// ===========================================================================

TEST_F(ConsensusEngineTest, RenormalizedWeightsSumToOne) {
    std::vector<std::vector<AgentRole>> subsets = {
        {AgentRole::Detection, AgentRole::Diagnosis},
        {AgentRole::Prediction, AgentRole::Resolution, AgentRole::Detection},
        {AgentRole::Detection, AgentRole::Diagnosis, AgentRole::Prediction, AgentRole::Resolution},
        {AgentRole::Resolution},
    };
    for (const auto& subset : subsets) {
        auto normalized = ConsensusEngine::renormalize(weights, subset);
        double sum = 0.0;
        for (auto& [_, w] : normalized) sum += w;
        EXPECT_NEAR(sum, 1.0, 1e-9);
    }
}

TEST_F(ConsensusEngineTest, RenormalizeSkipsUnweightedRoles) {
    auto normalized = ConsensusEngine::renormalize(
        weights, {AgentRole::Detection, AgentRole::Communication});
    ASSERT_EQ(normalized.size(), 1u);
    EXPECT_DOUBLE_EQ(normalized.at(AgentRole::Detection), 1.0);
}

TEST_F(ConsensusEngineTest, RenormalizeWithNoRespondersIsEmpty) {
    EXPECT_TRUE(ConsensusEngine::renormalize(weights, {}).empty());
}

TEST_F(ConsensusEngineTest, CircuitBrokenAgentWeightIsRedistributed) {
    cfg.default_threshold = 0.70;
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.9, "scale_out"),
        make_finding(AgentRole::Prediction, 0.6, "scale_out"),
        make_finding(AgentRole::Resolution, 0.3, "restart_service"),
    };

    auto result = engine().decide(7, 1, IncidentCategory::ResourceExhaustion, findings, weights,
                                  {AgentRole::Diagnosis});
    ASSERT_TRUE(result.reached());
    const auto& d = *result.decision;

    EXPECT_NEAR(contribution_for(d, AgentRole::Detection)->normalized_weight, 0.2 / 0.6, 1e-9);
    EXPECT_NEAR(contribution_for(d, AgentRole::Prediction)->normalized_weight, 0.3 / 0.6, 1e-9);
    EXPECT_NEAR(contribution_for(d, AgentRole::Resolution)->normalized_weight, 0.1 / 0.6, 1e-9);
    EXPECT_EQ(contribution_for(d, AgentRole::Diagnosis), nullptr);

    double expected = (0.2 * 0.9 + 0.3 * 0.6 + 0.1 * 0.3) / 0.6;
    EXPECT_NEAR(d.weighted_confidence, expected, 1e-9);
    ASSERT_EQ(d.excluded_roles.size(), 1u);
    EXPECT_EQ(d.excluded_roles[0], AgentRole::Diagnosis);
}

// ===========================================================================
// Decision
// ===========================================================================

TEST_F(ConsensusEngineTest, AllAgentsConfidentIsEligible) {
    cfg.default_threshold = 0.70;
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.9, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.85, "restart_service"),
        make_finding(AgentRole::Prediction, 0.8, "scale_out"),
        make_finding(AgentRole::Resolution, 0.95, "scale_out"),
    };

    auto result = engine().decide(7, 1, IncidentCategory::InfrastructureCascade, findings, weights);
    ASSERT_TRUE(result.reached());
    const auto& d = *result.decision;

    EXPECT_NEAR(d.weighted_confidence, 0.2 * 0.9 + 0.4 * 0.85 + 0.3 * 0.8 + 0.1 * 0.95, 1e-9);
    EXPECT_TRUE(d.autonomous_eligible);
    // scale_out carries 0.6 of the vote against 0.4
    EXPECT_EQ(d.action, "scale_out");
    EXPECT_NEAR(d.action_votes.at("scale_out"), 0.6, 1e-9);
    EXPECT_NEAR(d.action_votes.at("restart_service"), 0.4, 1e-9);
    EXPECT_EQ(d.contributions.size(), 4u);
    EXPECT_TRUE(d.excluded_roles.empty());
    EXPECT_DOUBLE_EQ(d.threshold, 0.70);
}

TEST_F(ConsensusEngineTest, ConfidenceExactlyAtThresholdIsEligible) {
    cfg.default_threshold = 0.8;
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.8, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.8, "scale_out"),
        make_finding(AgentRole::Prediction, 0.8, "scale_out"),
        make_finding(AgentRole::Resolution, 0.8, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::Security, findings, weights);
    ASSERT_TRUE(result.reached());
    EXPECT_TRUE(result.decision->autonomous_eligible);
}

TEST_F(ConsensusEngineTest, JustBelowThresholdIsNotEligible) {
    cfg.default_threshold = 0.8;
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.79, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.79, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::Security, findings, weights);
    ASSERT_TRUE(result.reached());
    EXPECT_FALSE(result.decision->autonomous_eligible);
}

TEST_F(ConsensusEngineTest, ThresholdToleranceIsOneBillionth) {
    cfg.default_threshold = 0.8;
    auto all_at = [](double confidence) {
        return std::vector<Finding>{
            make_finding(AgentRole::Detection, confidence, "scale_out"),
            make_finding(AgentRole::Diagnosis, confidence, "scale_out"),
            make_finding(AgentRole::Prediction, confidence, "scale_out"),
            make_finding(AgentRole::Resolution, confidence, "scale_out"),
        };
    };

    auto within = engine().decide(7, 1, IncidentCategory::Security, all_at(0.8 - 1e-10), weights);
    ASSERT_TRUE(within.reached());
    EXPECT_TRUE(within.decision->autonomous_eligible);

    auto outside = engine().decide(7, 1, IncidentCategory::Security, all_at(0.8 - 1e-6), weights);
    ASSERT_TRUE(outside.reached());
    EXPECT_FALSE(outside.decision->autonomous_eligible);
    EXPECT_DOUBLE_EQ(ConsensusEngine::kThresholdTolerance, 1e-9);
}

TEST_F(ConsensusEngineTest, CategoryThresholdOverridesDefault) {
    cfg.default_threshold = 0.85;
    cfg.category_thresholds[IncidentCategory::Security] = 0.95;
    auto e = engine();
    EXPECT_DOUBLE_EQ(e.threshold_for(IncidentCategory::Security), 0.95);
    EXPECT_DOUBLE_EQ(e.threshold_for(IncidentCategory::LatencyDegradation), 0.85);
}

TEST_F(ConsensusEngineTest, TieBrokenByHighestSingleConfidence) {
    WeightTable even = {{AgentRole::Detection, 0.5}, {AgentRole::Diagnosis, 0.5}};
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.7, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.9, "rollback"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::LatencyDegradation, findings, even);
    ASSERT_TRUE(result.reached());
    EXPECT_EQ(result.decision->action, "rollback");
}

TEST_F(ConsensusEngineTest, TieBrokenByStaticWeight) {
    WeightTable w = {{AgentRole::Detection, 0.5}, {AgentRole::Diagnosis, 0.3},
                     {AgentRole::Prediction, 0.2}};
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.8, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.8, "rollback"),
        make_finding(AgentRole::Prediction, 0.8, "rollback"),
    };
    // Both actions hold half the vote at the same confidence
    auto result = engine().decide(7, 1, IncidentCategory::LatencyDegradation, findings, w);
    ASSERT_TRUE(result.reached());
    EXPECT_EQ(result.decision->action, "scale_out");
}

TEST_F(ConsensusEngineTest, FullTieBrokenByActionName) {
    WeightTable even = {{AgentRole::Detection, 0.5}, {AgentRole::Diagnosis, 0.5}};
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.8, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.8, "rollback"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::LatencyDegradation, findings, even);
    ASSERT_TRUE(result.reached());
    EXPECT_EQ(result.decision->action, "rollback");
}

TEST_F(ConsensusEngineTest, DuplicateFindingFromSameRoleCountsOnce) {
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.9, "scale_out"),
        make_finding(AgentRole::Detection, 0.1, "rollback"),
        make_finding(AgentRole::Diagnosis, 0.9, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::ResourceExhaustion, findings, weights);
    ASSERT_TRUE(result.reached());
    EXPECT_EQ(result.decision->contributions.size(), 2u);
    EXPECT_NEAR(result.decision->weighted_confidence, 0.9, 1e-9);
    EXPECT_EQ(result.decision->action_votes.count("rollback"), 0u);
}

// ===========================================================================
// Quorum
// ===========================================================================

TEST_F(ConsensusEngineTest, SingleResponderIsInsufficientQuorum) {
    std::vector<Finding> findings = {make_finding(AgentRole::Diagnosis, 0.99, "scale_out")};
    auto result = engine().decide(7, 1, IncidentCategory::ResourceExhaustion, findings, weights);
    EXPECT_EQ(result.status, ConsensusStatus::InsufficientQuorum);
    EXPECT_FALSE(result.decision.has_value());
    EXPECT_NEAR(result.responding_weight, 0.4, 1e-9);
}

TEST_F(ConsensusEngineTest, NoFindingsIsInsufficientQuorum) {
    auto result = engine().decide(7, 1, IncidentCategory::ResourceExhaustion, {}, weights);
    EXPECT_FALSE(result.reached());
}

TEST_F(ConsensusEngineTest, LightRespondersBelowQuorumFraction) {
    // Detection + Resolution carry 0.3 of the static weight
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.99, "scale_out"),
        make_finding(AgentRole::Resolution, 0.99, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::ResourceExhaustion, findings, weights);
    EXPECT_EQ(result.status, ConsensusStatus::InsufficientQuorum);
    EXPECT_NEAR(result.responding_weight, 0.3, 1e-9);
}

TEST_F(ConsensusEngineTest, RespondersAtQuorumFractionAreEnough) {
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.9, "scale_out"),
        make_finding(AgentRole::Prediction, 0.9, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::ResourceExhaustion, findings, weights);
    EXPECT_TRUE(result.reached());
}

TEST_F(ConsensusEngineTest, FindingFromUnweightedRoleIsIgnored) {
    std::vector<Finding> findings = {
        make_finding(AgentRole::Communication, 0.99, "page_oncall"),
        make_finding(AgentRole::Diagnosis, 0.9, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::ResourceExhaustion, findings, weights);
    EXPECT_FALSE(result.reached());
}

// ===========================================================================
// Byzantine screening
// ===========================================================================

TEST_F(ConsensusEngineTest, ScreeningSetsAsideConfidenceOutlier) {
    cfg.byzantine_screening = true;
    cfg.default_threshold = 0.85;
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.9, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.1, "scale_out"),
        make_finding(AgentRole::Prediction, 0.9, "scale_out"),
        make_finding(AgentRole::Resolution, 0.9, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::Security, findings, weights);
    ASSERT_TRUE(result.reached());
    const auto& d = *result.decision;

    EXPECT_EQ(d.suspected_roles, (std::vector<AgentRole>{AgentRole::Diagnosis}));
    EXPECT_EQ(d.excluded_roles, (std::vector<AgentRole>{AgentRole::Diagnosis}));
    EXPECT_EQ(contribution_for(d, AgentRole::Diagnosis), nullptr);
    EXPECT_NEAR(d.weighted_confidence, 0.9, 1e-9);
    EXPECT_TRUE(d.autonomous_eligible);
    // 0.2 / 0.6 once Diagnosis' 0.4 is gone
    EXPECT_NEAR(contribution_for(d, AgentRole::Detection)->normalized_weight, 1.0 / 3.0, 1e-9);
}

TEST_F(ConsensusEngineTest, WithoutScreeningOutlierStillVotes) {
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.9, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.1, "scale_out"),
        make_finding(AgentRole::Prediction, 0.9, "scale_out"),
        make_finding(AgentRole::Resolution, 0.9, "scale_out"),
    };
    auto result = engine().decide(7, 1, IncidentCategory::Security, findings, weights);
    ASSERT_TRUE(result.reached());
    EXPECT_TRUE(result.decision->suspected_roles.empty());
    EXPECT_NEAR(result.decision->weighted_confidence, 0.58, 1e-9);
}

TEST_F(ConsensusEngineTest, ScreeningFlagsConfidentMinorityOnSplitVote) {
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.7, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.7, "scale_out"),
        make_finding(AgentRole::Prediction, 0.95, "restart_service"),
        make_finding(AgentRole::Resolution, 0.6, "rollback"),
    };
    EXPECT_EQ(engine().suspected_byzantine(findings),
              (std::vector<AgentRole>{AgentRole::Prediction}));
}

TEST_F(ConsensusEngineTest, ScreeningNeverExceedsTolerance) {
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.1, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.15, "scale_out"),
        make_finding(AgentRole::Prediction, 0.9, "scale_out"),
        make_finding(AgentRole::Resolution, 0.9, "scale_out"),
    };
    // Both low outliers qualify, but four agents tolerate only one
    EXPECT_EQ(engine().suspected_byzantine(findings),
              (std::vector<AgentRole>{AgentRole::Detection}));
}

TEST_F(ConsensusEngineTest, ScreeningNeedsFourResponders) {
    std::vector<Finding> findings = {
        make_finding(AgentRole::Detection, 0.1, "scale_out"),
        make_finding(AgentRole::Diagnosis, 0.9, "scale_out"),
        make_finding(AgentRole::Prediction, 0.9, "scale_out"),
    };
    EXPECT_TRUE(engine().suspected_byzantine(findings).empty());
}

// ===========================================================================
// Configuration and tolerance
// ===========================================================================

TEST(ConsensusEngineConfigTest, RejectsThresholdOutsideUnitInterval) {
    ConsensusConfig cfg;
    cfg.default_threshold = 1.2;
    EXPECT_THROW(ConsensusEngine{cfg}, InvalidConfigurationException);
}

TEST(ConsensusEngineConfigTest, RejectsMinRespondersBelowTwo) {
    ConsensusConfig cfg;
    cfg.min_responders = 1;
    EXPECT_THROW(ConsensusEngine{cfg}, InvalidConfigurationException);
}

TEST(ConsensusEngineConfigTest, RejectsCategoryWeightsNotSummingToOne) {
    ConsensusConfig cfg;
    cfg.category_weights[IncidentCategory::Security] = {
        {AgentRole::Detection, 0.5}, {AgentRole::Diagnosis, 0.4}};
    EXPECT_THROW(ConsensusEngine{cfg}, InvalidConfigurationException);
}

TEST(ConsensusEngineConfigTest, ValidateWeightsRejectsZeroWeight) {
    WeightTable w = {{AgentRole::Detection, 1.0}, {AgentRole::Diagnosis, 0.0}};
    EXPECT_THROW(ConsensusEngine::validate_weights(w), InvalidConfigurationException);
    EXPECT_THROW(ConsensusEngine::validate_weights({}), InvalidConfigurationException);
    EXPECT_NO_THROW(ConsensusEngine::validate_weights(four_agent_weights()));
}

TEST(ConsensusEngineConfigTest, ByzantineTolerance) {
    EXPECT_EQ(ConsensusEngine::byzantine_tolerance(0), 0u);
    EXPECT_EQ(ConsensusEngine::byzantine_tolerance(3), 0u);
    EXPECT_EQ(ConsensusEngine::byzantine_tolerance(4), 1u);
    EXPECT_EQ(ConsensusEngine::byzantine_tolerance(5), 1u);
    EXPECT_EQ(ConsensusEngine::byzantine_tolerance(7), 2u);
}
