#include "pch.h"

#include "HealthAQ/risk_scoring.h"

TEST(TestHealthAQ_RiskScoring, NormalizeClampsToUnitRange) {
    using namespace haq;

    ASSERT_DOUBLE_EQ(0.0, normalize(-30.0, -20.0, 20.0));
    ASSERT_DOUBLE_EQ(0.5, normalize(0.0, -20.0, 20.0));
    ASSERT_DOUBLE_EQ(1.0, normalize(150.0, 5.0, 100.0));
    ASSERT_DOUBLE_EQ(0.0, normalize(10.0, 5.0, 5.0));
}

TEST(TestHealthAQ_RiskScoring, WeightedScore) {
    using namespace haq;

    ASSERT_NEAR(0.60 * 0.5 + 0.25 * 0.75 + 0.15 * 0.5, risk_score(52.5, 10.0, 15.0), 1e-12);
    ASSERT_NEAR(1.0, risk_score(500.0, 40.0, 60.0), 1e-12);
}

TEST(TestHealthAQ_RiskScoring, ScoreBelowTmrelIsClamped) {
    using namespace haq;

    ASSERT_DOUBLE_EQ(risk_score(5.0, -20.0, 0.0), risk_score(1.0, -20.0, 0.0));
    ASSERT_DOUBLE_EQ(0.0, risk_score(1.0, -25.0, 0.0));
}

TEST(TestHealthAQ_RiskScoring, ConcentrationTiers) {
    using namespace haq;

    ASSERT_EQ("Low", risk_tier(11.9));
    ASSERT_EQ("Moderate", risk_tier(12.0));
    ASSERT_EQ("Moderate", risk_tier(35.4));
    ASSERT_EQ("High", risk_tier(35.5));
    ASSERT_EQ("High", risk_tier(55.4));
    ASSERT_EQ("Very High", risk_tier(55.5));
}

TEST(TestHealthAQ_RiskScoring, ScoreAndTier) {
    using namespace haq;
    auto risk = score_risk(90.0, 2.0, 3.0);

    ASSERT_EQ("Very High", risk.tier);
    ASSERT_GT(risk.score, 0.5);
    ASSERT_LE(risk.score, 1.0);
    ASSERT_EQ("Low", score_risk(2.0, 0.0, 0.0).tier);
}
