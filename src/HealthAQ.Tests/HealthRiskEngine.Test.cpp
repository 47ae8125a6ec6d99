#include "pch.h"
#include "reference_fixture.h"

#include "HealthAQ/errors.h"
#include "HealthAQ/exposure.h"
#include "HealthAQ/health_risk_engine.h"

namespace {

using haq::core::AgeGroup;

const haq::core::DiseaseInfo IschemicHeart{
    .name = "Ischemic heart disease", .category = "Cardiovascular", .alpha = 0.2969,
    .gamma = 0.0133, .delta = 1.0};

const haq::core::DiseaseInfo Stroke{
    .name = "Stroke", .category = "Cardiovascular", .alpha = 0.3120, .gamma = 0.0098,
    .delta = 1.0};

class HealthRiskEngineTest : public ::testing::Test {
  protected:
    HealthRiskEngineTest() : engine{haq::testing::test_reference_data()} {}

    haq::HealthRiskEngine engine;
};

} // anonymous namespace

TEST(TestHealthAQ_HealthRiskEngine, RelativeRiskCurve) {
    using haq::HealthRiskEngine;

    ASSERT_DOUBLE_EQ(1.0, HealthRiskEngine::relative_risk(IschemicHeart, haq::TMREL));
    ASSERT_DOUBLE_EQ(1.0, HealthRiskEngine::relative_risk(IschemicHeart, 3.0));
    ASSERT_NEAR(1.0536972684, HealthRiskEngine::relative_risk(IschemicHeart, 20.0), 1e-9);
    ASSERT_NEAR(1.2010393685, HealthRiskEngine::relative_risk(IschemicHeart, 90.0), 1e-9);
    ASSERT_LE(HealthRiskEngine::relative_risk(IschemicHeart, 10000.0), 1.0 + IschemicHeart.alpha);
}

TEST(TestHealthAQ_HealthRiskEngine, AttributableFraction) {
    using haq::HealthRiskEngine;

    ASSERT_DOUBLE_EQ(0.0, HealthRiskEngine::attributable_fraction(Stroke, 4.0));
    ASSERT_NEAR(0.0409074817, HealthRiskEngine::attributable_fraction(Stroke, 20.0), 1e-9);

    auto rr = HealthRiskEngine::relative_risk(IschemicHeart, 32.0);
    ASSERT_NEAR((rr - 1.0) / rr, HealthRiskEngine::attributable_fraction(IschemicHeart, 32.0),
                1e-12);
}

TEST(TestHealthAQ_HealthRiskEngine, AgeGroupsAndBands) {
    using haq::HealthRiskEngine;

    ASSERT_DOUBLE_EQ(1.3, HealthRiskEngine::age_multiplier(AgeGroup::children));
    ASSERT_DOUBLE_EQ(1.0, HealthRiskEngine::age_multiplier(AgeGroup::adults));
    ASSERT_DOUBLE_EQ(1.5, HealthRiskEngine::age_multiplier(AgeGroup::elderly));
    ASSERT_EQ("Elderly (65+)", HealthRiskEngine::age_label(AgeGroup::elderly));

    ASSERT_EQ(AgeGroup::children, HealthRiskEngine::age_group_of_band("<1 year"));
    ASSERT_EQ(AgeGroup::children, HealthRiskEngine::age_group_of_band("10-14 years"));
    ASSERT_EQ(AgeGroup::adults, HealthRiskEngine::age_group_of_band("15-19 years"));
    ASSERT_EQ(AgeGroup::adults, HealthRiskEngine::age_group_of_band(" 60-64 years"));
    ASSERT_EQ(AgeGroup::elderly, HealthRiskEngine::age_group_of_band("95+ years"));
    ASSERT_FALSE(HealthRiskEngine::age_group_of_band("All ages").has_value());
    ASSERT_FALSE(HealthRiskEngine::age_group_of_band("").has_value());
}

TEST(TestHealthAQ_HealthRiskEngine, AqiCategoryBreakpoints) {
    using haq::HealthRiskEngine;

    ASSERT_EQ("Good", HealthRiskEngine::aqi_category(11.9).level);
    ASSERT_EQ("Moderate", HealthRiskEngine::aqi_category(12.0).level);
    ASSERT_EQ("Unhealthy for Sensitive Groups", HealthRiskEngine::aqi_category(35.5).level);
    ASSERT_EQ("Unhealthy", HealthRiskEngine::aqi_category(55.5).level);
    ASSERT_EQ("Very Unhealthy", HealthRiskEngine::aqi_category(150.5).level);
    ASSERT_EQ("Hazardous", HealthRiskEngine::aqi_category(250.5).level);
    ASSERT_EQ("#4CAF50", HealthRiskEngine::aqi_category(5.0).color);
}

TEST(TestHealthAQ_HealthRiskEngine, DalysPerDeath) {
    ASSERT_DOUBLE_EQ(1250.0, haq::HealthRiskEngine::dalys(100.0));
    ASSERT_DOUBLE_EQ(0.0, haq::HealthRiskEngine::dalys(0.0));
}

TEST_F(HealthRiskEngineTest, AggregatedBaseline) {
    auto result = engine.attributable_deaths("thailand", 2019, 20.0);

    ASSERT_EQ("Thailand", result.country);
    ASSERT_EQ(2019, result.baseline_year.value());
    ASSERT_DOUBLE_EQ(15.0, result.excess_exposure);
    ASSERT_EQ("Moderate", result.aqi_category.level);
    ASSERT_NEAR(979.69708, result.total_deaths, 1e-4);
    ASSERT_NEAR(result.total_deaths * 0.8, result.ci_low, 1e-9);
    ASSERT_NEAR(result.total_deaths * 1.2, result.ci_high, 1e-9);
    ASSERT_DOUBLE_EQ(70000000.0, result.population);
    ASSERT_FALSE(result.population_is_proxy);
    ASSERT_NEAR(1.39957, result.rate_per_100k, 1e-4);
    ASSERT_TRUE(result.age_breakdown.empty());
    ASSERT_FALSE(result.age_group.has_value());

    ASSERT_EQ(2u, result.per_disease.size());
    ASSERT_EQ("Ischemic heart disease", result.per_disease[0].disease);
    ASSERT_DOUBLE_EQ(12000.0, result.per_disease[0].baseline_deaths);
    ASSERT_NEAR(611.5297, result.per_disease[0].attributed_deaths, 1e-3);
    ASSERT_EQ("Stroke", result.per_disease[1].disease);
}

TEST_F(HealthRiskEngineTest, NearestBaselineYear) {
    auto early = engine.attributable_deaths("Thailand", 2016, 20.0);
    ASSERT_EQ(2015, early.baseline_year.value());
    ASSERT_NEAR(836.86797, early.total_deaths, 1e-4);

    auto late = engine.attributable_deaths("Thailand", 2030, 20.0);
    ASSERT_EQ(2019, late.baseline_year.value());
    ASSERT_EQ(2030, late.year);
}

TEST_F(HealthRiskEngineTest, ExposureClampedToTmrel) {
    auto result = engine.attributable_deaths("Vietnam", 2019, 2.0);

    ASSERT_DOUBLE_EQ(haq::TMREL, result.pm25);
    ASSERT_DOUBLE_EQ(0.0, result.excess_exposure);
    ASSERT_DOUBLE_EQ(0.0, result.total_deaths);
    ASSERT_EQ(2u, result.per_disease.size());
}

TEST_F(HealthRiskEngineTest, AgeGroupMultiplier) {
    auto all = engine.attributable_deaths("Thailand", 2019, 20.0);
    auto elderly = engine.attributable_deaths("Thailand", 2019, 20.0, AgeGroup::elderly);

    ASSERT_EQ(AgeGroup::elderly, elderly.age_group.value());
    ASSERT_NEAR(all.total_deaths * 1.5, elderly.total_deaths, 1e-9);
    ASSERT_DOUBLE_EQ(18000.0, elderly.per_disease[0].baseline_deaths);
}

TEST_F(HealthRiskEngineTest, MissingBaseline) {
    auto result = engine.attributable_deaths("Germany", 2020, 9.5);

    ASSERT_FALSE(result.baseline_year.has_value());
    ASSERT_EQ("No health baseline data available", result.data_note);
    ASSERT_DOUBLE_EQ(0.0, result.total_deaths);
    ASSERT_DOUBLE_EQ(0.0, result.rate_per_100k);
    ASSERT_TRUE(result.per_disease.empty());
}

TEST_F(HealthRiskEngineTest, PopulationProxy) {
    auto result = engine.attributable_deaths("India", 2019, 90.0);

    ASSERT_TRUE(result.population_is_proxy);
    ASSERT_DOUBLE_EQ(180000.0, result.population);
    ASSERT_EQ("Unhealthy", result.aqi_category.level);
    ASSERT_NEAR(28732.3988, result.total_deaths, 1e-3);
    ASSERT_NEAR(15962.4438, result.rate_per_100k, 1e-3);
}

TEST_F(HealthRiskEngineTest, UnknownCountryThrows) {
    ASSERT_THROW(engine.attributable_deaths("Atlantis", 2019, 20.0), haq::UnknownCountryError);
}

TEST_F(HealthRiskEngineTest, FilterDisease) {
    auto result = engine.attributable_deaths("Thailand", 2019, 20.0);
    auto stroke = haq::HealthRiskEngine::filter_disease(result, "stroke");

    ASSERT_EQ(1u, stroke.per_disease.size());
    ASSERT_NEAR(9000.0 * 0.0409074817, stroke.total_deaths, 1e-5);
    ASSERT_NEAR(result.rate_per_100k * stroke.total_deaths / result.total_deaths,
                stroke.rate_per_100k, 1e-9);
    ASSERT_EQ("Disease: stroke", stroke.filter_applied.value());

    auto unchanged = haq::HealthRiskEngine::filter_disease(result, "cancer");
    ASSERT_EQ(2u, unchanged.per_disease.size());
    ASSERT_FALSE(unchanged.filter_applied.has_value());
}

TEST_F(HealthRiskEngineTest, TopDiseases) {
    auto top = engine.top_diseases("Cambodia", 2019, 26.0, 1);

    ASSERT_EQ(1u, top.size());
    ASSERT_EQ("Ischemic heart disease", top.front().disease);
    ASSERT_NEAR(202.4077, top.front().attributed_deaths, 1e-3);
    ASSERT_EQ(2u, engine.top_diseases("Cambodia", 2019, 26.0, 5).size());
}

TEST_F(HealthRiskEngineTest, CompareHealthSideBySide) {
    auto comparison = engine.compare_health("Thailand", 20.0, "India", 90.0, 2019);

    ASSERT_EQ("Thailand", comparison.first.country);
    ASSERT_EQ("India", comparison.second.country);
    ASSERT_GT(comparison.second.total_deaths, comparison.first.total_deaths);
}

TEST(TestHealthAQ_HealthRiskEngine, AgeStratifiedDetail) {
    auto engine = haq::HealthRiskEngine{haq::testing::test_reference_data_with_detail()};
    auto result = engine.attributable_deaths("Thailand", 2019, 20.0);

    ASSERT_EQ("Age-stratified (baseline year: 2019)", result.data_note);
    ASSERT_EQ(1u, result.per_disease.size());
    ASSERT_NEAR(611.5297, result.total_deaths, 1e-3);
    ASSERT_NEAR(462.7242, result.ci_low, 1e-3);
    ASSERT_NEAR(719.5667, result.ci_high, 1e-3);

    ASSERT_EQ(3u, result.age_breakdown.size());
    ASSERT_EQ(AgeGroup::elderly, result.age_breakdown[0].group);
    ASSERT_NEAR(402.5904, result.age_breakdown[0].attributed_deaths, 1e-3);
    ASSERT_EQ(AgeGroup::children, result.age_breakdown[2].group);
    auto total_share = 0.0;
    for (const auto &band : result.age_breakdown) {
        total_share += band.percentage;
    }

    ASSERT_NEAR(100.0, total_share, 1e-9);
}

TEST(TestHealthAQ_HealthRiskEngine, AgeStratifiedSingleGroup) {
    auto engine = haq::HealthRiskEngine{haq::testing::test_reference_data_with_detail()};
    auto result = engine.attributable_deaths("Thailand", 2019, 20.0, AgeGroup::elderly);

    ASSERT_EQ(1u, result.age_breakdown.size());
    ASSERT_DOUBLE_EQ(1.5, result.age_breakdown[0].vulnerability_multiplier);
    ASSERT_NEAR(603.8856, result.total_deaths, 1e-3);
    ASSERT_NEAR(458.6473, result.ci_low, 1e-3);
    ASSERT_DOUBLE_EQ(100.0, result.age_breakdown[0].percentage);
}

TEST(TestHealthAQ_HealthRiskEngine, AggregatedFallbackWithoutDetail) {
    auto engine = haq::HealthRiskEngine{haq::testing::test_reference_data_with_detail()};
    auto result = engine.attributable_deaths("Vietnam", 2019, 32.0);

    ASSERT_TRUE(result.age_breakdown.empty());
    ASSERT_EQ("Aggregated baseline, no age stratification (baseline year: 2019)",
              result.data_note);
}
