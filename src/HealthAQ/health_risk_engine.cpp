#include "health_risk_engine.h"
#include "exposure.h"

#include "HealthAQ.Core/string_util.h"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <map>
#include <utility>

namespace {

using haq::core::AgeGroup;

constexpr double LowerBoundFactor = 0.8;
constexpr double UpperBoundFactor = 1.2;
constexpr double RatePopulation = 100000.0;

void sort_by_deaths(std::vector<haq::DiseaseImpact> &impacts) {
    std::sort(impacts.begin(), impacts.end(), [](const auto &left, const auto &right) {
        if (left.attributed_deaths != right.attributed_deaths) {
            return left.attributed_deaths > right.attributed_deaths;
        }

        return left.disease < right.disease;
    });
}

} // anonymous namespace

namespace haq {

HealthRiskEngine::HealthRiskEngine(const ReferenceData &data) : data_{data} {}

double HealthRiskEngine::relative_risk(const core::DiseaseInfo &disease, double pm25) noexcept {
    auto exposure = excess_exposure(pm25);
    if (exposure <= 0.0) {
        return 1.0;
    }

    auto response = 1.0 - std::exp(-disease.gamma * std::pow(exposure, disease.delta));
    return 1.0 + disease.alpha * response;
}

double HealthRiskEngine::attributable_fraction(const core::DiseaseInfo &disease,
                                               double pm25) noexcept {
    auto rr = relative_risk(disease, pm25);
    return (rr - 1.0) / rr;
}

double HealthRiskEngine::age_multiplier(core::AgeGroup group) noexcept {
    switch (group) {
    case AgeGroup::children:
        return 1.3;
    case AgeGroup::adults:
        return 1.0;
    case AgeGroup::elderly:
        return 1.5;
    }

    return 1.0;
}

std::string HealthRiskEngine::age_label(core::AgeGroup group) {
    switch (group) {
    case AgeGroup::children:
        return "Children (0-14)";
    case AgeGroup::adults:
        return "Adults (15-64)";
    case AgeGroup::elderly:
        return "Elderly (65+)";
    }

    return "All ages";
}

std::optional<core::AgeGroup> HealthRiskEngine::age_group_of_band(std::string_view band) {
    auto text = core::trim(std::string{band});
    if (text.empty()) {
        return std::nullopt;
    }

    if (text.front() == '<') {
        return AgeGroup::children;
    }

    auto start = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), start);
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }

    if (start < 15) {
        return AgeGroup::children;
    }

    if (start < 65) {
        return AgeGroup::adults;
    }

    return AgeGroup::elderly;
}

AqiCategory HealthRiskEngine::aqi_category(double pm25) {
    if (pm25 < 12.0) {
        return AqiCategory{.level = "Good", .color = "#4CAF50"};
    }
    if (pm25 < 35.5) {
        return AqiCategory{.level = "Moderate", .color = "#FFC107"};
    }
    if (pm25 < 55.5) {
        return AqiCategory{.level = "Unhealthy for Sensitive Groups", .color = "#FF9800"};
    }
    if (pm25 < 150.5) {
        return AqiCategory{.level = "Unhealthy", .color = "#F44336"};
    }
    if (pm25 < 250.5) {
        return AqiCategory{.level = "Very Unhealthy", .color = "#9C27B0"};
    }

    return AqiCategory{.level = "Hazardous", .color = "#7B1FA2"};
}

HealthResult HealthRiskEngine::filter_disease(HealthResult result, std::string_view disease) {
    auto matched = std::vector<DiseaseImpact>{};
    for (const auto &impact : result.per_disease) {
        if (core::case_insensitive::contains(impact.disease, disease)) {
            matched.emplace_back(impact);
        }
    }

    if (matched.empty()) {
        return result;
    }

    auto previous_total = result.total_deaths;
    result.total_deaths = 0.0;
    result.ci_low = 0.0;
    result.ci_high = 0.0;
    for (const auto &impact : matched) {
        result.total_deaths += impact.attributed_deaths;
        result.ci_low += impact.ci_low;
        result.ci_high += impact.ci_high;
    }

    if (previous_total > 0.0) {
        result.rate_per_100k *= result.total_deaths / previous_total;
    }

    result.per_disease = std::move(matched);
    result.filter_applied = fmt::format("Disease: {}", disease);
    return result;
}

HealthResult HealthRiskEngine::attributable_deaths(std::string_view country, int year,
                                                   double pm25,
                                                   std::optional<core::AgeGroup> age_group) const {
    auto result = HealthResult{};
    result.country = data_.canonical_country(country);
    result.year = year;
    result.pm25 = clamp_to_tmrel(pm25);
    result.excess_exposure = excess_exposure(result.pm25);
    result.aqi_category = aqi_category(result.pm25);
    result.age_group = age_group;

    auto detail = data_.age_detail(result.country, year);
    if (detail.has_value()) {
        stratified_path(result, detail.value(), age_group);
    } else {
        aggregated_path(result, age_group);
    }

    sort_by_deaths(result.per_disease);
    return result;
}

void HealthRiskEngine::aggregated_path(HealthResult &result,
                                       std::optional<core::AgeGroup> age_group) const {
    auto baseline = data_.baseline_deaths(result.country, result.year);
    if (!baseline.has_value()) {
        result.data_note = "No health baseline data available";
        assign_rate(result, 0.0);
        return;
    }

    auto multiplier = age_group.has_value() ? age_multiplier(age_group.value()) : 1.0;
    auto baseline_total = 0.0;
    result.baseline_year = baseline->year;
    for (const auto &[name, deaths] : baseline->deaths) {
        const auto &info = data_.disease(name);
        auto impact = DiseaseImpact{};
        impact.disease = info.name;
        impact.category = info.category;
        impact.baseline_deaths = deaths * multiplier;
        impact.relative_risk = relative_risk(info, result.pm25);
        impact.attributable_fraction = attributable_fraction(info, result.pm25);
        impact.attributed_deaths = impact.baseline_deaths * impact.attributable_fraction;
        impact.ci_low = impact.attributed_deaths * LowerBoundFactor;
        impact.ci_high = impact.attributed_deaths * UpperBoundFactor;

        result.total_deaths += impact.attributed_deaths;
        baseline_total += deaths;
        result.per_disease.emplace_back(std::move(impact));
    }

    result.ci_low = result.total_deaths * LowerBoundFactor;
    result.ci_high = result.total_deaths * UpperBoundFactor;
    result.data_note =
        fmt::format("Aggregated baseline, no age stratification (baseline year: {})",
                    baseline->year);
    assign_rate(result, baseline_total);
}

void HealthRiskEngine::stratified_path(HealthResult &result, const AgeDetailLookup &detail,
                                       std::optional<core::AgeGroup> age_group) const {
    auto diseases = std::map<std::string, DiseaseImpact>{};
    auto groups = std::map<AgeGroup, AgeGroupImpact>{};
    auto baseline_total = 0.0;

    for (const auto &record : detail.records) {
        auto group = age_group_of_band(record.age_band);
        if (!group.has_value() || (age_group.has_value() && group != age_group)) {
            continue;
        }

        const auto &info = data_.disease(record.disease);
        auto multiplier = age_group.has_value() ? age_multiplier(group.value()) : 1.0;
        auto fraction = attributable_fraction(info, result.pm25);

        auto &impact = diseases[info.name];
        if (impact.disease.empty()) {
            impact.disease = info.name;
            impact.category = info.category;
            impact.relative_risk = relative_risk(info, result.pm25);
            impact.attributable_fraction = fraction;
        }

        impact.baseline_deaths += record.deaths * multiplier;
        impact.attributed_deaths += record.deaths * multiplier * fraction;
        impact.ci_low += record.lower * multiplier * fraction;
        impact.ci_high += record.upper * multiplier * fraction;

        auto &band = groups[group.value()];
        if (band.label.empty()) {
            band.group = group.value();
            band.label = age_label(group.value());
            band.vulnerability_multiplier = multiplier;
        }

        band.attributed_deaths += record.deaths * multiplier * fraction;
        band.ci_low += record.lower * multiplier * fraction;
        band.ci_high += record.upper * multiplier * fraction;
        baseline_total += record.deaths;
    }

    for (auto &[name, impact] : diseases) {
        result.total_deaths += impact.attributed_deaths;
        result.ci_low += impact.ci_low;
        result.ci_high += impact.ci_high;
        result.per_disease.emplace_back(std::move(impact));
    }

    for (auto &[group, band] : groups) {
        band.percentage =
            result.total_deaths > 0.0 ? band.attributed_deaths / result.total_deaths * 100.0 : 0.0;
        result.age_breakdown.emplace_back(std::move(band));
    }

    std::sort(result.age_breakdown.begin(), result.age_breakdown.end(),
              [](const auto &left, const auto &right) {
                  return left.attributed_deaths > right.attributed_deaths;
              });

    result.baseline_year = detail.year;
    result.data_note = fmt::format("Age-stratified (baseline year: {})", detail.year);
    assign_rate(result, baseline_total);
}

void HealthRiskEngine::assign_rate(HealthResult &result, double baseline_total) const {
    auto population = data_.population(result.country);
    if (population.has_value() && population.value() > 0.0) {
        result.population = population.value();
        result.population_is_proxy = false;
    } else {
        result.population = baseline_total;
        result.population_is_proxy = true;
    }

    result.rate_per_100k =
        result.population > 0.0 ? result.total_deaths / result.population * RatePopulation : 0.0;
}

std::vector<DiseaseImpact> HealthRiskEngine::top_diseases(std::string_view country, int year,
                                                          double pm25, std::size_t count) const {
    auto result = attributable_deaths(country, year, pm25).per_disease;
    if (result.size() > count) {
        result.resize(count);
    }

    return result;
}

HealthComparison HealthRiskEngine::compare_health(std::string_view first, double first_pm25,
                                                  std::string_view second, double second_pm25,
                                                  int year) const {
    return HealthComparison{.first = attributable_deaths(first, year, first_pm25),
                            .second = attributable_deaths(second, year, second_pm25)};
}

} // namespace haq
