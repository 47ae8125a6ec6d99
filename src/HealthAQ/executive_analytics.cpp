#include "executive_analytics.h"
#include "errors.h"
#include "exposure.h"

#include "HealthAQ.Core/string_util.h"
#include "HealthAQ.Core/thread_util.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>

namespace {

constexpr double TrendThresholdPercent = 2.0;
constexpr double StableCVPercent = 5.0;
constexpr int DeathsLookbackYears = 5;
constexpr std::size_t ScenarioTopDiseases = 3;
constexpr std::size_t ExplainTopDiseases = 2;
constexpr std::size_t TopSensitive = 3;

const std::vector<std::pair<std::string, std::string>> ForecastDrivers{
    {"lag_1y", "Previous year PM2.5 level"},
    {"yoy_change", "Year-over-year change trajectory"},
    {"rolling_mean_3y", "3-year moving average trend"}};

/// @brief Computes an optional metric for every country of a scope in parallel
template <typename Entry, typename Metric>
std::vector<Entry> collect(const haq::AnalysisScope &scope, Metric metric) {
    auto slots = std::vector<std::optional<Entry>>(scope.countries.size());
    haq::core::parallel_for(scope.countries.size(), [&scope, &slots, &metric](std::size_t index) {
        slots[index] = metric(scope.countries[index]);
    });

    auto result = std::vector<Entry>{};
    result.reserve(slots.size());
    for (auto &slot : slots) {
        if (slot.has_value()) {
            result.emplace_back(std::move(slot.value()));
        }
    }

    return result;
}

/// @brief Orders entries by a metric key, ties broken by country name
template <typename Entry, typename Key>
void order_entries(std::vector<Entry> &entries, Key key, bool ascending) {
    std::stable_sort(entries.begin(), entries.end(),
                     [&key, ascending](const Entry &left, const Entry &right) {
                         auto left_key = key(left);
                         auto right_key = key(right);
                         if (left_key != right_key) {
                             return ascending ? left_key < right_key : left_key > right_key;
                         }

                         return left.country < right.country;
                     });
}

double mean_of(const std::vector<double> &values) {
    if (values.empty()) {
        return 0.0;
    }

    return std::accumulate(values.cbegin(), values.cend(), 0.0) /
           static_cast<double>(values.size());
}

double population_std(const std::vector<double> &values, double mean) {
    if (values.empty()) {
        return 0.0;
    }

    auto sum = 0.0;
    for (auto value : values) {
        sum += (value - mean) * (value - mean);
    }

    return std::sqrt(sum / static_cast<double>(values.size()));
}

std::string trend_arrow(const std::string &direction) {
    if (direction == "Increasing") {
        return "↑";
    }

    if (direction == "Decreasing") {
        return "↓";
    }

    return "→";
}

std::string health_impact_text(const std::string &direction, double magnitude) {
    if (direction == "Decreasing") {
        if (magnitude > 10.0) {
            return "Significant pollution decline expected. Health burden projected to decrease "
                   "noticeably, with fewer pollution-attributable deaths over the window.";
        }

        return "Gradual pollution decline expected. Modest improvement in health burden "
               "anticipated over the window.";
    }

    if (direction == "Increasing") {
        if (magnitude > 10.0) {
            return "Substantial pollution increase projected. Health burden expected to rise "
                   "significantly, with growing attributable cardiovascular and respiratory "
                   "mortality.";
        }

        return "Slight pollution increase projected. Health burden may grow marginally.";
    }

    return "Pollution levels projected to remain roughly stable. Health burden expected to hold "
           "near current levels.";
}

} // anonymous namespace

namespace haq {

ExecutiveAnalytics::ExecutiveAnalytics(const PM25Forecaster &forecaster,
                                       const HealthRiskEngine &engine, AnalyticsOptions options)
    : forecaster_{forecaster}, engine_{engine}, options_{std::move(options)} {}

ScenarioResult ExecutiveAnalytics::scenario(std::string_view country, int year, double percent,
                                            int sign,
                                            std::optional<core::AgeGroup> age_group) const {
    auto baseline = forecaster_.forecast(country, year);
    auto percent_change = std::abs(percent) * (sign < 0 ? -1.0 : 1.0);
    auto scenario_pm25 = clamp_to_tmrel(baseline.pm25 * (1.0 + percent_change / 100.0));

    auto base = engine_.attributable_deaths(baseline.country, year, baseline.pm25, age_group);
    auto changed = engine_.attributable_deaths(baseline.country, year, scenario_pm25, age_group);

    auto result = ScenarioResult{};
    result.country = baseline.country;
    result.year = year;
    result.percent_change = percent_change;
    result.is_increase = percent_change > 0.0;
    result.baseline_pm25 = baseline.pm25;
    result.scenario_pm25 = scenario_pm25;
    result.baseline_deaths = base.total_deaths;
    result.scenario_deaths = changed.total_deaths;
    result.prevented_deaths = base.total_deaths - changed.total_deaths;
    result.baseline_rate = base.rate_per_100k;
    result.scenario_rate = changed.rate_per_100k;
    result.age_group = age_group;
    result.confidence = baseline.confidence;

    auto count = std::min(ScenarioTopDiseases, changed.per_disease.size());
    for (std::size_t index = 0; index < count; index++) {
        result.top_diseases.emplace_back(changed.per_disease[index].disease);
    }

    return result;
}

ScenarioResult ExecutiveAnalytics::scenario_to_target(std::string_view country, int year,
                                                      double target_pm25,
                                                      std::optional<core::AgeGroup> age_group)
    const {
    auto baseline = forecaster_.forecast(country, year);
    auto target = clamp_to_tmrel(target_pm25);
    auto percent = 0.0;
    if (baseline.pm25 > target) {
        percent = (baseline.pm25 - target) / baseline.pm25 * 100.0;
    }

    auto result = scenario(baseline.country, year, percent, -1, age_group);
    result.target_pm25 = target;
    return result;
}

TrendResult ExecutiveAnalytics::trend(std::string_view country, core::YearInterval window) const {
    if (window.length() < 1) {
        throw YearOutOfRangeError(
            fmt::format("Trend analysis needs at least two years, got {}", window.to_string()));
    }

    auto result = TrendResult{};
    result.series = forecaster_.range(country, window);
    result.country = result.series.front().country;
    result.window = window;

    auto values = std::vector<double>{};
    values.reserve(result.series.size());
    for (const auto &point : result.series) {
        values.push_back(point.pm25);
    }

    result.start_pm25 = values.front();
    result.end_pm25 = values.back();
    result.pct_change = result.start_pm25 > 0.0
                            ? (result.end_pm25 - result.start_pm25) / result.start_pm25 * 100.0
                            : 0.0;

    if (result.pct_change > TrendThresholdPercent) {
        result.direction = "Increasing";
    } else if (result.pct_change < -TrendThresholdPercent) {
        result.direction = "Decreasing";
    } else {
        result.direction = "Stable";
    }

    result.arrow = trend_arrow(result.direction);
    result.mean_pm25 = mean_of(values);
    result.std_pm25 = population_std(values, result.mean_pm25);
    result.cv = result.mean_pm25 > 0.0 ? result.std_pm25 / result.mean_pm25 * 100.0 : 0.0;
    result.stability = result.cv < StableCVPercent ? "Stable" : "Volatile";
    result.health_impact = health_impact_text(result.direction, std::abs(result.pct_change));
    return result;
}

RiskProfile ExecutiveAnalytics::risk_profile(std::string_view country, int year) const {
    auto point = forecaster_.forecast(country, year);

    auto result = RiskProfile{};
    result.country = point.country;
    result.year = year;
    result.pm25 = point.pm25;
    result.is_predicted = point.is_predicted;
    result.confidence = point.confidence;
    result.arrow = "→";

    const auto &history = forecaster_.data().pm25_history(point.country);
    if (year - 1 >= history.begin()->first) {
        auto change = forecaster_.yoy_change(point.country, year);
        result.yoy_pct = change.pct_change;
        result.arrow = change.arrow;
    }

    result.interval = pm25_interval(point.pm25, point.confidence.score);
    result.risk = score_risk(point.pm25, result.yoy_pct, result.interval.half_width);
    return result;
}

Ranking<PM25RankEntry> ExecutiveAnalytics::rank_pm25(const AnalysisScope &scope, int year,
                                                     bool ascending,
                                                     std::optional<int> top_n) const {
    auto entries = collect<PM25RankEntry>(
        scope, [this, year](const std::string &country) -> std::optional<PM25RankEntry> {
            if (forecaster_.data().pm25_history(country).begin()->first > year) {
                return std::nullopt;
            }

            auto point = forecaster_.forecast(country, year);
            return PM25RankEntry{
                .country = point.country, .pm25 = point.pm25, .is_predicted = point.is_predicted};
        });

    order_entries(entries, [](const PM25RankEntry &entry) { return entry.pm25; }, ascending);
    if (top_n.has_value() && top_n.value() > 0 &&
        entries.size() > static_cast<std::size_t>(top_n.value())) {
        entries.resize(static_cast<std::size_t>(top_n.value()));
    }

    return Ranking<PM25RankEntry>{.scope = scope.label,
                                  .years = core::YearInterval{year, year},
                                  .metric = "pm25",
                                  .ascending = ascending,
                                  .entries = std::move(entries)};
}

Ranking<StabilityEntry>
ExecutiveAnalytics::rank_stability(const AnalysisScope &scope,
                                   std::optional<core::YearInterval> window, bool ascending) const {
    auto years = window.value_or(options_.window);
    auto entries = collect<StabilityEntry>(
        scope, [this, years](const std::string &country) -> std::optional<StabilityEntry> {
            if (years.length() < 1 ||
                forecaster_.data().pm25_history(country).begin()->first > years.lower()) {
                return std::nullopt;
            }

            auto analysis = trend(country, years);
            return StabilityEntry{.country = analysis.country,
                                  .mean_pm25 = analysis.mean_pm25,
                                  .std_pm25 = analysis.std_pm25,
                                  .cv = analysis.cv,
                                  .label = analysis.stability};
        });

    order_entries(entries, [](const StabilityEntry &entry) { return entry.cv; }, ascending);
    return Ranking<StabilityEntry>{.scope = scope.label,
                                   .years = years,
                                   .metric = "cv",
                                   .ascending = ascending,
                                   .entries = std::move(entries)};
}

Ranking<ImprovementEntry>
ExecutiveAnalytics::fastest_improving(const AnalysisScope &scope,
                                      std::optional<core::YearInterval> window,
                                      bool ascending) const {
    auto years = window.value_or(options_.window);
    auto entries = collect<ImprovementEntry>(
        scope, [this, years](const std::string &country) -> std::optional<ImprovementEntry> {
            if (forecaster_.data().pm25_history(country).begin()->first > years.lower()) {
                return std::nullopt;
            }

            auto change = forecaster_.change(country, years.lower(), years.upper());
            if (change.from_pm25 <= 0.0) {
                return std::nullopt;
            }

            return ImprovementEntry{.country = change.country,
                                    .start_pm25 = change.from_pm25,
                                    .end_pm25 = change.to_pm25,
                                    .pct_change = change.pct_change,
                                    .direction =
                                        change.pct_change < 0.0 ? "Improving" : "Worsening"};
        });

    order_entries(
        entries, [](const ImprovementEntry &entry) { return entry.pct_change; }, ascending);
    return Ranking<ImprovementEntry>{.scope = scope.label,
                                     .years = years,
                                     .metric = "pct_change",
                                     .ascending = ascending,
                                     .entries = std::move(entries)};
}

Ranking<BurdenEntry> ExecutiveAnalytics::lowest_health_burden(const AnalysisScope &scope,
                                                              int year, std::string_view metric,
                                                              bool ascending) const {
    auto use_dalys = core::case_insensitive::equals(metric, "dalys");
    auto metric_name = std::string{use_dalys ? "DALYS" : "DEATHS"};
    auto entries = collect<BurdenEntry>(
        scope,
        [this, year, use_dalys,
         &metric_name](const std::string &country) -> std::optional<BurdenEntry> {
            if (forecaster_.data().pm25_history(country).begin()->first > year) {
                return std::nullopt;
            }

            auto point = forecaster_.forecast(country, year);
            auto deaths = engine_.attributable_deaths(country, year, point.pm25).total_deaths;
            if (deaths <= 0.0) {
                return std::nullopt;
            }

            return BurdenEntry{.country = point.country,
                               .pm25 = point.pm25,
                               .deaths = deaths,
                               .value = use_dalys ? HealthRiskEngine::dalys(deaths) : deaths,
                               .metric = metric_name};
        });

    order_entries(entries, [](const BurdenEntry &entry) { return entry.value; }, ascending);
    return Ranking<BurdenEntry>{.scope = scope.label,
                                .years = core::YearInterval{year, year},
                                .metric = metric_name,
                                .ascending = ascending,
                                .entries = std::move(entries)};
}

SensitivityResult ExecutiveAnalytics::sensitivity(const AnalysisScope &scope, int year,
                                                  std::optional<double> delta_percent) const {
    auto delta = delta_percent.value_or(options_.sensitivity_percent);
    auto magnitude = std::abs(delta);
    auto entries = collect<SensitivityEntry>(
        scope,
        [this, year, delta,
         magnitude](const std::string &country) -> std::optional<SensitivityEntry> {
            if (forecaster_.data().pm25_history(country).begin()->first > year) {
                return std::nullopt;
            }

            auto outcome = scenario(country, year, magnitude, delta < 0.0 ? -1 : 1);
            if (outcome.baseline_deaths <= 0.0) {
                return std::nullopt;
            }

            return SensitivityEntry{
                .country = outcome.country,
                .baseline_pm25 = outcome.baseline_pm25,
                .baseline_deaths = outcome.baseline_deaths,
                .scenario_deaths = outcome.scenario_deaths,
                .prevented = outcome.prevented_deaths,
                .prevented_per_1pct = magnitude > 0.0 ? outcome.prevented_deaths / magnitude : 0.0};
        });

    order_entries(
        entries, [](const SensitivityEntry &entry) { return entry.prevented_per_1pct; }, false);

    auto result = SensitivityResult{};
    result.scope = scope.label;
    result.year = year;
    result.delta_percent = delta;
    if (!entries.empty()) {
        auto sum = 0.0;
        for (const auto &entry : entries) {
            sum += entry.prevented_per_1pct;
        }

        result.avg_prevented_per_1pct = sum / static_cast<double>(entries.size());
    }

    auto count = std::min(TopSensitive, entries.size());
    result.top_sensitive.assign(entries.begin(), entries.begin() + count);
    result.per_country = std::move(entries);
    return result;
}

double ExecutiveAnalytics::deaths_at(const std::string &country, int year) const {
    auto point = forecaster_.forecast(country, year);
    return engine_.attributable_deaths(country, year, point.pm25).total_deaths;
}

DeathsChange ExecutiveAnalytics::deaths_change_yoy(std::string_view country, int year) const {
    const auto &name = forecaster_.data().canonical_country(country);
    auto first_year = forecaster_.data().pm25_history(name).begin()->first;

    auto result = DeathsChange{};
    result.country = name;
    result.year = year;
    result.deaths_current = deaths_at(name, year);

    for (auto previous = year - 1; previous >= year - DeathsLookbackYears; previous--) {
        if (previous < first_year) {
            break;
        }

        auto deaths = deaths_at(name, previous);
        if (deaths > 0.0) {
            result.previous_year = previous;
            result.deaths_previous = deaths;
            break;
        }
    }

    if (!result.deaths_previous.has_value()) {
        result.note = "No previous-year health data available for comparison";
        return result;
    }

    auto delta = result.deaths_current - result.deaths_previous.value();
    result.delta = delta;
    result.pct_change = delta / result.deaths_previous.value() * 100.0;
    if (delta > 0.0) {
        result.direction = "Increased";
    } else if (delta < 0.0) {
        result.direction = "Decreased";
    } else {
        result.direction = "Unchanged";
    }

    return result;
}

Ranking<DeathsChange> ExecutiveAnalytics::rank_deaths_change(const AnalysisScope &scope,
                                                            int year) const {
    auto entries = collect<DeathsChange>(
        scope, [this, year](const std::string &country) -> std::optional<DeathsChange> {
            if (forecaster_.data().pm25_history(country).begin()->first > year) {
                return std::nullopt;
            }

            auto change = deaths_change_yoy(country, year);
            if (!change.pct_change.has_value()) {
                return std::nullopt;
            }

            return change;
        });

    order_entries(
        entries, [](const DeathsChange &entry) { return entry.pct_change.value(); }, false);
    return Ranking<DeathsChange>{.scope = scope.label,
                                 .years = core::YearInterval{year, year},
                                 .metric = "pct_change",
                                 .ascending = false,
                                 .entries = std::move(entries)};
}

Ranking<RiskProfile> ExecutiveAnalytics::rank_risk(const AnalysisScope &scope, int year,
                                                   bool ascending) const {
    auto entries = collect<RiskProfile>(
        scope, [this, year](const std::string &country) -> std::optional<RiskProfile> {
            if (forecaster_.data().pm25_history(country).begin()->first > year) {
                return std::nullopt;
            }

            return risk_profile(country, year);
        });

    order_entries(entries, [](const RiskProfile &entry) { return entry.risk.score; }, ascending);
    return Ranking<RiskProfile>{.scope = scope.label,
                                .years = core::YearInterval{year, year},
                                .metric = "risk_score",
                                .ascending = ascending,
                                .entries = std::move(entries)};
}

Explanation ExecutiveAnalytics::explain(std::optional<std::string> country, int year) const {
    const auto &model = forecaster_.data().model();

    auto result = Explanation{};
    result.year = year;
    result.model = model.name();
    for (const auto &[feature, label] : ForecastDrivers) {
        result.drivers.push_back(
            ForecastDriver{.feature = feature,
                           .label = label,
                           .coefficient = model.coefficient(feature)});
    }

    if (!country.has_value()) {
        return result;
    }

    auto point = forecaster_.forecast(country.value(), year);
    result.country = point.country;
    result.top_diseases =
        engine_.top_diseases(point.country, year, point.pm25, ExplainTopDiseases);
    result.forecast = std::move(point);
    return result;
}

CompareResult ExecutiveAnalytics::compare_health(std::string_view first, std::string_view second,
                                                 int year,
                                                 std::optional<core::AgeGroup> age_group) const {
    auto first_point = forecaster_.forecast(first, year);
    auto second_point = forecaster_.forecast(second, year);
    auto health = HealthComparison{
        .first =
            engine_.attributable_deaths(first_point.country, year, first_point.pm25, age_group),
        .second =
            engine_.attributable_deaths(second_point.country, year, second_point.pm25, age_group)};

    return CompareResult{.first_forecast = std::move(first_point),
                         .second_forecast = std::move(second_point),
                         .health = std::move(health)};
}

MonthRanking ExecutiveAnalytics::month_ranking(std::string_view country, int year,
                                               bool ascending) const {
    auto decomposition = forecaster_.monthly(country, year);

    auto result = MonthRanking{};
    result.country = decomposition.country;
    result.year = year;
    result.seasonal_region = decomposition.seasonal_region;
    result.ascending = ascending;
    for (std::size_t index = 0; index < decomposition.values.size(); index++) {
        auto month = static_cast<int>(index) + 1;
        result.months.push_back(MonthValue{.month = month,
                                           .name = PM25Forecaster::month_name(month),
                                           .pm25 = decomposition.values[index],
                                           .seasonal_factor = decomposition.factors[index]});
    }

    std::stable_sort(result.months.begin(), result.months.end(),
                     [ascending](const MonthValue &left, const MonthValue &right) {
                         return ascending ? left.pm25 < right.pm25 : left.pm25 > right.pm25;
                     });

    return result;
}

MonthRanking ExecutiveAnalytics::best_months(std::string_view country, int year) const {
    return month_ranking(country, year, true);
}

MonthRanking ExecutiveAnalytics::worst_months(std::string_view country, int year) const {
    return month_ranking(country, year, false);
}

} // namespace haq
