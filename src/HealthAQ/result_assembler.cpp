#include "result_assembler.h"

namespace haq::core {

void to_json(json &j, const YearInterval &p) {
    j = json{{"start", p.lower()}, {"end", p.upper()}};
}

void to_json(json &j, const AgeGroup &p) { j = haq::to_string(p); }

} // namespace haq::core

namespace haq {

void to_json(json &j, const ParsedQuery &p) {
    j = json{{"country", optional_json(p.country)},
             {"countries", p.countries},
             {"region", optional_json(p.region)},
             {"year", optional_json(p.year)},
             {"year_range", optional_json(p.year_range)},
             {"percent", optional_json(p.percent)},
             {"percent_sign", optional_json(p.percent_sign)},
             {"month", optional_json(p.month)},
             {"age_group", optional_json(p.age_group)},
             {"disease", optional_json(p.disease)},
             {"top_n", optional_json(p.top_n)},
             {"raw_message", p.raw_message}};
}

void to_json(json &j, const ConfidenceTier &p) {
    j = json{{"level", p.level}, {"score", p.score}, {"note", p.note}};
}

void to_json(json &j, const PM25Interval &p) {
    j = json{{"lower", p.lower}, {"upper", p.upper}, {"half_width", p.half_width}};
}

void to_json(json &j, const RiskScore &p) { j = json{{"score", p.score}, {"tier", p.tier}}; }

void to_json(json &j, const ForecastPoint &p) {
    j = json{{"country", p.country},
             {"year", p.year},
             {"pm25", p.pm25},
             {"is_predicted", p.is_predicted},
             {"confidence", p.confidence}};
}

void to_json(json &j, const PM25Change &p) {
    j = json{{"country", p.country},     {"from_year", p.from_year},
             {"to_year", p.to_year},     {"from_pm25", p.from_pm25},
             {"to_pm25", p.to_pm25},     {"abs_change", p.abs_change},
             {"pct_change", p.pct_change}, {"arrow", p.arrow}};
}

void to_json(json &j, const MonthlyForecast &p) {
    auto months = json::array();
    for (std::size_t index = 0; index < p.values.size(); index++) {
        auto month = static_cast<int>(index) + 1;
        months.push_back(json{{"month", month},
                              {"name", PM25Forecaster::month_name(month)},
                              {"pm25", p.values[index]},
                              {"seasonal_factor", p.factors[index]}});
    }

    j = json{{"country", p.country},
             {"year", p.year},
             {"annual_pm25", p.annual_pm25},
             {"seasonal_region", p.seasonal_region},
             {"months", months},
             {"confidence", p.confidence}};
}

void to_json(json &j, const MonthlyPoint &p) {
    j = json{{"country", p.country},
             {"year", p.year},
             {"month", p.month},
             {"month_name", p.month_name},
             {"pm25", p.pm25},
             {"annual_pm25", p.annual_pm25},
             {"seasonal_factor", p.seasonal_factor},
             {"seasonal_region", p.seasonal_region},
             {"confidence", p.confidence}};
}

void to_json(json &j, const AqiCategory &p) { j = json{{"level", p.level}, {"color", p.color}}; }

void to_json(json &j, const DiseaseImpact &p) {
    j = json{{"disease", p.disease},
             {"category", p.category},
             {"baseline_deaths", p.baseline_deaths},
             {"relative_risk", p.relative_risk},
             {"attributable_fraction", p.attributable_fraction},
             {"attributed_deaths", p.attributed_deaths},
             {"ci_low", p.ci_low},
             {"ci_high", p.ci_high}};
}

void to_json(json &j, const AgeGroupImpact &p) {
    j = json{{"group", p.group},
             {"label", p.label},
             {"attributed_deaths", p.attributed_deaths},
             {"ci_low", p.ci_low},
             {"ci_high", p.ci_high},
             {"percentage", p.percentage},
             {"vulnerability_multiplier", p.vulnerability_multiplier}};
}

void to_json(json &j, const HealthResult &p) {
    j = json{{"country", p.country},
             {"year", p.year},
             {"baseline_year", optional_json(p.baseline_year)},
             {"pm25", p.pm25},
             {"excess_exposure", p.excess_exposure},
             {"aqi_category", p.aqi_category},
             {"total_deaths", p.total_deaths},
             {"ci_low", p.ci_low},
             {"ci_high", p.ci_high},
             {"rate_per_100k", p.rate_per_100k},
             {"population", p.population},
             {"population_is_proxy", p.population_is_proxy},
             {"age_group", optional_json(p.age_group)},
             {"per_disease", p.per_disease},
             {"age_breakdown", p.age_breakdown},
             {"data_note", p.data_note},
             {"filter_applied", optional_json(p.filter_applied)}};
}

void to_json(json &j, const HealthComparison &p) {
    j = json{{"first", p.first}, {"second", p.second}};
}

void to_json(json &j, const ScenarioResult &p) {
    j = json{{"country", p.country},
             {"year", p.year},
             {"percent_change", p.percent_change},
             {"is_increase", p.is_increase},
             {"baseline_pm25", p.baseline_pm25},
             {"scenario_pm25", p.scenario_pm25},
             {"target_pm25", optional_json(p.target_pm25)},
             {"baseline_deaths", p.baseline_deaths},
             {"scenario_deaths", p.scenario_deaths},
             {"prevented_deaths", p.prevented_deaths},
             {"baseline_rate", p.baseline_rate},
             {"scenario_rate", p.scenario_rate},
             {"age_group", optional_json(p.age_group)},
             {"confidence", p.confidence},
             {"top_diseases", p.top_diseases}};
}

void to_json(json &j, const TrendResult &p) {
    j = json{{"country", p.country},
             {"window", p.window},
             {"series", p.series},
             {"start_pm25", p.start_pm25},
             {"end_pm25", p.end_pm25},
             {"pct_change", p.pct_change},
             {"direction", p.direction},
             {"arrow", p.arrow},
             {"mean_pm25", p.mean_pm25},
             {"std_pm25", p.std_pm25},
             {"cv", p.cv},
             {"stability", p.stability},
             {"health_impact", p.health_impact}};
}

void to_json(json &j, const RiskProfile &p) {
    j = json{{"country", p.country},
             {"year", p.year},
             {"pm25", p.pm25},
             {"is_predicted", p.is_predicted},
             {"yoy_pct", p.yoy_pct},
             {"arrow", p.arrow},
             {"interval", p.interval},
             {"confidence", p.confidence},
             {"risk", p.risk}};
}

void to_json(json &j, const PM25RankEntry &p) {
    j = json{{"country", p.country}, {"pm25", p.pm25}, {"is_predicted", p.is_predicted}};
}

void to_json(json &j, const StabilityEntry &p) {
    j = json{{"country", p.country},
             {"mean_pm25", p.mean_pm25},
             {"std_pm25", p.std_pm25},
             {"cv", p.cv},
             {"label", p.label}};
}

void to_json(json &j, const ImprovementEntry &p) {
    j = json{{"country", p.country},
             {"start_pm25", p.start_pm25},
             {"end_pm25", p.end_pm25},
             {"pct_change", p.pct_change},
             {"direction", p.direction}};
}

void to_json(json &j, const BurdenEntry &p) {
    j = json{{"country", p.country},
             {"pm25", p.pm25},
             {"deaths", p.deaths},
             {"value", p.value},
             {"metric", p.metric}};
}

void to_json(json &j, const SensitivityEntry &p) {
    j = json{{"country", p.country},
             {"baseline_pm25", p.baseline_pm25},
             {"baseline_deaths", p.baseline_deaths},
             {"scenario_deaths", p.scenario_deaths},
             {"prevented", p.prevented},
             {"prevented_per_1pct", p.prevented_per_1pct}};
}

void to_json(json &j, const SensitivityResult &p) {
    j = json{{"scope", p.scope},
             {"year", p.year},
             {"delta_percent", p.delta_percent},
             {"per_country", p.per_country},
             {"avg_prevented_per_1pct", p.avg_prevented_per_1pct},
             {"top_sensitive", p.top_sensitive}};
}

void to_json(json &j, const DeathsChange &p) {
    j = json{{"country", p.country},
             {"year", p.year},
             {"deaths_current", p.deaths_current},
             {"previous_year", optional_json(p.previous_year)},
             {"deaths_previous", optional_json(p.deaths_previous)},
             {"delta", optional_json(p.delta)},
             {"pct_change", optional_json(p.pct_change)},
             {"direction", p.direction},
             {"note", optional_json(p.note)}};
}

void to_json(json &j, const ForecastDriver &p) {
    j = json{{"feature", p.feature},
             {"label", p.label},
             {"coefficient", optional_json(p.coefficient)}};
}

void to_json(json &j, const Explanation &p) {
    j = json{{"country", optional_json(p.country)},
             {"year", p.year},
             {"model", p.model},
             {"forecast", optional_json(p.forecast)},
             {"drivers", p.drivers},
             {"top_diseases", p.top_diseases}};
}

void to_json(json &j, const MonthValue &p) {
    j = json{{"month", p.month},
             {"name", p.name},
             {"pm25", p.pm25},
             {"seasonal_factor", p.seasonal_factor}};
}

void to_json(json &j, const MonthRanking &p) {
    j = json{{"country", p.country},
             {"year", p.year},
             {"seasonal_region", p.seasonal_region},
             {"ascending", p.ascending},
             {"months", p.months}};
}

void to_json(json &j, const CompareResult &p) {
    j = json{{"first_forecast", p.first_forecast},
             {"second_forecast", p.second_forecast},
             {"health", p.health}};
}

void to_json(json &j, const ForecastHealth &p) {
    j = json{{"forecast", p.forecast}, {"health", p.health}};
}

void to_json(json &j, const ServiceStatus &p) {
    j = json{{"model_loaded", p.model_loaded},
             {"model_name", p.model_name},
             {"country_count", p.country_count},
             {"disease_count", p.disease_count},
             {"extended_detail", p.extended_detail},
             {"last_observed_years", p.last_observed_years},
             {"current_year", p.current_year}};
}

void to_json(json &j, const ChatError &p) {
    j = json{{"kind", to_string(p.kind)}, {"message", p.message}};
    if (!p.supported.empty()) {
        j["supported"] = p.supported;
    }
}

void to_json(json &j, const ChatResult &p) {
    j = json{{"intent", to_string(p.intent)},
             {"answer", optional_json(p.answer)},
             {"data", p.data},
             {"parsed", p.parsed},
             {"error", optional_json(p.error)}};
}

} // namespace haq
