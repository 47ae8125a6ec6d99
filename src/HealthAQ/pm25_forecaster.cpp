#include "pm25_forecaster.h"
#include "errors.h"
#include "exposure.h"
#include "region_resolver.h"

#include <fmt/format.h>

#include <cmath>
#include <iterator>
#include <map>
#include <stdexcept>

namespace {

constexpr const char *NeutralRegion = "Default";

constexpr std::array<double, 12> SoutheastAsiaFactors{1.20, 1.25, 1.20, 1.10, 0.90, 0.80,
                                                      0.75, 0.80, 0.85, 0.95, 1.10, 1.15};

constexpr std::array<double, 12> SouthAsiaFactors{1.30, 1.25, 1.15, 1.10, 1.05, 0.90,
                                                  0.85, 0.85, 0.90, 1.10, 1.25, 1.30};

constexpr std::array<double, 12> EastAsiaFactors{1.25, 1.20, 1.10, 1.00, 0.95, 0.90,
                                                 0.90, 0.95, 1.00, 1.10, 1.20, 1.25};

constexpr std::array<double, 12> NeutralFactors{1.0, 1.0, 1.0, 1.0, 1.0, 1.0,
                                                1.0, 1.0, 1.0, 1.0, 1.0, 1.0};

constexpr const char *MonthNames[] = {"January", "February", "March",     "April",
                                      "May",     "June",     "July",      "August",
                                      "September", "October", "November", "December"};

/// @brief Mean of the history values in the closed year window, if any
std::optional<double> window_mean(const haq::WorkingHistory &history, int first, int last) {
    auto sum = 0.0;
    auto count = 0;
    for (auto it = history.lower_bound(first); it != history.end() && it->first <= last; ++it) {
        sum += it->second;
        count++;
    }

    if (count == 0) {
        return std::nullopt;
    }

    return sum / count;
}

std::string direction_arrow(double pct_change) {
    if (pct_change > 0.5) {
        return "↑";
    }

    if (pct_change < -0.5) {
        return "↓";
    }

    return "→";
}

} // anonymous namespace

namespace haq {

PM25Forecaster::PM25Forecaster(const ReferenceData &data) : data_{data} {}

std::optional<ForecastFeatures> PM25Forecaster::compute_features(const WorkingHistory &history,
                                                                 int year) {
    if (history.size() < 3) {
        return std::nullopt;
    }

    auto lag_1y_it = history.find(year - 1);
    if (lag_1y_it == history.end()) {
        return std::nullopt;
    }

    auto features = ForecastFeatures{};
    features.lag_1y = lag_1y_it->second;

    auto lag_3y_it = history.find(year - 3);
    features.lag_3y = lag_3y_it != history.end() ? lag_3y_it->second : features.lag_1y;

    auto lag_2y_it = history.find(year - 2);
    if (lag_2y_it != history.end()) {
        auto lag_2y = lag_2y_it->second;
        features.yoy_change = features.lag_1y - lag_2y;
        features.yoy_pct_change = std::abs(lag_2y) > 0.001 ? features.yoy_change / lag_2y : 0.0;
    }

    features.rolling_mean_3y = window_mean(history, year - 3, year - 1).value_or(features.lag_1y);
    features.rolling_mean_5y = window_mean(history, year - 5, year - 1).value_or(features.lag_1y);
    features.year = static_cast<double>(year);
    return features;
}

double PM25Forecaster::predict_step(const WorkingHistory &history, int year) const {
    auto features = compute_features(history, year);
    if (!features.has_value()) {
        // Persistence
        auto last = history.empty() ? EmptyHistoryValue : history.rbegin()->second;
        return clamp_to_tmrel(last);
    }

    return clamp_to_tmrel(data_.model().predict(features.value()));
}

WorkingHistory PM25Forecaster::predict_from(WorkingHistory history, int target_year) const {
    if (history.empty()) {
        throw std::invalid_argument("Can not forecast from an empty PM2.5 history.");
    }

    for (auto year = history.rbegin()->first + 1; year <= target_year; year++) {
        auto value = predict_step(history, year);
        history.emplace(year, value);
    }

    return history;
}

ForecastPoint PM25Forecaster::make_point(const std::string &country,
                                         const WorkingHistory &working, int last_observed,
                                         int year) const {
    // Exact year, else the nearest earlier year
    auto it = working.upper_bound(year);
    if (it == working.begin()) {
        throw YearOutOfRangeError(
            fmt::format("No PM2.5 data for {} in {}, the series starts in {}", country, year,
                        working.begin()->first));
    }

    --it;
    return ForecastPoint{.country = country,
                         .year = year,
                         .pm25 = clamp_to_tmrel(it->second),
                         .is_predicted = year > last_observed,
                         .confidence = forecast_confidence(year - last_observed)};
}

ForecastPoint PM25Forecaster::forecast(std::string_view country, int year) const {
    const auto &name = data_.canonical_country(country);
    const auto &series = data_.pm25_history(name);
    auto last_observed = series.rbegin()->first;
    if (year <= last_observed) {
        return make_point(name, series, last_observed, year);
    }

    auto working = predict_from(series, year);
    return make_point(name, working, last_observed, year);
}

std::vector<ForecastPoint> PM25Forecaster::path(std::string_view country, int target_year) const {
    const auto &name = data_.canonical_country(country);
    const auto &series = data_.pm25_history(name);
    auto last_observed = series.rbegin()->first;
    auto working = predict_from(series, target_year);

    auto result = std::vector<ForecastPoint>{};
    for (auto year = last_observed + 1; year <= target_year; year++) {
        result.emplace_back(make_point(name, working, last_observed, year));
    }

    return result;
}

std::vector<ForecastPoint> PM25Forecaster::range(std::string_view country,
                                                 core::YearInterval years) const {
    const auto &name = data_.canonical_country(country);
    const auto &series = data_.pm25_history(name);
    auto last_observed = series.rbegin()->first;
    auto working = predict_from(series, years.upper());

    auto result = std::vector<ForecastPoint>{};
    result.reserve(static_cast<std::size_t>(years.length()) + 1);
    for (auto year : core::enumerate_years(years)) {
        result.emplace_back(make_point(name, working, last_observed, year));
    }

    return result;
}

std::vector<ForecastPoint> PM25Forecaster::history(std::string_view country) const {
    const auto &name = data_.canonical_country(country);
    const auto &series = data_.pm25_history(name);
    auto result = std::vector<ForecastPoint>{};
    result.reserve(series.size());
    for (const auto &[year, value] : series) {
        result.push_back(ForecastPoint{.country = name,
                                       .year = year,
                                       .pm25 = clamp_to_tmrel(value),
                                       .is_predicted = false,
                                       .confidence = forecast_confidence(0)});
    }

    return result;
}

int PM25Forecaster::last_observed_year(std::string_view country) const {
    return data_.pm25_history(country).rbegin()->first;
}

PM25Change PM25Forecaster::change(std::string_view country, int from_year, int to_year) const {
    auto from = forecast(country, from_year);
    auto to = forecast(country, to_year);
    auto pct_change = from.pm25 > 0.0 ? (to.pm25 - from.pm25) / from.pm25 * 100.0 : 0.0;
    return PM25Change{.country = from.country,
                      .from_year = from_year,
                      .to_year = to_year,
                      .from_pm25 = from.pm25,
                      .to_pm25 = to.pm25,
                      .abs_change = to.pm25 - from.pm25,
                      .pct_change = pct_change,
                      .arrow = direction_arrow(pct_change)};
}

PM25Change PM25Forecaster::yoy_change(std::string_view country, int year) const {
    return change(country, year - 1, year);
}

MonthlyForecast PM25Forecaster::monthly(std::string_view country, int year) const {
    auto annual = forecast(country, year);
    auto region = RegionResolver::seasonal_region(annual.country);

    auto result = MonthlyForecast{};
    result.country = annual.country;
    result.year = year;
    result.annual_pm25 = annual.pm25;
    result.seasonal_region = region.value_or(NeutralRegion);
    result.factors = seasonal_factors(result.seasonal_region);
    for (std::size_t index = 0; index < result.values.size(); index++) {
        result.values[index] = clamp_to_tmrel(annual.pm25 * result.factors[index]);
    }

    result.confidence = annual.confidence;
    return result;
}

MonthlyPoint PM25Forecaster::monthly(std::string_view country, int year, int month) const {
    if (month < 1 || month > 12) {
        throw std::out_of_range(fmt::format("Invalid month number: {}", month));
    }

    auto decomposition = monthly(country, year);
    auto index = static_cast<std::size_t>(month - 1);
    return MonthlyPoint{.country = decomposition.country,
                        .year = year,
                        .month = month,
                        .month_name = month_name(month),
                        .pm25 = decomposition.values[index],
                        .annual_pm25 = decomposition.annual_pm25,
                        .seasonal_factor = decomposition.factors[index],
                        .seasonal_region = decomposition.seasonal_region,
                        .confidence = decomposition.confidence};
}

const std::array<double, 12> &PM25Forecaster::seasonal_factors(std::string_view region) {
    static const auto tables = std::map<std::string, std::array<double, 12>, std::less<>>{
        {"Southeast Asia", SoutheastAsiaFactors},
        {"South Asia", SouthAsiaFactors},
        {"East Asia", EastAsiaFactors}};

    auto it = tables.find(region);
    if (it == tables.end()) {
        return NeutralFactors;
    }

    return it->second;
}

std::string PM25Forecaster::month_name(int month) {
    if (month < 1 || month > 12) {
        throw std::out_of_range(fmt::format("Invalid month number: {}", month));
    }

    return MonthNames[month - 1];
}

} // namespace haq
