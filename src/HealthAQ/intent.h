#pragma once

#include <cstdint>
#include <string>

namespace haq {

/// @brief Enumerates the closed set of query intents
enum class Intent : uint8_t {
    scenario_pm25_change,
    sensitivity_pm25_deaths,
    lowest_health_burden,
    fastest_improvement_pm25,
    stability_pm25,
    rank_pm25,
    deaths_change_yoy,
    risk_ranking,
    highest_risk_country,
    health_dalys,
    explainability,
    risk_level,
    trend_pm25,
    pm25_change,
    compare_health,
    health_rate,
    health_deaths,
    top_diseases,
    best_month,
    worst_month,
    list_countries,
    pm25_forecast_monthly,
    pm25_forecast,

    /// @brief No dispatch rule matched the message
    unrecognized
};

/// @brief Converts an intent to its wire name, e.g. SCENARIO_PM25_CHANGE
/// @param intent The intent
/// @return The intent name
std::string to_string(Intent intent);

} // namespace haq
