#pragma once

#include <string>

namespace haq {

/// @brief Composite risk score of a country and year
struct RiskScore {
    /// @brief Weighted score in [0, 1]
    double score{};

    /// @brief The concentration tier: Low, Moderate, High or Very High
    std::string tier;
};

/// @brief Linear clamp and rescale of a value to [0, 1]
/// @param value The value
/// @param lower The value mapped to 0
/// @param upper The value mapped to 1
/// @return The normalised value
double normalize(double value, double lower, double upper) noexcept;

/// @brief Computes the composite risk score
///
/// `0.60 n(pm25, 5, 100) + 0.25 n(yoy_pct, -20, 20) + 0.15 n(ci_half_width, 0, 30)`
/// @param pm25 The concentration, µg/m³, clamped to the TMREL first
/// @param yoy_pct The year-over-year change, percent
/// @param ci_half_width The PM2.5 interval half-width, µg/m³
/// @return The score in [0, 1]
double risk_score(double pm25, double yoy_pct, double ci_half_width) noexcept;

/// @brief Classifies a concentration into Low, Moderate, High or Very High
/// (`< 12`, `< 35.5`, `< 55.5`, above), each boundary belongs to the higher tier
std::string risk_tier(double pm25);

/// @brief Computes the composite score and the concentration tier
RiskScore score_risk(double pm25, double yoy_pct, double ci_half_width);

} // namespace haq
