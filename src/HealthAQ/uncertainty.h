#pragma once

#include <string>

namespace haq {

/// @brief Forecast confidence tier, decays with the distance from the last observation
struct ConfidenceTier {
    /// @brief Tier label: High, Moderate, Low or Speculative
    std::string level{};

    /// @brief Confidence score in (0, 1]
    double score{};

    /// @brief Short description of the horizon
    std::string note{};

    auto operator<=>(const ConfidenceTier &) const = default;
};

/// @brief Symmetric PM2.5 uncertainty interval
struct PM25Interval {
    double lower{};
    double upper{};

    /// @brief The interval half-width, µg/m³
    double half_width{};
};

/// @brief Gets the forecast confidence tier for a horizon
///
/// | Years ahead | Tier        | Score |
/// |-------------|-------------|-------|
/// | <= 3        | High        | 0.90  |
/// | 4 - 7       | Moderate    | 0.70  |
/// | 8 - 12      | Low         | 0.50  |
/// | > 12        | Speculative | 0.30  |
///
/// @param years_ahead Distance from the last observed year; observed years are <= 0
/// @return The confidence tier
ConfidenceTier forecast_confidence(int years_ahead);

/// @brief Computes the PM2.5 interval `pm25 ± pm25 × (1 - score) × 0.5`
/// @param pm25 The central concentration
/// @param confidence_score The confidence score
/// @return The interval, lower bound clamped to the TMREL
PM25Interval pm25_interval(double pm25, double confidence_score);

} // namespace haq
