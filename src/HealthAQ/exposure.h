#pragma once

#include <algorithm>

namespace haq {

/// @brief Theoretical Minimum Risk Exposure Level (TMREL), µg/m³
///
/// The process-wide PM2.5 floor: every concentration produced by the forecaster,
/// or consumed by the health engine and risk scoring, is clamped to this value.
inline constexpr double TMREL = 5.0;

/// @brief Clamps a PM2.5 concentration to the TMREL floor
/// @param pm25 The concentration, µg/m³
/// @return The clamped concentration
inline double clamp_to_tmrel(double pm25) noexcept { return std::max(pm25, TMREL); }

/// @brief Gets the PM2.5 exposure above the TMREL
/// @param pm25 The concentration, µg/m³
/// @return The excess exposure, never negative
inline double excess_exposure(double pm25) noexcept { return std::max(0.0, pm25 - TMREL); }

} // namespace haq
