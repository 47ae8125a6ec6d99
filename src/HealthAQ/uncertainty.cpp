#include "uncertainty.h"
#include "exposure.h"

namespace haq {

ConfidenceTier forecast_confidence(int years_ahead) {
    if (years_ahead <= 3) {
        return ConfidenceTier{.level = "High",
                              .score = 0.90,
                              .note = "Near-term forecast based on recent data"};
    }
    if (years_ahead <= 7) {
        return ConfidenceTier{.level = "Moderate",
                              .score = 0.70,
                              .note = "Medium-term forecast, compounding uncertainty"};
    }
    if (years_ahead <= 12) {
        return ConfidenceTier{.level = "Low",
                              .score = 0.50,
                              .note = "Long-term projection, treat as indicative trend"};
    }

    return ConfidenceTier{.level = "Speculative",
                          .score = 0.30,
                          .note = "Very long-range, high uncertainty"};
}

PM25Interval pm25_interval(double pm25, double confidence_score) {
    auto half_width = pm25 * (1.0 - confidence_score) * 0.5;
    return PM25Interval{.lower = clamp_to_tmrel(pm25 - half_width),
                        .upper = pm25 + half_width,
                        .half_width = half_width};
}

} // namespace haq
