#include "risk_scoring.h"
#include "exposure.h"

#include <algorithm>

namespace {

constexpr double PM25Weight = 0.60;
constexpr double TrendWeight = 0.25;
constexpr double UncertaintyWeight = 0.15;

} // anonymous namespace

namespace haq {

double normalize(double value, double lower, double upper) noexcept {
    if (upper <= lower) {
        return 0.0;
    }

    return std::clamp((value - lower) / (upper - lower), 0.0, 1.0);
}

double risk_score(double pm25, double yoy_pct, double ci_half_width) noexcept {
    return PM25Weight * normalize(clamp_to_tmrel(pm25), 5.0, 100.0) +
           TrendWeight * normalize(yoy_pct, -20.0, 20.0) +
           UncertaintyWeight * normalize(ci_half_width, 0.0, 30.0);
}

std::string risk_tier(double pm25) {
    if (pm25 < 12.0) {
        return "Low";
    }
    if (pm25 < 35.5) {
        return "Moderate";
    }
    if (pm25 < 55.5) {
        return "High";
    }

    return "Very High";
}

RiskScore score_risk(double pm25, double yoy_pct, double ci_half_width) {
    return RiskScore{.score = risk_score(pm25, yoy_pct, ci_half_width),
                     .tier = risk_tier(clamp_to_tmrel(pm25))};
}

} // namespace haq
