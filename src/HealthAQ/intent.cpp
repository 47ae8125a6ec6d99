#include "intent.h"

namespace haq {

std::string to_string(Intent intent) {
    switch (intent) {
    case Intent::scenario_pm25_change:
        return "SCENARIO_PM25_CHANGE";
    case Intent::sensitivity_pm25_deaths:
        return "SENSITIVITY_PM25_DEATHS";
    case Intent::lowest_health_burden:
        return "LOWEST_HEALTH_BURDEN";
    case Intent::fastest_improvement_pm25:
        return "FASTEST_IMPROVEMENT_PM25";
    case Intent::stability_pm25:
        return "STABILITY_PM25";
    case Intent::rank_pm25:
        return "RANK_PM25";
    case Intent::deaths_change_yoy:
        return "DEATHS_CHANGE_YOY";
    case Intent::risk_ranking:
        return "RISK_RANKING";
    case Intent::highest_risk_country:
        return "HIGHEST_RISK_COUNTRY";
    case Intent::health_dalys:
        return "HEALTH_DALYS";
    case Intent::explainability:
        return "EXPLAINABILITY";
    case Intent::risk_level:
        return "RISK_LEVEL";
    case Intent::trend_pm25:
        return "TREND_PM25";
    case Intent::pm25_change:
        return "PM25_CHANGE";
    case Intent::compare_health:
        return "COMPARE_HEALTH";
    case Intent::health_rate:
        return "HEALTH_RATE";
    case Intent::health_deaths:
        return "HEALTH_DEATHS";
    case Intent::top_diseases:
        return "TOP_DISEASES";
    case Intent::best_month:
        return "BEST_MONTH";
    case Intent::worst_month:
        return "WORST_MONTH";
    case Intent::list_countries:
        return "LIST_COUNTRIES";
    case Intent::pm25_forecast_monthly:
        return "PM25_FORECAST_MONTHLY";
    case Intent::pm25_forecast:
        return "PM25_FORECAST";
    case Intent::unrecognized:
        return "UNRECOGNIZED";
    }

    return "UNRECOGNIZED";
}

} // namespace haq
