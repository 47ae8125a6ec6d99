#pragma once

#include "analytics_result.h"
#include "errors.h"
#include "health_risk_engine.h"
#include "intent.h"
#include "parsed_query.h"
#include "pm25_forecaster.h"

#include "HealthAQ.Core/forward_type.h"
#include "HealthAQ.Core/interval.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace haq::core {
using json = nlohmann::json;

void to_json(json &j, const YearInterval &p);
void to_json(json &j, const AgeGroup &p);
} // namespace haq::core

namespace haq {
using json = nlohmann::json;

/// @brief Structured caller-visible error of a request
struct ChatError {
    ErrorKind kind{};
    std::string message;

    /// @brief The supported region names, only for unknown region errors
    std::vector<std::string> supported;
};

/// @brief The response to one message: `{intent, answer, data, parsed, error}`
struct ChatResult {
    Intent intent{Intent::unrecognized};

    /// @brief Formatted text answer, left empty by the core
    std::optional<std::string> answer;

    /// @brief The intent specific analytics payload, null on error
    json data;

    ParsedQuery parsed;
    std::optional<ChatError> error;
};

/// @brief Converts an optional value to JSON, null when empty
template <typename T> json optional_json(const std::optional<T> &value) {
    if (value.has_value()) {
        return json(value.value());
    }

    return nullptr;
}

void to_json(json &j, const ParsedQuery &p);
void to_json(json &j, const ConfidenceTier &p);
void to_json(json &j, const PM25Interval &p);
void to_json(json &j, const RiskScore &p);

void to_json(json &j, const ForecastPoint &p);
void to_json(json &j, const PM25Change &p);
void to_json(json &j, const MonthlyForecast &p);
void to_json(json &j, const MonthlyPoint &p);

void to_json(json &j, const AqiCategory &p);
void to_json(json &j, const DiseaseImpact &p);
void to_json(json &j, const AgeGroupImpact &p);
void to_json(json &j, const HealthResult &p);
void to_json(json &j, const HealthComparison &p);

void to_json(json &j, const ScenarioResult &p);
void to_json(json &j, const TrendResult &p);
void to_json(json &j, const RiskProfile &p);
void to_json(json &j, const PM25RankEntry &p);
void to_json(json &j, const StabilityEntry &p);
void to_json(json &j, const ImprovementEntry &p);
void to_json(json &j, const BurdenEntry &p);
void to_json(json &j, const SensitivityEntry &p);
void to_json(json &j, const SensitivityResult &p);
void to_json(json &j, const DeathsChange &p);
void to_json(json &j, const ForecastDriver &p);
void to_json(json &j, const Explanation &p);
void to_json(json &j, const MonthValue &p);
void to_json(json &j, const MonthRanking &p);
void to_json(json &j, const CompareResult &p);
void to_json(json &j, const ForecastHealth &p);
void to_json(json &j, const ServiceStatus &p);

void to_json(json &j, const ChatError &p);
void to_json(json &j, const ChatResult &p);

template <typename Entry> void to_json(json &j, const Ranking<Entry> &p) {
    j = json{{"scope", p.scope},
             {"years", p.years},
             {"metric", p.metric},
             {"ascending", p.ascending},
             {"count", p.entries.size()},
             {"entries", p.entries}};
}

} // namespace haq
