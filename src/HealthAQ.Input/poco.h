#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace haq::input {

/// @brief Fitted coefficient of the forecasting model artifact
struct CoefficientInfo {
    double value{};
    double pvalue{};
    double tvalue{};
    double std_error{};
};

/// @brief PM2.5 forecasting linear model artifact
struct ForecastModelInfo {
    std::string name;
    std::string formula;
    double intercept{};

    /// @brief Coefficients by feature name
    std::map<std::string, CoefficientInfo> coefficients;

    double rsquared{};
};

/// @brief Analytics section of the configuration file
struct AnalysisInfo {
    /// @brief Default window of the stability and improvement rankings, [start, end]
    std::vector<int> window{2020, 2030};

    double sensitivity_percent{-5.0};
    double default_scenario_percent{15.0};
    double who_guideline{5.0};
};

} // namespace haq::input
