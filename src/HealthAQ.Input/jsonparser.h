#pragma once
#include "poco.h"

#include <nlohmann/json.hpp>

namespace haq::input {
/// @brief JSON parser namespace alias.
///
/// Configuration file and model artifact serialisation / de-serialisation mapping
/// specific to the `JSON for Modern C++` library adopted by the project.
///
/// @sa https://github.com/nlohmann/json#arbitrary-types-conversions
/// for details about the contents and code structure in this file.
using json = nlohmann::json;

// Forecasting model artifact
void to_json(json &j, const CoefficientInfo &p);
void from_json(const json &j, CoefficientInfo &p);

void to_json(json &j, const ForecastModelInfo &p);
void from_json(const json &j, ForecastModelInfo &p);

// Analytics defaults
void to_json(json &j, const AnalysisInfo &p);
void from_json(const json &j, AnalysisInfo &p);

} // namespace haq::input
