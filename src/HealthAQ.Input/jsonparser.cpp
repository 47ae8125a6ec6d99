#include "jsonparser.h"

namespace haq::input {

void to_json(json &j, const CoefficientInfo &p) {
    j = json{
        {"value", p.value}, {"stdError", p.std_error}, {"tValue", p.tvalue}, {"pValue", p.pvalue}};
}

void from_json(const json &j, CoefficientInfo &p) {
    j.at("value").get_to(p.value);
    p.std_error = j.value("stdError", 0.0);
    p.tvalue = j.value("tValue", 0.0);
    p.pvalue = j.value("pValue", 0.0);
}

void to_json(json &j, const ForecastModelInfo &p) {
    j = json{{"name", p.name},
             {"formula", p.formula},
             {"intercept", p.intercept},
             {"coefficients", p.coefficients},
             {"rSquared", p.rsquared}};
}

void from_json(const json &j, ForecastModelInfo &p) {
    j.at("name").get_to(p.name);
    j.at("formula").get_to(p.formula);
    j.at("intercept").get_to(p.intercept);
    j.at("coefficients").get_to(p.coefficients);
    p.rsquared = j.value("rSquared", 0.0);
}

void to_json(json &j, const AnalysisInfo &p) {
    j = json{{"window", p.window},
             {"sensitivity_percent", p.sensitivity_percent},
             {"default_scenario_percent", p.default_scenario_percent},
             {"who_guideline", p.who_guideline}};
}

void from_json(const json &j, AnalysisInfo &p) {
    if (j.contains("window")) {
        j.at("window").get_to(p.window);
    }

    p.sensitivity_percent = j.value("sensitivity_percent", p.sensitivity_percent);
    p.default_scenario_percent = j.value("default_scenario_percent", p.default_scenario_percent);
    p.who_guideline = j.value("who_guideline", p.who_guideline);
}

} // namespace haq::input
