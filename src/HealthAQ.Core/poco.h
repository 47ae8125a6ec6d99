#pragma once

#include <string>
#include <utility>
#include <vector>

namespace haq::core {

/// @brief Observed annual mean PM2.5 concentration data item
struct PM25Item {
    /// @brief Country name
    std::string country{};

    /// @brief Observation year
    int year{};

    /// @brief Concentration in µg/m³
    double value{};
};

/// @brief All-ages baseline deaths for a disease data item
struct BaselineDeathItem {
    std::string country{};
    int year{};
    std::string disease{};
    double deaths{};
};

/// @brief Age band stratified baseline deaths data item
struct AgeDeathItem {
    std::string country{};
    int year{};
    std::string disease{};

    /// @brief Age band name, e.g. 65-69 years
    std::string age_band{};

    double deaths{};
    double lower{};
    double upper{};
};

/// @brief Linear model definition read from the data store
struct LinearModelData {
    /// @brief Model name
    std::string name{};

    /// @brief The model formula, informative only
    std::string formula{};

    /// @brief The model intercept
    double intercept{};

    /// @brief Coefficients by feature name, in the model's order
    std::vector<std::pair<std::string, double>> coefficients{};
};

} // namespace haq::core
