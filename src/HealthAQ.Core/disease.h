#pragma once

#include <string>

namespace haq::core {

/// @brief Disease exposure-response definition
///
/// Parameters of the Integrated Exposure-Response (IER) curve used to compute
/// the relative risk of the disease at a given PM2.5 exposure:
/// `RR = 1 + alpha * (1 - exp(-gamma * exposure^delta))`
struct DiseaseInfo {
    /// @brief Canonical disease name
    std::string name{};

    /// @brief Disease category, e.g. Cardiovascular
    std::string category{};

    /// @brief IER curve asymptote
    double alpha{};

    /// @brief IER curve rate
    double gamma{};

    /// @brief IER curve shape exponent
    double delta{1.0};
};

/// @brief Determine whether a specified DiseaseInfo is less than another instance.
/// @param lhs The first instance to compare.
/// @param rhs The second instance to compare.
/// @return true if left instance is less than right instance; otherwise, false.
inline bool operator<(const DiseaseInfo &lhs, const DiseaseInfo &rhs) {
    return lhs.name < rhs.name;
}

} // namespace haq::core
