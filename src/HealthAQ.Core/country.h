#pragma once

#include <optional>
#include <string>

namespace haq::core {

/// @brief Country reference definition data structure
struct Country {
    /// @brief Canonical country name, e.g. Thailand
    std::string name{};

    /// @brief The alpha 3 characters unique identifier, e.g., THA
    std::string alpha3{};

    /// @brief Total population, when recorded
    std::optional<double> population{};
};

/// @brief Less-than operation for country data type, ordered by canonical name
/// @param lhs The left country to compare
/// @param rhs The right country to compare
/// @return true if the left country orders before the right country, otherwise false
inline bool operator<(const Country &lhs, const Country &rhs) { return lhs.name < rhs.name; }

} // namespace haq::core
