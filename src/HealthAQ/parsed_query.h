#pragma once

#include "HealthAQ.Core/forward_type.h"
#include "HealthAQ.Core/interval.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haq {

/// @brief Longest message the pipeline analyses, in bytes
inline constexpr std::size_t MaxMessageLength = 2000;

/// @brief Typed entities extracted from one free text message.
///
/// All fields are optional, absence is meaningful: the dispatch rules branch on the
/// presence of the fields, and the handlers decide the defaults.
struct ParsedQuery {
    /// @brief The first country mentioned
    std::optional<std::string> country;

    /// @brief All countries mentioned, in text order
    std::vector<std::string> countries;

    /// @brief The canonical region name
    std::optional<std::string> region;

    /// @brief The latest year mentioned
    std::optional<int> year;

    /// @brief Earliest and latest year, when two or more distinct years are mentioned
    std::optional<core::YearInterval> year_range;

    /// @brief Percentage magnitude, always positive
    std::optional<double> percent;

    /// @brief Direction of change: +1 increase, -1 decrease
    std::optional<int> percent_sign;

    /// @brief Month number, 1 - 12
    std::optional<int> month;

    std::optional<core::AgeGroup> age_group;

    /// @brief The canonical disease name
    std::optional<std::string> disease;

    /// @brief The `top N` ranking size
    std::optional<int> top_n;

    std::string raw_message;
};

/// @brief Converts an age group to its name, e.g. elderly
std::string to_string(core::AgeGroup group);

} // namespace haq
