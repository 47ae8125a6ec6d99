#pragma once

#include "exception.h"
#include "forward_type.h"

#include <algorithm>
#include <fmt/format.h>
#include <string>
#include <vector>

namespace haq::core {

/// @brief Closed numeric interval representation data type
/// @tparam TYPE The numerical type
template <Numerical TYPE> class Interval {
  public:
    /// @brief Initialises a new instance of the Interval class
    Interval() = default;

    /// @brief Initialises a new instance of the Interval class
    /// @param lower_value Lower bound value
    /// @param upper_value Upper bound value
    /// @throws HaqException for lower bound greater than the upper bound
    explicit Interval(TYPE lower_value, TYPE upper_value)
        : lower_{lower_value}, upper_{upper_value} {
        if (lower_ > upper_) {
            throw HaqException(fmt::format("Invalid interval: {}-{}", lower_, upper_));
        }
    }

    /// @brief Gets the interval lower bound
    /// @return The lower bound value
    TYPE lower() const noexcept { return lower_; }

    /// @brief Gets the interval upper bound
    /// @return The upper bound value
    TYPE upper() const noexcept { return upper_; }

    /// @brief Gets the interval length
    /// @return Length of the interval
    TYPE length() const noexcept { return upper_ - lower_; }

    /// @brief Determines whether a value is in the Interval.
    /// @param value The value to check
    /// @return true if the value is in the interval; otherwise, false.
    bool contains(TYPE value) const noexcept { return lower_ <= value && value <= upper_; }

    /// @brief Clamp a given value to the interval boundaries
    /// @param value The value to clamp
    /// @return The clamped value
    TYPE clamp(TYPE value) const noexcept { return std::clamp(value, lower_, upper_); }

    /// @brief Convert this instance to a string representation
    /// @return The equivalent string representation
    std::string to_string() const { return fmt::format("{}-{}", lower_, upper_); }

    /// @brief Compare two Interval instances
    /// @param rhs The Interval to compare to this instance.
    /// @return The comparison result
    auto operator<=>(const Interval<TYPE> &rhs) const = default;

  private:
    TYPE lower_{};
    TYPE upper_{};
};

/// @brief Interval of calendar years, both ends inclusive
using YearInterval = Interval<int>;

/// @brief Interval representation for double-precision data type
using DoubleInterval = Interval<double>;

/// @brief Enumerates every year in a closed year interval
/// @param years The year interval
/// @return The years in increasing order
inline std::vector<int> enumerate_years(const YearInterval &years) {
    auto result = std::vector<int>{};
    result.reserve(static_cast<std::size_t>(years.length()) + 1);
    for (auto year = years.lower(); year <= years.upper(); year++) {
        result.emplace_back(year);
    }

    return result;
}

} // namespace haq::core
