#pragma once
#include <cstdint>
#include <type_traits>

// forward type declaration
namespace haq::core {

/// @brief Verbosity mode enumeration
enum class VerboseMode : uint8_t {
    /// @brief only report errors
    none,

    /// @brief Print more information about actions, including warning
    verbose
};

/// @brief Enumerates the population age groups with distinct exposure vulnerability
enum class AgeGroup : uint8_t {
    /// @brief Children, 0-14 years
    children,

    /// @brief Adults, 15-64 years
    adults,

    /// @brief Elderly, 65 years and over
    elderly
};

/// @brief C++20 concept for numeric types
template <typename T>
concept Numerical = std::is_arithmetic_v<T>;

} // namespace haq::core
