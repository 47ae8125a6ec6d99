#pragma once

#include "HealthAQ.Core/exception.h"

#include <string>
#include <vector>

namespace haq {

/// @brief Enumerates the caller-visible analysis error kinds
enum class ErrorKind {
    /// @brief Region name not in the static region table
    unknown_region,

    /// @brief Country name not in the reference vocabulary
    unknown_country,

    /// @brief A handler needs a field the parser left unset
    missing_entity,

    /// @brief Year outside the range a series can answer
    year_out_of_range,

    /// @brief No dispatch rule matched the message
    unrecognized_intent,

    /// @brief Message longer than the pipeline analyses
    message_too_long,

    /// @brief Unexpected internal fault
    internal_error
};

/// @brief Converts an error kind to its wire name, e.g. unknown_region
/// @param kind The error kind
/// @return The error kind name
std::string to_string(ErrorKind kind);

/// @brief Base class for the structured analysis errors
class AnalysisError : public core::HaqException {
  public:
    AnalysisError(ErrorKind kind, const std::string &what_arg,
                  const source_location location = source_location::current());

    /// @brief Gets the error kind
    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

/// @brief Region alias is not in the static region table, or has no member with data
class UnknownRegionError : public AnalysisError {
  public:
    UnknownRegionError(std::string region, std::vector<std::string> supported,
                       const source_location location = source_location::current());

    const std::string &region() const noexcept { return region_; }

    /// @brief Gets the supported region names
    const std::vector<std::string> &supported() const noexcept { return supported_; }

  private:
    std::string region_;
    std::vector<std::string> supported_;
};

/// @brief Forecast or health request for a country absent from the vocabulary
class UnknownCountryError : public AnalysisError {
  public:
    UnknownCountryError(std::string country,
                        const source_location location = source_location::current());

    const std::string &country() const noexcept { return country_; }

  private:
    std::string country_;
};

/// @brief A request requires an entity that the query does not provide
class MissingEntityError : public AnalysisError {
  public:
    MissingEntityError(std::string entity, const std::string &what_arg,
                       const source_location location = source_location::current());

    /// @brief Gets the missing entity name, e.g. country
    const std::string &entity() const noexcept { return entity_; }

  private:
    std::string entity_;
};

/// @brief Requested year is before the first observation of a series
class YearOutOfRangeError : public AnalysisError {
  public:
    YearOutOfRangeError(const std::string &what_arg,
                        const source_location location = source_location::current());
};

} // namespace haq
