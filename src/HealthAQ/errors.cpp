#include "errors.h"

#include "HealthAQ.Core/string_util.h"

#include <fmt/format.h>

#include <utility>

namespace haq {

std::string to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::unknown_region:
        return "unknown_region";
    case ErrorKind::unknown_country:
        return "unknown_country";
    case ErrorKind::missing_entity:
        return "missing_entity";
    case ErrorKind::year_out_of_range:
        return "year_out_of_range";
    case ErrorKind::unrecognized_intent:
        return "unrecognized_intent";
    case ErrorKind::message_too_long:
        return "message_too_long";
    case ErrorKind::internal_error:
        return "internal_error";
    }

    return "internal_error";
}

AnalysisError::AnalysisError(ErrorKind kind, const std::string &what_arg,
                             const source_location location)
    : core::HaqException{what_arg, location}, kind_{kind} {}

UnknownRegionError::UnknownRegionError(std::string region, std::vector<std::string> supported,
                                       const source_location location)
    : AnalysisError{ErrorKind::unknown_region,
                    fmt::format("'{}' is not a recognised region. Supported regions: {}", region,
                                core::join_strings(", ", supported)),
                    location},
      region_{std::move(region)}, supported_{std::move(supported)} {}

UnknownCountryError::UnknownCountryError(std::string country, const source_location location)
    : AnalysisError{ErrorKind::unknown_country,
                    fmt::format("Country '{}' is not available in the reference data", country),
                    location},
      country_{std::move(country)} {}

MissingEntityError::MissingEntityError(std::string entity, const std::string &what_arg,
                                       const source_location location)
    : AnalysisError{ErrorKind::missing_entity, what_arg, location}, entity_{std::move(entity)} {}

YearOutOfRangeError::YearOutOfRangeError(const std::string &what_arg,
                                         const source_location location)
    : AnalysisError{ErrorKind::year_out_of_range, what_arg, location} {}

} // namespace haq
