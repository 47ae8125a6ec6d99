#pragma once

#include "parsed_query.h"
#include "vocabulary_matcher.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haq {

/// @brief Extracts typed entities from free text.
///
/// The extraction rules are independent of each other, and never fail: absence of a
/// signal leaves the field unset. Relative year phrases resolve against the externally
/// supplied current year, never the wall clock.
class QueryParser {
  public:
    QueryParser() = delete;

    /// @brief Initialises a new instance of the QueryParser class
    /// @param countries The country vocabulary
    /// @param diseases The canonical disease names
    /// @param current_year Reference year for relative year phrases
    QueryParser(std::vector<std::string> countries, std::vector<std::string> diseases,
                int current_year);

    /// @brief Parses a message into its typed entities
    /// @param text The free text message
    /// @return The parsed query
    ParsedQuery parse(std::string_view text) const;

    int current_year() const noexcept { return current_year_; }

    const VocabularyMatcher &country_matcher() const noexcept { return countries_; }

    const VocabularyMatcher &disease_matcher() const noexcept { return diseases_; }

    /// @brief Extracts the explicit and relative years, ordered and distinct
    std::vector<int> extract_years(std::string_view lowered) const;

    /// @brief Extracts a `N%` or `N percent` magnitude
    static std::optional<double> extract_percent(std::string_view lowered);

    /// @brief Extracts the direction of change from the keyword polarity
    ///
    /// With a percent token present, the direction keyword nearest to it wins; otherwise
    /// decrease keywords are checked before increase keywords.
    /// @param lowered The lower-case message
    /// @return +1 increase, -1 decrease, or std::nullopt when no keyword is found
    static std::optional<int> extract_percent_sign(std::string_view lowered);

    static std::optional<int> extract_month(std::string_view lowered);

    /// @brief Extracts the age group, elderly and children checked before adults
    static std::optional<core::AgeGroup> extract_age_group(std::string_view lowered);

    static std::optional<int> extract_top_n(std::string_view lowered);

  private:
    VocabularyMatcher countries_;
    VocabularyMatcher diseases_;
    int current_year_;
};

} // namespace haq
