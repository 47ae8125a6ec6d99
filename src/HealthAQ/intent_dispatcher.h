#pragma once

#include "intent.h"
#include "parsed_query.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace haq {

/// @brief Dispatch rule predicate over the lower-case message and the parsed entities
using DispatchPredicate = std::function<bool(std::string_view, const ParsedQuery &)>;

/// @brief One entry of the ordered dispatch table
struct DispatchRule {
    /// @brief The rule name, unique in the table
    std::string name;

    /// @brief The intent selected when the rule is satisfied
    Intent intent{Intent::unrecognized};

    DispatchPredicate predicate;
};

/// @brief Maps a parsed query and its message to one intent.
///
/// The rules are evaluated top to bottom and the first satisfied rule wins. The order is
/// the priority contract between overlapping rules, e.g. a message with both a `%` token
/// and a `trend` keyword always resolves to a scenario. No rule matching yields
/// Intent::unrecognized, never a failure.
class IntentDispatcher {
  public:
    /// @brief Initialises a new instance of the IntentDispatcher class with the default table
    IntentDispatcher();

    /// @brief Initialises a new instance of the IntentDispatcher class
    /// @param rules The ordered rules table
    /// @throws std::invalid_argument for empty tables, rules without predicate or duplicated names.
    explicit IntentDispatcher(std::vector<DispatchRule> rules);

    /// @brief Selects the intent of a message
    /// @param query The parsed entities
    /// @param raw_text The original message
    /// @return The intent of the first satisfied rule, or Intent::unrecognized
    Intent dispatch(const ParsedQuery &query, std::string_view raw_text) const;

    /// @brief Finds the first satisfied rule
    /// @return Pointer to the rule, or nullptr when no rule matches
    const DispatchRule *match(const ParsedQuery &query, std::string_view raw_text) const;

    /// @brief Gets the ordered rules table
    const std::vector<DispatchRule> &rules() const noexcept { return rules_; }

    /// @brief Creates the default rules table
    static std::vector<DispatchRule> default_rules();

  private:
    std::vector<DispatchRule> rules_;
};

} // namespace haq
