#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace haq {

/// @brief A vocabulary name found in a free text
struct VocabularyMatch {
    /// @brief The canonical vocabulary name
    std::string name;

    /// @brief Position of the matched span in the text
    std::size_t position{};

    /// @brief Length of the matched span
    std::size_t length{};

    /// @brief Match similarity, 1.0 for exact matches
    double similarity{1.0};
};

/// @brief Approximate string matching against a closed vocabulary.
///
/// Exact phrase matches on word boundaries are preferred, longest phrase first, and each
/// match masks its span so that shorter keys can not match inside it. The phrase keys are
/// the lower-case vocabulary names, the synonyms of the names, and optionally the unique
/// name parts longer than three characters, e.g. `zealand` for New Zealand.
///
/// When nothing matches exactly, the words and word pairs of the text (five characters or
/// more) are compared with every key using the normalised Levenshtein similarity
/// `1 - distance / max(length)`; the best candidate at or above the threshold wins.
class VocabularyMatcher {
  public:
    /// @brief Default minimum similarity for approximate matches
    static constexpr double DefaultThreshold = 0.85;

    /// @brief Initialises a new instance of the VocabularyMatcher class
    /// @param vocabulary The canonical names
    /// @param synonyms Alternative spelling to canonical name, unknown targets are skipped
    /// @param name_parts Whether the unique name parts also match
    /// @param threshold Minimum similarity for approximate matches, in (0, 1]
    /// @throws std::invalid_argument for threshold outside (0, 1].
    VocabularyMatcher(std::vector<std::string> vocabulary,
                      const std::map<std::string, std::string> &synonyms = {},
                      bool name_parts = true, double threshold = DefaultThreshold);

    /// @brief Finds all vocabulary names in a text
    /// @param text The free text
    /// @return The distinct matches in text order; a single approximate match at most
    std::vector<VocabularyMatch> find_all(std::string_view text) const;

    /// @brief Finds the first vocabulary name in a text
    /// @param text The free text
    /// @return The canonical name, or std::nullopt
    std::optional<std::string> match(std::string_view text) const;

    /// @brief Finds the best approximate match in a text, ignoring exact matches
    std::optional<VocabularyMatch> best_match(std::string_view text) const;

    /// @brief Replaces the exactly matched spans of a text with blanks
    std::string mask(std::string_view text) const;

    /// @brief Computes the normalised Levenshtein similarity of two strings
    /// @return The similarity in [0, 1], 1.0 for equal strings
    static double similarity(std::string_view left, std::string_view right);

    const std::vector<std::string> &vocabulary() const noexcept { return vocabulary_; }

    double threshold() const noexcept { return threshold_; }

  private:
    std::vector<std::string> vocabulary_;
    std::vector<std::pair<std::string, std::string>> keys_;
    double threshold_;

    std::vector<VocabularyMatch> find_exact(std::string &lowered) const;
};

} // namespace haq
