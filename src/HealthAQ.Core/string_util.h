#pragma once
#include <cstddef>
#include <iterator>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace haq::core {

/// @brief Trim leading and trailing occurrences of white-space characters from string.
/// @param value The string to trim
/// @return The resulting string
std::string trim(std::string value) noexcept;

/// @brief Converts the given ASCII string to lower-case
/// @param value The string to convert
/// @return The string in lower-case
std::string to_lower(std::string_view value) noexcept;

/// @brief Replaces every run of white-space characters with a single space
/// @param value The string to collapse
/// @return The collapsed and trimmed string
std::string collapse_whitespace(std::string_view value);

/// @brief Splits a string into substrings based on specified delimiting characters.
/// @param value The source string to split
/// @param delims The delimiting character to split
/// @return An array whose elements contain the substrings
std::vector<std::string_view> split_string(std::string_view value,
                                           std::string_view delims) noexcept;

/// @brief Finds the first occurrence of a phrase delimited by word boundaries
/// @param text The source string
/// @param phrase The phrase to seek
/// @param from The position to start the search
/// @return The position of the phrase, or std::string_view::npos if not found
std::size_t find_word(std::string_view text, std::string_view phrase,
                      std::size_t from = 0) noexcept;

/// @brief Checks whether a phrase occurs in a string delimited by word boundaries
/// @param text The source string
/// @param phrase The phrase to seek
/// @return true if the phrase is found, otherwise, false.
inline bool contains_word(std::string_view text, std::string_view phrase) noexcept {
    return find_word(text, phrase) != std::string_view::npos;
}

/// @brief Computes the Levenshtein edit distance between two ASCII strings
/// @param left The first string
/// @param right The second string
/// @return The minimum number of single character insertions, deletions or substitutions
std::size_t levenshtein_distance(std::string_view left, std::string_view right);

/// @brief Join a range of strings with a delimeter
/// @param begin Start of range
/// @param end End of range
/// @return A new string composed of the joined-up strings
template <std::input_iterator Iter>
std::string join_strings(const std::string &delim, Iter begin, Iter end) {
    if (begin == end) {
        return {};
    }

    std::stringstream ss;
    auto it = begin;
    ss << *it++;
    for (; it != end; ++it) {
        ss << delim << *it;
    }

    return ss.str();
}

/// @brief Join a range of strings with a delimeter
/// @param range Range of strings to join
/// @return A new string composed of the joined-up strings
template <std::ranges::range Range>
std::string join_strings(const std::string &delim, const Range &range) {
    return join_strings(delim, std::cbegin(range), std::cend(range));
}

/// @brief Case-insensitive operations on ASCII strings.
struct case_insensitive final {

    /// @brief Case-insensitive ASCII strings comparator, usable as a map key compare
    struct comparator {
        /// @brief Case-insensitive lexicographical less-than
        /// @param left The left string to compare
        /// @param right The right string to compare
        /// @return true if left orders before right, otherwise, false
        bool operator()(std::string_view left, std::string_view right) const;
    };

    /// @brief Compare two case-insensitive ASCII string for equality
    /// @param left The left string to compare
    /// @param right The right string to compare
    /// @return true if the string are equal, otherwise, false
    static bool equals(std::string_view left, std::string_view right) noexcept;

    /// @brief Checks whether a specified substring occurs within a ASCII string
    /// @param text The source string
    /// @param str The string to seek
    /// @return true if the value occurs within the string, otherwise, false.
    static bool contains(std::string_view text, std::string_view str) noexcept;

    /// @brief Checks whether a vector contains a ASCII strings element
    /// @param source The vector of strings
    /// @param element The string to seek
    /// @return true if the value occurs within the vector, otherwise, false.
    static bool contains(const std::vector<std::string> &source, std::string_view element) noexcept;

    /// @brief Gets the index of a ASCII string element in a vector
    /// @param source The vector of strings
    /// @param element The string to seek
    /// @return The zero-based index of the element, or -1 if not found.
    static int index_of(const std::vector<std::string> &source, std::string_view element) noexcept;

  private:
    static bool equal_char(char left, char right) noexcept;
};
} // namespace haq::core
