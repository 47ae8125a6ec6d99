#include "string_util.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <numeric>

namespace {

/// @brief ASCII lower case of one byte, bytes of multi-byte UTF-8 sequences are unchanged
char lower_char(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // anonymous namespace

namespace haq::core {

std::string trim(std::string value) noexcept {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }

    std::size_t pos = 0;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
        ++pos;
    }

    return value.substr(pos);
}

std::string to_lower(std::string_view value) noexcept {
    auto result = std::string(value);
    std::transform(value.begin(), value.end(), result.begin(),
                   [](char c) { return lower_char(c); });

    return result;
}

std::string collapse_whitespace(std::string_view value) {
    auto result = std::string{};
    result.reserve(value.size());
    auto pending_space = false;
    for (auto c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }

        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }

        result.push_back(c);
    }

    return result;
}

std::vector<std::string_view> split_string(std::string_view value,
                                           std::string_view delims) noexcept {
    std::vector<std::string_view> output;
    std::size_t first = 0;

    while (first < value.size()) {
        const auto second = value.find_first_of(delims, first);
        if (first != second) {
            output.emplace_back(value.substr(first, second - first));
        }

        if (second == std::string_view::npos) {
            break;
        }

        first = second + 1;
    }

    return output;
}

std::size_t find_word(std::string_view text, std::string_view phrase, std::size_t from) noexcept {
    if (phrase.empty()) {
        return std::string_view::npos;
    }

    auto is_word_char = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
    auto pos = text.find(phrase, from);
    while (pos != std::string_view::npos) {
        auto end = pos + phrase.size();
        auto left_ok = pos == 0 || !is_word_char(text[pos - 1]) || !is_word_char(phrase.front());
        auto right_ok =
            end == text.size() || !is_word_char(text[end]) || !is_word_char(phrase.back());
        if (left_ok && right_ok) {
            return pos;
        }

        pos = text.find(phrase, pos + 1);
    }

    return std::string_view::npos;
}

std::size_t levenshtein_distance(std::string_view left, std::string_view right) {
    if (left.empty()) {
        return right.size();
    }

    if (right.empty()) {
        return left.size();
    }

    // Two-row dynamic programming table
    auto previous = std::vector<std::size_t>(right.size() + 1);
    auto current = std::vector<std::size_t>(right.size() + 1);
    std::iota(previous.begin(), previous.end(), std::size_t{0});

    for (std::size_t i = 1; i <= left.size(); i++) {
        current[0] = i;
        for (std::size_t j = 1; j <= right.size(); j++) {
            auto cost = (left[i - 1] == right[j - 1]) ? 0u : 1u;
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost});
        }

        std::swap(previous, current);
    }

    return previous[right.size()];
}

bool case_insensitive::comparator::operator()(std::string_view left,
                                              std::string_view right) const {
    return std::lexicographical_compare(
        left.cbegin(), left.cend(), right.cbegin(), right.cend(),
        [](char a, char b) { return lower_char(a) < lower_char(b); });
}

bool case_insensitive::equal_char(char left, char right) noexcept {
    return left == right || lower_char(left) == lower_char(right);
}

bool case_insensitive::equals(std::string_view left, std::string_view right) noexcept {
    return left.size() == right.size() &&
           std::equal(left.cbegin(), left.cend(), right.cbegin(), right.cend(), equal_char);
}

bool case_insensitive::contains(std::string_view text, std::string_view str) noexcept {
    if (str.length() > text.length()) {
        return false;
    }

    auto it = std::search(text.cbegin(), text.cend(), str.cbegin(), str.cend(),
                          [](char a, char b) { return lower_char(a) == lower_char(b); });

    return it != text.cend();
}

bool case_insensitive::contains(const std::vector<std::string> &source,
                                std::string_view element) noexcept {
    return std::any_of(source.cbegin(), source.cend(), [&element](const auto &value) {
        return case_insensitive::equals(value, element);
    });
}

int case_insensitive::index_of(const std::vector<std::string> &source,
                               std::string_view element) noexcept {
    auto it = std::find_if(source.cbegin(), source.cend(), [&element](const std::string &other) {
        return case_insensitive::equals(element, other);
    });

    if (it != source.cend()) {
        return static_cast<int>(std::distance(source.cbegin(), it));
    }

    return -1;
}

} // namespace haq::core
