#include "vocabulary_matcher.h"

#include "HealthAQ.Core/string_util.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace {

constexpr std::size_t MinPartLength = 4;
constexpr std::size_t MinFuzzyLength = 5;

// Name parts too common to identify a single name
const std::set<std::string, std::less<>> PartStopList{
    "north", "south", "east", "west", "central", "united",
    "republic", "islands", "saint", "democratic", "and", "the"};

struct Token {
    std::string value;
    std::size_t position;
};

std::vector<Token> tokenize_words(std::string_view text) {
    auto result = std::vector<Token>{};
    std::size_t index = 0;
    while (index < text.size()) {
        while (index < text.size() && !std::isalnum(static_cast<unsigned char>(text[index]))) {
            index++;
        }

        auto start = index;
        while (index < text.size() && (std::isalnum(static_cast<unsigned char>(text[index])) ||
                                       text[index] == '-' || text[index] == '\'')) {
            index++;
        }

        if (index > start) {
            result.push_back(Token{std::string{text.substr(start, index - start)}, start});
        }
    }

    return result;
}

} // anonymous namespace

namespace haq {

VocabularyMatcher::VocabularyMatcher(std::vector<std::string> vocabulary,
                                     const std::map<std::string, std::string> &synonyms,
                                     bool name_parts, double threshold)
    : vocabulary_{std::move(vocabulary)}, threshold_{threshold} {
    if (threshold_ <= 0.0 || threshold_ > 1.0) {
        throw std::invalid_argument("Vocabulary similarity threshold must be in (0, 1].");
    }

    std::sort(vocabulary_.begin(), vocabulary_.end());
    vocabulary_.erase(std::unique(vocabulary_.begin(), vocabulary_.end()), vocabulary_.end());

    auto lookup = std::map<std::string, std::string>{};
    for (const auto &name : vocabulary_) {
        lookup.emplace(core::to_lower(name), name);
    }

    for (const auto &[alias, name] : synonyms) {
        if (std::binary_search(vocabulary_.cbegin(), vocabulary_.cend(), name)) {
            lookup.emplace(core::to_lower(alias), name);
        }
    }

    if (name_parts) {
        auto owners = std::map<std::string, std::set<std::string>>{};
        for (const auto &name : vocabulary_) {
            auto lowered = core::to_lower(name);
            for (const auto &part : core::split_string(lowered, " ")) {
                if (part.size() >= MinPartLength && !PartStopList.contains(part)) {
                    owners[std::string{part}].insert(name);
                }
            }
        }

        for (const auto &[part, names] : owners) {
            if (names.size() == 1) {
                lookup.emplace(part, *names.begin());
            }
        }
    }

    keys_.assign(lookup.begin(), lookup.end());
    std::stable_sort(keys_.begin(), keys_.end(), [](const auto &left, const auto &right) {
        return left.first.size() > right.first.size();
    });
}

std::vector<VocabularyMatch> VocabularyMatcher::find_exact(std::string &lowered) const {
    auto result = std::vector<VocabularyMatch>{};
    for (const auto &[key, name] : keys_) {
        auto position = core::find_word(lowered, key);
        while (position != std::string::npos) {
            result.push_back(VocabularyMatch{name, position, key.size(), 1.0});
            std::fill_n(lowered.begin() + position, key.size(), ' ');
            position = core::find_word(lowered, key, position + key.size());
        }
    }

    std::sort(result.begin(), result.end(),
              [](const auto &left, const auto &right) { return left.position < right.position; });

    auto distinct = std::vector<VocabularyMatch>{};
    for (auto &entry : result) {
        auto seen = std::any_of(distinct.cbegin(), distinct.cend(),
                                [&entry](const auto &item) { return item.name == entry.name; });
        if (!seen) {
            distinct.emplace_back(std::move(entry));
        }
    }

    return distinct;
}

std::vector<VocabularyMatch> VocabularyMatcher::find_all(std::string_view text) const {
    auto lowered = core::to_lower(text);
    auto result = find_exact(lowered);
    if (result.empty()) {
        auto approximate = best_match(text);
        if (approximate.has_value()) {
            result.emplace_back(std::move(approximate.value()));
        }
    }

    return result;
}

std::optional<std::string> VocabularyMatcher::match(std::string_view text) const {
    auto matches = find_all(text);
    if (matches.empty()) {
        return std::nullopt;
    }

    return matches.front().name;
}

std::optional<VocabularyMatch> VocabularyMatcher::best_match(std::string_view text) const {
    auto lowered = core::to_lower(text);
    auto words = tokenize_words(lowered);
    auto candidates = std::vector<Token>{};
    for (std::size_t index = 0; index < words.size(); index++) {
        candidates.push_back(words[index]);
        if (index + 1 < words.size()) {
            candidates.push_back(
                Token{words[index].value + " " + words[index + 1].value, words[index].position});
        }
    }

    auto best = std::optional<VocabularyMatch>{};
    for (const auto &candidate : candidates) {
        if (candidate.value.size() < MinFuzzyLength) {
            continue;
        }

        for (const auto &[key, name] : keys_) {
            auto score = similarity(candidate.value, key);
            if (score < threshold_) {
                continue;
            }

            if (!best.has_value() || score > best->similarity ||
                (score == best->similarity && candidate.position < best->position)) {
                best = VocabularyMatch{name, candidate.position, candidate.value.size(), score};
            }
        }
    }

    return best;
}

std::string VocabularyMatcher::mask(std::string_view text) const {
    auto lowered = core::to_lower(text);
    auto masked = std::string{text};
    // Blanks every matched span of the lower-case copy
    find_exact(lowered);
    for (std::size_t index = 0; index < masked.size(); index++) {
        if (lowered[index] == ' ') {
            masked[index] = ' ';
        }
    }

    return masked;
}

double VocabularyMatcher::similarity(std::string_view left, std::string_view right) {
    auto longest = std::max(left.size(), right.size());
    if (longest == 0) {
        return 1.0;
    }

    auto distance = core::levenshtein_distance(left, right);
    return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

} // namespace haq
