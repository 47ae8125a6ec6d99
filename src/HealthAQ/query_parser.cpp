#include "query_parser.h"
#include "region_resolver.h"

#include "HealthAQ.Core/string_util.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <map>
#include <regex>
#include <utility>

namespace {

using haq::core::AgeGroup;

constexpr auto RegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

const std::vector<std::string> IncreaseKeywords{
    "rise",    "rises",  "rising", "rose",   "increase", "increases", "increased",
    "higher",  "go up",  "goes up", "up by", "worsen",   "worsens",   "worsened",
    "worse",   "spike",  "spikes", "grow",   "grows",    "grew",      "raise",
    "raised"};

const std::vector<std::string> DecreaseKeywords{
    "reduce",  "reduces", "reduced",  "reducing", "reduction", "decrease", "decreases",
    "decreased", "lower", "lowers",   "lowered",  "go down",   "goes down", "down by",
    "cut",     "cuts",    "drop",     "drops",    "dropped",   "fall",     "falls",
    "fell",    "decline", "declines", "declined", "prevent",   "prevented", "save",
    "saved",   "meet",    "meets",    "guideline"};

const std::vector<std::pair<std::string, int>> MonthNames{
    {"january", 1},  {"february", 2}, {"march", 3},     {"april", 4},    {"may", 5},
    {"june", 6},     {"july", 7},     {"august", 8},    {"september", 9}, {"october", 10},
    {"november", 11}, {"december", 12}, {"jan", 1},     {"feb", 2},      {"mar", 3},
    {"apr", 4},      {"jun", 6},      {"jul", 7},       {"aug", 8},      {"sep", 9},
    {"sept", 9},     {"oct", 10},     {"nov", 11},      {"dec", 12}};

const std::vector<std::pair<AgeGroup, std::vector<std::string>>> AgeKeywords{
    {AgeGroup::elderly,
     {"elderly", "old people", "older people", "senior", "seniors", "over 65", "65+",
      "aged 65", "retiree", "retirees", "geriatric"}},
    {AgeGroup::children,
     {"children", "child", "kids", "kid", "infant", "infants", "baby", "babies", "toddler",
      "toddlers", "young", "pediatric", "paediatric", "under 15", "under 14", "under 5"}},
    {AgeGroup::adults,
     {"adults", "adult", "working age", "working-age", "middle age", "middle-aged"}},
};

const std::map<std::string, std::string> CountrySynonyms{
    {"Viet Nam", "Vietnam"},
    {"Lao PDR", "Laos"},
    {"Czechia", "Czech Republic"},
    {"Korea, Republic of", "South Korea"},
    {"Republic of Korea", "South Korea"},
    {"Russian Federation", "Russia"},
    {"Hong Kong, China", "Hong Kong"},
    {"Taiwan, China", "Taiwan"},
    {"USA", "United States"},
    {"United States of America", "United States"},
    {"UK", "United Kingdom"},
    {"Great Britain", "United Kingdom"},
    {"Britain", "United Kingdom"},
    {"UAE", "United Arab Emirates"},
    {"DRC", "Democratic Republic of the Congo"},
};

const std::map<std::string, std::string> DiseaseSynonyms{
    {"heart disease", "Ischemic heart disease"},
    {"ihd", "Ischemic heart disease"},
    {"ischemic", "Ischemic heart disease"},
    {"heart attack", "Ischemic heart disease"},
    {"cardiac", "Ischemic heart disease"},
    {"coronary", "Ischemic heart disease"},
    {"strokes", "Stroke"},
    {"cerebrovascular", "Stroke"},
    {"copd", "Chronic obstructive pulmonary disease"},
    {"chronic obstructive", "Chronic obstructive pulmonary disease"},
    {"emphysema", "Chronic obstructive pulmonary disease"},
    {"lower respiratory", "Lower respiratory infections"},
    {"pneumonia", "Lower respiratory infections"},
    {"lri", "Lower respiratory infections"},
    {"upper respiratory", "Upper respiratory infections"},
    {"uri", "Upper respiratory infections"},
    {"sinusitis", "Upper respiratory infections"},
    {"lung cancer", "Tracheal, bronchus, and lung cancer"},
    {"tracheal cancer", "Tracheal, bronchus, and lung cancer"},
    {"bronchus cancer", "Tracheal, bronchus, and lung cancer"},
    {"larynx cancer", "Larynx cancer"},
    {"throat cancer", "Larynx cancer"},
    {"laryngeal", "Larynx cancer"},
    {"tb", "Tuberculosis"},
    {"diabetes", "Diabetes mellitus"},
    {"diabetic", "Diabetes mellitus"},
    {"asthmatic", "Asthma"},
    {"wheezing", "Asthma"},
};

/// @brief Smallest distance between any occurrence of the keywords and a position
std::size_t nearest_keyword(std::string_view text, const std::vector<std::string> &keywords,
                            std::size_t position) {
    auto best = std::numeric_limits<std::size_t>::max();
    for (const auto &keyword : keywords) {
        auto index = haq::core::find_word(text, keyword);
        while (index != std::string_view::npos) {
            auto distance = index > position ? index - position : position - index;
            best = std::min(best, distance);
            index = haq::core::find_word(text, keyword, index + keyword.size());
        }
    }

    return best;
}

bool contains_any(std::string_view text, const std::vector<std::string> &keywords) {
    return std::any_of(keywords.cbegin(), keywords.cend(), [&text](const auto &keyword) {
        return haq::core::contains_word(text, keyword);
    });
}

} // anonymous namespace

namespace haq {

std::string to_string(core::AgeGroup group) {
    switch (group) {
    case core::AgeGroup::children:
        return "children";
    case core::AgeGroup::adults:
        return "adults";
    case core::AgeGroup::elderly:
        return "elderly";
    }

    return "unknown";
}

QueryParser::QueryParser(std::vector<std::string> countries, std::vector<std::string> diseases,
                         int current_year)
    : countries_{std::move(countries), CountrySynonyms, true},
      diseases_{std::move(diseases), DiseaseSynonyms, false}, current_year_{current_year} {}

ParsedQuery QueryParser::parse(std::string_view text) const {
    auto result = ParsedQuery{};
    result.raw_message = std::string{text};

    auto lowered =
        core::collapse_whitespace(core::to_lower(text.substr(0, MaxMessageLength)));

    for (auto &match : countries_.find_all(lowered)) {
        result.countries.emplace_back(std::move(match.name));
    }

    if (!result.countries.empty()) {
        result.country = result.countries.front();
    }

    auto years = extract_years(lowered);
    if (!years.empty()) {
        result.year = years.back();
        if (years.size() >= 2) {
            result.year_range = core::YearInterval{years.front(), years.back()};
        }
    }

    result.percent = extract_percent(lowered);
    result.percent_sign = extract_percent_sign(lowered);
    result.month = extract_month(lowered);
    result.age_group = extract_age_group(lowered);
    result.disease = diseases_.match(lowered);
    result.region = RegionResolver::normalize(countries_.mask(lowered));
    result.top_n = extract_top_n(lowered);
    return result;
}

std::vector<int> QueryParser::extract_years(std::string_view lowered) const {
    static const auto year_pattern = std::regex{R"(\b(20[0-4]\d)\b)", RegexFlags};
    static const auto next_pattern = std::regex{R"(\bnext\s+year\b)", RegexFlags};
    static const auto last_pattern = std::regex{R"(\blast\s+year\b)", RegexFlags};
    static const auto this_pattern = std::regex{R"(\b(this|current)\s+year\b)", RegexFlags};
    static const auto ahead_pattern = std::regex{R"(\bin\s+(\d{1,2})\s+years?\b)", RegexFlags};
    static const auto since_pattern = std::regex{R"(\bsince\s+(20[0-4]\d)\b)", RegexFlags};

    const auto text = std::string{lowered};
    auto years = std::vector<int>{};
    for (auto it = std::sregex_iterator(text.begin(), text.end(), year_pattern);
         it != std::sregex_iterator(); ++it) {
        years.push_back(std::stoi((*it)[1].str()));
    }

    if (std::regex_search(text, next_pattern)) {
        years.push_back(current_year_ + 1);
    }

    if (std::regex_search(text, last_pattern)) {
        years.push_back(current_year_ - 1);
    }

    if (std::regex_search(text, this_pattern)) {
        years.push_back(current_year_);
    }

    auto match = std::smatch{};
    if (std::regex_search(text, match, ahead_pattern)) {
        years.push_back(current_year_ + std::stoi(match[1].str()));
    }

    if (std::regex_search(text, since_pattern)) {
        years.push_back(current_year_);
    }

    std::sort(years.begin(), years.end());
    years.erase(std::unique(years.begin(), years.end()), years.end());
    return years;
}

std::optional<double> QueryParser::extract_percent(std::string_view lowered) {
    static const auto pattern = std::regex{R"((\d+(?:\.\d+)?)\s*(%|percent\b))", RegexFlags};

    const auto text = std::string{lowered};
    auto match = std::smatch{};
    if (!std::regex_search(text, match, pattern)) {
        return std::nullopt;
    }

    const auto number = match[1].str();
    auto value = 0.0;
    auto [end, error] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (error != std::errc{} || end != number.data() + number.size()) {
        return std::nullopt;
    }

    return value;
}

std::optional<int> QueryParser::extract_percent_sign(std::string_view lowered) {
    static const auto pattern = std::regex{R"(\d+(?:\.\d+)?\s*(%|percent\b))", RegexFlags};

    const auto text = std::string{lowered};
    auto match = std::smatch{};
    if (!std::regex_search(text, match, pattern)) {
        if (contains_any(text, DecreaseKeywords)) {
            return -1;
        }

        if (contains_any(text, IncreaseKeywords)) {
            return +1;
        }

        return std::nullopt;
    }

    auto position = static_cast<std::size_t>(match.position(0));
    auto increase = nearest_keyword(text, IncreaseKeywords, position);
    auto decrease = nearest_keyword(text, DecreaseKeywords, position);
    if (increase < decrease) {
        return +1;
    }

    if (decrease < increase) {
        return -1;
    }

    // Equal distance, or no keyword at all
    if (contains_any(text, IncreaseKeywords)) {
        return +1;
    }

    if (contains_any(text, DecreaseKeywords)) {
        return -1;
    }

    return std::nullopt;
}

std::optional<int> QueryParser::extract_month(std::string_view lowered) {
    // "may" is a month only in a date context
    static const auto may_pattern =
        std::regex{R"(\b(in|during|of|for)\s+may\b|\bmay\s+20\d\d\b)", RegexFlags};

    for (const auto &[name, number] : MonthNames) {
        if (!core::contains_word(lowered, name)) {
            continue;
        }

        if (name == "may" && !std::regex_search(std::string{lowered}, may_pattern)) {
            continue;
        }

        return number;
    }

    return std::nullopt;
}

std::optional<core::AgeGroup> QueryParser::extract_age_group(std::string_view lowered) {
    for (const auto &[group, keywords] : AgeKeywords) {
        if (contains_any(lowered, keywords)) {
            return group;
        }
    }

    return std::nullopt;
}

std::optional<int> QueryParser::extract_top_n(std::string_view lowered) {
    static const auto pattern = std::regex{R"(\btop\s+(\d{1,3})\b)", RegexFlags};

    const auto text = std::string{lowered};
    auto match = std::smatch{};
    if (std::regex_search(text, match, pattern)) {
        auto value = std::stoi(match[1].str());
        if (value > 0) {
            return value;
        }
    }

    return std::nullopt;
}

} // namespace haq
