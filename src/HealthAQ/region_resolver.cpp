#include "region_resolver.h"
#include "errors.h"

#include "HealthAQ.Core/string_util.h"

#include <algorithm>
#include <map>
#include <regex>
#include <utility>

namespace {

using RegionTable = std::map<std::string, std::vector<std::string>, std::less<>>;

const RegionTable &region_table() {
    static const auto table = RegionTable{
        {"ASEAN",
         {"Brunei", "Cambodia", "Indonesia", "Laos", "Malaysia", "Myanmar", "Philippines",
          "Singapore", "Thailand", "Vietnam", "Timor-Leste"}},
        {"Southeast Asia",
         {"Brunei", "Cambodia", "Indonesia", "Laos", "Malaysia", "Myanmar", "Philippines",
          "Singapore", "Thailand", "Vietnam", "Timor-Leste"}},
        {"South Asia",
         {"Afghanistan", "Bangladesh", "Bhutan", "India", "Maldives", "Nepal", "Pakistan",
          "Sri Lanka"}},
        {"East Asia",
         {"China", "Japan", "South Korea", "North Korea", "Mongolia", "Taiwan", "Hong Kong",
          "Macao"}},
        {"Central Asia", {"Kazakhstan", "Kyrgyzstan", "Tajikistan", "Turkmenistan", "Uzbekistan"}},
        {"Europe",
         {"Albania",     "Andorra",     "Austria",     "Belarus",       "Belgium",
          "Bosnia and Herzegovina",     "Bulgaria",    "Croatia",       "Cyprus",
          "Czech Republic",             "Denmark",     "Estonia",       "Finland",
          "France",      "Germany",     "Greece",      "Hungary",       "Iceland",
          "Ireland",     "Italy",       "Kosovo",      "Latvia",        "Liechtenstein",
          "Lithuania",   "Luxembourg",  "Macedonia",   "Malta",         "Moldova",
          "Monaco",      "Montenegro",  "Netherlands", "Norway",        "Poland",
          "Portugal",    "Romania",     "Russia",      "San Marino",    "Serbia",
          "Slovakia",    "Slovenia",    "Spain",       "Sweden",        "Switzerland",
          "Turkey",      "Ukraine",     "United Kingdom",               "Vatican City"}},
        {"Africa",
         {"Algeria",      "Angola",      "Benin",        "Botswana",
          "Burkina Faso", "Burundi",     "Cameroon",     "Cape Verde",
          "Central African Republic",    "Chad",         "Comoros",
          "Democratic Republic of the Congo",            "Republic of Congo",
          "Djibouti",     "Egypt",       "Equatorial Guinea",           "Eritrea",
          "Ethiopia",     "Gabon",       "Gambia",       "Ghana",       "Guinea",
          "Guinea-Bissau", "Kenya",      "Lesotho",      "Liberia",     "Libya",
          "Madagascar",   "Malawi",      "Mali",         "Mauritania",  "Mauritius",
          "Morocco",      "Mozambique",  "Namibia",      "Niger",       "Nigeria",
          "Rwanda",       "Senegal",     "Seychelles",   "Sierra Leone", "Somalia",
          "South Africa", "South Sudan", "Sudan",        "Swaziland",   "Tanzania",
          "Togo",         "Tunisia",     "Uganda",       "Zambia",      "Zimbabwe"}},
        {"North America", {"Canada", "United States", "Mexico"}},
        {"South America",
         {"Argentina", "Bolivia", "Brazil", "Chile", "Colombia", "Ecuador", "Guyana", "Paraguay",
          "Peru", "Suriname", "Uruguay", "Venezuela"}},
        {"Central America",
         {"Belize", "Costa Rica", "El Salvador", "Guatemala", "Honduras", "Nicaragua", "Panama"}},
        {"Caribbean",
         {"Bahamas", "Barbados", "Cuba", "Dominica", "Dominican Republic", "Grenada", "Haiti",
          "Jamaica", "Saint Kitts and Nevis", "Saint Lucia", "Saint Vincent and the Grenadines",
          "Trinidad and Tobago"}},
        {"Middle East",
         {"Bahrain", "Iran", "Iraq", "Israel", "Jordan", "Kuwait", "Lebanon", "Oman", "Qatar",
          "Saudi Arabia", "Syria", "United Arab Emirates", "Yemen"}},
        {"Oceania",
         {"Australia", "Fiji", "Kiribati", "Marshall Islands", "Micronesia", "Nauru",
          "New Zealand", "Palau", "Papua New Guinea", "Samoa", "Solomon Islands", "Tonga",
          "Tuvalu", "Vanuatu"}},
    };

    return table;
}

// Order matters, more specific patterns first
const std::vector<std::pair<std::regex, std::string>> &region_patterns() {
    static const auto patterns = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        auto result = std::vector<std::pair<std::regex, std::string>>{};
        const auto definitions = std::vector<std::pair<const char *, const char *>>{
            {R"(\basean\b)", "ASEAN"},
            {R"(\bsouth[\s-]*east\s+asia(n)?\b)", "Southeast Asia"},
            {R"(\bsouth\s+asia(n)?\b)", "South Asia"},
            {R"(\beast\s+asia(n)?\b)", "East Asia"},
            {R"(\bcentral\s+asia(n)?\b)", "Central Asia"},
            {R"(\beurop(e|ean)\b)", "Europe"},
            {R"(\b(eu|european\s+union)\b)", "Europe"},
            {R"(\bafric(a|an)\b)", "Africa"},
            {R"(\bnorth\s+americ(a|an)\b)", "North America"},
            {R"(\bsouth\s+americ(a|an)\b)", "South America"},
            {R"(\bcentral\s+americ(a|an)\b)", "Central America"},
            {R"(\blatin\s+americ(a|an)\b)", "South America"},
            {R"(\bmiddle\s+east(ern)?\b)", "Middle East"},
            {R"(\boceani(a|an)\b)", "Oceania"},
            {R"(\bcaribbean\b)", "Caribbean"},
            {R"(\bglobal(ly)?\b)", "Global"},
            {R"(\bworld\s*wide\b)", "Global"},
            {R"(\ball\s+countr)", "Global"},
            {R"(\bantarctic(a|an)?\b)", "Antarctica"},
            {R"(\barctic\b)", "Arctic"},
        };

        for (const auto &[pattern, name] : definitions) {
            result.emplace_back(std::regex{pattern, flags}, name);
        }

        return result;
    }();

    return patterns;
}

// Countries with a documented monthly seasonal pattern, lookup order
constexpr const char *SeasonalRegions[] = {"Southeast Asia", "South Asia", "East Asia"};

} // anonymous namespace

namespace haq {

RegionResolver::RegionResolver(std::vector<std::string> available)
    : available_{std::move(available)} {
    std::sort(available_.begin(), available_.end());
}

std::optional<std::string> RegionResolver::normalize(std::string_view text) {
    const auto value = std::string{text};
    for (const auto &[pattern, name] : region_patterns()) {
        if (std::regex_search(value, pattern)) {
            return name;
        }
    }

    return std::nullopt;
}

std::vector<std::string> RegionResolver::resolve(std::string_view name_or_adjective) const {
    auto region = normalize(name_or_adjective);
    if (!region.has_value()) {
        // Accept the exact canonical name, e.g. from a previous resolution
        const auto &table = region_table();
        auto it = std::find_if(table.cbegin(), table.cend(), [&](const auto &entry) {
            return core::case_insensitive::equals(entry.first, name_or_adjective);
        });

        if (it == table.cend()) {
            throw UnknownRegionError(std::string{name_or_adjective}, supported_regions());
        }

        region = it->first;
    }

    if (region.value() == GlobalRegion) {
        return available_;
    }

    auto result = std::vector<std::string>{};
    for (const auto &country : members(region.value())) {
        if (std::binary_search(available_.cbegin(), available_.cend(), country)) {
            result.emplace_back(country);
        }
    }

    if (result.empty()) {
        throw UnknownRegionError(region.value(), supported_regions());
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::string> RegionResolver::resolve(const std::optional<std::string> &region) const {
    if (!region.has_value()) {
        return available_;
    }

    return resolve(std::string_view{region.value()});
}

const std::vector<std::string> &RegionResolver::members(std::string_view region) {
    const auto &table = region_table();
    auto it = table.find(region);
    if (it == table.end()) {
        throw UnknownRegionError(std::string{region}, supported_regions());
    }

    return it->second;
}

std::optional<std::string> RegionResolver::seasonal_region(std::string_view country) {
    const auto &table = region_table();
    for (const auto *region : SeasonalRegions) {
        const auto &countries = table.find(region)->second;
        if (std::find(countries.cbegin(), countries.cend(), country) != countries.cend()) {
            return std::string{region};
        }
    }

    return std::nullopt;
}

std::vector<std::string> RegionResolver::supported_regions() {
    auto result = std::vector<std::string>{};
    for (const auto &entry : region_table()) {
        result.emplace_back(entry.first);
    }

    return result;
}

} // namespace haq
