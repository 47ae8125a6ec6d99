#include "reference_data.h"
#include "errors.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {

/// @brief Finds the entry for the exact key, else the nearest key (earlier on ties)
template <typename T> const auto *find_nearest_year(const std::map<int, T> &table, int year) {
    using value_type = typename std::map<int, T>::value_type;
    const value_type *best = nullptr;
    auto best_distance = std::numeric_limits<int>::max();
    for (const auto &entry : table) {
        auto distance = std::abs(entry.first - year);
        if (distance < best_distance) {
            best = &entry;
            best_distance = distance;
        }
    }

    return best;
}

} // anonymous namespace

namespace haq {

ReferenceData::ReferenceData(const core::Datastore &store, int current_year,
                             std::vector<core::AgeDeathItem> age_detail)
    : current_year_{current_year}, model_{store.get_forecast_model()} {

    for (const auto &item : store.get_pm25_history()) {
        history_[item.country][item.year] = item.value;
    }

    if (history_.empty()) {
        throw std::runtime_error("Reference data has no PM2.5 history.");
    }

    auto first_year = std::numeric_limits<int>::max();
    auto last_year = std::numeric_limits<int>::min();
    for (const auto &[name, series] : history_) {
        countries_.emplace_back(name);
        canonical_.emplace(name, name);
        first_year = std::min(first_year, series.begin()->first);
        last_year = std::max(last_year, series.rbegin()->first);
    }

    std::sort(countries_.begin(), countries_.end());
    observed_years_ = core::YearInterval{first_year, last_year};

    for (const auto &country : store.get_countries()) {
        if (country.population.has_value() && history_.contains(country.name)) {
            population_.emplace(country.name, country.population.value());
        }
    }

    diseases_ = store.get_diseases();
    std::sort(diseases_.begin(), diseases_.end());

    for (const auto &item : store.get_baseline_deaths()) {
        // Validates the disease name against the registry
        static_cast<void>(disease(item.disease));
        baseline_[item.country][item.year][item.disease] += item.deaths;
    }

    for (auto &item : age_detail) {
        if (!history_.contains(item.country)) {
            continue;
        }

        static_cast<void>(disease(item.disease));
        auto &records = age_detail_[item.country][item.year];
        records.emplace_back(std::move(item));
    }
}

bool ReferenceData::contains_country(std::string_view name) const {
    return canonical_.contains(std::string{name});
}

const std::string &ReferenceData::canonical_country(std::string_view name) const {
    auto it = canonical_.find(std::string{name});
    if (it == canonical_.end()) {
        throw UnknownCountryError(std::string{name});
    }

    return it->second;
}

std::optional<double> ReferenceData::population(std::string_view country) const {
    auto it = population_.find(std::string{country});
    if (it == population_.end()) {
        return std::nullopt;
    }

    return it->second;
}

const WorkingHistory &ReferenceData::pm25_history(std::string_view country) const {
    return history_.at(canonical_country(country));
}

std::vector<std::string> ReferenceData::disease_names() const {
    auto result = std::vector<std::string>{};
    result.reserve(diseases_.size());
    for (const auto &info : diseases_) {
        result.emplace_back(info.name);
    }

    return result;
}

const core::DiseaseInfo &ReferenceData::disease(std::string_view name) const {
    auto it = std::find_if(diseases_.cbegin(), diseases_.cend(), [&name](const auto &info) {
        return core::case_insensitive::equals(info.name, name);
    });

    if (it == diseases_.cend()) {
        throw std::out_of_range(fmt::format("Unknown disease: '{}'", name));
    }

    return *it;
}

std::optional<BaselineLookup> ReferenceData::baseline_deaths(const std::string &country,
                                                             int year) const {
    auto it = baseline_.find(country);
    if (it == baseline_.end() || it->second.empty()) {
        return std::nullopt;
    }

    const auto *nearest = find_nearest_year(it->second, year);
    return BaselineLookup{.year = nearest->first, .deaths = nearest->second};
}

std::optional<AgeDetailLookup> ReferenceData::age_detail(const std::string &country,
                                                         int year) const {
    auto it = age_detail_.find(country);
    if (it == age_detail_.end() || it->second.empty()) {
        return std::nullopt;
    }

    const auto *nearest = find_nearest_year(it->second, year);
    return AgeDetailLookup{.year = nearest->first, .records = nearest->second};
}

} // namespace haq
