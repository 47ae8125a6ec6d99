#include "reference_fixture.h"

#include "HealthAQ.Core/string_util.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

using haq::core::PM25Item;

void add_series(std::vector<PM25Item> &items, const std::string &country, int first_year,
                const std::vector<double> &values) {
    auto year = first_year;
    for (auto value : values) {
        items.push_back(PM25Item{.country = country, .year = year, .value = value});
        year++;
    }
}

} // anonymous namespace

namespace haq::testing {

InMemoryDatastore::InMemoryDatastore(std::optional<core::LinearModelData> model, bool clean_air)
    : model_{std::move(model)}, clean_air_{clean_air} {}

std::vector<core::Country> InMemoryDatastore::get_countries() const {
    auto countries = std::vector<core::Country>{
        core::Country{.name = "Cambodia", .alpha3 = "KHM", .population = 16000000.0},
        core::Country{.name = "Germany", .alpha3 = "DEU", .population = 80000000.0},
        core::Country{.name = "India", .alpha3 = "IND", .population = std::nullopt},
        core::Country{.name = "Thailand", .alpha3 = "THA", .population = 70000000.0},
        core::Country{.name = "Vietnam", .alpha3 = "VNM", .population = 100000000.0}};

    if (clean_air_) {
        countries.push_back(
            core::Country{.name = "Iceland", .alpha3 = "ISL", .population = 370000.0});
    }

    return countries;
}

core::Country InMemoryDatastore::get_country(const std::string &name_or_alpha) const {
    auto countries = get_countries();
    auto it = std::find_if(countries.begin(), countries.end(), [&name_or_alpha](const auto &c) {
        return core::case_insensitive::equals(c.name, name_or_alpha) ||
               core::case_insensitive::equals(c.alpha3, name_or_alpha);
    });

    if (it == countries.end()) {
        throw std::runtime_error("Country not found: " + name_or_alpha);
    }

    return *it;
}

std::vector<core::DiseaseInfo> InMemoryDatastore::get_diseases() const {
    return {core::DiseaseInfo{.name = "Ischemic heart disease",
                              .category = "Cardiovascular",
                              .alpha = 0.2969,
                              .gamma = 0.0133,
                              .delta = 1.0},
            core::DiseaseInfo{.name = "Stroke",
                              .category = "Cardiovascular",
                              .alpha = 0.3120,
                              .gamma = 0.0098,
                              .delta = 1.0}};
}

std::vector<core::PM25Item> InMemoryDatastore::get_pm25_history() const {
    auto items = std::vector<PM25Item>{};
    add_series(items, "Cambodia", 2018, {24.0, 25.0, 26.0});
    add_series(items, "Germany", 2015, {12.0, 11.5, 11.0, 10.5, 10.0, 9.5});
    add_series(items, "India", 2015, {80.0, 82.0, 84.0, 86.0, 88.0, 90.0});
    add_series(items, "Thailand", 2010,
               {30.0, 29.0, 28.0, 27.0, 26.0, 25.0, 24.0, 23.0, 22.0, 20.0});
    add_series(items, "Vietnam", 2012, {28.0, 28.5, 29.0, 29.5, 30.0, 30.5, 31.0, 31.5, 32.0});
    if (clean_air_) {
        add_series(items, "Iceland", 2016, {6.0, 5.5, 4.8, 4.2, 3.9});
    }

    return items;
}

std::vector<core::BaselineDeathItem> InMemoryDatastore::get_baseline_deaths() const {
    constexpr auto ihd = "Ischemic heart disease";
    constexpr auto stroke = "Stroke";
    auto row = [](const char *country, int year, const char *disease, double deaths) {
        return core::BaselineDeathItem{
            .country = country, .year = year, .disease = disease, .deaths = deaths};
    };

    return {row("Cambodia", 2019, ihd, 3000.0),   row("Cambodia", 2019, stroke, 2000.0),
            row("India", 2019, ihd, 100000.0),    row("India", 2019, stroke, 80000.0),
            row("Thailand", 2015, ihd, 10000.0),  row("Thailand", 2015, stroke, 8000.0),
            row("Thailand", 2019, ihd, 12000.0),  row("Thailand", 2019, stroke, 9000.0),
            row("Vietnam", 2019, ihd, 15000.0),   row("Vietnam", 2019, stroke, 11000.0)};
}

core::LinearModelData InMemoryDatastore::get_forecast_model() const {
    if (model_.has_value()) {
        return model_.value();
    }

    return core::LinearModelData{.name = "persistence",
                                 .formula = "pm25 ~ lag_1y",
                                 .intercept = 0.0,
                                 .coefficients = {{"lag_1y", 1.0}}};
}

core::LinearModelData test_trend_model() {
    return core::LinearModelData{.name = "trend",
                                 .formula = "pm25 ~ lag_1y + yoy_change",
                                 .intercept = 1.0,
                                 .coefficients = {{"lag_1y", 0.9}, {"yoy_change", 0.5}}};
}

std::vector<core::AgeDeathItem> thailand_age_detail() {
    return {{.country = "Thailand",
             .year = 2019,
             .disease = "Ischemic heart disease",
             .age_band = "<1 year",
             .deaths = 100.0,
             .lower = 80.0,
             .upper = 120.0},
            {.country = "Thailand",
             .year = 2019,
             .disease = "Ischemic heart disease",
             .age_band = "50-54 years",
             .deaths = 4000.0,
             .lower = 3000.0,
             .upper = 5000.0},
            {.country = "Thailand",
             .year = 2019,
             .disease = "Ischemic heart disease",
             .age_band = "70-74 years",
             .deaths = 7900.0,
             .lower = 6000.0,
             .upper = 9000.0}};
}

const ReferenceData &test_reference_data() {
    static const auto store = InMemoryDatastore{};
    static const auto data = ReferenceData{store, TestCurrentYear};
    return data;
}

const ReferenceData &test_reference_data_with_detail() {
    static const auto store = InMemoryDatastore{};
    static const auto data = ReferenceData{store, TestCurrentYear, thailand_age_detail()};
    return data;
}

const ReferenceData &test_reference_data_trend_model() {
    static const auto store = InMemoryDatastore{test_trend_model(), false};
    static const auto data = ReferenceData{store, TestCurrentYear};
    return data;
}

const ReferenceData &test_reference_data_clean_air() {
    static const auto store = InMemoryDatastore{std::nullopt, true};
    static const auto data = ReferenceData{store, TestCurrentYear};
    return data;
}

} // namespace haq::testing
