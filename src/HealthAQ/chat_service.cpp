#include "chat_service.h"
#include "errors.h"

#include "HealthAQ.Core/string_util.h"

#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <initializer_list>

namespace {

constexpr std::size_t DefaultTopDiseases = 5;
constexpr int DefaultTrendYears = 4;

bool contains_any(std::string_view lowered, std::initializer_list<std::string_view> phrases) {
    return std::any_of(phrases.begin(), phrases.end(), [&lowered](std::string_view phrase) {
        return haq::core::contains_word(lowered, phrase);
    });
}

bool asks_lowest(std::string_view lowered) {
    return contains_any(lowered, {"lowest", "cleanest", "least polluted", "least", "best"});
}

bool asks_highest(std::string_view lowered) {
    return contains_any(lowered, {"highest", "most", "largest", "worst", "biggest"});
}

const std::vector<std::string> &unrecognized_examples() {
    static const auto examples = std::vector<std::string>{
        "What is the PM2.5 forecast for Thailand in 2027?",
        "Health risk in Vietnam 2026",
        "What if PM2.5 drops 20% in Thailand in 2030?",
        "Which Southeast Asian countries have the highest PM2.5 in 2028?",
        "Best month to visit Myanmar in 2026",
        "Which countries do you have data for?"};
    return examples;
}

} // anonymous namespace

namespace haq {

ChatService::ChatService(const ReferenceData &data, AnalyticsOptions options)
    : data_{data}, regions_{data.countries()},
      parser_{data.countries(), data.disease_names(), data.current_year()}, dispatcher_{},
      forecaster_{data}, engine_{data}, analytics_{forecaster_, engine_, std::move(options)} {
    register_handlers();
}

void ChatService::register_handlers() {
    handlers_.emplace(Intent::scenario_pm25_change,
                      [this](const ParsedQuery &query, std::string_view lowered) {
                          return scenario(query, lowered);
                      });

    handlers_.emplace(Intent::sensitivity_pm25_deaths,
                      [this](const ParsedQuery &query, std::string_view) {
                          return sensitivity(query);
                      });

    handlers_.emplace(Intent::lowest_health_burden,
                      [this](const ParsedQuery &query, std::string_view lowered) {
                          auto metric =
                              contains_any(lowered, {"daly", "dalys"}) ? "dalys" : "deaths";
                          return json(analytics_.lowest_health_burden(
                              scope_of(query), year_of(query), metric, !asks_highest(lowered)));
                      });

    handlers_.emplace(Intent::fastest_improvement_pm25,
                      [this](const ParsedQuery &query, std::string_view lowered) {
                          auto worsening = contains_any(lowered, {"worse", "worsening", "worst"});
                          return json(analytics_.fastest_improving(scope_of(query),
                                                                   query.year_range, !worsening));
                      });

    handlers_.emplace(Intent::stability_pm25,
                      [this](const ParsedQuery &query, std::string_view lowered) {
                          auto volatile_first = contains_any(
                              lowered, {"least stable", "most volatile", "unstable", "volatile"});
                          return json(analytics_.rank_stability(scope_of(query), query.year_range,
                                                                !volatile_first));
                      });

    handlers_.emplace(Intent::rank_pm25,
                      [this](const ParsedQuery &query, std::string_view lowered) {
                          return json(analytics_.rank_pm25(scope_of(query), year_of(query),
                                                           asks_lowest(lowered), query.top_n));
                      });

    handlers_.emplace(Intent::deaths_change_yoy,
                      [this](const ParsedQuery &query, std::string_view) {
                          return deaths_change(query);
                      });

    handlers_.emplace(Intent::risk_ranking,
                      [this](const ParsedQuery &query, std::string_view lowered) {
                          return json(analytics_.rank_risk(scope_of(query), year_of(query),
                                                           asks_lowest(lowered)));
                      });

    handlers_.emplace(Intent::highest_risk_country,
                      [this](const ParsedQuery &query, std::string_view) {
                          return highest_risk(query);
                      });

    handlers_.emplace(Intent::health_dalys, [this](const ParsedQuery &query, std::string_view) {
        return dalys(query);
    });

    handlers_.emplace(Intent::explainability, [this](const ParsedQuery &query, std::string_view) {
        return json(analytics_.explain(query.country, year_of(query)));
    });

    handlers_.emplace(Intent::risk_level, [this](const ParsedQuery &query, std::string_view) {
        return json(analytics_.risk_profile(require_country(query), year_of(query)));
    });

    handlers_.emplace(Intent::trend_pm25, [this](const ParsedQuery &query, std::string_view) {
        return json(analytics_.trend(require_country(query), trend_window(query)));
    });

    handlers_.emplace(Intent::pm25_change, [this](const ParsedQuery &query, std::string_view) {
        if (!query.year_range.has_value()) {
            throw MissingEntityError("year_range", "A change needs a start and an end year");
        }

        const auto &years = query.year_range.value();
        return json(forecaster_.change(require_country(query), years.lower(), years.upper()));
    });

    handlers_.emplace(Intent::compare_health, [this](const ParsedQuery &query, std::string_view) {
        return compare(query);
    });

    handlers_.emplace(Intent::health_rate, [this](const ParsedQuery &query, std::string_view) {
        return health(query);
    });

    handlers_.emplace(Intent::health_deaths, [this](const ParsedQuery &query, std::string_view) {
        return health(query);
    });

    handlers_.emplace(Intent::top_diseases, [this](const ParsedQuery &query, std::string_view) {
        const auto &country = require_country(query);
        auto year = year_of(query);
        auto point = forecaster_.forecast(country, year);
        auto count = static_cast<std::size_t>(query.top_n.value_or(DefaultTopDiseases));
        return json{{"forecast", point},
                    {"top_diseases", engine_.top_diseases(point.country, year, point.pm25, count)}};
    });

    handlers_.emplace(Intent::best_month, [this](const ParsedQuery &query, std::string_view) {
        return json(analytics_.best_months(require_country(query), year_of(query)));
    });

    handlers_.emplace(Intent::worst_month, [this](const ParsedQuery &query, std::string_view) {
        return json(analytics_.worst_months(require_country(query), year_of(query)));
    });

    handlers_.emplace(Intent::list_countries, [this](const ParsedQuery &, std::string_view) {
        return json{{"countries", list_countries()}, {"total", list_countries().size()}};
    });

    handlers_.emplace(Intent::pm25_forecast_monthly,
                      [this](const ParsedQuery &query, std::string_view) {
                          return forecast_monthly(query);
                      });

    handlers_.emplace(Intent::pm25_forecast, [this](const ParsedQuery &query, std::string_view) {
        return forecast(query);
    });
}

ChatResult ChatService::handle(std::string_view message) const {
    auto result = ChatResult{};
    if (message.size() > MaxMessageLength) {
        result.error = ChatError{
            .kind = ErrorKind::message_too_long,
            .message = fmt::format("The question is longer than {} characters", MaxMessageLength),
            .supported = {}};
        return result;
    }

    try {
        result.parsed = parser_.parse(message);
        result.intent = dispatcher_.dispatch(result.parsed, message);
        if (result.intent == Intent::unrecognized) {
            result.data = json{{"examples", unrecognized_examples()}};
            result.error =
                ChatError{.kind = ErrorKind::unrecognized_intent,
                          .message = "The question does not match any supported analysis",
                          .supported = {}};
            return result;
        }

        const auto lowered = core::collapse_whitespace(core::to_lower(message));
        result.data = handlers_.at(result.intent)(result.parsed, lowered);
    } catch (const UnknownRegionError &ex) {
        result.error =
            ChatError{.kind = ex.kind(), .message = ex.message(), .supported = ex.supported()};
    } catch (const AnalysisError &ex) {
        result.error = ChatError{.kind = ex.kind(), .message = ex.message(), .supported = {}};
    } catch (const std::exception &ex) {
        fmt::print(stderr, fg(fmt::color::red), "Internal error answering '{}': {}\n", message,
                   ex.what());
        result.data = nullptr;
        result.error = ChatError{.kind = ErrorKind::internal_error,
                                 .message = "Internal error while answering the question",
                                 .supported = {}};
    }

    return result;
}

ForecastPoint ChatService::predict(std::string_view country, int year) const {
    return forecaster_.forecast(country, year);
}

ForecastHealth ChatService::health_risk(std::string_view country, int year,
                                        std::optional<core::AgeGroup> age_group,
                                        std::optional<std::string> disease) const {
    auto point = forecaster_.forecast(country, year);
    auto health = engine_.attributable_deaths(point.country, year, point.pm25, age_group);
    if (disease.has_value()) {
        health = HealthRiskEngine::filter_disease(std::move(health), disease.value());
    }

    return ForecastHealth{.forecast = std::move(point), .health = std::move(health)};
}

const std::vector<std::string> &ChatService::list_countries() const noexcept {
    return data_.countries();
}

ServiceStatus ChatService::status() const {
    auto status = ServiceStatus{};
    status.model_loaded = !data_.model().features().empty();
    status.model_name = data_.model().name();
    status.country_count = data_.countries().size();
    status.disease_count = data_.diseases().size();
    status.extended_detail = data_.has_age_detail();
    status.current_year = data_.current_year();

    auto first = 0;
    auto last = 0;
    for (const auto &country : data_.countries()) {
        auto year = forecaster_.last_observed_year(country);
        first = first == 0 ? year : std::min(first, year);
        last = std::max(last, year);
    }

    status.last_observed_years = core::YearInterval{first, last};
    return status;
}

int ChatService::year_of(const ParsedQuery &query) const {
    return query.year.value_or(data_.current_year());
}

AnalysisScope ChatService::scope_of(const ParsedQuery &query) const {
    if (query.countries.size() >= 2) {
        return AnalysisScope{.label = "Custom", .countries = query.countries};
    }

    if (query.region.has_value()) {
        return AnalysisScope{.label = query.region.value(),
                             .countries = regions_.resolve(query.region.value())};
    }

    return AnalysisScope{.label = RegionResolver::GlobalRegion, .countries = regions_.available()};
}

core::YearInterval ChatService::trend_window(const ParsedQuery &query) const {
    if (query.year_range.has_value()) {
        return query.year_range.value();
    }

    auto current = data_.current_year();
    if (query.year.has_value() && query.year.value() != current) {
        auto year = query.year.value();
        return core::YearInterval{std::min(year, current), std::max(year, current)};
    }

    return core::YearInterval{current, current + DefaultTrendYears};
}

const std::string &ChatService::require_country(const ParsedQuery &query) {
    if (!query.country.has_value()) {
        throw MissingEntityError("country", "A country is required to answer this question");
    }

    return query.country.value();
}

json ChatService::scenario(const ParsedQuery &query, std::string_view lowered) const {
    if (!query.country.has_value()) {
        return sensitivity(query);
    }

    auto year = year_of(query);
    if (contains_any(lowered, {"who guideline", "who limit", "who standard", "meet the who"})) {
        return json(analytics_.scenario_to_target(query.country.value(), year,
                                                  analytics_.options().who_guideline,
                                                  query.age_group));
    }

    auto percent = query.percent.value_or(analytics_.options().default_scenario_percent);
    auto sign = query.percent_sign.value_or(-1);
    return json(
        analytics_.scenario(query.country.value(), year, percent, sign, query.age_group));
}

json ChatService::sensitivity(const ParsedQuery &query) const {
    auto delta = std::optional<double>{};
    if (query.percent.has_value()) {
        delta = query.percent.value() * query.percent_sign.value_or(-1);
    }

    return json(analytics_.sensitivity(scope_of(query), year_of(query), delta));
}

json ChatService::health(const ParsedQuery &query) const {
    return json(health_risk(require_country(query), year_of(query), query.age_group,
                            query.disease));
}

json ChatService::dalys(const ParsedQuery &query) const {
    if (!query.country.has_value() || query.countries.size() >= 2) {
        return json(
            analytics_.lowest_health_burden(scope_of(query), year_of(query), "dalys", false));
    }

    auto result = health_risk(query.country.value(), year_of(query), query.age_group,
                              query.disease);
    auto data = json(result);
    data["dalys"] = HealthRiskEngine::dalys(result.health.total_deaths);
    data["dalys_ci_low"] = HealthRiskEngine::dalys(result.health.ci_low);
    data["dalys_ci_high"] = HealthRiskEngine::dalys(result.health.ci_high);
    data["dalys_per_death"] = HealthRiskEngine::DalysPerDeath;
    return data;
}

json ChatService::deaths_change(const ParsedQuery &query) const {
    if (query.country.has_value() && query.countries.size() < 2) {
        return json(analytics_.deaths_change_yoy(query.country.value(), year_of(query)));
    }

    return json(analytics_.rank_deaths_change(scope_of(query), year_of(query)));
}

json ChatService::highest_risk(const ParsedQuery &query) const {
    auto ranking = analytics_.rank_risk(scope_of(query), year_of(query), false);
    auto top = ranking.entries.empty() ? json(nullptr) : json(ranking.entries.front());
    return json{{"top", top}, {"ranking", ranking}};
}

json ChatService::compare(const ParsedQuery &query) const {
    if (query.countries.size() < 2) {
        throw MissingEntityError("countries", "A comparison needs two countries");
    }

    return json(analytics_.compare_health(query.countries[0], query.countries[1], year_of(query),
                                          query.age_group));
}

json ChatService::forecast_monthly(const ParsedQuery &query) const {
    const auto &country = require_country(query);
    if (!query.month.has_value()) {
        return json(forecaster_.monthly(country, year_of(query)));
    }

    return json(forecaster_.monthly(country, year_of(query), query.month.value()));
}

json ChatService::forecast(const ParsedQuery &query) const {
    const auto &country = require_country(query);
    auto year = year_of(query);
    auto point = forecaster_.forecast(country, year);
    auto data = json(point);
    data["aqi_category"] = HealthRiskEngine::aqi_category(point.pm25);
    data["interval"] = pm25_interval(point.pm25, point.confidence.score);
    if (point.is_predicted) {
        data["path"] = forecaster_.path(point.country, year);
    }

    return data;
}

} // namespace haq
