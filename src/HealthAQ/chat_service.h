#pragma once

#include "analytics_result.h"
#include "executive_analytics.h"
#include "health_risk_engine.h"
#include "intent_dispatcher.h"
#include "pm25_forecaster.h"
#include "query_parser.h"
#include "reference_data.h"
#include "region_resolver.h"
#include "result_assembler.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace haq {

/// @brief Intent handler: parsed query and lower-case message to the analytics payload
using IntentHandler = std::function<json(const ParsedQuery &, std::string_view)>;

/// @brief The query-to-analytics pipeline service.
///
/// Owns the pipeline components, all built over one immutable ReferenceData instance
/// that must outlive the service. Every request runs on request-local state only, the
/// service can answer concurrent requests without locking.
class ChatService {
  public:
    ChatService() = delete;

    /// @brief Initialises a new instance of the ChatService class
    /// @param data The reference data
    /// @param options The executive analytics defaults
    explicit ChatService(const ReferenceData &data, AnalyticsOptions options = {});

    ChatService(const ChatService &) = delete;
    ChatService(ChatService &&) = delete;
    ChatService &operator=(const ChatService &) = delete;
    ChatService &operator=(ChatService &&) = delete;
    ~ChatService() = default;

    /// @brief Answers one free text message.
    ///
    /// Analysis errors are converted into the result `error` field, unexpected faults
    /// are logged and reported as internal errors. Never throws for message content.
    /// @param message The message text
    /// @return The structured result
    ChatResult handle(std::string_view message) const;

    /// @brief Gets the PM2.5 forecast of a country
    /// @throws UnknownCountryError for unknown countries.
    ForecastPoint predict(std::string_view country, int year) const;

    /// @brief Gets the PM2.5 forecast and the attributable health burden at that level
    /// @param country The country name
    /// @param year The target year
    /// @param age_group Optional age group weighting
    /// @param disease Optional disease filter, case-insensitive
    ForecastHealth health_risk(std::string_view country, int year,
                               std::optional<core::AgeGroup> age_group = {},
                               std::optional<std::string> disease = {}) const;

    /// @brief Gets the known country names, ordered
    const std::vector<std::string> &list_countries() const noexcept;

    ServiceStatus status() const;

    const QueryParser &parser() const noexcept { return parser_; }

    const IntentDispatcher &dispatcher() const noexcept { return dispatcher_; }

    const ExecutiveAnalytics &analytics() const noexcept { return analytics_; }

  private:
    const ReferenceData &data_;
    RegionResolver regions_;
    QueryParser parser_;
    IntentDispatcher dispatcher_;
    PM25Forecaster forecaster_;
    HealthRiskEngine engine_;
    ExecutiveAnalytics analytics_;
    std::unordered_map<Intent, IntentHandler> handlers_;

    void register_handlers();

    int year_of(const ParsedQuery &query) const;
    AnalysisScope scope_of(const ParsedQuery &query) const;
    core::YearInterval trend_window(const ParsedQuery &query) const;
    static const std::string &require_country(const ParsedQuery &query);

    json scenario(const ParsedQuery &query, std::string_view lowered) const;
    json sensitivity(const ParsedQuery &query) const;
    json health(const ParsedQuery &query) const;
    json dalys(const ParsedQuery &query) const;
    json deaths_change(const ParsedQuery &query) const;
    json highest_risk(const ParsedQuery &query) const;
    json compare(const ParsedQuery &query) const;
    json forecast_monthly(const ParsedQuery &query) const;
    json forecast(const ParsedQuery &query) const;
};

} // namespace haq
