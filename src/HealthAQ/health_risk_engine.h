#pragma once

#include "reference_data.h"

#include "HealthAQ.Core/disease.h"
#include "HealthAQ.Core/forward_type.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haq {

/// @brief US EPA air quality index category of a PM2.5 concentration
struct AqiCategory {
    std::string level;

    /// @brief Display colour, hex RGB
    std::string color;
};

/// @brief Exposure attributable deaths of one disease
struct DiseaseImpact {
    std::string disease;
    std::string category;
    double baseline_deaths{};
    double relative_risk{1.0};
    double attributable_fraction{};
    double attributed_deaths{};
    double ci_low{};
    double ci_high{};
};

/// @brief Exposure attributable deaths of one age group
struct AgeGroupImpact {
    core::AgeGroup group{};

    /// @brief Display label, e.g. Elderly (65+)
    std::string label;

    double attributed_deaths{};
    double ci_low{};
    double ci_high{};

    /// @brief Share of the total attributed deaths, percent
    double percentage{};

    double vulnerability_multiplier{1.0};
};

/// @brief Exposure attributable health burden of a country and year
struct HealthResult {
    std::string country;
    int year{};

    /// @brief The baseline year actually used, nearest to the requested year
    std::optional<int> baseline_year;

    /// @brief The exposure, clamped to the TMREL
    double pm25{};

    double excess_exposure{};
    AqiCategory aqi_category;
    double total_deaths{};
    double ci_low{};
    double ci_high{};
    double rate_per_100k{};

    /// @brief Rate denominator: recorded population, else the baseline deaths proxy
    double population{};

    bool population_is_proxy{};
    std::optional<core::AgeGroup> age_group;

    /// @brief Per disease impacts, attributed deaths descending, ties by disease name
    std::vector<DiseaseImpact> per_disease;

    /// @brief Per age group impacts, only with the age stratified detail
    std::vector<AgeGroupImpact> age_breakdown;

    std::string data_note;
    std::optional<std::string> filter_applied;
};

/// @brief Two health results side by side, no cross normalisation
struct HealthComparison {
    HealthResult first;
    HealthResult second;
};

/// @brief Integrated exposure-response (IER) health impact engine.
///
/// Per disease with parameters (α, γ, δ):
/// \code
///   exposure = max(0, pm25 - TMREL)
///   RR       = 1 + α (1 - exp(-γ exposure^δ))
///   AF       = (RR - 1) / RR
///   deaths   = baseline × multiplier(age group) × AF
/// \endcode
/// The confidence interval of the aggregated path is a fixed ±20% of the central estimate.
class HealthRiskEngine {
  public:
    /// @brief Disability-adjusted life years per attributed death
    static constexpr double DalysPerDeath = 12.5;

    HealthRiskEngine() = delete;

    /// @brief Initialises a new instance of the HealthRiskEngine class
    /// @param data The reference data
    explicit HealthRiskEngine(const ReferenceData &data);

    /// @brief Computes the relative risk of a disease, always >= 1
    static double relative_risk(const core::DiseaseInfo &disease, double pm25) noexcept;

    /// @brief Computes the attributable fraction of a disease, always in [0, 1)
    static double attributable_fraction(const core::DiseaseInfo &disease, double pm25) noexcept;

    /// @brief Gets the age group vulnerability multiplier
    static double age_multiplier(core::AgeGroup group) noexcept;

    /// @brief Gets the age group display label
    static std::string age_label(core::AgeGroup group);

    /// @brief Maps an age band name, e.g. `65-69 years` or `<1 year`, to its age group
    static std::optional<core::AgeGroup> age_group_of_band(std::string_view band);

    /// @brief Converts attributed deaths to DALYs
    static double dalys(double deaths) noexcept { return deaths * DalysPerDeath; }

    /// @brief Gets the AQI category of a concentration
    static AqiCategory aqi_category(double pm25);

    /// @brief Keeps only the disease rows matching a name, totals recomputed
    /// @param result The health result
    /// @param disease The disease name, case-insensitive
    /// @return The filtered result, or the unchanged result when nothing matches
    static HealthResult filter_disease(HealthResult result, std::string_view disease);

    /// @brief Computes the attributable deaths of a country and year
    /// @param country The country name
    /// @param year The analysis year, the nearest baseline year is used
    /// @param pm25 The exposure, clamped to the TMREL first
    /// @param age_group Optional age group weighting
    /// @return The health result
    /// @throws UnknownCountryError for unknown countries.
    HealthResult attributable_deaths(std::string_view country, int year, double pm25,
                                     std::optional<core::AgeGroup> age_group = {}) const;

    /// @brief Gets the diseases with the highest attributed deaths
    std::vector<DiseaseImpact> top_diseases(std::string_view country, int year, double pm25,
                                            std::size_t count) const;

    /// @brief Computes two health results side by side
    HealthComparison compare_health(std::string_view first, double first_pm25,
                                    std::string_view second, double second_pm25,
                                    int year) const;

    const ReferenceData &data() const noexcept { return data_; }

  private:
    const ReferenceData &data_;

    void aggregated_path(HealthResult &result, std::optional<core::AgeGroup> age_group) const;
    void stratified_path(HealthResult &result, const AgeDetailLookup &detail,
                         std::optional<core::AgeGroup> age_group) const;
    void assign_rate(HealthResult &result, double baseline_total) const;
};

} // namespace haq
