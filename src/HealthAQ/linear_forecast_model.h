#pragma once

#include "HealthAQ.Core/poco.h"

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace haq {

/// @brief Input features of one recursive forecasting step for year Y
///
/// All lag and rolling values are computed from the working history ending at Y-1.
struct ForecastFeatures {
    double lag_1y{};
    double lag_3y{};
    double yoy_change{};
    double yoy_pct_change{};
    double rolling_mean_3y{};
    double rolling_mean_5y{};
    double year{};

    /// @brief Gets a feature value by name
    /// @param feature The feature name, e.g. lag_1y
    /// @return The feature value
    /// @throws std::out_of_range for unknown feature names.
    double value(std::string_view feature) const;

    /// @brief Gets the names of all features, in declaration order
    static const std::vector<std::string> &names();
};

/// @brief PM2.5 forecasting linear model: intercept plus weighted features.
///
/// Immutable after construction, safe to share between concurrent requests.
class LinearForecastModel {
  public:
    LinearForecastModel() = delete;

    /// @brief Initialises a new instance of the LinearForecastModel class
    /// @param name The model name
    /// @param intercept The model intercept
    /// @param coefficients The coefficients by feature name
    /// @throws std::invalid_argument for empty or unknown feature names.
    LinearForecastModel(std::string name, double intercept,
                        const std::vector<std::pair<std::string, double>> &coefficients);

    /// @brief Initialises a new instance of the LinearForecastModel class
    /// @param definition The model definition read from the data store
    explicit LinearForecastModel(const core::LinearModelData &definition);

    const std::string &name() const noexcept { return name_; }

    double intercept() const noexcept { return intercept_; }

    /// @brief Gets a feature coefficient, if the model uses the feature
    /// @param feature The feature name
    /// @return The coefficient value, or std::nullopt
    std::optional<double> coefficient(std::string_view feature) const;

    /// @brief Gets the features used by the model, in coefficient order
    const std::vector<std::string> &features() const noexcept { return features_; }

    /// @brief Evaluates the model for a set of features, unclamped
    /// @param features The step features
    /// @return The predicted concentration
    double predict(const ForecastFeatures &features) const;

  private:
    std::string name_;
    double intercept_{};
    std::vector<std::string> features_;
    Eigen::VectorXd coefficients_;
};

} // namespace haq
