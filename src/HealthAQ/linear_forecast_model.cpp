#include "linear_forecast_model.h"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace haq {

double ForecastFeatures::value(std::string_view feature) const {
    if (feature == "lag_1y") {
        return lag_1y;
    }
    if (feature == "lag_3y") {
        return lag_3y;
    }
    if (feature == "yoy_change") {
        return yoy_change;
    }
    if (feature == "yoy_pct_change") {
        return yoy_pct_change;
    }
    if (feature == "rolling_mean_3y") {
        return rolling_mean_3y;
    }
    if (feature == "rolling_mean_5y") {
        return rolling_mean_5y;
    }
    if (feature == "year") {
        return year;
    }

    throw std::out_of_range(fmt::format("Unknown forecast feature: {}", feature));
}

const std::vector<std::string> &ForecastFeatures::names() {
    static const auto feature_names = std::vector<std::string>{
        "lag_1y",          "lag_3y",          "yoy_change", "yoy_pct_change",
        "rolling_mean_3y", "rolling_mean_5y", "year"};
    return feature_names;
}

LinearForecastModel::LinearForecastModel(
    std::string name, double intercept,
    const std::vector<std::pair<std::string, double>> &coefficients)
    : name_{std::move(name)}, intercept_{intercept},
      coefficients_(static_cast<Eigen::Index>(coefficients.size())) {
    if (coefficients.empty()) {
        throw std::invalid_argument(
            fmt::format("Forecast model '{}' has no coefficients.", name_));
    }

    const auto &known = ForecastFeatures::names();
    auto index = Eigen::Index{0};
    for (const auto &[feature, value] : coefficients) {
        if (std::find(known.cbegin(), known.cend(), feature) == known.cend()) {
            throw std::invalid_argument(
                fmt::format("Forecast model '{}' unknown feature: {}", name_, feature));
        }

        features_.emplace_back(feature);
        coefficients_(index++) = value;
    }
}

LinearForecastModel::LinearForecastModel(const core::LinearModelData &definition)
    : LinearForecastModel(definition.name, definition.intercept, definition.coefficients) {}

std::optional<double> LinearForecastModel::coefficient(std::string_view feature) const {
    auto it = std::find(features_.cbegin(), features_.cend(), feature);
    if (it == features_.cend()) {
        return std::nullopt;
    }

    return coefficients_(std::distance(features_.cbegin(), it));
}

double LinearForecastModel::predict(const ForecastFeatures &features) const {
    auto x = Eigen::VectorXd(coefficients_.size());
    for (auto i = Eigen::Index{0}; i < x.size(); i++) {
        x(i) = features.value(features_[static_cast<std::size_t>(i)]);
    }

    return intercept_ + coefficients_.dot(x);
}

} // namespace haq
