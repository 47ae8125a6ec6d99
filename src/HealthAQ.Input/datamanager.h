#pragma once

#include "HealthAQ.Core/api.h"

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace haq::input {

using namespace haq::core;

/// @brief Implements HealthAQ back-end data store interface using a file-based storage
///
/// The storage is a folder indexed by a file, `index.json`, with a versioned schema
/// defining the storage sub-folders structure, file names and the diseases registry.
/// Every table is a CSV file with a header row, columns are matched by name,
/// case-insensitive, and may appear in any order.
class DataManager : public Datastore {
  public:
    DataManager() = delete;

    /// @brief Initialises a new instance of the haq::input::DataManager class.
    /// @param data_path The path to the directory containing the data.
    /// @param verbosity The terminal logging verbosity mode to use.
    /// @throws std::runtime_error for missing or invalid index.json file.
    explicit DataManager(std::filesystem::path data_path,
                         VerboseMode verbosity = VerboseMode::none);

    std::vector<Country> get_countries() const override;

    Country get_country(const std::string &name_or_alpha) const override;

    std::vector<DiseaseInfo> get_diseases() const override;

    std::vector<PM25Item> get_pm25_history() const override;

    std::vector<BaselineDeathItem> get_baseline_deaths() const override;

    LinearModelData get_forecast_model() const override;

    /// @brief Loads the optional age stratified baseline deaths
    ///
    /// The detail is an optional enrichment: a missing or unreadable file yields an
    /// empty collection, reported as a warning, and the aggregated baseline is used.
    /// @param file_path The detail CSV file, relative paths resolve to the store root
    /// @return The age band records, empty if unavailable
    std::vector<AgeDeathItem> get_age_detail(const std::filesystem::path &file_path) const;

    const std::filesystem::path &root() const noexcept { return root_; }

  private:
    std::filesystem::path root_;
    VerboseMode verbosity_;
    nlohmann::json index_;

    std::filesystem::path resolve_file(const std::string &node, std::string_view what) const;

    static std::map<std::string, std::size_t>
    create_fields_index_mapping(const std::vector<std::string> &column_names,
                                const std::vector<std::string> &fields);

    void notify_warning(std::string_view message) const;
};

} // namespace haq::input
