#include "data_config.h"
#include "pch.h"

#include "HealthAQ.Core/exception.h"
#include "HealthAQ.Input/configuration.h"
#include "HealthAQ.Input/jsonparser.h"
#include "HealthAQ.Input/schema.h"

#include <fstream>
#include <random>
#include <sstream>

using json = nlohmann::json;
using namespace haq::input;

namespace {

constexpr auto *MINIMAL_CONFIG = R"(
        {
            "data": { "source": "store" },
            "current_year": 2026
        })";

constexpr auto *FULL_CONFIG = R"(
        {
            "$schema": "https://healthaq.github.io/schemas/v1/config.json",
            "data": { "source": "store" },
            "current_year": 2030,
            "extended_detail": "store/detail.csv",
            "analysis": {
                "window": [2018, 2024],
                "sensitivity_percent": -10,
                "default_scenario_percent": 25,
                "who_guideline": 10
            }
        })";

class TempDir {
  public:
    TempDir() : rnd_{std::random_device()()} {
        path_ = std::filesystem::path{::testing::TempDir()} / "haq" / random_string();
        if (!std::filesystem::create_directories(path_)) {
            throw std::runtime_error{"Could not create temp dir"};
        }

        path_ = std::filesystem::absolute(path_);
    }

    ~TempDir() {
        if (std::filesystem::exists(path_)) {
            std::filesystem::remove_all(path_);
        }
    }

    std::string random_string() const { return std::to_string(rnd_()); }

    const auto &path() const { return path_; }

  private:
    mutable std::mt19937 rnd_;
    std::filesystem::path path_;
};

class ConfigParsingFixture : public ::testing::Test {
  public:
    const auto &tmp_path() const { return dir_.path(); }

    std::filesystem::path write_config(const std::string &content) const {
        auto file_path = tmp_path() / (dir_.random_string() + ".json");
        std::ofstream ofs{file_path};
        ofs << content;
        return file_path;
    }

  private:
    TempDir dir_;
};

} // anonymous namespace

TEST_F(ConfigParsingFixture, MinimalConfigUsesDefaults) {
    auto config = get_configuration(write_config(MINIMAL_CONFIG), false);

    ASSERT_EQ(tmp_path(), config.root_path);
    ASSERT_EQ((tmp_path() / "store").lexically_normal(), config.data_source);
    ASSERT_EQ(2026, config.current_year);
    ASSERT_FALSE(config.extended_detail.has_value());
    ASSERT_EQ(haq::core::VerboseMode::none, config.verbosity);

    auto options = create_analytics_options(config);
    ASSERT_EQ(haq::core::YearInterval(2020, 2030), options.window);
    ASSERT_DOUBLE_EQ(-5.0, options.sensitivity_percent);
    ASSERT_DOUBLE_EQ(15.0, options.default_scenario_percent);
    ASSERT_DOUBLE_EQ(5.0, options.who_guideline);
}

TEST_F(ConfigParsingFixture, FullConfig) {
    auto config = get_configuration(write_config(FULL_CONFIG), true);

    ASSERT_EQ(2030, config.current_year);
    ASSERT_EQ(haq::core::VerboseMode::verbose, config.verbosity);
    ASSERT_EQ((tmp_path() / "store" / "detail.csv").lexically_normal(),
              config.extended_detail.value());

    auto options = create_analytics_options(config);
    ASSERT_EQ(haq::core::YearInterval(2018, 2024), options.window);
    ASSERT_DOUBLE_EQ(-10.0, options.sensitivity_percent);
    ASSERT_DOUBLE_EQ(25.0, options.default_scenario_percent);
    ASSERT_DOUBLE_EQ(10.0, options.who_guideline);
}

TEST_F(ConfigParsingFixture, MissingFileThrows) {
    ASSERT_THROW(get_configuration(tmp_path() / "missing.json", false), std::runtime_error);
}

TEST_F(ConfigParsingFixture, MissingRequiredKeyFailsValidation) {
    auto file_path = write_config(R"({ "data": { "source": "store" } })");
    ASSERT_ANY_THROW(get_configuration(file_path, false));
}

TEST_F(ConfigParsingFixture, WrongSchemaUrlThrows) {
    auto file_path = write_config(R"(
        {
            "$schema": "https://healthaq.github.io/schemas/v2/config.json",
            "data": { "source": "store" },
            "current_year": 2026
        })");

    ASSERT_THROW(get_configuration(file_path, false), std::runtime_error);
}

TEST_F(ConfigParsingFixture, SchemaRejectsInvalidValues) {
    auto file_path = write_config(R"(
        {
            "data": { "source": "store" },
            "current_year": 2026,
            "analysis": { "who_guideline": -1 }
        })");

    ASSERT_ANY_THROW(get_configuration(file_path, false));
}

TEST(ConfigParsing, InvalidAnalysisWindowThrows) {
    auto config = Configuration{};
    config.analysis.window = {2030, 2020};
    ASSERT_THROW(create_analytics_options(config), ConfigurationError);

    config.analysis.window = {2020};
    ASSERT_THROW(create_analytics_options(config), ConfigurationError);
}

TEST(ConfigParsing, ExampleConfigurationFile) {
    auto config = get_configuration(default_config_path(), false);

    ASSERT_EQ(2025, config.current_year);
    ASSERT_TRUE(std::filesystem::exists(config.data_source / "index.json"));
    ASSERT_TRUE(config.extended_detail.has_value());
    ASSERT_TRUE(std::filesystem::exists(config.extended_detail.value()));
}

TEST(ConfigParsing, ValidateIndexAgainstSchema) {
    auto ifs = std::ifstream{std::filesystem::path{default_datastore_path()} / "index.json"};
    ASSERT_TRUE(ifs.good());
    EXPECT_NO_THROW(validate_json(ifs, "data_index.json", 1));

    auto invalid = std::istringstream{R"({ "version": 1 })"};
    EXPECT_ANY_THROW(validate_json(invalid, "data_index.json", 1));
}

TEST(ConfigParsing, SchemaUrlOfInstalledSchema) {
    ASSERT_EQ("https://healthaq.github.io/schemas/v1/config.json", schema_url("config.json", 1));
    ASSERT_EQ("https://healthaq.github.io/schemas/v2/data_index.json",
              schema_url("data_index.json", 2));

    auto document = std::istringstream{R"({ "version": 1 })"};
    ASSERT_THROW(validate_json(document, "missing_schema.json", 1), haq::core::HaqException);
}

TEST(JsonParser, AnalysisInfoRoundTripKeepsMissingDefaults) {
    auto info = json::parse(R"({ "who_guideline": 15 })").get<AnalysisInfo>();
    ASSERT_DOUBLE_EQ(15.0, info.who_guideline);
    ASSERT_DOUBLE_EQ(15.0, info.default_scenario_percent);
    ASSERT_EQ((std::vector<int>{2020, 2030}), info.window);

    auto j = json(info);
    ASSERT_EQ(15.0, j["who_guideline"].get<double>());
    ASSERT_EQ(2u, j["window"].size());
}

TEST(JsonParser, ForecastModelInfo) {
    auto info = json::parse(R"(
        {
            "name": "m",
            "formula": "pm25 ~ lag_1y",
            "intercept": 1.5,
            "coefficients": { "lag_1y": { "value": 0.9, "pValue": 0.01 } }
        })")
                    .get<ForecastModelInfo>();

    ASSERT_EQ("m", info.name);
    ASSERT_DOUBLE_EQ(1.5, info.intercept);
    ASSERT_DOUBLE_EQ(0.9, info.coefficients.at("lag_1y").value);
    ASSERT_DOUBLE_EQ(0.01, info.coefficients.at("lag_1y").pvalue);
    ASSERT_DOUBLE_EQ(0.0, info.coefficients.at("lag_1y").std_error);
    ASSERT_DOUBLE_EQ(0.0, info.rsquared);

    ASSERT_THROW(json::parse(R"({ "name": "m" })").get<ForecastModelInfo>(), json::exception);
}
