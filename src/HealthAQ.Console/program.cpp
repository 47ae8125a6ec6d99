#include "HealthAQ.Input/configuration.h"
#include "HealthAQ.Input/datamanager.h"
#include "HealthAQ/chat_service.h"
#include "HealthAQ/result_assembler.h"
#include "command_options.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/task_arena.h>
#include <string>

namespace {
/// @brief Get a string representation of current system time
/// @return The system time as string
std::string get_time_now_str() {
    auto tp = std::chrono::system_clock::now();
    return fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch());
}

/// @brief Prints application start-up messages, to the error stream
void print_app_title() {
    fmt::print(stderr, fg(fmt::color::yellow) | fmt::emphasis::bold,
               "\n# HealthAQ PM2.5 Exposure and Health Burden Analytics #\n\n");

    fmt::print(stderr, "Today: {}\nMaximum threads: {}\n\n", get_time_now_str(),
               tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
}

/// @brief Prints application exit message
/// @param exit_code The application exit code
/// @return The respective exit code
int exit_application(int exit_code) {
    fmt::print(stderr, fg(fmt::color::yellow) | fmt::emphasis::bold, "\nGoodbye.");
    fmt::print(stderr, " {}.\n\n", get_time_now_str());
    return exit_code;
}

void print_json(const nlohmann::json &value) { fmt::print("{}\n", value.dump()); }

/// @brief Answers one message per input line until the end of the stream
void run_interactive(const haq::ChatService &service) {
    fmt::print(stderr, fg(fmt::color::cyan), "Ask a question, one per line (Ctrl-D to exit).\n");
    auto line = std::string{};
    while (std::getline(std::cin, line)) {
        if (haq::core::trim(line).empty()) {
            continue;
        }

        print_json(nlohmann::json(service.handle(line)));
    }
}
} // anonymous namespace

/// @brief HealthAQ host application entry point
/// @param argc The number of command arguments
/// @param argv The list of arguments provided
/// @return The application exit code
int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace haq;
    using namespace haq::input;

    auto options = create_options();
    if (argc < 2) {
        std::cout << options.help() << '\n';
        return exit_application(EXIT_FAILURE);
    }

    print_app_title();

    std::optional<CommandOptions> cmd_args_opt;
    try {
        cmd_args_opt = parse_arguments(options, argc, argv);
        if (!cmd_args_opt) {
            return exit_application(EXIT_SUCCESS);
        }
    } catch (const std::exception &ex) {
        fmt::print(stderr, fg(fmt::color::red), "\nInvalid command line argument: {}\n",
                   ex.what());
        fmt::print(stderr, "\n{}\n", options.help());
        return exit_application(EXIT_FAILURE);
    }

    const auto &cmd_args = cmd_args_opt.value();

    auto threads = cmd_args.num_threads > 0
                       ? cmd_args.num_threads
                       : static_cast<size_t>(tbb::this_task_arena::max_concurrency());
    auto thread_control =
        tbb::global_control(tbb::global_control::max_allowed_parallelism, threads);

    Configuration config;
    try {
        config = get_configuration(cmd_args.config_file, cmd_args.verbose);
        if (cmd_args.storage_folder.has_value()) {
            config.data_source = cmd_args.storage_folder.value();
        }

        if (cmd_args.current_year.has_value()) {
            config.current_year = cmd_args.current_year.value();
        }
    } catch (const std::exception &ex) {
        fmt::print(stderr, fg(fmt::color::red), "\n\nInvalid configuration - {}.\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    try {
        auto data_api = DataManager(config.data_source, config.verbosity);
        auto reference = load_reference_data(data_api, config);
        auto service = ChatService(*reference, create_analytics_options(config));
        auto target_year = cmd_args.target_year.value_or(config.current_year);

        if (cmd_args.status) {
            print_json(nlohmann::json(service.status()));
        } else if (cmd_args.list_countries) {
            const auto &countries = service.list_countries();
            print_json(nlohmann::json{{"countries", countries}, {"total", countries.size()}});
        } else if (cmd_args.predict_country.has_value()) {
            print_json(nlohmann::json(service.predict(cmd_args.predict_country.value(),
                                                      target_year)));
        } else if (cmd_args.health_country.has_value()) {
            print_json(nlohmann::json(service.health_risk(cmd_args.health_country.value(),
                                                          target_year)));
        } else if (cmd_args.query.has_value()) {
            print_json(nlohmann::json(service.handle(cmd_args.query.value())));
        } else {
            run_interactive(service);
        }
    } catch (const std::exception &ex) {
        fmt::print(stderr, fg(fmt::color::red), "\n\nFailed with message: {}.\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    return exit_application(EXIT_SUCCESS);
}
