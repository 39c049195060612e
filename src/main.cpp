#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "livebar/common/config.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/bar_command.hpp"
#include "cli/group_command.hpp"
#include "cli/spin_command.hpp"
#include "cli/threads_command.hpp"

namespace {

// Global flags have to be known before the subcommands are built, since the
// subcommands take their defaults from the loaded configuration.
std::string find_flag_value(int argc, char** argv, const std::string& long_name,
                            const std::string& short_name = "") {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == long_name || (!short_name.empty() && arg == short_name)) && i + 1 < argc) {
            return argv[i + 1];
        }
        std::string prefix = long_name + "=";
        if (arg.rfind(prefix, 0) == 0) {
            return arg.substr(prefix.size());
        }
    }
    return "";
}

}

int main(int argc, char** argv) {
    try {
        CLI::App app{"Live terminal progress bar demonstrations", livebar::constants::system::DEMO_NAME};
        app.set_version_flag("--version,-v", livebar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level;
        std::string log_file;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "debug, info, warn or error");
        app.add_option("--log-file", log_file, "Write diagnostics to a rotating log file");

        auto& config = livebar::common::Config::instance();
        std::string early_config = find_flag_value(argc, argv, "--config", "-c");
        if (!config.load(early_config)) {
            std::cerr << "Error: configuration could not be loaded";
            if (!config.currentConfigPath().empty()) {
                std::cerr << " from " << config.currentConfigPath();
            }
            std::cerr << std::endl;
            return 1;
        }

        auto logging = config.global().logging;
        std::string early_level = find_flag_value(argc, argv, "--log-level");
        if (!early_level.empty()) {
            auto parsed = livebar::common::Config::parseLogLevel(early_level);
            if (!parsed) {
                std::cerr << "Error: unknown log level: " << early_level << std::endl;
                return 1;
            }
            logging.level = *parsed;
        }
        std::string early_log_file = find_flag_value(argc, argv, "--log-file");
        if (!early_log_file.empty()) {
            logging.log_file = early_log_file;
        }

        bool to_file = !logging.log_file.empty();
        livebar::common::Logger::instance().initialize(
            to_file ? livebar::common::LogMode::FILE_ONLY : livebar::common::LogMode::CONSOLE_ONLY,
            logging
        );

        auto bar_cmd = std::make_unique<livebar::cli::BarCommand>();
        auto group_cmd = std::make_unique<livebar::cli::GroupCommand>();
        auto spin_cmd = std::make_unique<livebar::cli::SpinCommand>();
        auto threads_cmd = std::make_unique<livebar::cli::ThreadsCommand>();

        bar_cmd->setup(app.add_subcommand("bar", "Single determinate bar"));
        group_cmd->setup(app.add_subcommand("group", "Several bars drawn as one block"));
        spin_cmd->setup(app.add_subcommand("spin", "Indeterminate bar"));
        threads_cmd->setup(app.add_subcommand("threads", "One thread-safe bar fed from a worker pool"));

        CLI11_PARSE(app, argc, argv);

        int result = 0;
        if (bar_cmd->wasCalled()) {
            result = bar_cmd->execute();
        } else if (group_cmd->wasCalled()) {
            result = group_cmd->execute();
        } else if (spin_cmd->wasCalled()) {
            result = spin_cmd->execute();
        } else if (threads_cmd->wasCalled()) {
            result = threads_cmd->execute();
        } else {
            livebar::cli::MainCommand().printHelp();
        }

        livebar::common::Logger::instance().shutdown();
        return result;

    } catch (const CLI::ParseError& e) {
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
