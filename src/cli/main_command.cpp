#include "main_command.hpp"
#include "livebar/common/config.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/logger.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

namespace livebar {
namespace cli {

namespace {

// "r,g,b" selects an RGB triple; anything else is passed through as a
// palette name or hex string.
format::ColorSpec parseColorArgument(const std::string& text) {
    if (text.find(',') == std::string::npos) {
        return text;
    }

    std::array<int, 3> channels{};
    std::istringstream stream(text);
    std::string part;
    size_t count = 0;
    while (std::getline(stream, part, ',')) {
        if (count >= channels.size()) {
            return text;
        }
        try {
            channels[count++] = std::stoi(part);
        } catch (const std::exception&) {
            return text;
        }
    }
    if (count != channels.size()) {
        return text;
    }
    return channels;
}

}

MainCommand::MainCommand() {
    auto defaults = core::BarOptions::fromConfig();
    bar_style_ = defaults.bar_style;
    color_ = std::get<std::string>(defaults.color);
    width_ = defaults.width;
    unit_ = defaults.unit;
    unit_scale_ = defaults.unit_scale;
    smoothing_ = defaults.smoothing;
    log_interval_ = defaults.log_interval;
    log_timestamp_ = defaults.log_timestamp;
}

MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    if (delay_ms_ < 0) {
        std::cerr << "Error: --delay-ms must not be negative\n";
        return false;
    }
    return true;
}

void MainCommand::addBarOptions(CLI::App* subcommand) {
    subcommand->add_option("-d,--desc", desc_, "Label printed before the bar");
    subcommand->add_option("-s,--style", bar_style_, "classic, gradient, braille, circles or blocks")
        ->capture_default_str();
    subcommand->add_option("--color", color_, "Palette name, #hex or r,g,b")
        ->capture_default_str();
    subcommand->add_option("-w,--width", width_, "Columns reserved for the glyphs")
        ->capture_default_str();
    subcommand->add_option("--unit", unit_, "Unit label")->capture_default_str();
    subcommand->add_option("--unit-scale", unit_scale_, "none, kmg or binary")
        ->capture_default_str();
    subcommand->add_option("--smoothing", smoothing_, "Rate smoothing factor in [0, 1]")
        ->capture_default_str();
    subcommand->add_option("--log-interval", log_interval_,
                           "Seconds between status lines when stdout is not a terminal")
        ->capture_default_str();
    subcommand->add_flag("--log-timestamp", log_timestamp_, "Timestamp status lines");
    subcommand->add_option("--delay-ms", delay_ms_, "Artificial work per step in milliseconds")
        ->capture_default_str();
}

core::BarOptions MainCommand::barOptions() const {
    auto options = core::BarOptions::fromConfig();
    options.desc = desc_;
    options.bar_style = bar_style_;
    options.color = parseColorArgument(color_);
    options.width = width_;
    options.unit = unit_;
    options.unit_scale = unit_scale_;
    options.smoothing = smoothing_;
    options.log_interval = log_interval_;
    options.log_timestamp = log_timestamp_;
    return options;
}

void MainCommand::pause() const {
    if (delay_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    }
}

void MainCommand::printHelp() const {
    std::cout << constants::system::DEMO_NAME << " - Live terminal progress bars\n\n";
    std::cout << "Usage: " << constants::system::DEMO_NAME << " [OPTIONS] COMMAND [ARGS]...\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH    Configuration file path\n";
    std::cout << "  --log-level LEVEL    debug, info, warn or error\n";
    std::cout << "  --log-file PATH      Write diagnostics to a rotating log file\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version information\n\n";
    std::cout << "Commands:\n";
    std::cout << "  bar                  Single determinate bar\n";
    std::cout << "  group                Several bars drawn as one block\n";
    std::cout << "  spin                 Indeterminate bar\n";
    std::cout << "  threads              One thread-safe bar fed from a worker pool\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << constants::system::DEMO_NAME << " bar --total 200 --style braille\n";
    std::cout << "  " << constants::system::DEMO_NAME << " group --remove-middle\n";
    std::cout << "  " << constants::system::DEMO_NAME << " threads --items 500 | cat\n";
}

void MainCommand::printVersion() const {
    std::cout << constants::version::getFullVersion() << "\n";
}

}}
