#include "bar_command.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/common/logger.hpp"
#include "livebar/core/progress_bar.hpp"
#include <iostream>
#include <spdlog/fmt/fmt.h>

namespace livebar {
namespace cli {

BarCommand::BarCommand() : was_called_(false) {}

void BarCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    addBarOptions(subcommand);

    subcommand->add_option("-t,--total", total_, "Number of steps")->capture_default_str();
    subcommand->add_option("--suffix-every", suffix_every_,
                           "Replace the suffix every N steps (0 disables)");
    subcommand->add_flag("--overshoot", overshoot_, "Run ten percent past the total");

    subcommand->callback([this]() { was_called_ = true; });
}

bool BarCommand::wasCalled() const {
    return was_called_;
}

int BarCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    auto options = barOptions();
    options.total = total_;
    if (options.desc.empty()) {
        options.desc = "Processing";
    }

    try {
        core::ProgressBar bar(options);
        common::Logger::instance().info("[BarCommand] Started | total={} | mode={}",
                                        total_, common::to_string(bar.mode()));

        int64_t steps = overshoot_ ? total_ + total_ / 10 : total_;
        for (int64_t i = 1; i <= steps; ++i) {
            pause();
            bar.update();
            if (suffix_every_ > 0 && i % suffix_every_ == 0) {
                bar.setSuffix(fmt::format("checkpoint {}", i / suffix_every_));
            }
        }
        bar.close();
        common::Logger::instance().info("[BarCommand] Finished | current={}", bar.current());
    } catch (const common::BarError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

}}
