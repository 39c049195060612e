#include "group_command.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/common/logger.hpp"
#include "livebar/group/progress_group.hpp"
#include <iostream>
#include <spdlog/fmt/fmt.h>

namespace livebar {
namespace cli {

GroupCommand::GroupCommand() : was_called_(false) {}

void GroupCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    addBarOptions(subcommand);

    subcommand->add_option("-n,--steps", steps_, "Steps of the slowest bar")->capture_default_str();
    subcommand->add_flag("--remove-middle", remove_middle_, "Remove the second bar half way");

    subcommand->callback([this]() { was_called_ = true; });
}

bool GroupCommand::wasCalled() const {
    return was_called_;
}

int GroupCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }
    if (steps_ <= 0) {
        std::cerr << "Error: --steps must be positive\n";
        return 1;
    }

    try {
        group::ProgressGroup group(group::GroupOptions::fromConfig());

        auto download_options = barOptions();
        download_options.desc = "Download";
        download_options.color = std::string("green");
        download_options.total = static_cast<int64_t>(steps_) * 3 * 1024;
        download_options.unit = "B";
        download_options.unit_scale = "binary";

        auto extract_options = barOptions();
        extract_options.desc = "Extract";
        extract_options.color = std::string("magenta");
        extract_options.total = steps_ * 2;

        auto index_options = barOptions();
        index_options.desc = "Index";
        index_options.total = steps_;

        auto download = group.addBar(download_options);
        auto extract = group.addBar(extract_options);
        auto index = group.addBar(index_options);

        for (int i = 1; i <= steps_; ++i) {
            pause();
            download->update(3 * 1024);
            if (extract) {
                extract->update(2);
            }
            index->update();
            index->setSuffix(fmt::format("document {} of {}", i, steps_));

            if (i == steps_ / 2) {
                group.println(fmt::format("half way: {} documents indexed", i));
                if (remove_middle_ && extract) {
                    group.removeBar(extract);
                    extract.reset();
                }
            }
        }
        group.close();
    } catch (const common::BarError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

}}
