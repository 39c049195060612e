#include "threads_command.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/common/logger.hpp"
#include "livebar/core/progress_bar.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <atomic>
#include <iostream>
#include <spdlog/fmt/fmt.h>

namespace livebar {
namespace cli {

ThreadsCommand::ThreadsCommand() : was_called_(false) {}

void ThreadsCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    addBarOptions(subcommand);

    subcommand->add_option("-n,--items", items_, "Work items")->capture_default_str();
    subcommand->add_option("-j,--threads", max_threads_, "Worker threads")->capture_default_str();

    subcommand->callback([this]() { was_called_ = true; });
}

bool ThreadsCommand::wasCalled() const {
    return was_called_;
}

int ThreadsCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }
    if (items_ <= 0 || max_threads_ <= 0) {
        std::cerr << "Error: --items and --threads must be positive\n";
        return 1;
    }

    auto options = barOptions();
    options.total = items_;
    options.thread_safe = true;
    if (options.desc.empty()) {
        options.desc = fmt::format("Workers x{}", max_threads_);
    }

    try {
        core::ProgressBar bar(options);
        std::atomic<int> failures{0};

        tbb::task_arena arena(max_threads_);
        arena.execute([&] {
            tbb::parallel_for(0, items_, [&](int i) {
                pause();
                try {
                    bar.update();
                    if (i % 50 == 0) {
                        bar.setSuffix(fmt::format("item {} on worker {}", i,
                                                  tbb::this_task_arena::current_thread_index()));
                    }
                } catch (const common::BarError& e) {
                    failures.fetch_add(1);
                    common::Logger::instance().error("[ThreadsCommand] Update failed | item={} | error={}",
                                                     i, e.what());
                }
            });
        });

        bar.close();
        if (failures.load() > 0) {
            std::cerr << "Error: " << failures.load() << " updates could not be rendered\n";
            return 1;
        }
    } catch (const common::BarError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

}}
