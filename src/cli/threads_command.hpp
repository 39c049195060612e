#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace livebar {
namespace cli {

class ThreadsCommand : public MainCommand {
public:
    ThreadsCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    int items_ = 400;
    int max_threads_ = 4;
};

}}
