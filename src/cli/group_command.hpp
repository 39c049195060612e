#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace livebar {
namespace cli {

class GroupCommand : public MainCommand {
public:
    GroupCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    int steps_ = 60;
    bool remove_middle_ = false;
};

}}
