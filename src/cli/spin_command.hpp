#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace livebar {
namespace cli {

class SpinCommand : public MainCommand {
public:
    SpinCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    int count_ = 150;
};

}}
