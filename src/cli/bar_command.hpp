#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>

namespace livebar {
namespace cli {

class BarCommand : public MainCommand {
public:
    BarCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    int64_t total_ = 100;
    int suffix_every_ = 0;
    bool overshoot_ = false;
};

}}
