#pragma once

#include "livebar/core/bar_options.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace livebar {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;
    void printHelp() const;
    void printVersion() const;

protected:
    CLI::App* subcommand_ = nullptr;

    // Flags shared by every demo: one per construction option plus the
    // artificial per-step delay.
    void addBarOptions(CLI::App* subcommand);
    core::BarOptions barOptions() const;
    void pause() const;

    std::string desc_;
    std::string bar_style_;
    std::string color_;
    int width_;
    std::string unit_;
    std::string unit_scale_;
    double smoothing_;
    double log_interval_;
    bool log_timestamp_ = false;
    int delay_ms_ = 20;
};

}}
