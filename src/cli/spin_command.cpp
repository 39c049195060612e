#include "spin_command.hpp"
#include "livebar/common/error_codes.hpp"
#include "livebar/iter/progress_range.hpp"
#include <iostream>
#include <vector>

namespace livebar {
namespace cli {

namespace {

// Stands in for a stream whose length is unknown up front.
class LineStream {
public:
    explicit LineStream(int count) : count_(count) {}

    class iterator {
    public:
        explicit iterator(int line) : line_(line) {}
        int operator*() const { return line_; }
        iterator& operator++() {
            ++line_;
            return *this;
        }
        bool operator!=(const iterator& other) const { return line_ != other.line_; }
        bool operator==(const iterator& other) const { return line_ == other.line_; }

    private:
        int line_;
    };

    iterator begin() const { return iterator(0); }
    iterator end() const { return iterator(count_); }

private:
    int count_;
};

}

SpinCommand::SpinCommand() : was_called_(false) {}

void SpinCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    addBarOptions(subcommand);

    subcommand->add_option("-n,--count", count_, "Items to consume")->capture_default_str();

    subcommand->callback([this]() { was_called_ = true; });
}

bool SpinCommand::wasCalled() const {
    return was_called_;
}

int SpinCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    auto options = barOptions();
    options.total.reset();
    if (options.desc.empty()) {
        options.desc = "Reading";
    }
    options.unit = options.unit == "it" ? "lines" : options.unit;

    try {
        size_t bytes = 0;
        for (int line : track(LineStream(count_), options)) {
            pause();
            bytes += static_cast<size_t>(line % 80);
        }
        std::cout << "consumed " << count_ << " lines, " << bytes << " bytes\n";
    } catch (const common::BarError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

}}
