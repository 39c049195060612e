#pragma once

#include "livebar/common/error_codes.hpp"
#include "livebar/common/types.hpp"
#include "livebar/term/output_sink.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

// Clock that only moves when told to.
class ManualClock {
public:
    ManualClock() : now_(std::make_shared<livebar::common::TimePoint>(
                        livebar::common::TimePoint(std::chrono::seconds(1000)))) {}

    void advance(double seconds) {
        *now_ += std::chrono::duration_cast<livebar::common::SteadyClock::duration>(
            livebar::common::Seconds(seconds));
    }

    livebar::common::TimePoint now() const { return *now_; }

    livebar::common::ClockFn fn() const {
        auto state = now_;
        return [state]() { return *state; };
    }

private:
    std::shared_ptr<livebar::common::TimePoint> now_;
};

// Sink that starts failing after a number of successful writes.
class FailingSink : public livebar::term::OutputSink {
public:
    FailingSink(bool terminal, int writes_before_failure)
        : terminal_(terminal), remaining_(writes_before_failure) {}

    void write(const std::string&) override {
        if (remaining_-- <= 0) {
            livebar::common::ErrorContext ctx;
            ctx.component = "FailingSink";
            ctx.details["errno"] = "Broken pipe";
            throw livebar::common::BarError(livebar::common::BarErrorCode::STREAM_WRITE_FAILED, ctx);
        }
    }
    void flush() override {}
    bool isTerminal() const override { return terminal_; }
    int columns() const override { return 80; }

private:
    bool terminal_;
    int remaining_;
};

struct TestEnv {
    std::shared_ptr<livebar::term::MemorySink> render;
    std::shared_ptr<livebar::term::MemorySink> log;
    ManualClock clock;
    livebar::term::Environment env;
};

inline TestEnv makeTestEnv(bool terminal, int columns = 100) {
    TestEnv t;
    t.render = std::make_shared<livebar::term::MemorySink>(terminal, columns);
    t.log = std::make_shared<livebar::term::MemorySink>(false, columns);
    t.env.render = t.render;
    t.env.log = t.log;
    t.env.clock = t.clock.fn();
    t.env.wall_clock = []() {
        return std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    };
    return t;
}

inline size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

template<typename Fn>
bool throwsCode(Fn&& fn, livebar::common::BarErrorCode expected) {
    try {
        fn();
    } catch (const livebar::common::BarError& e) {
        return e.code() == expected;
    }
    return false;
}
