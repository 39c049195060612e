#include "test_util.hpp"
#include "test_env.hpp"
#include "livebar/core/progress_bar.hpp"
#include "livebar/term/tty_gate.hpp"

#include <cstdio>
#include <string>

using namespace livebar;
using livebar::common::RedrawReason;

static void test_mode_follows_render_sink() {
    std::fprintf(stderr, "-- test_mode_follows_render_sink\n");
    term::MemorySink tty(true, 80);
    term::MemorySink pipe(false, 80);
    CHECK(term::TtyGate(tty).animated());
    CHECK(term::TtyGate(tty).mode() == common::DisplayMode::ANIMATED);
    CHECK(!term::TtyGate(pipe).animated());
    CHECK(term::TtyGate(pipe).mode() == common::DisplayMode::FALLBACK);
}

static void test_animated_throttle() {
    std::fprintf(stderr, "-- test_animated_throttle\n");
    term::MemorySink tty(true, 80);
    term::TtyGate gate(tty);
    ManualClock clock;
    term::RowThrottle throttle;
    throttle.min_redraw_interval = 0.05;

    CHECK(gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    clock.advance(0.01);
    CHECK(!gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    CHECK(gate.admit(throttle, clock.now(), RedrawReason::SUFFIX));
    clock.advance(0.03);
    CHECK(!gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    CHECK(gate.admit(throttle, clock.now(), RedrawReason::REFRESH));
    CHECK(gate.admit(throttle, clock.now(), RedrawReason::FINALIZE));
    clock.advance(0.06);
    CHECK(gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    CHECK(throttle.last_redraw.has_value());
    CHECK(!throttle.last_log.has_value());
}

static void test_fallback_interval() {
    std::fprintf(stderr, "-- test_fallback_interval\n");
    term::MemorySink pipe(false, 80);
    term::TtyGate gate(pipe);
    ManualClock clock;
    term::RowThrottle throttle;
    throttle.log_interval = 30.0;

    CHECK(gate.admit(throttle, clock.now(), RedrawReason::START));
    clock.advance(5);
    CHECK(!gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    CHECK(!gate.admit(throttle, clock.now(), RedrawReason::SUFFIX));
    CHECK(!gate.admit(throttle, clock.now(), RedrawReason::REFRESH));
    clock.advance(25);
    CHECK(gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    clock.advance(1);
    CHECK(!gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    CHECK(gate.admit(throttle, clock.now(), RedrawReason::FINALIZE));
    CHECK(!throttle.last_redraw.has_value());
}

static void test_fallback_zero_interval_is_unlimited() {
    std::fprintf(stderr, "-- test_fallback_zero_interval_is_unlimited\n");
    term::MemorySink pipe(false, 80);
    term::TtyGate gate(pipe);
    ManualClock clock;
    term::RowThrottle throttle;
    throttle.log_interval = 0.0;

    CHECK(gate.admit(throttle, clock.now(), RedrawReason::START));
    for (int i = 0; i < 5; ++i) {
        CHECK(gate.admit(throttle, clock.now(), RedrawReason::UPDATE));
    }
}

static void test_non_terminal_bar_logs_sparsely() {
    std::fprintf(stderr, "-- test_non_terminal_bar_logs_sparsely\n");
    TestEnv t = makeTestEnv(false);

    core::BarOptions options;
    options.total = 1000;
    options.desc = "Copy";
    options.log_interval = 30.0;
    {
        core::ProgressBar bar(options, t.env);
        CHECK(bar.mode() == common::DisplayMode::FALLBACK);
        for (int i = 0; i < 1000; ++i) {
            t.clock.advance(0.005);
            bar.update(1);
        }
        CHECK_EQ(countOccurrences(t.log->str(), "\n"), 1u);
        bar.close();
    }

    std::string out = t.log->str();
    CHECK_EQ(countOccurrences(out, "\n"), 2u);
    CHECK(out.find('\033') == std::string::npos);
    CHECK(out.find("Copy: 0.0% (0/1000)") != std::string::npos);
    CHECK(out.find("Copy: 100.0% (1000/1000)") != std::string::npos);
    CHECK(out.find("done in 5.0s") != std::string::npos);
    CHECK(t.render->str().empty());
}

static void test_non_terminal_bar_logs_after_interval() {
    std::fprintf(stderr, "-- test_non_terminal_bar_logs_after_interval\n");
    TestEnv t = makeTestEnv(false);

    core::BarOptions options;
    options.total = 100;
    options.desc = "Sync";
    options.log_interval = 30.0;
    core::ProgressBar bar(options, t.env);

    t.clock.advance(10);
    bar.update(10);
    CHECK_EQ(countOccurrences(t.log->str(), "\n"), 1u);

    t.clock.advance(21);
    bar.update(10);
    CHECK_EQ(countOccurrences(t.log->str(), "\n"), 2u);
    CHECK(t.log->str().find("Sync: 20.0% (20/100)") != std::string::npos);

    bar.close();
    CHECK_EQ(countOccurrences(t.log->str(), "\n"), 3u);
    CHECK(t.log->str().find("incomplete after 31.0s") != std::string::npos);
}

static void test_timestamped_status_lines() {
    std::fprintf(stderr, "-- test_timestamped_status_lines\n");
    TestEnv t = makeTestEnv(false);

    core::BarOptions options;
    options.total = 10;
    options.desc = "Stamp";
    options.log_timestamp = true;
    core::ProgressBar bar(options, t.env);
    bar.close();

    std::string out = t.log->str();
    CHECK_EQ(countOccurrences(out, " | Stamp: "), 2u);
    CHECK(out.find("20") == 0);
}

int main() {
    test_mode_follows_render_sink();
    test_animated_throttle();
    test_fallback_interval();
    test_fallback_zero_interval_is_unlimited();
    test_non_terminal_bar_logs_sparsely();
    test_non_terminal_bar_logs_after_interval();
    test_timestamped_status_lines();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
