#include "test_util.hpp"
#include "test_env.hpp"
#include "livebar/core/bar_state.hpp"
#include "livebar/core/smoother.hpp"

#include <cmath>
#include <cstdio>
#include <limits>

using namespace livebar;
using namespace livebar::core;
using livebar::common::BarErrorCode;

static void test_alpha_one_tracks_latest() {
    std::fprintf(stderr, "-- test_alpha_one_tracks_latest\n");
    RateSmoother smoother(1.0);
    CHECK(!smoother.hasRate());
    CHECK(smoother.addSample(1.0, 10));
    CHECK_NEAR(smoother.rate(), 10.0, 1e-9);
    CHECK(smoother.addSample(0.5, 40));
    CHECK_NEAR(smoother.rate(), 80.0, 1e-9);
}

static void test_alpha_zero_freezes_first() {
    std::fprintf(stderr, "-- test_alpha_zero_freezes_first\n");
    RateSmoother smoother(0.0);
    CHECK(smoother.addSample(2.0, 10));
    CHECK(smoother.addSample(1.0, 500));
    CHECK(smoother.addSample(1.0, 1));
    CHECK_NEAR(smoother.rate(), 5.0, 1e-9);
}

static void test_exponential_average() {
    std::fprintf(stderr, "-- test_exponential_average\n");
    RateSmoother smoother(0.5);
    smoother.addSample(1.0, 10);
    smoother.addSample(1.0, 20);
    CHECK_NEAR(smoother.rate(), 15.0, 1e-9);
    smoother.addSample(1.0, 5);
    CHECK_NEAR(smoother.rate(), 10.0, 1e-9);

    smoother.reset();
    CHECK(!smoother.hasRate());
    CHECK_NEAR(smoother.rate(), 0.0, 1e-12);
}

static void test_degenerate_samples_skipped() {
    std::fprintf(stderr, "-- test_degenerate_samples_skipped\n");
    RateSmoother smoother(0.3);
    CHECK(!smoother.addSample(0.0, 10));
    CHECK(!smoother.addSample(-1.0, 10));
    CHECK(!smoother.addSample(1.0, -3));
    CHECK(!smoother.addSample(std::numeric_limits<double>::quiet_NaN(), 1));
    CHECK(!smoother.hasRate());

    CHECK(smoother.addSample(1e-9, 1));
    CHECK(std::isfinite(smoother.rate()));
}

static void test_eta() {
    std::fprintf(stderr, "-- test_eta\n");
    RateSmoother smoother(1.0);
    CHECK(!smoother.eta(100).has_value());

    smoother.addSample(1.0, 20);
    auto eta = smoother.eta(100);
    CHECK(eta.has_value());
    CHECK_NEAR(*eta, 5.0, 1e-9);
    CHECK_NEAR(*smoother.eta(-10), 0.0, 1e-12);

    RateSmoother idle(1.0);
    idle.addSample(1.0, 0);
    CHECK(idle.hasRate());
    CHECK(!idle.eta(10).has_value());
}

static void test_invalid_alpha_rejected() {
    std::fprintf(stderr, "-- test_invalid_alpha_rejected\n");
    const auto code = BarErrorCode::CONFIG_INVALID_SMOOTHING;
    CHECK(throwsCode([] { RateSmoother s(-0.1); }, code));
    CHECK(throwsCode([] { RateSmoother s(1.5); }, code));
    CHECK(throwsCode([] { RateSmoother s(std::nan("")); }, code));
}

static void test_bounce_cursor() {
    std::fprintf(stderr, "-- test_bounce_cursor\n");
    BounceCursor cursor(3);
    const int expected[] = {1, 2, 1, 0, 1, 2, 1};
    for (int value : expected) {
        cursor.tick();
        CHECK_EQ(cursor.position(), value);
    }

    BounceCursor wide(8);
    for (int i = 0; i < 200; ++i) {
        wide.tick();
        CHECK(wide.position() >= 0 && wide.position() < 8);
    }
    wide.reset();
    CHECK_EQ(wide.position(), 0);

    BounceCursor single(0);
    CHECK_EQ(single.positions(), 1);
    single.tick();
    single.tick();
    CHECK_EQ(single.position(), 0);
}

static BarConfig makeConfig(std::optional<int64_t> total, double smoothing) {
    BarOptions options;
    options.total = total;
    options.smoothing = smoothing;
    options.width = 10;
    return BarConfig::resolve(options);
}

static void test_bar_state_carries_zero_time_deltas() {
    std::fprintf(stderr, "-- test_bar_state_carries_zero_time_deltas\n");
    ManualClock clock;
    BarState state(makeConfig(100, 1.0), clock.now());

    state.apply(5, clock.now());
    CHECK_EQ(state.current(), 5u);
    CHECK(!state.view(clock.now()).rate.has_value());

    clock.advance(1.0);
    state.apply(5, clock.now());
    CHECK_NEAR(state.rate(), 10.0, 1e-9);
    CHECK(state.eta().has_value());
    CHECK_NEAR(*state.eta(), 9.0, 1e-9);
}

static void test_bar_state_count_rules() {
    std::fprintf(stderr, "-- test_bar_state_count_rules\n");
    ManualClock clock;
    BarState state(makeConfig(100, 0.3), clock.now());

    clock.advance(1.0);
    state.apply(150, clock.now());
    CHECK_EQ(state.current(), 150u);
    CHECK_NEAR(state.percentage(), 100.0, 1e-9);
    CHECK(!state.eta().has_value());

    state.apply(-60, clock.now());
    CHECK_EQ(state.current(), 90u);
    state.apply(-1000, clock.now());
    CHECK_EQ(state.current(), 0u);

    clock.advance(2.5);
    auto view = state.view(clock.now());
    CHECK_NEAR(view.elapsed_seconds, 3.5, 1e-6);

    state.reset(clock.now());
    CHECK_EQ(state.current(), 0u);
    CHECK(!state.view(clock.now()).rate.has_value());
    CHECK_NEAR(state.view(clock.now()).elapsed_seconds, 0.0, 1e-9);
}

static void test_bar_state_animation() {
    std::fprintf(stderr, "-- test_bar_state_animation\n");
    ManualClock clock;
    BarState state(makeConfig(std::nullopt, 0.3), clock.now());
    CHECK_EQ(state.view(clock.now()).spinner_frame, 0u);

    state.advanceAnimation();
    state.advanceAnimation();
    auto view = state.view(clock.now());
    CHECK_EQ(view.spinner_frame, 2u);
    CHECK_EQ(view.bounce_position, 2);
    CHECK(!view.determinate());
    CHECK(!state.eta().has_value());
}

int main() {
    test_alpha_one_tracks_latest();
    test_alpha_zero_freezes_first();
    test_exponential_average();
    test_degenerate_samples_skipped();
    test_eta();
    test_invalid_alpha_rejected();
    test_bounce_cursor();
    test_bar_state_carries_zero_time_deltas();
    test_bar_state_count_rules();
    test_bar_state_animation();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
