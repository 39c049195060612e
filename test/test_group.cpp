#include "test_util.hpp"
#include "test_env.hpp"
#include "screen_model.hpp"
#include "livebar/group/progress_group.hpp"

#include <cstdio>
#include <memory>
#include <string>

using namespace livebar;
using livebar::common::BarErrorCode;

static core::BarOptions rowOptions(const std::string& desc) {
    core::BarOptions options;
    options.total = 10;
    options.desc = desc;
    options.bar_style = "classic";
    options.width = 10;
    options.min_redraw_interval = 0.0;
    return options;
}

static std::vector<std::string> screenLines(const TestEnv& t) {
    ScreenModel screen(100);
    screen.feed(t.render->str());
    return screen.lines();
}

static bool startsWith(const std::string& text, const std::string& head) {
    return text.rfind(head, 0) == 0;
}

static void test_rows_stack_in_order() {
    std::fprintf(stderr, "-- test_rows_stack_in_order\n");
    TestEnv t = makeTestEnv(true);
    group::ProgressGroup group(group::GroupOptions(), t.env);
    auto a = group.addBar(rowOptions("alpha"));
    auto b = group.addBar(rowOptions("beta"));
    auto c = group.addBar(rowOptions("gamma"));

    CHECK_EQ(group.size(), 3u);
    CHECK(group.mode() == common::DisplayMode::ANIMATED);
    CHECK_EQ(group.coordinator().rowOffset(a.get()), 0);
    CHECK_EQ(group.coordinator().rowOffset(b.get()), 1);
    CHECK_EQ(group.coordinator().rowOffset(c.get()), 2);
    CHECK_EQ(group.coordinator().blockHeight(), 3);

    b->update(5);
    auto lines = screenLines(t);
    CHECK_EQ(lines.size(), 3u);
    CHECK(lines[0].find("alpha") != std::string::npos);
    CHECK(lines[1].find("beta") != std::string::npos);
    CHECK(lines[1].find("50.0% 5/10") != std::string::npos);
    CHECK(lines[2].find("gamma") != std::string::npos);
}

static void test_remove_middle_bar() {
    std::fprintf(stderr, "-- test_remove_middle_bar\n");
    TestEnv t = makeTestEnv(true);
    std::shared_ptr<core::ProgressBar> removed;
    {
        group::ProgressGroup group(group::GroupOptions(), t.env);
        auto a = group.addBar(rowOptions("alpha"));
        removed = group.addBar(rowOptions("beta"));
        auto c = group.addBar(rowOptions("gamma"));
        a->update(10);
        removed->update(4);
        c->update(3);

        CHECK(group.removeBar(removed));
        CHECK_EQ(group.size(), 2u);
        CHECK_EQ(group.coordinator().rowOffset(removed.get()), -1);
        CHECK_EQ(group.coordinator().rowOffset(c.get()), 1);

        auto lines = screenLines(t);
        CHECK_EQ(lines.size(), 2u);
        CHECK(lines[0].find("alpha") != std::string::npos);
        CHECK(lines[1].find("gamma") != std::string::npos);
        CHECK(t.render->str().rfind("beta") < t.render->str().rfind("gamma"));

        std::string before = t.render->str();
        removed->update(1);
        removed->setSuffix("gone");
        CHECK_STR_EQ(t.render->str(), before);
        CHECK_EQ(removed->current(), 5u);
        CHECK(!group.removeBar(removed));
    }

    std::string out = t.render->str();
    CHECK(!out.empty() && out.back() == '\n');
    auto lines = screenLines(t);
    CHECK_EQ(lines.size(), 2u);
    CHECK(startsWith(lines[0], "✓ alpha"));
    CHECK(startsWith(lines[1], "✗ gamma"));
    CHECK(out.find("beta", out.rfind("alpha")) == std::string::npos);
}

static void test_multiline_suffix_shifts_rows() {
    std::fprintf(stderr, "-- test_multiline_suffix_shifts_rows\n");
    TestEnv t = makeTestEnv(true);
    group::ProgressGroup group(group::GroupOptions(), t.env);
    auto a = group.addBar(rowOptions("alpha"));
    auto b = group.addBar(rowOptions("beta"));
    auto c = group.addBar(rowOptions("gamma"));

    b->setSuffix("downloading\nverifying");
    CHECK_EQ(group.coordinator().rowOffset(c.get()), 4);
    CHECK_EQ(group.coordinator().blockHeight(), 5);
    auto lines = screenLines(t);
    CHECK_EQ(lines.size(), 5u);
    CHECK(lines[1].find("beta") != std::string::npos);
    CHECK_STR_EQ(lines[2], "downloading");
    CHECK_STR_EQ(lines[3], "verifying");
    CHECK(lines[4].find("gamma") != std::string::npos);

    b->setSuffix("");
    CHECK_EQ(group.coordinator().blockHeight(), 3);
    lines = screenLines(t);
    CHECK_EQ(lines.size(), 3u);
    CHECK(lines[2].find("gamma") != std::string::npos);

    c->update(2);
    lines = screenLines(t);
    CHECK_EQ(lines.size(), 3u);
    CHECK(lines[2].find("20.0% 2/10") != std::string::npos);
    (void)a;
}

static void test_println_and_refresh() {
    std::fprintf(stderr, "-- test_println_and_refresh\n");
    TestEnv t = makeTestEnv(true);
    group::ProgressGroup group(group::GroupOptions(), t.env);
    auto a = group.addBar(rowOptions("alpha"));
    auto b = group.addBar(rowOptions("beta"));

    group.println("phase one done");
    auto lines = screenLines(t);
    CHECK_EQ(lines.size(), 3u);
    CHECK_STR_EQ(lines[0], "phase one done");
    CHECK(lines[1].find("alpha") != std::string::npos);
    CHECK(lines[2].find("beta") != std::string::npos);

    b->println("from a bar");
    lines = screenLines(t);
    CHECK_EQ(lines.size(), 4u);
    CHECK_STR_EQ(lines[1], "from a bar");

    size_t before = t.render->str().size();
    group.refresh();
    CHECK(t.render->str().size() > before);
    CHECK_EQ(screenLines(t).size(), 4u);
    (void)a;
}

static void test_close_finalizes_once() {
    std::fprintf(stderr, "-- test_close_finalizes_once\n");
    TestEnv t = makeTestEnv(true);
    group::ProgressGroup group(group::GroupOptions(), t.env);
    auto a = group.addBar(rowOptions("alpha"));
    a->update(10);
    auto b = group.addBar(rowOptions("beta"));

    group.close();
    CHECK(group.isClosed());
    CHECK(a->isClosed());
    CHECK(b->isClosed());

    std::string after = t.render->str();
    CHECK(after.back() == '\n');
    CHECK_EQ(countOccurrences(after, "✓"), 1u);
    CHECK_EQ(countOccurrences(after, "✗"), 1u);

    group.close();
    a->update(1);
    group.refresh();
    group.println("after close");
    CHECK_STR_EQ(t.render->str(), after + "after close\n");

    CHECK(throwsCode([&] { group.addBar(rowOptions("late")); }, BarErrorCode::GROUP_CLOSED));
}

static void test_bar_closed_inside_group() {
    std::fprintf(stderr, "-- test_bar_closed_inside_group\n");
    TestEnv t = makeTestEnv(true);
    group::ProgressGroup group(group::GroupOptions(), t.env);
    auto a = group.addBar(rowOptions("alpha"));
    auto b = group.addBar(rowOptions("beta"));

    a->update(10);
    a->close();
    b->update(5);

    auto lines = screenLines(t);
    CHECK_EQ(lines.size(), 2u);
    CHECK(startsWith(lines[0], "✓ alpha"));
    CHECK(lines[1].find("50.0% 5/10") != std::string::npos);
    CHECK(!startsWith(lines[1], "✓"));
}

static void test_invalid_bar_leaves_group_intact() {
    std::fprintf(stderr, "-- test_invalid_bar_leaves_group_intact\n");
    TestEnv t = makeTestEnv(true);
    group::ProgressGroup group(group::GroupOptions(), t.env);
    group.addBar(rowOptions("alpha"));

    core::BarOptions bad = rowOptions("bad");
    bad.width = -1;
    std::string before = t.render->str();
    CHECK(throwsCode([&] { group.addBar(bad); }, BarErrorCode::CONFIG_INVALID_WIDTH));
    CHECK_EQ(group.size(), 1u);
    CHECK_STR_EQ(t.render->str(), before);

    TestEnv other_env = makeTestEnv(true);
    group::ProgressGroup other(group::GroupOptions(), other_env.env);
    auto stranger = other.addBar(rowOptions("stranger"));
    CHECK(!group.removeBar(stranger));
    CHECK(!group.removeBar(nullptr));
}

static void test_fallback_group() {
    std::fprintf(stderr, "-- test_fallback_group\n");
    TestEnv t = makeTestEnv(false);
    {
        group::ProgressGroup group(group::GroupOptions(), t.env);
        CHECK(group.mode() == common::DisplayMode::FALLBACK);
        auto a = group.addBar(rowOptions("alpha"));
        auto b = group.addBar(rowOptions("beta"));
        auto c = group.addBar(rowOptions("gamma"));
        CHECK_EQ(countOccurrences(t.log->str(), "\n"), 3u);

        t.clock.advance(1.0);
        a->update(10);
        b->update(2);
        CHECK_EQ(countOccurrences(t.log->str(), "\n"), 3u);
        CHECK(group.removeBar(c));
    }

    std::string out = t.log->str();
    CHECK_EQ(countOccurrences(out, "\n"), 5u);
    CHECK_EQ(countOccurrences(out, " - done in "), 1u);
    CHECK_EQ(countOccurrences(out, " - incomplete after "), 1u);
    CHECK(out.find("alpha: 100.0% (10/10)") != std::string::npos);
    CHECK(out.find('\033') == std::string::npos);
    CHECK(t.render->str().empty());
}

int main() {
    test_rows_stack_in_order();
    test_remove_middle_bar();
    test_multiline_suffix_shifts_rows();
    test_println_and_refresh();
    test_close_finalizes_once();
    test_bar_closed_inside_group();
    test_invalid_bar_leaves_group_intact();
    test_fallback_group();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
