#include "test_util.hpp"
#include "livebar/format/ansi_text.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

using namespace livebar::format;

static const std::string RESET = "\033[0m";

// True when every ESC in text starts a CSI sequence that is complete.
static bool escapesComplete(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\033') continue;
        if (i + 1 >= text.size() || text[i + 1] != '[') return false;
        size_t j = i + 2;
        while (j < text.size()) {
            unsigned char c = static_cast<unsigned char>(text[j]);
            if (c >= 0x40 && c <= 0x7E) break;
            ++j;
        }
        if (j >= text.size()) return false;
        i = j;
    }
    return true;
}

// True when the last SGR in text is a reset, or there is none.
static bool styleClosed(const std::string& text) {
    size_t last = text.rfind("\033[");
    while (last != std::string::npos) {
        size_t end = last + 2;
        while (end < text.size() && !(text[end] >= 0x40 && text[end] <= 0x7E)) ++end;
        if (end < text.size() && text[end] == 'm') {
            return isResetSequence(text.substr(last, end - last + 1));
        }
        if (last == 0) break;
        last = text.rfind("\033[", last - 1);
    }
    return true;
}

static void test_plain_width() {
    std::fprintf(stderr, "-- test_plain_width\n");
    CHECK_EQ(displayWidth(""), 0);
    CHECK_EQ(displayWidth("hello"), 5);
    CHECK_EQ(displayWidth("█▓▒░"), 4);
    CHECK_EQ(displayWidth("⣿⣤ ⠉"), 4);
    CHECK_EQ(displayWidth("ab\ncdef"), 4);
}

static void test_escape_sequences_have_no_width() {
    std::fprintf(stderr, "-- test_escape_sequences_have_no_width\n");
    CHECK_EQ(displayWidth("\033[31mred\033[0m"), 3);
    CHECK_EQ(displayWidth("\033[m\033[0m"), 0);
    CHECK_EQ(displayWidth("\033[1m\033[38;2;255;87;51mbold\033[0m\033[0m!"), 5);
    CHECK_EQ(displayWidth("\033[2K\033[3Aabc"), 3);
    CHECK_STR_EQ(stripAnsi("\033[96mcyan\033[0m text"), "cyan text");
}

static void test_wide_glyphs() {
    std::fprintf(stderr, "-- test_wide_glyphs\n");
    CHECK_EQ(codepointWidth(U'a'), 1);
    CHECK_EQ(codepointWidth(U'\u6F22'), 2);
    CHECK_EQ(codepointWidth(U'\u0301'), 0);
    CHECK_EQ(displayWidth("ab\xE6\xBC\xA2" "cd"), 6);

    std::string text = "ab\xE6\xBC\xA2" "cd";
    CHECK_STR_EQ(truncateToWidth(text, 3), "ab");
    CHECK_STR_EQ(truncateToWidth(text, 4), "ab\xE6\xBC\xA2");
}

static void test_randomized_interleavings() {
    std::fprintf(stderr, "-- test_randomized_interleavings\n");
    const std::vector<std::string> visible = {"a", "Z", "7", " ", "█", "░", "⣿", "✓"};
    const std::vector<std::string> wide = {"\xE6\xBC\xA2", "\xE5\xAD\x97"};
    const std::vector<std::string> escapes = {
        "\033[0m", "\033[m", "\033[96m", "\033[1m", "\033[38;2;1;2;3m", "\033[K", "\033[2A"
    };

    std::mt19937 rng(42);
    for (int round = 0; round < 500; ++round) {
        std::string text;
        int expected = 0;
        int length = static_cast<int>(rng() % 40);
        for (int i = 0; i < length; ++i) {
            int escape_run = static_cast<int>(rng() % 3);
            for (int e = 0; e < escape_run; ++e) {
                text += escapes[rng() % escapes.size()];
            }
            if (rng() % 5 == 0) {
                text += wide[rng() % wide.size()];
                expected += 2;
            } else {
                text += visible[rng() % visible.size()];
                expected += 1;
            }
        }
        CHECK_EQ(displayWidth(text), expected);

        int target = static_cast<int>(rng() % 45);
        std::string cut = truncateToWidth(text, target);
        CHECK(displayWidth(cut) <= std::max(target, 0));
        CHECK(escapesComplete(cut));
        if (cut != text) {
            CHECK(styleClosed(cut));
        }
    }
}

static void test_truncate_zero_width() {
    std::fprintf(stderr, "-- test_truncate_zero_width\n");
    CHECK_STR_EQ(truncateToWidth("\033[96mabc\033[0m", 0), RESET);
    CHECK_STR_EQ(truncateToWidth("abc", -3), RESET);
}

static void test_truncate_closes_open_style() {
    std::fprintf(stderr, "-- test_truncate_closes_open_style\n");
    std::string styled = "\033[93mwarning text\033[0m";
    std::string cut = truncateToWidth(styled, 4);
    CHECK_STR_EQ(cut, "\033[93mwarn" + RESET);
    CHECK_STR_EQ(truncateToWidth("plain text", 5), "plain");
    CHECK_STR_EQ(truncateToWidth(styled, 100), styled);
}

static void test_elide() {
    std::fprintf(stderr, "-- test_elide\n");
    CHECK_STR_EQ(elide("abcdefghij", 6), "abc...");
    CHECK_STR_EQ(elide("abc", 6), "abc");
    CHECK_STR_EQ(elide("abcdefghij", 2), "..");
    CHECK_EQ(displayWidth(elide("\033[96mabcdefghij\033[0m", 7)), 7);
}

static void test_wrap_reopens_styles() {
    std::fprintf(stderr, "-- test_wrap_reopens_styles\n");
    auto lines = wrapToWidth("\033[93mabcdefgh\033[0m", 3);
    CHECK_EQ(lines.size(), 3u);
    CHECK_STR_EQ(lines[0], "\033[93mabc" + RESET);
    CHECK_STR_EQ(lines[1], "\033[93mdef" + RESET);
    CHECK_STR_EQ(lines[2], "\033[93mgh" + RESET);
    for (const auto& line : lines) {
        CHECK(displayWidth(line) <= 3);
    }

    auto split = wrapToWidth("one\ntwo", 10);
    CHECK_EQ(split.size(), 2u);
    CHECK_STR_EQ(split[0], "one");
    CHECK_STR_EQ(split[1], "two");
}

int main() {
    test_plain_width();
    test_escape_sequences_have_no_width();
    test_wide_glyphs();
    test_randomized_interleavings();
    test_truncate_zero_width();
    test_truncate_closes_open_style();
    test_elide();
    test_wrap_reopens_styles();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
