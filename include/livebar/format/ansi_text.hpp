#pragma once

#include <string>
#include <vector>

namespace livebar {
namespace format {

// Column width of a single code point; 0 for control and combining
// characters, 2 for East Asian wide glyphs.
int codepointWidth(char32_t cp);

// Visible terminal columns of text. Escape sequences (SGR and any other
// CSI sequence) occupy no columns; malformed UTF-8 bytes count one each.
int displayWidth(const std::string& text);

std::string stripAnsi(const std::string& text);

// Longest prefix whose visible width fits in width. Escape sequences are
// never split; when text was cut while a style was active a reset is
// appended. A non-positive width yields a bare reset sequence.
std::string truncateToWidth(const std::string& text, int width);

// Truncates text so that it plus marker fits in width, then appends marker.
// Text that already fits is returned unchanged.
std::string elide(const std::string& text, int width, const std::string& marker = "...");

// Hard-wraps text into lines of at most width columns. Embedded newlines
// start new lines; styles active at a break are closed on the broken line
// and reopened on the next one.
std::vector<std::string> wrapToWidth(const std::string& text, int width);

bool isResetSequence(const std::string& sequence);

}}
