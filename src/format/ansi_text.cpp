#include "livebar/format/ansi_text.hpp"
#include "livebar/common/constants.hpp"
#include <locale.h>
#include <wchar.h>
#include <mutex>

namespace livebar {
namespace format {

namespace {

struct Token {
    enum class Kind { ESCAPE, GLYPH, NEWLINE };
    Kind kind;
    size_t begin;
    size_t length;
    int width;
    bool is_sgr;
};

locale_t utf8Locale() {
    static locale_t locale = nullptr;
    static std::once_flag once;
    std::call_once(once, []() {
        const char* candidates[] = {"C.UTF-8", "C.utf8", "en_US.UTF-8", "en_US.utf8"};
        for (const char* name : candidates) {
            locale = newlocale(LC_CTYPE_MASK, name, static_cast<locale_t>(0));
            if (locale) {
                break;
            }
        }
    });
    return locale;
}

size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// Decodes one UTF-8 sequence at pos. Returns the byte length consumed and
// stores the code point, or returns 0 when the bytes are malformed.
size_t decodeUtf8(const std::string& text, size_t pos, char32_t& cp) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t len = utf8SequenceLength(lead);
    if (len == 0 || pos + len > text.size()) {
        return 0;
    }
    if (len == 1) {
        cp = lead;
        return 1;
    }

    static const unsigned char lead_masks[] = {0, 0, 0x1F, 0x0F, 0x07};
    cp = lead & lead_masks[len];
    for (size_t j = 1; j < len; ++j) {
        unsigned char c = static_cast<unsigned char>(text[pos + j]);
        if ((c & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    return len;
}

size_t escapeLength(const std::string& text, size_t pos, bool& is_sgr) {
    is_sgr = false;
    if (pos + 1 >= text.size()) {
        return 1;
    }
    if (text[pos + 1] != '[') {
        return 2;
    }
    size_t i = pos + 2;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c >= 0x40 && c <= 0x7E) {
            is_sgr = (c == 'm');
            return i - pos + 1;
        }
        ++i;
    }
    return text.size() - pos;
}

template<typename Callback>
void scan(const std::string& text, Callback&& callback) {
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == constants::ansi::ESC) {
            bool is_sgr = false;
            size_t len = escapeLength(text, pos, is_sgr);
            if (!callback(Token{Token::Kind::ESCAPE, pos, len, 0, is_sgr})) return;
            pos += len;
        } else if (c == '\n') {
            if (!callback(Token{Token::Kind::NEWLINE, pos, 1, 0, false})) return;
            pos += 1;
        } else {
            char32_t cp = 0;
            size_t len = decodeUtf8(text, pos, cp);
            int width = 1;
            if (len == 0) {
                len = 1;
            } else {
                width = codepointWidth(cp);
            }
            if (!callback(Token{Token::Kind::GLYPH, pos, len, width, false})) return;
            pos += len;
        }
    }
}

}

bool isResetSequence(const std::string& sequence) {
    if (sequence.size() < 3 || sequence[0] != constants::ansi::ESC ||
        sequence[1] != '[' || sequence.back() != 'm') {
        return false;
    }
    for (size_t i = 2; i + 1 < sequence.size(); ++i) {
        if (sequence[i] != '0' && sequence[i] != ';') {
            return false;
        }
    }
    return true;
}

int codepointWidth(char32_t cp) {
    if (cp == 0) return 0;
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 0;
    if (cp < 0x7F) return 1;

    int width = -1;
    locale_t locale = utf8Locale();
    if (locale) {
        locale_t previous = uselocale(locale);
        width = wcwidth(static_cast<wchar_t>(cp));
        uselocale(previous);
    } else {
        width = wcwidth(static_cast<wchar_t>(cp));
    }
    return width < 0 ? 1 : width;
}

int displayWidth(const std::string& text) {
    int width = 0;
    int line_width = 0;
    scan(text, [&](const Token& token) {
        if (token.kind == Token::Kind::GLYPH) {
            line_width += token.width;
            if (line_width > width) width = line_width;
        } else if (token.kind == Token::Kind::NEWLINE) {
            line_width = 0;
        }
        return true;
    });
    return width;
}

std::string stripAnsi(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    scan(text, [&](const Token& token) {
        if (token.kind != Token::Kind::ESCAPE) {
            result.append(text, token.begin, token.length);
        }
        return true;
    });
    return result;
}

std::string truncateToWidth(const std::string& text, int width) {
    if (width <= 0) {
        return constants::ansi::RESET;
    }

    std::string result;
    int accumulated = 0;
    bool style_open = false;
    bool truncated = false;

    scan(text, [&](const Token& token) {
        if (token.kind == Token::Kind::ESCAPE) {
            result.append(text, token.begin, token.length);
            if (token.is_sgr) {
                style_open = !isResetSequence(text.substr(token.begin, token.length));
            }
            return true;
        }
        if (token.kind == Token::Kind::NEWLINE) {
            truncated = true;
            return false;
        }
        if (accumulated + token.width > width) {
            truncated = true;
            return false;
        }
        result.append(text, token.begin, token.length);
        accumulated += token.width;
        return true;
    });

    if (truncated && style_open) {
        result += constants::ansi::RESET;
    }
    return result;
}

std::string elide(const std::string& text, int width, const std::string& marker) {
    if (displayWidth(text) <= width && text.find('\n') == std::string::npos) {
        return text;
    }
    if (width <= 0) {
        return constants::ansi::RESET;
    }

    int marker_width = displayWidth(marker);
    if (width <= marker_width) {
        return truncateToWidth(marker, width);
    }
    return truncateToWidth(text, width - marker_width) + marker;
}

std::vector<std::string> wrapToWidth(const std::string& text, int width) {
    if (width < 1) width = 1;

    std::vector<std::string> lines;
    std::string current;
    std::string active_styles;
    int accumulated = 0;

    auto closeLine = [&]() {
        if (!active_styles.empty()) {
            current += constants::ansi::RESET;
        }
        lines.push_back(current);
        current = active_styles;
        accumulated = 0;
    };

    scan(text, [&](const Token& token) {
        switch (token.kind) {
            case Token::Kind::ESCAPE: {
                std::string sequence = text.substr(token.begin, token.length);
                current += sequence;
                if (token.is_sgr) {
                    if (isResetSequence(sequence)) {
                        active_styles.clear();
                    } else {
                        active_styles += sequence;
                    }
                }
                break;
            }
            case Token::Kind::NEWLINE:
                closeLine();
                break;
            case Token::Kind::GLYPH:
                if (accumulated > 0 && accumulated + token.width > width) {
                    closeLine();
                }
                current.append(text, token.begin, token.length);
                accumulated += token.width;
                break;
        }
        return true;
    });

    lines.push_back(current);
    return lines;
}

}}
