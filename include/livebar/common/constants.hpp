#pragma once

#include <string>
#include <array>
#include <cstddef>

namespace livebar {
namespace constants {

namespace version {
    constexpr const char* LIBRARY_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("livebar v") + LIBRARY_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "livebar";
    constexpr const char* DEMO_NAME = "livebar-demo";
    constexpr const char* CONFIG_ENV = "LIVEBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "livebar.toml";
    constexpr const char* LOGGER_NAME = "livebar";
}

namespace ansi {
    constexpr char ESC = '\033';
    constexpr const char* RESET = "\033[0m";
    constexpr const char* CLEAR_LINE = "\033[K";
    constexpr const char* CLEAR_DOWN = "\033[J";
    constexpr const char* SUFFIX_COLOR = "\033[93m";
    constexpr const char* DONE_COLOR = "\033[92m";
    constexpr const char* FAIL_COLOR = "\033[91m";
}

namespace glyphs {
    constexpr std::array<const char*, 10> SPINNER = {
        "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
    };
    constexpr const char* DONE_MARK = "✓";
    constexpr const char* INCOMPLETE_MARK = "✗";
    constexpr const char* ELLIPSIS = "...";
    constexpr int BOUNCE_MARKER_CELLS = 3;
}

namespace limits {
    constexpr int DEFAULT_BAR_WIDTH = 35;
    constexpr double DEFAULT_SMOOTHING = 0.3;
    constexpr double DEFAULT_LOG_INTERVAL_SECONDS = 30.0;
    constexpr double DEFAULT_MIN_REDRAW_INTERVAL_SECONDS = 0.05;
    constexpr int DEFAULT_TERMINAL_COLUMNS = 80;
    constexpr int LINE_MARGIN = 2;
    constexpr int DEFAULT_MAX_SUFFIX_LINES = 3;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr const char* BAR_STYLE = "gradient";
    constexpr const char* COLOR = "cyan";
    constexpr const char* UNIT = "it";
    constexpr const char* UNIT_SCALE = "none";
    constexpr int BAR_WIDTH = limits::DEFAULT_BAR_WIDTH;
    constexpr double SMOOTHING = limits::DEFAULT_SMOOTHING;
    constexpr double LOG_INTERVAL = limits::DEFAULT_LOG_INTERVAL_SECONDS;
    constexpr bool LOG_TIMESTAMP = false;
    constexpr bool THREAD_SAFE = false;
    constexpr double MIN_REDRAW_INTERVAL = limits::DEFAULT_MIN_REDRAW_INTERVAL_SECONDS;

    constexpr int MAX_SUFFIX_LINES = limits::DEFAULT_MAX_SUFFIX_LINES;
    constexpr int FALLBACK_COLUMNS = limits::DEFAULT_TERMINAL_COLUMNS;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
