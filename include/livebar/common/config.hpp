#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace livebar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct BarDefaults {
    std::string bar_style;
    std::string color;
    int width;
    std::string unit;
    std::string unit_scale;
    double smoothing;
    double log_interval;
    bool log_timestamp;
    bool thread_safe;
    double min_redraw_interval;
};

struct RenderConfig {
    int max_suffix_lines;
    int fallback_columns;
};

struct LoggingConfig {
    LogLevel level;
    LogFormat format;
    std::string log_file;
    size_t rotation_size_mb;
    size_t max_files;
};

struct GlobalConfig {
    BarDefaults bar;
    RenderConfig render;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    void reset();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::optional<std::string> findBestConfig() const;
    const std::string& currentConfigPath() const { return current_config_path_; }

    static GlobalConfig createDefaultConfig();
    static std::optional<LogLevel> parseLogLevel(const std::string& level);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path, const std::string& description);
};

}}
