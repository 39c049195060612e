#include "livebar/common/config.hpp"
#include "livebar/common/constants.hpp"
#include "livebar/common/paths.hpp"
#include "livebar/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace livebar {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.bar.bar_style = BAR_STYLE;
    config.bar.color = COLOR;
    config.bar.width = BAR_WIDTH;
    config.bar.unit = UNIT;
    config.bar.unit_scale = UNIT_SCALE;
    config.bar.smoothing = SMOOTHING;
    config.bar.log_interval = LOG_INTERVAL;
    config.bar.log_timestamp = LOG_TIMESTAMP;
    config.bar.thread_safe = THREAD_SAFE;
    config.bar.min_redraw_interval = MIN_REDRAW_INTERVAL;

    config.render.max_suffix_lines = MAX_SUFFIX_LINES;
    config.render.fallback_columns = FALLBACK_COLUMNS;

    config.logging.level = LogLevel::WARN;
    config.logging.format = LogFormat::TEXT;
    config.logging.log_file = "";
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;

    return config;
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& level) {
    if (level == "DEBUG" || level == "debug") return LogLevel::DEBUG;
    if (level == "INFO" || level == "info") return LogLevel::INFO;
    if (level == "WARN" || level == "warn") return LogLevel::WARN;
    if (level == "ERROR" || level == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No config file found, using defaults");
            current_config_path_.clear();
            return true;
        }
        effective_config_file = *best;
    } else if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().error("[Config] Config file not found | path={}", effective_config_file);
        return false;
    }

    current_config_path_ = effective_config_file;
    if (!tryLoadTomlFile(effective_config_file, "main config")) {
        global_ = createDefaultConfig();
        return false;
    }
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path, const std::string& description) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().error("[Config] {} not readable | path={}", description, path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("bar")) {
            auto bar_section = data.at("bar");

            if (bar_section.contains("bar_style")) {
                global_.bar.bar_style = toml::find<std::string>(bar_section, "bar_style");
            }
            if (bar_section.contains("color")) {
                global_.bar.color = toml::find<std::string>(bar_section, "color");
            }
            if (bar_section.contains("width")) {
                global_.bar.width = toml::find<int>(bar_section, "width");
            }
            if (bar_section.contains("unit")) {
                global_.bar.unit = toml::find<std::string>(bar_section, "unit");
            }
            if (bar_section.contains("unit_scale")) {
                global_.bar.unit_scale = toml::find<std::string>(bar_section, "unit_scale");
            }
            if (bar_section.contains("smoothing")) {
                global_.bar.smoothing = toml::find<double>(bar_section, "smoothing");
            }
            if (bar_section.contains("log_interval")) {
                global_.bar.log_interval = toml::find<double>(bar_section, "log_interval");
            }
            if (bar_section.contains("log_timestamp")) {
                global_.bar.log_timestamp = toml::find<bool>(bar_section, "log_timestamp");
            }
            if (bar_section.contains("thread_safe")) {
                global_.bar.thread_safe = toml::find<bool>(bar_section, "thread_safe");
            }
            if (bar_section.contains("min_redraw_interval")) {
                global_.bar.min_redraw_interval = toml::find<double>(bar_section, "min_redraw_interval");
            }
        }

        if (data.contains("render")) {
            auto render_section = data.at("render");

            if (render_section.contains("max_suffix_lines")) {
                global_.render.max_suffix_lines = toml::find<int>(render_section, "max_suffix_lines");
            }
            if (render_section.contains("fallback_columns")) {
                global_.render.fallback_columns = toml::find<int>(render_section, "fallback_columns");
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("level")) {
                std::string level = toml::find<std::string>(logging_section, "level");
                auto parsed = parseLogLevel(level);
                if (!parsed) {
                    Logger::instance().error("[Config] Unknown log level | path={} | level={}", path, level);
                    return false;
                }
                global_.logging.level = *parsed;
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                if (format_str == "json") {
                    global_.logging.format = LogFormat::JSON;
                } else if (format_str == "text") {
                    global_.logging.format = LogFormat::TEXT;
                } else {
                    Logger::instance().error("[Config] Unknown log format | path={} | format={}", path, format_str);
                    return false;
                }
            }
            if (logging_section.contains("log_file")) {
                global_.logging.log_file = toml::find<std::string>(logging_section, "log_file");
            }
            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
        }

        Logger::instance().info("[Config] {} loaded | path={}", description, path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] {} parse failed | path={} | error={}",
                                description, path, e.what());
        return false;
    }
}

}}
