#pragma once

#include "../zip/archive.hpp"

#include <string>

namespace zipbundle::core {

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};

    // Mirror log lines to stderr. With a file set, false keeps the
    // terminal quiet.
    bool console{true};
};

struct ArchiveConfig {
    zip::Utf8Names utf8Names{zip::Utf8Names::Auto};

    // false: DOS epoch for every entry (reproducible output).
    bool useCurrentTime{false};

    bool allowEmpty{true};

    // Sort tool input by archive path before packing.
    bool sort{true};
};

struct ToolConfig {
    LoggingConfig logging{};
    ArchiveConfig archive{};
};

// INI settings for the command line tools.
//
//   [logging]  enabled, level, file, console
//   [archive]  utf8_names (auto|always|never), timestamp (epoch|now),
//              allow_empty, sort
class Config {
public:
    static Config& instance();

    Config();

    bool load_from_file(const std::string& path);

    // Parses INI text; unknown sections and keys are ignored.
    void load_from_string(const std::string& text);

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ToolConfig& get() const { return config_; }

    const LoggingConfig& logging() const { return config_.logging; }
    const ArchiveConfig& archive() const { return config_.archive; }

    // Assembly options for the current settings. With timestamp = now the
    // clock is read on each call.
    zip::ArchiveOptions archive_options() const;

private:
    ToolConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);

    static int log_level_from_string(const std::string& v, int default_value);
    static zip::Utf8Names utf8_names_from_string(const std::string& v, zip::Utf8Names default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace zipbundle::core
