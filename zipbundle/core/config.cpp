#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <raylib.h>

namespace zipbundle::core {

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    // Logging defaults
    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) {
            return default_value;
        }
        return out;
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range
        return default_value;
    }
}

static std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    // Allow numeric.
    return parse_int(s, default_value);
}

zip::Utf8Names Config::utf8_names_from_string(const std::string& v, zip::Utf8Names default_value) {
    const std::string s = to_lower(strip_quotes(v));
    if (s == "auto") return zip::Utf8Names::Auto;
    if (s == "always" || s == "true" || s == "on") return zip::Utf8Names::Always;
    if (s == "never" || s == "false" || s == "off") return zip::Utf8Names::Never;
    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        else if (k == "console") config_.logging.console = parse_bool(v, config_.logging.console);
        return;
    }

    if (sec == "archive") {
        if (k == "utf8_names") {
            config_.archive.utf8Names = utf8_names_from_string(v, config_.archive.utf8Names);
        } else if (k == "timestamp") {
            const std::string ts = to_lower(v);
            if (ts == "now") config_.archive.useCurrentTime = true;
            else if (ts == "epoch" || ts == "fixed") config_.archive.useCurrentTime = false;
        } else if (k == "allow_empty") {
            config_.archive.allowEmpty = parse_bool(v, config_.archive.allowEmpty);
        } else if (k == "sort") {
            config_.archive.sort = parse_bool(v, config_.archive.sort);
        }
        return;
    }
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Strip comments (# or ;) - cut at first occurrence.
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::ostringstream text;
    text << in.rdbuf();
    load_from_string(text.str());

    loaded_from_path_ = path;
    return true;
}

zip::ArchiveOptions Config::archive_options() const {
    zip::ArchiveOptions options;
    options.utf8Names = config_.archive.utf8Names;
    options.allowEmpty = config_.archive.allowEmpty;
    if (config_.archive.useCurrentTime) {
        options.modifiedTime = std::time(nullptr);
    }
    return options;
}

} // namespace zipbundle::core
