#include "config.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

#include <raylib.h>

namespace rscpack::core {

std::string trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string strip_quotes(std::string s) {
    s = trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int parse_int(const std::string& v, int default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) {
            return default_value;
        }
        return out;
    } catch (const std::exception&) {
        return default_value;
    }
}

int log_level_from_string(const std::string& v, int default_value) {
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

std::string log_level_name(int level) {
    switch (level) {
        case LOG_ALL: return "all";
        case LOG_TRACE: return "trace";
        case LOG_DEBUG: return "debug";
        case LOG_INFO: return "info";
        case LOG_WARNING: return "warning";
        case LOG_ERROR: return "error";
        case LOG_FATAL: return "fatal";
        case LOG_NONE: return "none";
        default: break;
    }
    return std::to_string(level);
}

LoggingConfig default_logging_config() {
    LoggingConfig cfg;
    cfg.enabled = true;
    cfg.level = LOG_INFO;
    cfg.file = "";
    return cfg;
}

void apply_logging_kv(LoggingConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "enabled") cfg.enabled = parse_bool(value, cfg.enabled);
    else if (key == "level") cfg.level = log_level_from_string(value, cfg.level);
    else if (key == "file") cfg.file = strip_quotes(value);
}

bool parse_ini_file(const std::filesystem::path& path, const IniHandler& handler, std::string* outError) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (outError) *outError = "cannot open " + path.string();
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        // Whole-line comments only: values are paths and may contain ';' or '#'.
        if (line.front() == '#' || line.front() == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            section = to_lower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = to_lower(trim(line.substr(0, eq)));
        std::string value = strip_quotes(line.substr(eq + 1));
        if (key.empty()) continue;

        handler(section, key, value);
    }

    if (in.bad()) {
        if (outError) *outError = "read error in " + path.string();
        return false;
    }

    return true;
}

} // namespace rscpack::core
