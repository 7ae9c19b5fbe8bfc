#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace rscpack::core {

struct LoggingConfig {
    bool enabled{true};
    int level{0};  // raylib TraceLogLevel
    std::string file{};
};

// Logging enabled at LOG_INFO, no file sink.
LoggingConfig default_logging_config();

// Called once per `key = value` line with the current [section] name.
using IniHandler = std::function<void(const std::string& section,
                                      const std::string& key,
                                      const std::string& value)>;

// Parses an INI-style file. Lines starting with '#' or ';' are comments.
// Section and key names are passed lowercased; values are trimmed with quotes stripped.
// On failure returns false and fills outError (if provided).
bool parse_ini_file(const std::filesystem::path& path, const IniHandler& handler, std::string* outError);

std::string trim(std::string s);
std::string to_lower(std::string s);
std::string strip_quotes(std::string s);

bool parse_bool(const std::string& v, bool default_value);
int parse_int(const std::string& v, int default_value);
int log_level_from_string(const std::string& v, int default_value);
std::string log_level_name(int level);

// Applies one key of a [logging] section.
void apply_logging_kv(LoggingConfig& cfg, const std::string& key, const std::string& value);

} // namespace rscpack::core
