#pragma once

#include <filesystem>
#include <string>

namespace rscpack::core {

// Archive header fields and expanded environment strings are UTF-8. Building
// a path from a plain std::string would go through the ANSI code page on
// Windows.
inline std::filesystem::path path_from_utf8(const std::string& s) {
    return std::filesystem::path(std::u8string(s.begin(), s.end()));
}

inline std::string path_to_utf8(const std::filesystem::path& p) {
    const std::u8string u = p.u8string();
    return std::string(u.begin(), u.end());
}

} // namespace rscpack::core
