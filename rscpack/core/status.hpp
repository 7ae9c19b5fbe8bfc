#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace rscpack::core {

enum class ErrorKind : std::uint8_t {
    None = 0,
    Validation = 1,      // Bad packer input
    IO = 2,              // Disk read/write/permission failure
    CorruptArchive = 3,  // Marker, length, decode, decompression or offset failure
    Privilege = 4,       // Elevation missing or could not be queried
    Launch = 5,          // Spawn error or OS-reported launch failure
};

const char* error_kind_name(ErrorKind kind);

// Operation result shared by packer, extractor and launcher.
struct Status {
    ErrorKind kind{ErrorKind::None};
    std::string message;

    static Status ok() { return {ErrorKind::None, ""}; }
    static Status fail(ErrorKind k, std::string msg) { return {k, std::move(msg)}; }

    bool is_ok() const { return kind == ErrorKind::None; }
    explicit operator bool() const { return is_ok(); }

    // e.g. "CorruptArchiveError: invalid archive marker"
    std::string describe() const;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "Ok";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::IO: return "IOError";
        case ErrorKind::CorruptArchive: return "CorruptArchiveError";
        case ErrorKind::Privilege: return "PrivilegeError";
        case ErrorKind::Launch: return "LaunchError";
    }
    return "UnknownError";
}

inline std::string Status::describe() const {
    if (is_ok()) {
        return "Ok";
    }
    return std::string(error_kind_name(kind)) + ": " + message;
}

} // namespace rscpack::core
