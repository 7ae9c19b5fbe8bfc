#pragma once

// Archive header encoding (all integers little-endian, str = u16 length + UTF-8 bytes):
//
//   magic[4]          = "RSHD"
//   extraction_path   : str
//   main_file         : str
//   resource_count    : u32
//   resources         : { filename : str, size : u32 } x resource_count
//   execution_style   : str   ("no-window" | "minimized" | "normal" | "maximized")
//   run_as_admin      : u8    (0/1)
//   is_compressed     : u8    (0/1)
//
// The encoded header must occupy exactly header_length bytes of archive data.

#include "core/status.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rscpack::archive {

constexpr std::array<unsigned char, 4> HEADER_MAGIC{{'R', 'S', 'H', 'D'}};

// Maximum number of resources a header may declare (to reject garbage counts early).
constexpr std::uint32_t MAX_RESOURCE_COUNT = 65536;

// The (decompressed) payload must fit the footer's 32-bit archive length.
constexpr std::uint64_t MAX_PAYLOAD_SIZE = 0xFFFFFFFFull;

enum class ExecutionStyle : std::uint8_t {
    Hidden = 0,
    Minimized = 1,
    Normal = 2,
    Maximized = 3,
};

// Wire name of a style ("no-window", "minimized", "normal", "maximized").
const char* execution_style_name(ExecutionStyle style);

// Case-insensitive. Accepts "hidden" as an alias of "no-window".
// Any unrecognized value maps to Normal.
ExecutionStyle parse_execution_style(std::string_view text);
bool is_known_execution_style(std::string_view text);

struct ResourceEntry {
    std::string filename;
    std::uint32_t size{0};

    bool operator==(const ResourceEntry&) const = default;
};

struct ArchiveHeader {
    std::string extractionPath;
    std::string mainFile;
    std::vector<ResourceEntry> resources;
    std::string executionStyle{"normal"};
    bool runAsAdmin{false};
    bool isCompressed{false};

    ExecutionStyle style() const { return parse_execution_style(executionStyle); }

    // Sum of all entry sizes, i.e. the expected decompressed payload length.
    std::uint64_t total_resource_size() const;
};

// A resource filename must be a single path component: non-empty, not "." or "..",
// and free of '/', '\\' and ':' so extraction cannot escape the target directory.
bool is_plain_filename(std::string_view name);

core::Status encode_header(const ArchiveHeader& header, std::vector<std::uint8_t>* outBytes);

// Fails with CorruptArchive on malformed input, trailing bytes, unsafe or
// duplicate filenames, a main file that is not one of the entries, or entry
// sizes that add up past MAX_PAYLOAD_SIZE.
core::Status decode_header(std::span<const std::uint8_t> bytes, ArchiveHeader* outHeader);

} // namespace rscpack::archive
