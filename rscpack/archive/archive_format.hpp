#pragma once

// rscpack appended archive (RSCARCHIVE v1)
//
// An archive is appended to an arbitrary host executable (the stub) and is
// found from the end of the file, so the stub needs no knowledge of its own size.
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Stub executable (variable)          │
// ├─────────────────────────────────────┤
// │ Header (header_length bytes)        │
// │   see archive_header.hpp            │
// ├─────────────────────────────────────┤
// │ Payload (variable)                  │
// │   Concatenated resource contents    │
// │   (no alignment padding), or one    │
// │   gzip stream of them when the      │
// │   header says is_compressed         │
// ├─────────────────────────────────────┤
// │ Footer (24 bytes)                   │
// │   header_length       : u32 LE      │
// │   archive_data_length : u32 LE      │
// │   marker[16] = "RSCARCHIVE_V1___"   │
// └─────────────────────────────────────┘
//
// archive_data_length = header_length + payload length.

#include "core/status.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace rscpack::archive {

constexpr std::size_t FOOTER_MARKER_SIZE = 16;
constexpr std::size_t FOOTER_SIZE = 4 + 4 + FOOTER_MARKER_SIZE;

constexpr std::array<unsigned char, FOOTER_MARKER_SIZE> FOOTER_MARKER{{
    'R', 'S', 'C', 'A', 'R', 'C', 'H', 'I', 'V', 'E', '_', 'V', '1', '_', '_', '_',
}};

struct Footer {
    std::uint32_t headerLength{0};
    std::uint32_t archiveDataLength{0};
};

std::array<std::uint8_t, FOOTER_SIZE> encode_footer(const Footer& footer);

// Parses the last FOOTER_SIZE bytes of a file. The marker must match byte-for-byte.
core::Status decode_footer(std::span<const std::uint8_t> bytes, Footer* outFooter);

// Computes where archive data starts in a file of fileSize bytes.
// Fails with CorruptArchive when the declared lengths do not fit the file.
core::Status locate_archive(std::uint64_t fileSize, const Footer& footer, std::uint64_t* outStart);

} // namespace rscpack::archive
