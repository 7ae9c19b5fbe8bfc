#pragma once

#include "archive_format.hpp"
#include "archive_header.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace rscpack::archive {

// Reads an archive appended to the end of a file (normally the running stub).
class ArchiveReader {
public:
    ArchiveReader();
    ~ArchiveReader();

    // Non-copyable, movable.
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ArchiveReader(ArchiveReader&& other) noexcept;
    ArchiveReader& operator=(ArchiveReader&& other) noexcept;

    // Locate the footer, read archive data and decode the header.
    // Nothing is written to disk.
    core::Status open(const std::filesystem::path& hostPath);

    void close();
    bool is_open() const { return open_; }

    const std::filesystem::path& path() const { return hostPath_; }
    const ArchiveHeader& header() const { return header_; }
    const Footer& footer() const { return footer_; }

    // Offset of archive data within the host file.
    std::uint64_t archive_start() const { return archiveStart_; }

    // Stored payload bytes (still compressed if the header says so).
    std::uint64_t stored_payload_size() const { return archiveData_.size() - footer_.headerLength; }

    // Payload as the resources see it, inflated in one pass when compressed.
    core::Status read_payload(std::vector<std::uint8_t>* outPayload) const;

    // Write every resource to destDir/filename in header order.
    // destDir is created (recursively) if missing; empty means the working
    // directory. Files written before a failure are left in place;
    // outWritten lists them either way.
    core::Status extract_all(const std::filesystem::path& destDir,
                             std::vector<std::filesystem::path>* outWritten) const;

private:
    std::filesystem::path hostPath_;
    ArchiveHeader header_;
    Footer footer_;
    std::uint64_t archiveStart_{0};
    std::vector<std::uint8_t> archiveData_;  // header ++ stored payload
    bool open_{false};
};

} // namespace rscpack::archive
