#pragma once

#include "archive_format.hpp"
#include "archive_header.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rscpack::archive {

// Everything needed to produce one self-extracting binary. Consumed once by pack().
struct BuildRequest {
    std::vector<std::filesystem::path> resources;  // In payload order
    std::string mainFile;                          // Filename component of one resource
    std::string extractionPath;
    std::string executionStyle{"normal"};
    bool runAsAdmin{false};
    bool compress{false};
    std::vector<std::uint8_t> stubBytes;
    std::filesystem::path outputPath;
};

struct PackReport {
    std::filesystem::path outputPath;
    ArchiveHeader header;
    Footer footer;
    std::uint64_t rawPayloadSize{0};
    std::uint64_t storedPayloadSize{0};
    std::uint64_t outputSize{0};
};

// Checks a request without touching the filesystem.
core::Status validate_request(const BuildRequest& request);

// Validates, reads resources, assembles the archive in memory and writes
// stub + archive + footer to request.outputPath in one go.
core::Status pack(const BuildRequest& request, PackReport* outReport);

// In-memory archive builder.
class ArchiveWriter {
public:
    // Header fields other than the resource list and compression flag.
    ArchiveWriter(std::string extractionPath, std::string mainFile, ExecutionStyle style, bool runAsAdmin);

    // Non-copyable.
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // Append a resource; its bytes follow the previous resource with no padding.
    core::Status add_resource(const std::string& filename, const std::vector<std::uint8_t>& data);

    // Read a file fully and append it under its filename component.
    core::Status add_resource_from_disk(const std::filesystem::path& sourcePath);

    // Produce header + payload (compressed as one stream when requested) and the footer.
    // Fails with Validation unless the main file is one of the added resources.
    core::Status finalize(bool compress, std::vector<std::uint8_t>* outArchiveData, Footer* outFooter);

    const ArchiveHeader& header() const { return header_; }
    std::uint64_t payload_size() const { return payload_.size(); }
    std::uint32_t resource_count() const { return static_cast<std::uint32_t>(header_.resources.size()); }

private:
    ArchiveHeader header_;
    std::vector<std::uint8_t> payload_;
    bool finalized_{false};
};

// Writes stub ++ archiveData ++ footer. Removes the output file if the write fails.
core::Status write_self_extractor(const std::filesystem::path& outputPath,
                                  const std::vector<std::uint8_t>& stubBytes,
                                  const std::vector<std::uint8_t>& archiveData,
                                  const Footer& footer);

} // namespace rscpack::archive
