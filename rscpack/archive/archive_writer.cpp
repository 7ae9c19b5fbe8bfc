#include "archive_writer.hpp"

#include "compression.hpp"
#include "core/utf8_path.hpp"

#include <cstdio>
#include <fstream>
#include <limits>
#include <unordered_set>

#include <raylib.h>

namespace rscpack::archive {

namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();

} // namespace

core::Status validate_request(const BuildRequest& request) {
    if (request.outputPath.empty()) {
        return core::Status::fail(core::ErrorKind::Validation, "output path is empty");
    }

    bool mainFound = false;
    std::unordered_set<std::string> seen;

    for (const auto& path : request.resources) {
        const std::string name = core::path_to_utf8(path.filename());
        if (!is_plain_filename(name)) {
            return core::Status::fail(core::ErrorKind::Validation,
                                      "invalid resource file name: " + path.string());
        }
        if (!seen.insert(name).second) {
            return core::Status::fail(core::ErrorKind::Validation,
                                      "duplicate resource file name: " + name);
        }
        if (name == request.mainFile) {
            mainFound = true;
        }
    }

    if (!mainFound) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  "main file '" + request.mainFile +
                                  "' must be one of the added resources (by filename)");
    }

    return core::Status::ok();
}

core::Status pack(const BuildRequest& request, PackReport* outReport) {
    core::Status st = validate_request(request);
    if (!st) {
        return st;
    }

    const ExecutionStyle style = parse_execution_style(request.executionStyle);
    if (!is_known_execution_style(request.executionStyle)) {
        TraceLog(LOG_WARNING, "[pack] Unknown execution style '%s', using '%s'",
                 request.executionStyle.c_str(), execution_style_name(style));
    }

    ArchiveWriter writer(request.extractionPath, request.mainFile, style, request.runAsAdmin);

    for (const auto& path : request.resources) {
        st = writer.add_resource_from_disk(path);
        if (!st) {
            return st;
        }
    }

    std::vector<std::uint8_t> archiveData;
    Footer footer;
    st = writer.finalize(request.compress, &archiveData, &footer);
    if (!st) {
        return st;
    }

    st = write_self_extractor(request.outputPath, request.stubBytes, archiveData, footer);
    if (!st) {
        return st;
    }

    PackReport report;
    report.outputPath = request.outputPath;
    report.header = writer.header();
    report.footer = footer;
    report.rawPayloadSize = writer.payload_size();
    report.storedPayloadSize = footer.archiveDataLength - footer.headerLength;
    report.outputSize = request.stubBytes.size() + archiveData.size() + FOOTER_SIZE;

    TraceLog(LOG_INFO, "[pack] Wrote %s: %u resources, header %u bytes, payload %llu -> %llu bytes%s",
             request.outputPath.string().c_str(),
             writer.resource_count(),
             footer.headerLength,
             static_cast<unsigned long long>(report.rawPayloadSize),
             static_cast<unsigned long long>(report.storedPayloadSize),
             request.compress ? " (gzip)" : "");

    if (outReport) *outReport = std::move(report);
    return core::Status::ok();
}

ArchiveWriter::ArchiveWriter(std::string extractionPath, std::string mainFile, ExecutionStyle style, bool runAsAdmin) {
    header_.extractionPath = std::move(extractionPath);
    header_.mainFile = std::move(mainFile);
    header_.executionStyle = execution_style_name(style);
    header_.runAsAdmin = runAsAdmin;
}

core::Status ArchiveWriter::add_resource(const std::string& filename, const std::vector<std::uint8_t>& data) {
    if (finalized_) {
        return core::Status::fail(core::ErrorKind::Validation, "archive already finalized");
    }

    if (!is_plain_filename(filename)) {
        return core::Status::fail(core::ErrorKind::Validation, "invalid resource file name: " + filename);
    }

    for (const auto& entry : header_.resources) {
        if (entry.filename == filename) {
            return core::Status::fail(core::ErrorKind::Validation, "duplicate resource file name: " + filename);
        }
    }

    if (data.size() > kMaxU32) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  "resource " + filename + " is larger than 4 GiB");
    }

    payload_.insert(payload_.end(), data.begin(), data.end());

    ResourceEntry entry;
    entry.filename = filename;
    entry.size = static_cast<std::uint32_t>(data.size());
    header_.resources.push_back(std::move(entry));

    TraceLog(LOG_DEBUG, "[pack] + %s (%zu bytes)", filename.c_str(), data.size());
    return core::Status::ok();
}

core::Status ArchiveWriter::add_resource_from_disk(const fs::path& sourcePath) {
    std::ifstream src(sourcePath, std::ios::binary | std::ios::ate);
    if (!src) {
        return core::Status::fail(core::ErrorKind::IO, "failed to read resource " + sourcePath.string());
    }

    const std::streamoff end = src.tellg();
    if (end < 0) {
        return core::Status::fail(core::ErrorKind::IO, "failed to read resource " + sourcePath.string());
    }
    if (static_cast<std::uint64_t>(end) > kMaxU32) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  "resource " + sourcePath.string() + " is larger than 4 GiB");
    }

    const auto size = static_cast<std::size_t>(end);
    src.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(size);
    if (size > 0) {
        if (!src.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
            return core::Status::fail(core::ErrorKind::IO, "failed to read resource " + sourcePath.string());
        }
    }

    return add_resource(core::path_to_utf8(sourcePath.filename()), data);
}

core::Status ArchiveWriter::finalize(bool compress, std::vector<std::uint8_t>* outArchiveData, Footer* outFooter) {
    if (finalized_) {
        return core::Status::fail(core::ErrorKind::Validation, "archive already finalized");
    }

    bool mainFound = false;
    for (const auto& entry : header_.resources) {
        if (entry.filename == header_.mainFile) {
            mainFound = true;
            break;
        }
    }
    if (!mainFound) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  "main file '" + header_.mainFile + "' is not one of the added resources");
    }
    if (payload_.size() > MAX_PAYLOAD_SIZE) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  "resource data (" + std::to_string(payload_.size()) +
                                  " bytes) exceeds the 4 GiB format limit");
    }

    header_.isCompressed = compress;

    std::vector<std::uint8_t> stored;
    if (compress) {
        core::Status st = compress_payload(payload_, &stored);
        if (!st) {
            return st;
        }
    }
    const std::vector<std::uint8_t>& payload = compress ? stored : payload_;

    std::vector<std::uint8_t> headerBytes;
    core::Status st = encode_header(header_, &headerBytes);
    if (!st) {
        return st;
    }

    const std::uint64_t archiveLength = static_cast<std::uint64_t>(headerBytes.size()) + payload.size();
    if (archiveLength > kMaxU32) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  "archive data (" + std::to_string(archiveLength) + " bytes) exceeds the 4 GiB format limit");
    }

    Footer footer;
    footer.headerLength = static_cast<std::uint32_t>(headerBytes.size());
    footer.archiveDataLength = static_cast<std::uint32_t>(archiveLength);

    std::vector<std::uint8_t> archiveData;
    archiveData.reserve(static_cast<std::size_t>(archiveLength));
    archiveData.insert(archiveData.end(), headerBytes.begin(), headerBytes.end());
    archiveData.insert(archiveData.end(), payload.begin(), payload.end());

    finalized_ = true;

    if (outArchiveData) *outArchiveData = std::move(archiveData);
    if (outFooter) *outFooter = footer;
    return core::Status::ok();
}

core::Status write_self_extractor(const fs::path& outputPath,
                                  const std::vector<std::uint8_t>& stubBytes,
                                  const std::vector<std::uint8_t>& archiveData,
                                  const Footer& footer) {
    const std::string pathStr = outputPath.string();
    FILE* file = std::fopen(pathStr.c_str(), "wb");
    if (!file) {
        return core::Status::fail(core::ErrorKind::IO, "failed to open output " + pathStr + " for writing");
    }

    const auto trailer = encode_footer(footer);

    bool ok = true;
    if (!stubBytes.empty()) {
        ok = std::fwrite(stubBytes.data(), 1, stubBytes.size(), file) == stubBytes.size();
    }
    if (ok && !archiveData.empty()) {
        ok = std::fwrite(archiveData.data(), 1, archiveData.size(), file) == archiveData.size();
    }
    if (ok) {
        ok = std::fwrite(trailer.data(), 1, trailer.size(), file) == trailer.size();
    }
    if (std::fclose(file) != 0) {
        ok = false;
    }

    if (!ok) {
        std::error_code ec;
        fs::remove(outputPath, ec);
        return core::Status::fail(core::ErrorKind::IO, "failed to write output " + pathStr);
    }

#if !defined(_WIN32)
    std::error_code ec;
    fs::permissions(outputPath,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        TraceLog(LOG_WARNING, "[pack] Could not mark %s executable: %s", pathStr.c_str(), ec.message().c_str());
    }
#endif

    return core::Status::ok();
}

} // namespace rscpack::archive
