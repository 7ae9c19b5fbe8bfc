#include "archive_reader.hpp"

#include "compression.hpp"
#include "core/utf8_path.hpp"

#include <fstream>
#include <span>
#include <string>

#include <raylib.h>

namespace rscpack::archive {

namespace fs = std::filesystem;

namespace {

bool read_at(std::ifstream& in, std::uint64_t offset, std::uint8_t* data, std::size_t size) {
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in) {
        return false;
    }
    if (size == 0) {
        return true;
    }
    in.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
    return static_cast<bool>(in);
}

} // namespace

ArchiveReader::ArchiveReader() = default;

ArchiveReader::~ArchiveReader() = default;

ArchiveReader::ArchiveReader(ArchiveReader&& other) noexcept
    : hostPath_(std::move(other.hostPath_))
    , header_(std::move(other.header_))
    , footer_(other.footer_)
    , archiveStart_(other.archiveStart_)
    , archiveData_(std::move(other.archiveData_))
    , open_(other.open_) {
    other.open_ = false;
}

ArchiveReader& ArchiveReader::operator=(ArchiveReader&& other) noexcept {
    if (this != &other) {
        hostPath_ = std::move(other.hostPath_);
        header_ = std::move(other.header_);
        footer_ = other.footer_;
        archiveStart_ = other.archiveStart_;
        archiveData_ = std::move(other.archiveData_);
        open_ = other.open_;
        other.open_ = false;
    }
    return *this;
}

core::Status ArchiveReader::open(const fs::path& hostPath) {
    close();

    std::error_code ec;
    const std::uint64_t fileSize = fs::file_size(hostPath, ec);
    if (ec) {
        return core::Status::fail(core::ErrorKind::IO,
                                  "cannot stat " + hostPath.string() + ": " + ec.message());
    }

    if (fileSize < FOOTER_SIZE) {
        return core::Status::fail(core::ErrorKind::CorruptArchive, "no appended resource archive found");
    }

    std::ifstream in(hostPath, std::ios::binary);
    if (!in) {
        return core::Status::fail(core::ErrorKind::IO, "failed to open " + hostPath.string());
    }

    std::uint8_t trailer[FOOTER_SIZE];
    if (!read_at(in, fileSize - FOOTER_SIZE, trailer, FOOTER_SIZE)) {
        return core::Status::fail(core::ErrorKind::IO, "failed to read footer of " + hostPath.string());
    }

    Footer footer;
    core::Status st = decode_footer(std::span<const std::uint8_t>(trailer, FOOTER_SIZE), &footer);
    if (!st) {
        return st;
    }

    std::uint64_t start = 0;
    st = locate_archive(fileSize, footer, &start);
    if (!st) {
        return st;
    }

    std::vector<std::uint8_t> data(footer.archiveDataLength);
    if (!read_at(in, start, data.data(), data.size())) {
        return core::Status::fail(core::ErrorKind::IO, "failed to read archive data of " + hostPath.string());
    }

    ArchiveHeader header;
    st = decode_header(std::span<const std::uint8_t>(data.data(), footer.headerLength), &header);
    if (!st) {
        return st;
    }

    hostPath_ = hostPath;
    header_ = std::move(header);
    footer_ = footer;
    archiveStart_ = start;
    archiveData_ = std::move(data);
    open_ = true;

    TraceLog(LOG_DEBUG, "[extract] Archive at offset %llu: header %u bytes, %zu resources, payload %llu bytes%s",
             static_cast<unsigned long long>(archiveStart_),
             footer_.headerLength,
             header_.resources.size(),
             static_cast<unsigned long long>(stored_payload_size()),
             header_.isCompressed ? " (gzip)" : "");

    return core::Status::ok();
}

void ArchiveReader::close() {
    hostPath_.clear();
    header_ = ArchiveHeader{};
    footer_ = Footer{};
    archiveStart_ = 0;
    archiveData_.clear();
    open_ = false;
}

core::Status ArchiveReader::read_payload(std::vector<std::uint8_t>* outPayload) const {
    if (!open_) {
        return core::Status::fail(core::ErrorKind::IO, "archive is not open");
    }

    const std::span<const std::uint8_t> stored(archiveData_.data() + footer_.headerLength,
                                               archiveData_.size() - footer_.headerLength);

    if (!header_.isCompressed) {
        if (outPayload) outPayload->assign(stored.begin(), stored.end());
        return core::Status::ok();
    }

    return decompress_payload(stored, static_cast<std::size_t>(header_.total_resource_size()), outPayload);
}

core::Status ArchiveReader::extract_all(const fs::path& destDir, std::vector<fs::path>* outWritten) const {
    if (!open_) {
        return core::Status::fail(core::ErrorKind::IO, "archive is not open");
    }

    std::vector<std::uint8_t> payload;
    core::Status st = read_payload(&payload);
    if (!st) {
        return st;
    }

    // An empty extraction path means the working directory.
    const fs::path root = destDir.empty() ? fs::path(".") : destDir;

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return core::Status::fail(core::ErrorKind::IO,
                                  "failed to create extraction directory " + core::path_to_utf8(root) + ": " +
                                  ec.message());
    }

    std::uint64_t offset = 0;
    for (const auto& entry : header_.resources) {
        if (offset + entry.size > payload.size()) {
            return core::Status::fail(core::ErrorKind::CorruptArchive,
                                      "resource data is incomplete: " + entry.filename + " needs " +
                                      std::to_string(entry.size) + " bytes at offset " + std::to_string(offset) +
                                      ", payload has " + std::to_string(payload.size()));
        }

        const fs::path target = root / core::path_from_utf8(entry.filename);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            return core::Status::fail(core::ErrorKind::IO, "failed to write file " + core::path_to_utf8(target));
        }
        if (entry.size > 0) {
            out.write(reinterpret_cast<const char*>(payload.data() + offset), static_cast<std::streamsize>(entry.size));
        }
        out.close();
        if (!out) {
            return core::Status::fail(core::ErrorKind::IO, "failed to write file " + core::path_to_utf8(target));
        }

        if (outWritten) outWritten->push_back(target);
        TraceLog(LOG_DEBUG, "[extract] %s (%u bytes)", core::path_to_utf8(target).c_str(), entry.size);

        offset += entry.size;
    }

    if (offset != payload.size()) {
        TraceLog(LOG_WARNING, "[extract] %llu trailing payload bytes after the last resource",
                 static_cast<unsigned long long>(payload.size() - offset));
    }

    return core::Status::ok();
}

} // namespace rscpack::archive
