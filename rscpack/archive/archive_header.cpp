#include "archive_header.hpp"

#include "core/byte_buffer.hpp"
#include "core/config.hpp"

#include <stdexcept>
#include <unordered_set>

namespace rscpack::archive {

const char* execution_style_name(ExecutionStyle style) {
    switch (style) {
        case ExecutionStyle::Hidden: return "no-window";
        case ExecutionStyle::Minimized: return "minimized";
        case ExecutionStyle::Normal: return "normal";
        case ExecutionStyle::Maximized: return "maximized";
    }
    return "normal";
}

ExecutionStyle parse_execution_style(std::string_view text) {
    const std::string s = core::to_lower(core::trim(std::string(text)));

    if (s == "no-window" || s == "hidden") return ExecutionStyle::Hidden;
    if (s == "minimized") return ExecutionStyle::Minimized;
    if (s == "maximized") return ExecutionStyle::Maximized;
    return ExecutionStyle::Normal;
}

bool is_known_execution_style(std::string_view text) {
    const std::string s = core::to_lower(core::trim(std::string(text)));
    return s == "no-window" || s == "hidden" || s == "minimized" || s == "normal" || s == "maximized";
}

std::uint64_t ArchiveHeader::total_resource_size() const {
    std::uint64_t total = 0;
    for (const auto& entry : resources) {
        total += entry.size;
    }
    return total;
}

bool is_plain_filename(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\:") == std::string_view::npos;
}

core::Status encode_header(const ArchiveHeader& header, std::vector<std::uint8_t>* outBytes) {
    if (header.resources.size() > MAX_RESOURCE_COUNT) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  "too many resources (" + std::to_string(header.resources.size()) + ")");
    }

    core::ByteWriter writer(256);
    try {
        writer.write_tag(HEADER_MAGIC);
        writer.write_string(header.extractionPath);
        writer.write_string(header.mainFile);
        writer.write_u32(static_cast<std::uint32_t>(header.resources.size()));
        for (const auto& entry : header.resources) {
            writer.write_string(entry.filename);
            writer.write_u32(entry.size);
        }
        writer.write_string(header.executionStyle);
        writer.write_bool(header.runAsAdmin);
        writer.write_bool(header.isCompressed);
    } catch (const std::runtime_error& e) {
        return core::Status::fail(core::ErrorKind::Validation,
                                  std::string("cannot encode header: ") + e.what());
    }

    if (outBytes) *outBytes = writer.take();
    return core::Status::ok();
}

core::Status decode_header(std::span<const std::uint8_t> bytes, ArchiveHeader* outHeader) {
    ArchiveHeader header;
    core::ByteReader reader(bytes);
    std::unordered_set<std::string> names;

    try {
        if (!reader.read_tag(HEADER_MAGIC)) {
            return core::Status::fail(core::ErrorKind::CorruptArchive, "bad header magic");
        }

        header.extractionPath = reader.read_string();
        header.mainFile = reader.read_string();

        const std::uint32_t count = reader.read_u32();
        if (count > MAX_RESOURCE_COUNT) {
            return core::Status::fail(core::ErrorKind::CorruptArchive,
                                      "resource count " + std::to_string(count) + " out of range");
        }

        header.resources.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            ResourceEntry entry;
            entry.filename = reader.read_string();
            entry.size = reader.read_u32();

            if (!is_plain_filename(entry.filename)) {
                return core::Status::fail(core::ErrorKind::CorruptArchive,
                                          "unsafe resource filename '" + entry.filename + "'");
            }
            if (!names.insert(entry.filename).second) {
                return core::Status::fail(core::ErrorKind::CorruptArchive,
                                          "duplicate resource filename '" + entry.filename + "'");
            }
            header.resources.push_back(std::move(entry));
        }

        header.executionStyle = reader.read_string();
        header.runAsAdmin = reader.read_bool();
        header.isCompressed = reader.read_bool();
    } catch (const std::runtime_error& e) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  std::string("malformed header: ") + e.what());
    }

    if (!reader.at_end()) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  std::to_string(reader.remaining()) + " trailing bytes after header");
    }

    // The launcher resolves main_file under the extraction directory, so it
    // must name one of the extracted entries.
    if (names.find(header.mainFile) == names.end()) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  "main file '" + header.mainFile + "' is not one of the archived resources");
    }

    const std::uint64_t total = header.total_resource_size();
    if (total > MAX_PAYLOAD_SIZE) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  "declared resource sizes (" + std::to_string(total) +
                                  " bytes) exceed the 4 GiB payload limit");
    }

    if (outHeader) *outHeader = std::move(header);
    return core::Status::ok();
}

} // namespace rscpack::archive
