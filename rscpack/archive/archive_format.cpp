#include "archive_format.hpp"

#include "core/byte_buffer.hpp"

#include <algorithm>
#include <string>

namespace rscpack::archive {

std::array<std::uint8_t, FOOTER_SIZE> encode_footer(const Footer& footer) {
    core::ByteWriter writer(FOOTER_SIZE);
    writer.write_u32(footer.headerLength);
    writer.write_u32(footer.archiveDataLength);
    writer.write_tag(FOOTER_MARKER);

    std::array<std::uint8_t, FOOTER_SIZE> out{};
    std::copy(writer.data().begin(), writer.data().end(), out.begin());
    return out;
}

core::Status decode_footer(std::span<const std::uint8_t> bytes, Footer* outFooter) {
    if (bytes.size() != FOOTER_SIZE) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  "footer must be " + std::to_string(FOOTER_SIZE) + " bytes");
    }

    core::ByteReader reader(bytes);
    Footer footer;
    footer.headerLength = reader.read_u32();
    footer.archiveDataLength = reader.read_u32();

    if (!reader.read_tag(FOOTER_MARKER)) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  "invalid resource archive marker (no archive appended or unsupported version)");
    }

    if (footer.headerLength > footer.archiveDataLength) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  "header length " + std::to_string(footer.headerLength) +
                                  " exceeds archive data length " + std::to_string(footer.archiveDataLength));
    }

    if (outFooter) *outFooter = footer;
    return core::Status::ok();
}

core::Status locate_archive(std::uint64_t fileSize, const Footer& footer, std::uint64_t* outStart) {
    const std::uint64_t needed = static_cast<std::uint64_t>(footer.archiveDataLength) + FOOTER_SIZE;
    if (needed > fileSize) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  "invalid archive start: declared length " +
                                  std::to_string(footer.archiveDataLength) + " exceeds file size " +
                                  std::to_string(fileSize));
    }

    if (outStart) *outStart = fileSize - needed;
    return core::Status::ok();
}

} // namespace rscpack::archive
