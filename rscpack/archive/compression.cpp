#include "compression.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <zlib.h>

namespace rscpack::archive {

namespace {

// windowBits + 16 selects the gzip wrapper in both deflate and inflate.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;
constexpr std::size_t kInflateChunk = 256 * 1024;
constexpr uInt kMaxStep = std::numeric_limits<uInt>::max();
// Deflate cannot expand data by more than about 1032:1.
constexpr std::size_t kMaxDeflateRatio = 1032;
constexpr std::size_t kMaxInitialOutput = 64 * 1024 * 1024;
constexpr std::size_t kMaxInflatedSize = 0xFFFFFFFFull;

std::string zlib_message(const z_stream& zs, int code) {
    if (zs.msg) {
        return std::string(zs.msg) + " (" + std::to_string(code) + ")";
    }
    return "zlib error " + std::to_string(code);
}

} // namespace

core::Status compress_payload(std::span<const std::uint8_t> input, std::vector<std::uint8_t>* outCompressed) {
    z_stream zs{};
    int rc = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        return core::Status::fail(core::ErrorKind::IO, "deflateInit2 failed: " + zlib_message(zs, rc));
    }

    std::vector<std::uint8_t> out(deflateBound(&zs, static_cast<uLong>(input.size())) + 64);

    const std::uint8_t* next = input.data();
    std::size_t left = input.size();
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(std::min<std::size_t>(out.size(), kMaxStep));

    do {
        const uInt step = static_cast<uInt>(std::min<std::size_t>(left, kMaxStep));
        zs.next_in = const_cast<Bytef*>(next);
        zs.avail_in = step;
        next += step;
        left -= step;

        const int flush = (left == 0) ? Z_FINISH : Z_NO_FLUSH;
        do {
            if (zs.avail_out == 0) {
                const std::size_t used = static_cast<std::size_t>(zs.next_out - out.data());
                if (used == out.size()) {
                    out.resize(out.size() * 2);
                }
                zs.next_out = out.data() + used;
                zs.avail_out = static_cast<uInt>(std::min<std::size_t>(out.size() - used, kMaxStep));
            }
            rc = deflate(&zs, flush);
            if (rc == Z_STREAM_ERROR) {
                deflateEnd(&zs);
                return core::Status::fail(core::ErrorKind::IO, "deflate failed: " + zlib_message(zs, rc));
            }
        } while (zs.avail_out == 0 || (flush == Z_FINISH && rc != Z_STREAM_END));
    } while (left > 0);

    const std::size_t produced = static_cast<std::size_t>(zs.next_out - out.data());
    deflateEnd(&zs);

    out.resize(produced);
    if (outCompressed) *outCompressed = std::move(out);
    return core::Status::ok();
}

core::Status decompress_payload(std::span<const std::uint8_t> input,
                                std::size_t sizeHint,
                                std::vector<std::uint8_t>* outData) {
    if (input.empty()) {
        return core::Status::fail(core::ErrorKind::CorruptArchive, "compressed payload is empty");
    }

    z_stream zs{};
    int rc = inflateInit2(&zs, kGzipWindowBits);
    if (rc != Z_OK) {
        return core::Status::fail(core::ErrorKind::CorruptArchive, "inflateInit2 failed: " + zlib_message(zs, rc));
    }

    // The hint comes from the archive header and is not trusted for allocation.
    std::size_t initial = std::min(sizeHint, kMaxInitialOutput);
    if (input.size() < (kMaxInitialOutput - 64) / kMaxDeflateRatio) {
        initial = std::min(initial, input.size() * kMaxDeflateRatio + 64);
    }
    std::vector<std::uint8_t> out(std::max<std::size_t>(initial, 1));
    std::size_t produced = 0;

    const std::uint8_t* next = input.data();
    std::size_t left = input.size();

    rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (zs.avail_in == 0) {
            if (left == 0) {
                inflateEnd(&zs);
                return core::Status::fail(core::ErrorKind::CorruptArchive,
                                          "compressed payload is truncated");
            }
            const uInt step = static_cast<uInt>(std::min<std::size_t>(left, kMaxStep));
            zs.next_in = const_cast<Bytef*>(next);
            zs.avail_in = step;
            next += step;
            left -= step;
        }

        if (produced == out.size()) {
            if (produced >= kMaxInflatedSize) {
                inflateEnd(&zs);
                return core::Status::fail(core::ErrorKind::CorruptArchive,
                                          "decompressed payload exceeds 4 GiB");
            }
            const std::size_t grown = out.size() + std::max(kInflateChunk, out.size() / 2);
            out.resize(std::min(grown, kMaxInflatedSize));
        }
        zs.next_out = out.data() + produced;
        zs.avail_out = static_cast<uInt>(std::min<std::size_t>(out.size() - produced, kMaxStep));

        const uInt before = zs.avail_out;
        rc = inflate(&zs, Z_NO_FLUSH);
        produced += before - zs.avail_out;

        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            const std::string msg = zlib_message(zs, rc);
            inflateEnd(&zs);
            return core::Status::fail(core::ErrorKind::CorruptArchive, "decompression failed: " + msg);
        }
        if (rc == Z_BUF_ERROR && zs.avail_in == 0 && left == 0) {
            inflateEnd(&zs);
            return core::Status::fail(core::ErrorKind::CorruptArchive, "compressed payload is truncated");
        }
    }

    const bool trailing = zs.avail_in > 0 || left > 0;
    inflateEnd(&zs);

    if (trailing) {
        return core::Status::fail(core::ErrorKind::CorruptArchive,
                                  "unexpected bytes after end of compressed payload");
    }

    out.resize(produced);
    if (outData) *outData = std::move(out);
    return core::Status::ok();
}

} // namespace rscpack::archive
