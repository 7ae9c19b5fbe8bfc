#pragma once

#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rscpack::archive {

// Compresses the whole payload as a single gzip stream.
core::Status compress_payload(std::span<const std::uint8_t> input, std::vector<std::uint8_t>* outCompressed);

// Inflates one complete gzip stream. sizeHint pre-sizes the output buffer
// (the header's total resource size), bounded by what the input can inflate
// to; the result may differ from it.
// Fails with CorruptArchive on a damaged, truncated or over-long stream, or
// when the output would exceed 4 GiB.
core::Status decompress_payload(std::span<const std::uint8_t> input,
                                std::size_t sizeHint,
                                std::vector<std::uint8_t>* outData);

} // namespace rscpack::archive
