#pragma once

#include "core/status.hpp"
#include "platform.hpp"

#include <filesystem>
#include <vector>

namespace rscpack::launch {

struct ExtractionReport {
    std::filesystem::path extractionDir;              // After environment expansion
    std::vector<std::filesystem::path> writtenFiles;  // In header order
    core::Status launchStatus;                        // Launch outcome, never folded into the result
};

// Full stub run against hostPath: read the appended archive, pass the
// privilege gate, extract into the expanded extraction path, then launch the
// main file. Returns the first read/privilege/extraction failure. A launch
// failure is only recorded in outReport->launchStatus.
core::Status run_self_extractor(const std::filesystem::path& hostPath,
                                IPlatform& platform,
                                ExtractionReport* outReport);

} // namespace rscpack::launch
