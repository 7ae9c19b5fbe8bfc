#include "self_extractor.hpp"

#include "archive/archive_reader.hpp"
#include "launcher.hpp"
#include "core/utf8_path.hpp"

#include <utility>

#include <raylib.h>

namespace rscpack::launch {

namespace fs = std::filesystem;

core::Status run_self_extractor(const fs::path& hostPath, IPlatform& platform, ExtractionReport* outReport) {
    ExtractionReport report;

    archive::ArchiveReader reader;
    core::Status st = reader.open(hostPath);
    if (!st) {
        return st;
    }

    const archive::ArchiveHeader& header = reader.header();
    TraceLog(LOG_INFO, "[extract] Archive: %zu resource(s), main file '%s', %s payload",
             header.resources.size(), header.mainFile.c_str(),
             header.isCompressed ? "compressed" : "raw");

    Launcher launcher(platform);

    // Gate before anything is written.
    st = launcher.check_privileges(header);
    if (!st) {
        return st;
    }

    // An empty extraction path means the working directory.
    const std::string expanded = platform.expand_environment(header.extractionPath);
    report.extractionDir = expanded.empty() ? fs::path(".") : core::path_from_utf8(expanded);
    TraceLog(LOG_INFO, "[extract] Extracting to %s", core::path_to_utf8(report.extractionDir).c_str());

    st = reader.extract_all(report.extractionDir, &report.writtenFiles);
    if (!st) {
        if (outReport) *outReport = std::move(report);
        return st;
    }

    report.launchStatus = launcher.launch(report.extractionDir, header);

    if (outReport) *outReport = std::move(report);
    return core::Status::ok();
}

} // namespace rscpack::launch
