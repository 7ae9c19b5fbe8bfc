// rscstub - self-extracting bundle bootstrap.
// Reads the archive appended to its own executable, extracts the resources and
// launches the main file. Takes no arguments.

#include "core/logger.hpp"
#include "launch/platform.hpp"
#include "launch/self_extractor.hpp"

#include <iostream>

#include <raylib.h>

#ifndef RSCPACK_VERSION
#define RSCPACK_VERSION "0.0.0-dev"
#endif

int main() {
    rscpack::core::Logger::instance().init(rscpack::core::default_logging_config());
    TraceLog(LOG_DEBUG, "[extract] rscstub v%s", RSCPACK_VERSION);

    const auto self = rscpack::launch::current_executable_path();
    if (!self) {
        std::cerr << "[ERROR] Cannot determine the path of the running executable\n";
        return 1;
    }

    auto platform = rscpack::launch::create_native_platform();

    rscpack::launch::ExtractionReport report;
    const rscpack::core::Status st = rscpack::launch::run_self_extractor(*self, *platform, &report);
    if (!st) {
        std::cerr << "[ERROR] " << st.describe() << "\n";
        rscpack::core::Logger::instance().shutdown();
        return 1;
    }

    TraceLog(LOG_INFO, "[extract] Extracted %zu file(s) to %s",
             report.writtenFiles.size(), report.extractionDir.string().c_str());

    // Extraction stands even if the launch did not go through.
    if (!report.launchStatus) {
        std::cerr << "[WARNING] " << report.launchStatus.describe() << "\n";
    }

    rscpack::core::Logger::instance().shutdown();
    return 0;
}
