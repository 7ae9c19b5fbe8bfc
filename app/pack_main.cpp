// rscpack - CLI tool for building self-extracting resource bundles.
//
// Usage:
//   rscpack [--project <file>] --resource <path> ... --main <name> [options]
//
// Options:
//   --project <file>         Load settings from a project file.
//   --resource, -r <path>    File to bundle (can be repeated, appended to the project's list).
//   --main, -m <name>        File name of the resource to launch after extraction.
//   --extract-to, -x <path>  Extraction directory; may contain environment placeholders.
//   --style <style>          no-window | minimized | normal | maximized.
//   --admin                  Require administrator rights to run the bundle.
//   --compress, -c           Compress the payload (gzip).
//   --stub <path>            Stub executable to prepend.
//   --output, -o <file>      Output executable path.
//   --save-project <file>    Write the effective settings to a project file.
//   --verbose, -v            Debug logging.
//   --help, -h               Show this help message.

#include "archive/archive_writer.hpp"
#include "core/logger.hpp"
#include "core/project.hpp"
#include "launch/platform.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <raylib.h>

#ifndef RSCPACK_VERSION
#define RSCPACK_VERSION "0.0.0-dev"
#endif

namespace fs = std::filesystem;

namespace {

struct Options {
    std::optional<fs::path> projectFile;
    std::vector<fs::path> resources;
    std::optional<std::string> mainFile;
    std::optional<std::string> extractTo;
    std::optional<std::string> style;
    bool admin{false};
    bool compress{false};
    std::optional<fs::path> stub;
    std::optional<fs::path> output;
    std::optional<fs::path> saveProject;
    bool verbose{false};
    bool help{false};
};

void print_usage(const char* program) {
    std::cerr << "rscpack v" << RSCPACK_VERSION << "\n"
              << "\n"
              << "Usage: " << program << " [--project <file>] --resource <path> ... --main <name> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --project <file>         Load settings from a project file.\n"
              << "  --resource, -r <path>    File to bundle (can be repeated).\n"
              << "  --main, -m <name>        File name of the resource to launch after extraction.\n"
              << "  --extract-to, -x <path>  Extraction directory (default: " << rscpack::core::DEFAULT_EXTRACTION_PATH << ").\n"
              << "  --style <style>          no-window | minimized | normal | maximized (default: normal).\n"
              << "  --admin                  Require administrator rights to run the bundle.\n"
              << "  --compress, -c           Compress the payload (gzip).\n"
              << "  --stub <path>            Stub executable (default: " << rscpack::core::DEFAULT_STUB_NAME << ").\n"
              << "  --output, -o <file>      Output executable (default: " << rscpack::core::DEFAULT_OUTPUT_NAME << ").\n"
              << "  --save-project <file>    Write the effective settings to a project file.\n"
              << "  --verbose, -v            Debug logging.\n"
              << "  --help, -h               Show this help message.\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* what) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires " << what << ".\n";
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            return true;
        } else if (arg == "--project") {
            const char* v = next_value("a file path");
            if (!v) return false;
            opts.projectFile = v;
        } else if (arg == "--resource" || arg == "-r") {
            const char* v = next_value("a file path");
            if (!v) return false;
            opts.resources.push_back(v);
        } else if (arg == "--main" || arg == "-m") {
            const char* v = next_value("a file name");
            if (!v) return false;
            opts.mainFile = v;
        } else if (arg == "--extract-to" || arg == "-x") {
            const char* v = next_value("a directory path");
            if (!v) return false;
            opts.extractTo = v;
        } else if (arg == "--style") {
            const char* v = next_value("a style name");
            if (!v) return false;
            opts.style = v;
        } else if (arg == "--admin") {
            opts.admin = true;
        } else if (arg == "--compress" || arg == "-c") {
            opts.compress = true;
        } else if (arg == "--stub") {
            const char* v = next_value("a file path");
            if (!v) return false;
            opts.stub = v;
        } else if (arg == "--output" || arg == "-o") {
            const char* v = next_value("a file path");
            if (!v) return false;
            opts.output = v;
        } else if (arg == "--save-project") {
            const char* v = next_value("a file path");
            if (!v) return false;
            opts.saveProject = v;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    return true;
}

void apply_overrides(const Options& opts, rscpack::core::ProjectConfig& project) {
    for (const auto& r : opts.resources) {
        project.resources.push_back(r);
    }
    if (opts.mainFile) project.mainFile = *opts.mainFile;
    if (opts.extractTo) project.extractionPath = *opts.extractTo;
    if (opts.style) project.executionStyle = *opts.style;
    if (opts.admin) project.runAsAdmin = true;
    if (opts.compress) project.compress = true;
    if (opts.stub) project.stub = *opts.stub;
    if (opts.output) project.output = *opts.output;
}

void init_logging(const rscpack::core::LoggingConfig& cfg, bool verbose) {
    rscpack::core::LoggingConfig effective = cfg;
    if (verbose) {
        effective.enabled = true;
        effective.level = LOG_DEBUG;
    }
    rscpack::core::Logger::instance().init(effective);
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        return 1;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    rscpack::core::ProjectConfig project;
    init_logging(project.logging, opts.verbose);

    if (opts.projectFile) {
        rscpack::core::Status st = rscpack::core::load_project(*opts.projectFile, &project);
        if (!st) {
            std::cerr << "Error: " << st.describe() << "\n";
            return 1;
        }
        init_logging(project.logging, opts.verbose);
    }

    apply_overrides(opts, project);

    if (opts.saveProject) {
        rscpack::core::Status st = rscpack::core::save_project(*opts.saveProject, project);
        if (!st) {
            std::cerr << "Error: " << st.describe() << "\n";
            return 1;
        }
        std::cout << "Saved project to " << opts.saveProject->string() << "\n";

        // Saving alone is a complete run.
        if (project.resources.empty()) {
            return 0;
        }
    }

    if (project.resources.empty()) {
        std::cerr << "Error: No resources to pack.\n";
        print_usage(argv[0]);
        return 1;
    }

    const fs::path stubPath = rscpack::core::resolve_stub_path(project.stub, rscpack::launch::current_executable_path());

    rscpack::archive::BuildRequest request;
    rscpack::core::Status st = rscpack::core::make_build_request(project, stubPath, &request);
    if (!st) {
        std::cerr << "Error: " << st.describe() << "\n";
        return 1;
    }

    rscpack::archive::PackReport report;
    st = rscpack::archive::pack(request, &report);
    if (!st) {
        std::cerr << "Error: " << st.describe() << "\n";
        return 1;
    }

    if (opts.verbose) {
        for (const auto& entry : report.header.resources) {
            std::cout << "  " << entry.filename << " (" << entry.size << " bytes)\n";
        }
    }

    std::cout << "Packed " << report.header.resources.size() << " files into " << report.outputPath.string() << "\n";
    std::cout << "  Stub:         " << stubPath.string() << "\n";
    std::cout << "  Header:       " << report.footer.headerLength << " bytes\n";
    std::cout << "  Payload:      " << report.rawPayloadSize << " bytes"
              << (report.header.isCompressed ? " (" + std::to_string(report.storedPayloadSize) + " compressed)" : "")
              << "\n";
    std::cout << "  Output size:  " << (report.outputSize / 1024) << " KB\n";

    rscpack::core::Logger::instance().shutdown();
    return 0;
}
