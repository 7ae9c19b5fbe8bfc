#pragma once

#include "archive/archive_writer.hpp"
#include "config.hpp"
#include "status.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rscpack::core {

constexpr const char* DEFAULT_EXTRACTION_PATH = "rc_extracted";

#if defined(_WIN32)
constexpr const char* DEFAULT_OUTPUT_NAME = "packed.exe";
constexpr const char* DEFAULT_STUB_NAME = "rscstub.exe";
#else
constexpr const char* DEFAULT_OUTPUT_NAME = "packed";
constexpr const char* DEFAULT_STUB_NAME = "rscstub";
#endif

// Packer settings as stored in a project file.
struct ProjectConfig {
    std::vector<std::filesystem::path> resources;
    std::string mainFile;
    std::string extractionPath{DEFAULT_EXTRACTION_PATH};
    std::string executionStyle{"normal"};
    bool runAsAdmin{false};
    bool compress{false};
    std::filesystem::path stub{DEFAULT_STUB_NAME};
    std::filesystem::path output{DEFAULT_OUTPUT_NAME};
    LoggingConfig logging{default_logging_config()};
};

// Reads a project file on top of *inOutProject (so unset keys keep their
// current values). Relative resource paths are taken relative to the project
// file's directory. Resources that do not exist are dropped with a warning.
Status load_project(const std::filesystem::path& path, ProjectConfig* inOutProject);

Status save_project(const std::filesystem::path& path, const ProjectConfig& project);

// Relative stub paths that do not exist in the working directory are looked
// up next to the packer executable.
std::filesystem::path resolve_stub_path(const std::filesystem::path& stub,
                                        const std::optional<std::filesystem::path>& packerExe);

Status read_file_bytes(const std::filesystem::path& path, std::vector<std::uint8_t>* outBytes);

// Fills a BuildRequest from the project settings, validates it, then loads
// the stub binary.
Status make_build_request(const ProjectConfig& project,
                          const std::filesystem::path& stubPath,
                          archive::BuildRequest* outRequest);

} // namespace rscpack::core
