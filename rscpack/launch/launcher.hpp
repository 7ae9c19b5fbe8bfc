#pragma once

#include "archive/archive_header.hpp"
#include "platform.hpp"

#include <filesystem>
#include <string_view>

namespace rscpack::launch {

constexpr const char* NOTICE_TITLE = "Admin Required";
constexpr const char* NOTICE_NOT_ELEVATED = "Please run as administrator.";
constexpr const char* NOTICE_QUERY_FAILED = "Failed to check admin rights. Please run as administrator.";

Visibility visibility_for(archive::ExecutionStyle style);

// Case-insensitive; unrecognized styles map to Normal.
Visibility visibility_from_style(std::string_view executionStyle);

// True for extensions run through the command interpreter
// (.bat/.cmd on Windows, .sh elsewhere).
bool is_script(const std::filesystem::path& path);

class Launcher {
public:
    explicit Launcher(IPlatform& platform);

    // When the header asks for admin rights, requires an elevated process.
    // Otherwise shows a blocking notice and fails with Privilege. A failed
    // query counts as "not elevated".
    core::Status check_privileges(const archive::ArchiveHeader& header);

    // Absolute path of the main file under the extraction directory.
    std::filesystem::path resolve_main_file(const std::filesystem::path& extractionDir,
                                            const archive::ArchiveHeader& header) const;

    LaunchCommand build_command(const std::filesystem::path& mainPath, Visibility visibility) const;

    // Resolve, build and dispatch. Does not wait for the program.
    core::Status launch(const std::filesystem::path& extractionDir, const archive::ArchiveHeader& header);

private:
    IPlatform& platform_;
};

} // namespace rscpack::launch
