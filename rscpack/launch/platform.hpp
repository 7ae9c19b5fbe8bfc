#pragma once

#include "core/status.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rscpack::launch {

// Window-visibility directive for the launched program.
enum class Visibility : std::uint8_t {
    Hidden = 0,
    Minimized = 1,
    Normal = 2,
    Maximized = 3,
};

struct LaunchCommand {
    std::string program;             // Executable, interpreter or document path
    std::vector<std::string> args;
    Visibility visibility{Visibility::Normal};
};

// OS services used by the launcher. Tests substitute their own implementation.
class IPlatform {
public:
    virtual ~IPlatform() = default;

    // Elevation state of the current process, or nullopt if it cannot be queried.
    virtual std::optional<bool> query_elevated() = 0;

    // Fire-and-forget: returns once the OS accepted (or refused) the request.
    virtual core::Status launch(const LaunchCommand& cmd) = 0;

    // Blocking notice to the user.
    virtual void show_notice(const std::string& title, const std::string& message) = 0;

    // Expands platform environment placeholders. Unknown variables are kept verbatim.
    virtual std::string expand_environment(const std::string& text) = 0;
};

std::unique_ptr<IPlatform> create_native_platform();

// Path of the running executable image.
std::optional<std::filesystem::path> current_executable_path();

} // namespace rscpack::launch
