#include "platform.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

#include <raylib.h>

extern char** environ;

namespace rscpack::launch {

namespace {

#if defined(__APPLE__)
constexpr const char* kOpenCommand = "open";
#else
constexpr const char* kOpenCommand = "xdg-open";
#endif

bool is_executable_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

bool is_var_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

class PosixPlatform final : public IPlatform {
public:
    std::optional<bool> query_elevated() override {
        return ::geteuid() == 0;
    }

    core::Status launch(const LaunchCommand& cmd) override {
        // Programs that are not directly executable go through the desktop opener.
        std::vector<std::string> argvStrings;
        if (is_executable_file(cmd.program) || cmd.program.find('/') == std::string::npos) {
            argvStrings.push_back(cmd.program);
        } else {
            argvStrings.push_back(kOpenCommand);
            argvStrings.push_back(cmd.program);
        }
        argvStrings.insert(argvStrings.end(), cmd.args.begin(), cmd.args.end());

        std::vector<char*> argv;
        argv.reserve(argvStrings.size() + 1);
        for (auto& s : argvStrings) {
            argv.push_back(s.data());
        }
        argv.push_back(nullptr);

        posix_spawnattr_t attr;
        posix_spawnattr_init(&attr);
#if defined(POSIX_SPAWN_SETSID)
        // Detach from the stub's session so the program outlives it.
        posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSID);
#endif

        pid_t pid = 0;
        const int rc = ::posix_spawnp(&pid, argv[0], nullptr, &attr, argv.data(), environ);
        posix_spawnattr_destroy(&attr);

        if (rc != 0) {
            return core::Status::fail(core::ErrorKind::Launch,
                                      std::string("failed to start ") + argv[0] + ": " + std::strerror(rc));
        }

        TraceLog(LOG_DEBUG, "[launch] Spawned %s (pid %d)", argv[0], static_cast<int>(pid));
        return core::Status::ok();
    }

    void show_notice(const std::string& title, const std::string& message) override {
        std::fprintf(stderr, "\n*** %s ***\n%s\n", title.c_str(), message.c_str());

        if (::isatty(STDIN_FILENO) && ::isatty(STDERR_FILENO)) {
            std::fprintf(stderr, "Press Enter to continue...");
            std::fflush(stderr);
            int c = 0;
            do {
                c = std::getchar();
            } while (c != '\n' && c != EOF);
        }
    }

    // Supports ~ (leading), $VAR and ${VAR}.
    std::string expand_environment(const std::string& text) override {
        std::string out;
        out.reserve(text.size());

        std::size_t i = 0;
        if (!text.empty() && text[0] == '~' && (text.size() == 1 || text[1] == '/')) {
            const char* home = std::getenv("HOME");
            if (home) {
                out += home;
                i = 1;
            }
        }

        while (i < text.size()) {
            const char c = text[i];
            if (c != '$' || i + 1 >= text.size()) {
                out += c;
                ++i;
                continue;
            }

            std::size_t nameStart = i + 1;
            std::size_t nameEnd = nameStart;
            std::size_t next = 0;
            if (text[nameStart] == '{') {
                const std::size_t close = text.find('}', nameStart + 1);
                if (close == std::string::npos) {
                    out += c;
                    ++i;
                    continue;
                }
                nameStart += 1;
                nameEnd = close;
                next = close + 1;
            } else {
                while (nameEnd < text.size() && is_var_char(text[nameEnd])) ++nameEnd;
                next = nameEnd;
            }

            const std::string name = text.substr(nameStart, nameEnd - nameStart);
            const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
            if (value) {
                out += value;
            } else {
                out.append(text, i, next - i);
            }
            i = next;
        }

        return out;
    }
};

} // namespace

std::unique_ptr<IPlatform> create_native_platform() {
    return std::make_unique<PosixPlatform>();
}

std::optional<std::filesystem::path> current_executable_path() {
#if defined(__APPLE__)
    std::uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buf(size, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0) {
        return std::nullopt;
    }
    buf.resize(std::strlen(buf.c_str()));
    std::error_code ec;
    auto resolved = std::filesystem::canonical(buf, ec);
    if (ec) {
        return std::filesystem::path(buf);
    }
    return resolved;
#else
    std::error_code ec;
    auto resolved = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return resolved;
#endif
}

} // namespace rscpack::launch
