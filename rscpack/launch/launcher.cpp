#include "launcher.hpp"

#include "core/config.hpp"
#include "core/utf8_path.hpp"

#include <raylib.h>

namespace rscpack::launch {

namespace fs = std::filesystem;

namespace {

struct ScriptInterpreter {
    const char* extension;
    const char* program;
    const char* flag;  // Inserted before the script path, may be null
};

#if defined(_WIN32)
constexpr ScriptInterpreter kInterpreters[] = {
    {".bat", "cmd", "/c"},
    {".cmd", "cmd", "/c"},
};
#else
constexpr ScriptInterpreter kInterpreters[] = {
    {".sh", "/bin/sh", nullptr},
};
#endif

const ScriptInterpreter* find_interpreter(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    for (const auto& interp : kInterpreters) {
        if (ext == interp.extension) {
            return &interp;
        }
    }
    return nullptr;
}

const char* visibility_name(Visibility v) {
    switch (v) {
        case Visibility::Hidden: return "hidden";
        case Visibility::Minimized: return "minimized";
        case Visibility::Normal: return "normal";
        case Visibility::Maximized: return "maximized";
    }
    return "normal";
}

} // namespace

Visibility visibility_for(archive::ExecutionStyle style) {
    switch (style) {
        case archive::ExecutionStyle::Hidden: return Visibility::Hidden;
        case archive::ExecutionStyle::Minimized: return Visibility::Minimized;
        case archive::ExecutionStyle::Normal: return Visibility::Normal;
        case archive::ExecutionStyle::Maximized: return Visibility::Maximized;
    }
    return Visibility::Normal;
}

Visibility visibility_from_style(std::string_view executionStyle) {
    return visibility_for(archive::parse_execution_style(executionStyle));
}

bool is_script(const fs::path& path) {
    return find_interpreter(path) != nullptr;
}

Launcher::Launcher(IPlatform& platform) : platform_(platform) {}

core::Status Launcher::check_privileges(const archive::ArchiveHeader& header) {
    if (!header.runAsAdmin) {
        return core::Status::ok();
    }

    const std::optional<bool> elevated = platform_.query_elevated();
    if (!elevated.has_value()) {
        TraceLog(LOG_ERROR, "[launch] Failed to check admin rights");
        platform_.show_notice(NOTICE_TITLE, NOTICE_QUERY_FAILED);
        return core::Status::fail(core::ErrorKind::Privilege, "failed to check admin rights");
    }

    if (!*elevated) {
        TraceLog(LOG_ERROR, "[launch] Administrator rights required but process is not elevated");
        platform_.show_notice(NOTICE_TITLE, NOTICE_NOT_ELEVATED);
        return core::Status::fail(core::ErrorKind::Privilege, "administrator rights required");
    }

    return core::Status::ok();
}

fs::path Launcher::resolve_main_file(const fs::path& extractionDir, const archive::ArchiveHeader& header) const {
    const fs::path joined = extractionDir / core::path_from_utf8(header.mainFile);
    std::error_code ec;
    fs::path absolute = fs::absolute(joined, ec);
    if (ec) {
        return joined.lexically_normal();
    }
    return absolute.lexically_normal();
}

LaunchCommand Launcher::build_command(const fs::path& mainPath, Visibility visibility) const {
    LaunchCommand cmd;
    cmd.visibility = visibility;

    if (const ScriptInterpreter* interp = find_interpreter(mainPath)) {
        cmd.program = interp->program;
        if (interp->flag) {
            cmd.args.push_back(interp->flag);
        }
        cmd.args.push_back(core::path_to_utf8(mainPath));
    } else {
        cmd.program = core::path_to_utf8(mainPath);
    }

    return cmd;
}

core::Status Launcher::launch(const fs::path& extractionDir, const archive::ArchiveHeader& header) {
    const Visibility visibility = visibility_from_style(header.executionStyle);
    const fs::path mainPath = resolve_main_file(extractionDir, header);
    const LaunchCommand cmd = build_command(mainPath, visibility);

    TraceLog(LOG_INFO, "[launch] Launching main file: %s (%s)", core::path_to_utf8(mainPath).c_str(), visibility_name(visibility));

    core::Status st = platform_.launch(cmd);
    if (!st) {
        TraceLog(LOG_ERROR, "[launch] %s", st.message.c_str());
    }
    return st;
}

} // namespace rscpack::launch
