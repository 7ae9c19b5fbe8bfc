#include "project.hpp"

#include <fstream>
#include <system_error>

#include <raylib.h>

namespace rscpack::core {

namespace fs = std::filesystem;

namespace {

std::string quoted(const std::string& v) {
    return "\"" + v + "\"";
}

const char* bool_str(bool v) {
    return v ? "true" : "false";
}

} // namespace

Status load_project(const fs::path& path, ProjectConfig* inOutProject) {
    if (!inOutProject) {
        return Status::fail(ErrorKind::Validation, "no project to load into");
    }

    ProjectConfig project = *inOutProject;
    std::vector<fs::path> listed;
    const fs::path baseDir = path.parent_path();

    auto handler = [&](const std::string& section, const std::string& key, const std::string& value) {
        if (section == "project") {
            if (key == "extraction_path") project.extractionPath = value;
            else if (key == "main_file") project.mainFile = value;
            else if (key == "output") project.output = value;
            else if (key == "stub") project.stub = value;
            else if (key == "execution_style") project.executionStyle = value;
            else if (key == "run_as_admin") project.runAsAdmin = parse_bool(value, project.runAsAdmin);
            else if (key == "compress") project.compress = parse_bool(value, project.compress);
            else TraceLog(LOG_WARNING, "[project] Unknown key '%s' in [project]", key.c_str());
            return;
        }

        if (section == "resources") {
            if (key == "resource") {
                fs::path p(value);
                if (p.is_relative() && !baseDir.empty()) {
                    p = baseDir / p;
                }
                listed.push_back(p.lexically_normal());
            } else {
                TraceLog(LOG_WARNING, "[project] Unknown key '%s' in [resources]", key.c_str());
            }
            return;
        }

        if (section == "logging") {
            apply_logging_kv(project.logging, key, value);
            return;
        }

        TraceLog(LOG_WARNING, "[project] Ignoring '%s' in unknown section [%s]", key.c_str(), section.c_str());
    };

    std::string err;
    if (!parse_ini_file(path, handler, &err)) {
        return Status::fail(ErrorKind::IO, err);
    }

    for (const auto& p : listed) {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) {
            TraceLog(LOG_WARNING, "[project] Resource not found, dropped: %s", p.string().c_str());
            continue;
        }
        project.resources.push_back(p);
    }

    TraceLog(LOG_INFO, "[project] Loaded %s (%zu resource(s))", path.string().c_str(), project.resources.size());
    *inOutProject = std::move(project);
    return Status::ok();
}

Status save_project(const fs::path& path, const ProjectConfig& project) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return Status::fail(ErrorKind::IO, "cannot open " + path.string() + " for writing");
    }

    out << "# rscpack project\n\n";

    out << "[project]\n";
    out << "extraction_path = " << quoted(project.extractionPath) << "\n";
    out << "main_file = " << quoted(project.mainFile) << "\n";
    out << "output = " << quoted(project.output.string()) << "\n";
    out << "stub = " << quoted(project.stub.string()) << "\n";
    out << "execution_style = " << project.executionStyle << "\n";
    out << "run_as_admin = " << bool_str(project.runAsAdmin) << "\n";
    out << "compress = " << bool_str(project.compress) << "\n";
    out << "\n";

    out << "[resources]\n";
    for (const auto& r : project.resources) {
        out << "resource = " << quoted(r.string()) << "\n";
    }
    out << "\n";

    out << "[logging]\n";
    out << "enabled = " << bool_str(project.logging.enabled) << "\n";
    out << "level = " << log_level_name(project.logging.level) << "\n";
    out << "file = " << quoted(project.logging.file) << "\n";

    out.flush();
    if (!out) {
        return Status::fail(ErrorKind::IO, "failed to write " + path.string());
    }

    TraceLog(LOG_INFO, "[project] Saved %s", path.string().c_str());
    return Status::ok();
}

fs::path resolve_stub_path(const fs::path& stub, const std::optional<fs::path>& packerExe) {
    if (stub.is_absolute()) {
        return stub;
    }

    std::error_code ec;
    if (fs::exists(stub, ec)) {
        return stub;
    }

    if (packerExe) {
        const fs::path beside = packerExe->parent_path() / stub;
        if (fs::exists(beside, ec)) {
            return beside;
        }
    }

    return stub;
}

Status read_file_bytes(const fs::path& path, std::vector<std::uint8_t>* outBytes) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in.is_open()) {
        return Status::fail(ErrorKind::IO, "cannot open " + path.string());
    }

    const std::streamsize size = in.tellg();
    if (size < 0) {
        return Status::fail(ErrorKind::IO, "cannot determine size of " + path.string());
    }
    in.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(bytes.data()), size)) {
        return Status::fail(ErrorKind::IO, "failed to read " + path.string());
    }

    if (outBytes) *outBytes = std::move(bytes);
    return Status::ok();
}

Status make_build_request(const ProjectConfig& project, const fs::path& stubPath, archive::BuildRequest* outRequest) {
    archive::BuildRequest req;
    req.resources = project.resources;
    req.mainFile = project.mainFile;
    req.extractionPath = project.extractionPath;
    req.executionStyle = project.executionStyle;
    req.runAsAdmin = project.runAsAdmin;
    req.compress = project.compress;
    req.outputPath = project.output;

    Status st = archive::validate_request(req);
    if (!st) {
        return st;
    }

    st = read_file_bytes(stubPath, &req.stubBytes);
    if (!st) {
        return Status::fail(ErrorKind::IO, "stub: " + st.message);
    }

    if (outRequest) *outRequest = std::move(req);
    return Status::ok();
}

} // namespace rscpack::core
