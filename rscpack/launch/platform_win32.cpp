#include "platform.hpp"

#include <string>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>

namespace rscpack::launch {

namespace {

std::wstring widen(const std::string& s) {
    if (s.empty()) {
        return std::wstring();
    }
    const int len = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<std::size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), len);
    return out;
}

std::string narrow(const std::wstring& s) {
    if (s.empty()) {
        return std::string();
    }
    const int len = WideCharToMultiByte(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<std::size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), len, nullptr, nullptr);
    return out;
}

// Quotes an argument for the command line parser used by cmd.exe and the CRT.
std::wstring quote_arg(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos) {
        return arg;
    }
    return L"\"" + arg + L"\"";
}

int show_command(Visibility v) {
    switch (v) {
        case Visibility::Hidden: return SW_HIDE;
        case Visibility::Minimized: return SW_SHOWMINIMIZED;
        case Visibility::Normal: return SW_SHOWNORMAL;
        case Visibility::Maximized: return SW_SHOWMAXIMIZED;
    }
    return SW_SHOWNORMAL;
}

class Win32Platform final : public IPlatform {
public:
    std::optional<bool> query_elevated() override {
        HANDLE token = nullptr;
        if (!OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &token)) {
            return std::nullopt;
        }

        TOKEN_ELEVATION elevation{};
        DWORD returned = 0;
        const BOOL ok = GetTokenInformation(token, TokenElevation, &elevation, sizeof(elevation), &returned);
        CloseHandle(token);

        if (!ok) {
            return std::nullopt;
        }
        return elevation.TokenIsElevated != 0;
    }

    core::Status launch(const LaunchCommand& cmd) override {
        const std::wstring file = widen(cmd.program);

        std::wstring params;
        for (const auto& arg : cmd.args) {
            if (!params.empty()) params += L' ';
            params += quote_arg(widen(arg));
        }

        // The verb is always "open"; elevation is gated before launch, never requested here.
        HINSTANCE result = ShellExecuteW(nullptr, L"open", file.c_str(),
                                         params.empty() ? nullptr : params.c_str(),
                                         nullptr, show_command(cmd.visibility));

        const INT_PTR code = reinterpret_cast<INT_PTR>(result);
        if (code <= 32) {
            return core::Status::fail(core::ErrorKind::Launch,
                                      "ShellExecuteW failed with code " + std::to_string(static_cast<long long>(code)));
        }
        return core::Status::ok();
    }

    void show_notice(const std::string& title, const std::string& message) override {
        MessageBoxW(nullptr, widen(message).c_str(), widen(title).c_str(), MB_OK | MB_ICONWARNING);
    }

    std::string expand_environment(const std::string& text) override {
        const std::wstring src = widen(text);
        DWORD needed = ExpandEnvironmentStringsW(src.c_str(), nullptr, 0);
        if (needed == 0) {
            return text;
        }

        std::wstring out(needed, L'\0');
        needed = ExpandEnvironmentStringsW(src.c_str(), out.data(), needed);
        if (needed == 0) {
            return text;
        }
        out.resize(needed - 1);  // Drop terminator.
        return narrow(out);
    }
};

} // namespace

std::unique_ptr<IPlatform> create_native_platform() {
    return std::make_unique<Win32Platform>();
}

std::optional<std::filesystem::path> current_executable_path() {
    std::wstring buf(MAX_PATH, L'\0');
    for (;;) {
        const DWORD len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0) {
            return std::nullopt;
        }
        if (len < buf.size()) {
            buf.resize(len);
            return std::filesystem::path(buf);
        }
        buf.resize(buf.size() * 2);
    }
}

} // namespace rscpack::launch
