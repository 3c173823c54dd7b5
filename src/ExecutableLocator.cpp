#include "ExecutableLocator.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace {
#ifdef _WIN32
constexpr char kPathSeparator = ';';

std::optional<std::string> ReadInstallDirectory(const char* valueName) {
    char buffer[MAX_PATH] = {};
    DWORD size = static_cast<DWORD>(sizeof(buffer));
    const LSTATUS status = RegGetValueA(
        HKEY_LOCAL_MACHINE,
        "SOFTWARE\\7-Zip",
        valueName,
        RRF_RT_REG_SZ,
        nullptr,
        buffer,
        &size);
    if (status != ERROR_SUCCESS) {
        return std::nullopt;
    }
    return std::string(buffer);
}
#else
constexpr char kPathSeparator = ':';
#endif
} // namespace

std::optional<std::string> ExecutableLocator::LocatePrimary() {
#ifdef _WIN32
    for (const char* valueName : {"Path64", "Path"}) {
        const auto directory = ReadInstallDirectory(valueName);
        if (!directory) {
            continue;
        }

        const auto candidate = (std::filesystem::path(*directory) / "7z.exe").string();
        if (IsExecutable(candidate)) {
            return candidate;
        }
    }

    for (const char* name : {"7z", "7zr"}) {
        if (auto path = SearchPath(name)) {
            return path;
        }
    }
#else
    for (const char* name : {"7zz", "7zzs", "7z"}) {
        if (auto path = SearchPath(name)) {
            return path;
        }
    }
#endif
    return std::nullopt;
}

std::optional<std::string> ExecutableLocator::LocateAuxiliary(const std::string& primary, const std::string& name) {
#ifdef _WIN32
    if (primary.empty() || name.empty()) {
        return std::nullopt;
    }

    const auto candidate = (std::filesystem::path(primary).parent_path() / name).string();
    if (IsExecutable(candidate)) {
        return candidate;
    }
    return std::nullopt;
#else
    (void)primary;
    (void)name;
    return std::nullopt;
#endif
}

std::optional<std::string> ExecutableLocator::SearchPath(const std::string& name) {
    const char* pathList = std::getenv("PATH");
    return SearchPath(name, pathList ? std::string(pathList) : std::string());
}

std::optional<std::string> ExecutableLocator::SearchPath(const std::string& name, const std::string& pathList) {
    if (name.empty()) {
        return std::nullopt;
    }

#ifdef _WIN32
    const std::vector<std::string> suffixes = {"", ".exe", ".com", ".bat"};
#else
    const std::vector<std::string> suffixes = {""};
#endif

    for (const auto& directory : SplitPathList(pathList)) {
        for (const auto& suffix : suffixes) {
            const auto candidate = (std::filesystem::path(directory) / (name + suffix)).string();
            if (IsExecutable(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> ExecutableLocator::SplitPathList(const std::string& pathList) {
    std::vector<std::string> directories;
    size_t start = 0;
    while (start <= pathList.size()) {
        const auto end = pathList.find(kPathSeparator, start);
        const auto length = (end == std::string::npos ? pathList.size() : end) - start;
        std::string directory = pathList.substr(start, length);
        if (!directory.empty()) {
            directories.push_back(std::move(directory));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return directories;
}

bool ExecutableLocator::IsExecutable(const std::string& path) {
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}
