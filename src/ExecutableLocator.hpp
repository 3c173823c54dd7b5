#pragma once

#include <optional>
#include <string>
#include <vector>

class ExecutableLocator {
public:
    // Windows: the 7-Zip registry key, then 7z / 7zr on PATH.
    // Elsewhere: 7zz, 7zzs (official Linux builds) and 7z (p7zip) on PATH.
    static std::optional<std::string> LocatePrimary();

    // Sibling executable next to |primary| (7zG.exe, 7zFM.exe). Windows only.
    static std::optional<std::string> LocateAuxiliary(const std::string& primary, const std::string& name);

    static std::optional<std::string> SearchPath(const std::string& name);
    static std::optional<std::string> SearchPath(const std::string& name, const std::string& pathList);

private:
    static std::vector<std::string> SplitPathList(const std::string& pathList);
    static bool IsExecutable(const std::string& path);
};
