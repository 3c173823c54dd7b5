#pragma once

#include "ArchiveOptions.hpp"
#include "SevenZip.hpp"
#include "Tracing.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

struct EnvironmentSettings {
    // ZIPWRIGHT_7Z, bypasses the PATH / registry lookup when set.
    std::string executable;
    std::optional<bool> gui;
    TraceConfig trace;

    static EnvironmentSettings FromEnvironment();
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);

// Explicit executable from |settings| if given, otherwise the located one.
ToolPaths ResolveToolPaths(const EnvironmentSettings& settings);

// Builds an option container from a JSON object. Strings and numbers become
// atomic values, arrays become sets (or sequences for sequence keys), objects
// become mappings and booleans become "" / "-". The "methods" key holds an
// array of {"id": ..., <params>} compression methods. Throws ConfigError.
ArchiveOptions OptionsFromJson(const nlohmann::json& object);

// {"archive": str, "presets": [str | object], "args": [str], "gui": bool}
// Keys present in the file replace the corresponding fields of |base|.
SevenZipJob ParseJob(const std::string& text, SevenZipJob base = SevenZipJob());
SevenZipJob LoadJobFile(const std::string& path, SevenZipJob base = SevenZipJob());

// Command-line settings layered over the environment and the job file.
struct JobOverrides {
    std::string jobFile;
    // Replace the default presets, or extend the job file's.
    std::vector<std::string> presets;
    std::optional<std::string> archive;
    std::vector<std::string> args;
    std::optional<bool> gui;
    // Merged after every other preset.
    std::optional<std::string> password;
};

// Precedence, lowest first: defaults, environment, job file, overrides.
SevenZipJob ComposeJob(const EnvironmentSettings& env, const JobOverrides& overrides);
