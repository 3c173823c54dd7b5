#include "JobConfig.hpp"

#include "ExecutableLocator.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace {
constexpr const char* kMethodsKey = "methods";
constexpr const char* kMethodIdKey = "id";

std::string ScalarText(const nlohmann::json& value, const std::string& context) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<uint64_t>());
    }
    throw ConfigError(context + ": expected a string or an integer");
}

MethodChain ChainFromJson(const nlohmann::json& methods) {
    if (!methods.is_array()) {
        throw ConfigError("'methods' must be an array");
    }

    MethodChain chain;
    for (const auto& item : methods) {
        if (!item.is_object() || !item.contains(kMethodIdKey) || !item[kMethodIdKey].is_string()) {
            throw ConfigError("every method needs a string 'id'");
        }

        const std::string id = item[kMethodIdKey].get<std::string>();
        ParameterMap params;
        for (auto it = item.begin(); it != item.end(); ++it) {
            if (it.key() == kMethodIdKey) {
                continue;
            }
            params.emplace_back(it.key(), ScalarText(it.value(), id + "." + it.key()));
        }
        chain.Append(MakeCompressionMethod(id, params));
    }
    return chain;
}

OptionValue ValueFromJson(const std::string& key, const nlohmann::json& value, const OptionSchema& schema) {
    if (value.is_boolean()) {
        return OptionValue(value.get<bool>() ? "" : "-");
    }
    if (value.is_array()) {
        const KeySpec* spec = schema.Find(key);
        if (spec != nullptr && spec->kind == ValueKind::Sequence) {
            OptionValue::Sequence items;
            for (const auto& item : value) {
                items.push_back(ScalarText(item, key));
            }
            return OptionValue(std::move(items));
        }

        OptionValue::Set items;
        for (const auto& item : value) {
            items.insert(ScalarText(item, key));
        }
        return OptionValue(std::move(items));
    }
    if (value.is_object()) {
        OptionValue::Mapping items;
        for (auto it = value.begin(); it != value.end(); ++it) {
            items[it.key()] = ScalarText(it.value(), key + "." + it.key());
        }
        return OptionValue(std::move(items));
    }
    return OptionValue(ScalarText(value, key));
}

std::vector<std::string> StringArray(const nlohmann::json& value, const std::string& context) {
    if (!value.is_array()) {
        throw ConfigError("'" + context + "' must be an array");
    }

    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ConfigError("'" + context + "' entries must be strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}
} // namespace

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

EnvironmentSettings EnvironmentSettings::FromEnvironment() {
    EnvironmentSettings settings;
    settings.executable = GetEnvOrDefault("ZIPWRIGHT_7Z", "");
    if (std::getenv("ZIPWRIGHT_GUI") != nullptr) {
        settings.gui = GetEnvBool("ZIPWRIGHT_GUI", DefaultGuiPreference());
    }
    settings.trace.enabled = GetEnvBool("ZIPWRIGHT_OTEL_ENABLED", false);
    settings.trace.endpoint = GetEnvOrDefault("ZIPWRIGHT_OTEL_ENDPOINT", "");
    settings.trace.serviceName = GetEnvOrDefault("ZIPWRIGHT_SERVICE_NAME", "zipwright");
    return settings;
}

ToolPaths ResolveToolPaths(const EnvironmentSettings& settings) {
    if (settings.executable.empty()) {
        return ToolPaths::Locate();
    }

    ToolPaths tools;
    tools.executable = settings.executable;
    tools.gui = ExecutableLocator::LocateAuxiliary(tools.executable, "7zG.exe").value_or("");
    tools.fileManager = ExecutableLocator::LocateAuxiliary(tools.executable, "7zFM.exe").value_or("");
    return tools;
}

ArchiveOptions OptionsFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw ConfigError("option preset must be a JSON object");
    }

    ArchiveOptions options;
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (it.key() == kMethodsKey) {
            options.Methods(ChainFromJson(it.value()));
            continue;
        }
        if (it.value().is_null()) {
            continue;
        }
        options.Set(it.key(), ValueFromJson(it.key(), it.value(), options.Schema()));
    }
    return options;
}

SevenZipJob ParseJob(const std::string& text, SevenZipJob base) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw ConfigError("job file is not a JSON object");
    }

    SevenZipJob job = std::move(base);
    if (parsed.contains("archive")) {
        if (!parsed["archive"].is_string()) {
            throw ConfigError("'archive' must be a string");
        }
        job.archive = parsed["archive"].get<std::string>();
    }

    if (parsed.contains("presets")) {
        const auto& presets = parsed["presets"];
        if (!presets.is_array()) {
            throw ConfigError("'presets' must be an array");
        }

        job.presets.clear();
        for (const auto& preset : presets) {
            if (preset.is_string()) {
                job.presets.emplace_back(preset.get<std::string>());
            } else {
                job.presets.emplace_back(OptionsFromJson(preset));
            }
        }
    }

    if (parsed.contains("args")) {
        job.args = StringArray(parsed["args"], "args");
    }

    if (parsed.contains("gui")) {
        if (!parsed["gui"].is_boolean()) {
            throw ConfigError("'gui' must be a boolean");
        }
        job.gui = parsed["gui"].get<bool>();
    }

    return job;
}

SevenZipJob LoadJobFile(const std::string& path, SevenZipJob base) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("cannot read job file: " + path);
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    return ParseJob(buffer.str(), std::move(base));
}

SevenZipJob ComposeJob(const EnvironmentSettings& env, const JobOverrides& overrides) {
    SevenZipJob job;
    if (env.gui) {
        job.gui = *env.gui;
    }
    if (!overrides.jobFile.empty()) {
        job = LoadJobFile(overrides.jobFile, std::move(job));
        std::cerr << "[Zipwright] Loaded job file " << overrides.jobFile << std::endl;
    }

    if (!overrides.presets.empty()) {
        if (overrides.jobFile.empty()) {
            job.presets.clear();
        }
        job.presets.insert(job.presets.end(), overrides.presets.begin(), overrides.presets.end());
    }

    if (overrides.password) {
        ArchiveOptions password;
        password.Password(*overrides.password);
        job.presets.emplace_back(std::move(password));
    }

    if (overrides.archive && !overrides.archive->empty()) {
        job.archive = overrides.archive;
    }
    job.args.insert(job.args.end(), overrides.args.begin(), overrides.args.end());
    if (overrides.gui) {
        job.gui = *overrides.gui;
    }
    return job;
}
