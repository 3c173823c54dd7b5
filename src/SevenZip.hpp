#pragma once

#include "ArchiveOptions.hpp"
#include "Subprocess.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

enum class Operation {
    Add,
    List,
    Extract,
    ExtractAll,
    Test
};

const char* ToString(Operation operation);
const char* Subcommand(Operation operation);
// Switches legal for |operation|. "m" covers the whole -m family and the method chain.
const std::set<std::string>& AllowedSwitches(Operation operation);

struct ToolPaths {
    std::string executable;
    std::string gui;
    std::string fileManager;

    static ToolPaths Locate();
};

using PresetRef = std::variant<std::string, ArchiveOptions>;

// Resolves registry names and merges all presets in order. All-or-nothing.
ArchiveOptions MergePresets(const std::vector<PresetRef>& presets);

bool DefaultGuiPreference();

struct SevenZipJob {
    // Optional default target; every operation may name another archive.
    std::optional<std::string> archive;
    // Merged in order; later entries override or extend earlier ones.
    std::vector<PresetRef> presets = {std::string("store")};
    // Passed through to every invocation without validation.
    std::vector<std::string> args;
    bool gui = DefaultGuiPreference();
};

// Runs 7-Zip with a merged set of presets. Not tied to a single archive: the
// same instance can operate on any number of archives.
class SevenZip {
public:
    using Launcher = std::function<std::shared_ptr<ProcessHandle>(const std::vector<std::string>&)>;
    using Runner = std::function<RunResult(const std::vector<std::string>&)>;

    // Throws ToolNotFoundError when |tools| has no executable and NotFoundError
    // for unknown preset names.
    explicit SevenZip(SevenZipJob job = SevenZipJob(),
                      ToolPaths tools = ToolPaths::Locate(),
                      Launcher launcher = Launcher(),
                      Runner runner = Runner());

    std::shared_ptr<ProcessHandle> Add(const std::vector<std::string>& include,
                                       const std::optional<std::string>& archive = std::nullopt,
                                       const std::vector<std::string>& args = {});
    RunResult List(const std::optional<std::string>& archive = std::nullopt,
                   const std::vector<std::string>& args = {});
    // Extracts into one directory. |output| defaults to the -o preset value, then ".".
    std::shared_ptr<ProcessHandle> Extract(const std::optional<std::string>& output = std::nullopt,
                                           const std::vector<std::string>& include = {},
                                           const std::optional<std::string>& archive = std::nullopt,
                                           const std::vector<std::string>& args = {});
    // Extracts with full paths.
    std::shared_ptr<ProcessHandle> ExtractAll(const std::optional<std::string>& output = std::nullopt,
                                              const std::vector<std::string>& include = {},
                                              const std::optional<std::string>& archive = std::nullopt,
                                              const std::vector<std::string>& args = {});
    std::shared_ptr<ProcessHandle> Test(const std::vector<std::string>& include = {},
                                        const std::optional<std::string>& archive = std::nullopt,
                                        const std::vector<std::string>& args = {});
    // Opens the archive in the 7-Zip file manager.
    std::shared_ptr<ProcessHandle> Browse(const std::optional<std::string>& archive = std::nullopt);

    std::vector<std::string> BuildArguments(Operation operation,
                                            const std::vector<std::string>& include = {},
                                            const std::optional<std::string>& archive = std::nullopt,
                                            const std::vector<std::string>& args = {},
                                            const std::optional<std::string>& output = std::nullopt) const;

    const ArchiveOptions& Options() const;
    const SevenZipJob& Job() const;
    const ToolPaths& Tools() const;

private:
    std::string ResolveArchive(const std::optional<std::string>& archive) const;
    std::string ResolveOutput(const std::optional<std::string>& output) const;
    const std::string& ExecutableFor(Operation operation) const;
    std::shared_ptr<ProcessHandle> Start(Operation operation, const std::vector<std::string>& argv);

    SevenZipJob job_;
    ToolPaths tools_;
    Launcher launcher_;
    Runner runner_;
    ArchiveOptions options_;
};
