#include "SevenZip.hpp"

#include "ExecutableLocator.hpp"
#include "PresetRegistry.hpp"
#include "Tracing.hpp"

#include <iostream>
#include <utility>

namespace {
constexpr const char* kCurrentDirectory = ".";
} // namespace

ArchiveOptions MergePresets(const std::vector<PresetRef>& presets) {
    std::vector<ArchiveOptions> resolved;
    resolved.reserve(presets.size());
    for (const auto& preset : presets) {
        if (const auto* name = std::get_if<std::string>(&preset)) {
            resolved.push_back(PresetRegistry::Instance().Resolve(*name));
        } else {
            resolved.push_back(std::get<ArchiveOptions>(preset));
        }
    }

    ArchiveOptions merged;
    merged.MergeAll(resolved);
    return merged;
}

const char* ToString(Operation operation) {
    switch (operation) {
    case Operation::Add:
        return "add";
    case Operation::List:
        return "list";
    case Operation::Extract:
        return "extract";
    case Operation::ExtractAll:
        return "extractall";
    case Operation::Test:
        return "test";
    }
    return "unknown";
}

const char* Subcommand(Operation operation) {
    switch (operation) {
    case Operation::Add:
        return "a";
    case Operation::List:
        return "l";
    case Operation::Extract:
        return "e";
    case Operation::ExtractAll:
        return "x";
    case Operation::Test:
        return "t";
    }
    return "";
}

const std::set<std::string>& AllowedSwitches(Operation operation) {
    static const std::set<std::string> add = {
        "i", "m", "p", "r", "sdel", "sfx", "si", "sni", "sns", "so", "spf",
        "ssw", "stl", "t", "u", "v", "w", "x", "slp", "ssc"};
    // No -t: 7-Zip detects the type of the archive being listed.
    static const std::set<std::string> list = {"ai", "an", "ax", "i", "slt", "sns", "p", "r", "x"};
    static const std::set<std::string> extract = {
        "ai", "an", "ao", "ax", "i", "m", "o", "p", "r", "si", "sni", "sns", "so", "spf", "t", "x", "y"};
    static const std::set<std::string> test = {"ai", "an", "ax", "i", "p", "r", "sns", "x"};

    switch (operation) {
    case Operation::Add:
        return add;
    case Operation::List:
        return list;
    case Operation::Extract:
    case Operation::ExtractAll:
        return extract;
    case Operation::Test:
        return test;
    }
    return test;
}

ToolPaths ToolPaths::Locate() {
    ToolPaths tools;
    tools.executable = ExecutableLocator::LocatePrimary().value_or("");
    tools.gui = ExecutableLocator::LocateAuxiliary(tools.executable, "7zG.exe").value_or("");
    tools.fileManager = ExecutableLocator::LocateAuxiliary(tools.executable, "7zFM.exe").value_or("");
    return tools;
}

bool DefaultGuiPreference() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

SevenZip::SevenZip(SevenZipJob job, ToolPaths tools, Launcher launcher, Runner runner)
    : job_(std::move(job)),
      tools_(std::move(tools)),
      launcher_(std::move(launcher)),
      runner_(std::move(runner)) {
    if (tools_.executable.empty()) {
        throw ToolNotFoundError("7-Zip executable not found");
    }

    options_ = MergePresets(job_.presets);

    if (job_.gui && tools_.gui.empty()) {
        std::cerr << "[Zipwright] GUI preferred but 7zG not found; using " << tools_.executable << std::endl;
    }
}

std::shared_ptr<ProcessHandle> SevenZip::Add(const std::vector<std::string>& include,
                                             const std::optional<std::string>& archive,
                                             const std::vector<std::string>& args) {
    return Start(Operation::Add, BuildArguments(Operation::Add, include, archive, args));
}

RunResult SevenZip::List(const std::optional<std::string>& archive, const std::vector<std::string>& args) {
    const auto argv = BuildArguments(Operation::List, {}, archive, args);

    auto span = Tracer::Instance().StartSpan("sevenzip.list");
    Tracer::Instance().SetAttribute(span, "sevenzip.archive", argv.back());
    Tracer::Instance().SetAttribute(span, "sevenzip.argc", static_cast<int64_t>(argv.size()));

    RunResult result = runner_ ? runner_(argv) : Subprocess::Run(argv);
    Tracer::Instance().SetAttribute(span, "process.exit_code", static_cast<int64_t>(result.exitCode));
    Tracer::Instance().EndSpan(span, result.exitCode == 0);

    if (result.exitCode != 0) {
        std::cerr << "[Zipwright] 7-Zip list exited with code " << result.exitCode << std::endl;
    }
    return result;
}

std::shared_ptr<ProcessHandle> SevenZip::Extract(const std::optional<std::string>& output,
                                                 const std::vector<std::string>& include,
                                                 const std::optional<std::string>& archive,
                                                 const std::vector<std::string>& args) {
    return Start(Operation::Extract, BuildArguments(Operation::Extract, include, archive, args, output));
}

std::shared_ptr<ProcessHandle> SevenZip::ExtractAll(const std::optional<std::string>& output,
                                                    const std::vector<std::string>& include,
                                                    const std::optional<std::string>& archive,
                                                    const std::vector<std::string>& args) {
    return Start(Operation::ExtractAll, BuildArguments(Operation::ExtractAll, include, archive, args, output));
}

std::shared_ptr<ProcessHandle> SevenZip::Test(const std::vector<std::string>& include,
                                              const std::optional<std::string>& archive,
                                              const std::vector<std::string>& args) {
    return Start(Operation::Test, BuildArguments(Operation::Test, include, archive, args));
}

std::shared_ptr<ProcessHandle> SevenZip::Browse(const std::optional<std::string>& archive) {
    if (tools_.fileManager.empty()) {
        throw ToolNotFoundError("7-Zip file manager not found");
    }

    const std::vector<std::string> argv = {tools_.fileManager, ResolveArchive(archive)};
    return launcher_ ? launcher_(argv) : Subprocess::Launch(argv);
}

std::vector<std::string> SevenZip::BuildArguments(Operation operation,
                                                  const std::vector<std::string>& include,
                                                  const std::optional<std::string>& archive,
                                                  const std::vector<std::string>& args,
                                                  const std::optional<std::string>& output) const {
    const std::string target = ResolveArchive(archive);
    const bool extracting = operation == Operation::Extract || operation == Operation::ExtractAll;

    std::set<std::string> allowed = AllowedSwitches(operation);
    if (allowed.count("m") != 0) {
        // -m takes a sub-switch: mx, mmt, ms and friends are all -m.
        for (const auto& key : options_.Keys()) {
            if (!key.empty() && key.front() == 'm') {
                allowed.insert(key);
            }
        }
    }
    if (extracting) {
        // Emitted once below, whatever the presets say.
        allowed.erase("o");
    }

    std::vector<std::string> argv;
    argv.push_back(ExecutableFor(operation));
    argv.push_back(Subcommand(operation));
    for (auto& option : options_.Serialize(allowed)) {
        argv.push_back(std::move(option));
    }
    argv.insert(argv.end(), job_.args.begin(), job_.args.end());
    argv.insert(argv.end(), args.begin(), args.end());
    if (extracting) {
        argv.push_back("-o" + ResolveOutput(output));
    }

    // Everything after "--" is a file name, even if it starts with '-'.
    argv.push_back("--");
    argv.push_back(target);
    if (operation != Operation::List) {
        argv.insert(argv.end(), include.begin(), include.end());
    }
    return argv;
}

const ArchiveOptions& SevenZip::Options() const {
    return options_;
}

const SevenZipJob& SevenZip::Job() const {
    return job_;
}

const ToolPaths& SevenZip::Tools() const {
    return tools_;
}

std::string SevenZip::ResolveArchive(const std::optional<std::string>& archive) const {
    if (archive && !archive->empty()) {
        return *archive;
    }
    if (job_.archive && !job_.archive->empty()) {
        return *job_.archive;
    }
    throw MissingTargetError("missing archive argument");
}

std::string SevenZip::ResolveOutput(const std::optional<std::string>& output) const {
    if (output && !output->empty()) {
        return *output;
    }
    if (const OptionValue* preset = options_.Find("o")) {
        if (!preset->AsScalar().empty()) {
            return preset->AsScalar();
        }
    }
    return kCurrentDirectory;
}

const std::string& SevenZip::ExecutableFor(Operation operation) const {
    if (operation != Operation::List && job_.gui && !tools_.gui.empty()) {
        return tools_.gui;
    }
    return tools_.executable;
}

std::shared_ptr<ProcessHandle> SevenZip::Start(Operation operation, const std::vector<std::string>& argv) {
    auto span = Tracer::Instance().StartSpan(std::string("sevenzip.") + ToString(operation));
    Tracer::Instance().SetAttribute(span, "sevenzip.executable", argv.front());
    Tracer::Instance().SetAttribute(span, "sevenzip.argc", static_cast<int64_t>(argv.size()));

    std::shared_ptr<ProcessHandle> handle;
    try {
        handle = launcher_ ? launcher_(argv) : Subprocess::Launch(argv);
    } catch (const std::exception&) {
        Tracer::Instance().EndSpan(span, false);
        throw;
    }

    if (handle) {
        Tracer::Instance().SetAttribute(span, "process.pid", static_cast<int64_t>(handle->Pid()));
        std::cerr << "[Zipwright] Started 7-Zip " << ToString(operation) << " (pid " << handle->Pid() << ", trace "
                  << span.traceparent << ")" << std::endl;
    }
    Tracer::Instance().EndSpan(span, handle != nullptr);
    return handle;
}
