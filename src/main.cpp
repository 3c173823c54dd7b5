#include "JobConfig.hpp"
#include "PresetRegistry.hpp"
#include "SevenZip.hpp"
#include "Tracing.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

namespace {
struct CliSettings {
    std::string archive;
    std::vector<std::string> presets;
    std::string jobFile;
    std::string output;
    bool passwordPrompt = false;
    bool dryRun = false;
    std::optional<bool> gui;
    std::vector<std::string> rawArgs;
    std::vector<std::string> paths;
};

// Reads a line from the terminal without echoing it.
std::string PromptPassword() {
    std::cerr << "Password: " << std::flush;
    std::string password;
#ifdef _WIN32
    HANDLE input = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    const bool console = GetConsoleMode(input, &mode) != 0;
    if (console) {
        SetConsoleMode(input, mode & ~ENABLE_ECHO_INPUT);
    }
    std::getline(std::cin, password);
    if (console) {
        SetConsoleMode(input, mode);
    }
#else
    termios saved {};
    const bool terminal = tcgetattr(STDIN_FILENO, &saved) == 0;
    if (terminal) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }
    std::getline(std::cin, password);
    if (terminal) {
        tcsetattr(STDIN_FILENO, TCSANOW, &saved);
    }
#endif
    std::cerr << std::endl;
    return password;
}

JobOverrides OverridesOf(const CliSettings& cli) {
    JobOverrides overrides;
    overrides.jobFile = cli.jobFile;
    overrides.presets = cli.presets;
    if (!cli.archive.empty()) {
        overrides.archive = cli.archive;
    }
    overrides.args = cli.rawArgs;
    overrides.gui = cli.gui;
    if (cli.passwordPrompt) {
        overrides.password = PromptPassword();
    }
    return overrides;
}

std::string JoinArguments(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

std::optional<std::string> OutputOf(const CliSettings& cli) {
    if (cli.output.empty()) {
        return std::nullopt;
    }
    return cli.output;
}

int WaitFor(const std::shared_ptr<ProcessHandle>& handle, const char* operation) {
    if (!handle) {
        return 1;
    }

    const int exitCode = handle->Wait();
    if (exitCode != 0) {
        std::cerr << "[Zipwright] 7-Zip " << operation << " failed with exit code " << exitCode << std::endl;
    }
    ProcessRegistry::Instance().Tidy();
    return exitCode;
}

int RunOperation(Operation operation, const CliSettings& cli, const SevenZipJob& job, const ToolPaths& tools) {
    SevenZip sevenZip(job, tools);

    if (cli.dryRun) {
        std::cout << JoinArguments(sevenZip.BuildArguments(operation, cli.paths, std::nullopt, {}, OutputOf(cli)))
                  << std::endl;
        return 0;
    }

    switch (operation) {
    case Operation::Add:
        return WaitFor(sevenZip.Add(cli.paths), "add");
    case Operation::List: {
        const RunResult result = sevenZip.List();
        std::cout << result.output;
        return result.exitCode;
    }
    case Operation::Extract:
        return WaitFor(sevenZip.Extract(OutputOf(cli), cli.paths), "extract");
    case Operation::ExtractAll:
        return WaitFor(sevenZip.ExtractAll(OutputOf(cli), cli.paths), "extractall");
    case Operation::Test:
        return WaitFor(sevenZip.Test(cli.paths), "test");
    }
    return 1;
}

void AddCommonOptions(CLI::App& command, CliSettings& settings, bool takesPaths) {
    command.add_option("-a,--archive", settings.archive, "Archive to operate on.");
    if (takesPaths) {
        command.add_option("paths", settings.paths, "Files or wildcards passed after the archive.");
    }
}
} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Compose 7-Zip command lines from named presets and run them."};
    app.require_subcommand(1);

    CliSettings settings;
    app.add_option("--preset", settings.presets, "Preset to merge, in order. (Can be used multiple times).");
    app.add_option("--job", settings.jobFile, "JSON job file with archive, presets, args and gui.")
        ->check(CLI::ExistingFile);
    app.add_option("--arg", settings.rawArgs, "Raw argument passed to 7-Zip unchanged. (Can be used multiple times).")
        ->allow_extra_args(false);
    app.add_flag("--password-prompt", settings.passwordPrompt, "Ask for the archive password without echo.");
    app.add_flag("--dry-run", settings.dryRun, "Print the 7-Zip command line instead of running it.");
    app.add_flag_callback("--gui", [&settings]() { settings.gui = true; }, "Prefer the 7-Zip GUI executable.");
    app.add_flag_callback("--no-gui", [&settings]() { settings.gui = false; }, "Never use the GUI executable.");

    auto* add = app.add_subcommand("add", "Add files to an archive.")->fallthrough();
    AddCommonOptions(*add, settings, true);
    auto* list = app.add_subcommand("list", "List archive contents.")->fallthrough();
    AddCommonOptions(*list, settings, false);
    auto* extract = app.add_subcommand("extract", "Extract files into one directory.")->fallthrough();
    AddCommonOptions(*extract, settings, true);
    extract->add_option("-o,--output", settings.output, "Output directory.");
    auto* extractAll = app.add_subcommand("extractall", "Extract files with full paths.")->fallthrough();
    AddCommonOptions(*extractAll, settings, true);
    extractAll->add_option("-o,--output", settings.output, "Output directory.");
    auto* test = app.add_subcommand("test", "Test archive integrity.")->fallthrough();
    AddCommonOptions(*test, settings, true);
    auto* browse = app.add_subcommand("browse", "Open an archive in the 7-Zip file manager.")->fallthrough();
    AddCommonOptions(*browse, settings, false);
    auto* presets = app.add_subcommand("presets", "Print the built-in preset names.");
    auto* args = app.add_subcommand("args", "Print the merged options of the selected presets.")->fallthrough();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    const EnvironmentSettings env = EnvironmentSettings::FromEnvironment();
    Tracer::Instance().Configure(env.trace);

    int exitCode = 0;
    try {
        if (presets->parsed()) {
            for (const auto& name : PresetRegistry::Instance().Names()) {
                std::cout << name << std::endl;
            }
        } else {
            const SevenZipJob job = ComposeJob(env, OverridesOf(settings));
            if (args->parsed()) {
                std::cout << MergePresets(job.presets).ToString() << std::endl;
            } else {
                const ToolPaths tools = ResolveToolPaths(env);
                if (add->parsed()) {
                    exitCode = RunOperation(Operation::Add, settings, job, tools);
                } else if (list->parsed()) {
                    exitCode = RunOperation(Operation::List, settings, job, tools);
                } else if (extract->parsed()) {
                    exitCode = RunOperation(Operation::Extract, settings, job, tools);
                } else if (extractAll->parsed()) {
                    exitCode = RunOperation(Operation::ExtractAll, settings, job, tools);
                } else if (test->parsed()) {
                    exitCode = RunOperation(Operation::Test, settings, job, tools);
                } else if (browse->parsed()) {
                    SevenZip sevenZip(job, tools);
                    exitCode = WaitFor(sevenZip.Browse(), "browse");
                }
            }
        }
    } catch (const ZipwrightError& ex) {
        std::cerr << "[Zipwright] " << ex.what() << std::endl;
        exitCode = 1;
    }

    Tracer::Instance().Shutdown();
    return exitCode;
}
