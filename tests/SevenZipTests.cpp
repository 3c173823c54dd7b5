#include "SevenZip.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

std::string Join(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

size_t CountPrefix(const std::vector<std::string>& args, const std::string& prefix) {
    return static_cast<size_t>(std::count_if(args.begin(), args.end(), [&](const std::string& arg) {
        return arg.rfind(prefix, 0) == 0;
    }));
}

class FakeProcess : public ProcessHandle {
public:
    explicit FakeProcess(std::vector<std::string> args)
        : args_(std::move(args)) {}

    int Pid() const override {
        return 4242;
    }
    const std::vector<std::string>& Args() const override {
        return args_;
    }
    std::optional<int> Poll() override {
        return 0;
    }
    int Wait() override {
        return 0;
    }
    void Terminate() override {}
    std::string ReadOutput() override {
        return "";
    }

private:
    std::vector<std::string> args_;
};

ToolPaths FakeTools() {
    ToolPaths tools;
    tools.executable = "/opt/7zip/7zz";
    return tools;
}

SevenZipJob JobWith(std::vector<PresetRef> presets) {
    SevenZipJob job;
    job.presets = std::move(presets);
    job.gui = false;
    return job;
}
} // namespace

int main() {
    std::vector<std::string> launched;
    const SevenZip::Launcher launcher = [&](const std::vector<std::string>& argv) {
        launched = argv;
        return std::make_shared<FakeProcess>(argv);
    };

    std::vector<std::string> ran;
    const SevenZip::Runner runner = [&](const std::vector<std::string>& argv) {
        ran = argv;
        RunResult result;
        result.exitCode = 0;
        result.output = "listing";
        return result;
    };

    // Extract with no output anywhere still emits exactly one -o, set to ".".
    {
        SevenZipJob job = JobWith({std::string("store")});
        job.archive = "backup.zip";
        SevenZip sevenZip(job, FakeTools(), launcher, runner);

        const auto handle = sevenZip.Extract();
        if (!handle || handle->Pid() != 4242) {
            return Fail("Extract did not return the launched handle.");
        }
        const std::string expected =
            "/opt/7zip/7zz e -tzip -mx=0 -mcu=on -xr!desktop.ini -xr!thumbs.db* -o. -- backup.zip";
        if (Join(launched) != expected) {
            return Fail("Unexpected extract command: " + Join(launched));
        }
    }

    // A preset output directory is used once; the call argument wins over it.
    {
        ArchiveOptions withOutput;
        withOutput.Output("from-preset").Yes();
        SevenZip sevenZip(JobWith({std::string("store"), withOutput}), FakeTools(), launcher, runner);

        auto argv = sevenZip.BuildArguments(Operation::ExtractAll, {"*.txt"}, std::string("a.zip"));
        if (CountPrefix(argv, "-o") != 1
            || std::find(argv.begin(), argv.end(), "-ofrom-preset") == argv.end()) {
            return Fail("Preset output not used exactly once: " + Join(argv));
        }
        if (argv[1] != "x" || argv.back() != "*.txt" || argv[argv.size() - 2] != "a.zip") {
            return Fail("Unexpected extractall layout: " + Join(argv));
        }

        argv = sevenZip.BuildArguments(Operation::Extract, {}, std::string("a.zip"), {}, std::string("out"));
        if (CountPrefix(argv, "-o") != 1 || std::find(argv.begin(), argv.end(), "-oout") == argv.end()) {
            return Fail("Call output did not override the preset: " + Join(argv));
        }
        if (std::find(argv.begin(), argv.end(), "-y") == argv.end()) {
            return Fail("Extract dropped -y: " + Join(argv));
        }
    }

    // Add keeps the compression switches, job args come before call args.
    {
        SevenZipJob job = JobWith({std::string("ultra"), std::string(".mt4")});
        job.args = {"-bb1"};
        SevenZip sevenZip(job, FakeTools(), launcher, runner);

        sevenZip.Add({"docs", "src"}, std::string("out.7z"), {"-sccUTF-8"});
        const std::string expected = "/opt/7zip/7zz a -t7z -slp -mx=9 -mmt=4 -xr!desktop.ini -xr!thumbs.db* "
                                     "-ms=2g -bb1 -sccUTF-8 -- out.7z docs src";
        if (Join(launched) != expected) {
            return Fail("Unexpected add command: " + Join(launched));
        }
    }

    // List drops type and compression switches and uses the runner.
    {
        SevenZipJob job = JobWith({std::string("extreme")});
        job.archive = "default.7z";
        SevenZip sevenZip(job, FakeTools(), launcher, runner);

        const RunResult result = sevenZip.List();
        if (result.output != "listing") {
            return Fail("List did not return the runner output.");
        }
        if (Join(ran) != "/opt/7zip/7zz l -xr!desktop.ini -xr!thumbs.db* -- default.7z") {
            return Fail("Unexpected list command: " + Join(ran));
        }
    }

    // Test uses its own allowed set.
    {
        ArchiveOptions options;
        options.Password("pw").OverwriteMode("s").Type("7z");
        SevenZip sevenZip(JobWith({options}), FakeTools(), launcher, runner);

        sevenZip.Test({}, std::string("t.7z"));
        if (Join(launched) != "/opt/7zip/7zz t -ppw -- t.7z") {
            return Fail("Unexpected test command: " + Join(launched));
        }
    }

    // Missing archive.
    {
        SevenZip sevenZip(JobWith({std::string("store")}), FakeTools(), launcher, runner);
        launched.clear();
        bool threw = false;
        try {
            sevenZip.Add({"file"});
        } catch (const MissingTargetError&) {
            threw = true;
        }
        if (!threw || !launched.empty()) {
            return Fail("Add without an archive should fail before launching.");
        }
    }

    // Missing executable, unknown preset.
    {
        bool threw = false;
        try {
            SevenZip sevenZip(JobWith({std::string("store")}), ToolPaths(), launcher, runner);
        } catch (const ToolNotFoundError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Construction without an executable should fail.");
        }

        threw = false;
        try {
            SevenZip sevenZip(JobWith({std::string("no-such-preset")}), FakeTools(), launcher, runner);
        } catch (const NotFoundError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Unknown preset name accepted.");
        }
    }

    // GUI executable for add / extract / test, never for list.
    {
        ToolPaths tools = FakeTools();
        tools.gui = "C:\\7-Zip\\7zG.exe";
        tools.fileManager = "C:\\7-Zip\\7zFM.exe";
        SevenZipJob job = JobWith({std::string("store")});
        job.archive = "a.zip";
        job.gui = true;
        SevenZip sevenZip(job, tools, launcher, runner);

        if (sevenZip.BuildArguments(Operation::Add).front() != tools.gui) {
            return Fail("Add did not prefer the GUI executable.");
        }
        if (sevenZip.BuildArguments(Operation::List).front() != tools.executable) {
            return Fail("List must use the console executable.");
        }

        sevenZip.Browse();
        if (Join(launched) != "C:\\7-Zip\\7zFM.exe a.zip") {
            return Fail("Unexpected browse command: " + Join(launched));
        }

        SevenZip console(JobWith({std::string("store")}), FakeTools(), launcher, runner);
        bool threw = false;
        try {
            console.Browse(std::string("a.zip"));
        } catch (const ToolNotFoundError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Browse without a file manager should fail.");
        }
    }

    return 0;
}
