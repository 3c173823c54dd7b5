#include "Errors.hpp"
#include "ExecutableLocator.hpp"
#include "Subprocess.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
#ifdef _WIN32
    return 0;
#else
    const auto shell = ExecutableLocator::SearchPath("sh", "/nonexistent-zipwright:/bin");
    if (!shell || *shell != "/bin/sh") {
        return Fail("sh not found on an explicit path list.");
    }
    if (ExecutableLocator::SearchPath("zipwright-no-such-tool", "/bin:/usr/bin")) {
        return Fail("Located a tool that does not exist.");
    }
    if (ExecutableLocator::LocateAuxiliary("/usr/bin/7z", "7zG.exe")) {
        return Fail("Auxiliary executables only exist on Windows.");
    }

    const RunResult echo = Subprocess::Run({"/bin/sh", "-c", "echo zipwright"});
    if (echo.exitCode != 0 || echo.output != "zipwright\n") {
        return Fail("Unexpected run result: " + echo.output);
    }

    const RunResult failing = Subprocess::Run({"/bin/sh", "-c", "exit 3"});
    if (failing.exitCode != 3) {
        return Fail("Exit code not reported: " + std::to_string(failing.exitCode));
    }

    bool threw = false;
    try {
        Subprocess::Launch({"/nonexistent/zipwright-tool"});
    } catch (const ProcessError&) {
        threw = true;
    }
    if (!threw) {
        return Fail("Launching a missing program should fail.");
    }

    ProcessRegistry& registry = ProcessRegistry::Instance();
    const auto quick = Subprocess::Launch({"/bin/sh", "-c", "exit 0"});
    const auto sleeper = Subprocess::Launch({"/bin/sh", "-c", "sleep 30"});
    if (registry.Find(sleeper->Pid()) != sleeper) {
        return Fail("Launched process not registered.");
    }
    if (registry.Matching("sleep [0-9]+").size() != 1) {
        return Fail("Matching did not find the sleeper.");
    }

    if (quick->Wait() != 0) {
        return Fail("Quick process failed.");
    }
    if (registry.Tidy() != 1 || registry.Size() != 1) {
        return Fail("Tidy should drop exactly the finished process.");
    }

    const std::string table = ProcessRegistry::Describe(registry.All());
    if (table.find("sleep 30") == std::string::npos) {
        return Fail("Describe is missing the command line: " + table);
    }

    registry.Purge();
    const int code = sleeper->Wait();
    if (code >= 0) {
        return Fail("Purged process should report a signal: " + std::to_string(code));
    }

    threw = false;
    try {
        registry.Find(999999);
    } catch (const NotFoundError&) {
        threw = true;
    }
    if (!threw) {
        return Fail("Unknown pid found.");
    }

    // A child launched from another thread must not hold a captured pipe open.
    std::atomic<bool> launching{true};
    std::thread launcher([&launching]() {
        for (int i = 0; i < 20 && launching; ++i) {
            Subprocess::Launch({"/bin/sh", "-c", "sleep 5"});
        }
    });
    bool slowRun = false;
    for (int i = 0; i < 20; ++i) {
        const auto started = std::chrono::steady_clock::now();
        const RunResult concurrent = Subprocess::Run({"/bin/sh", "-c", "echo zipwright"});
        const auto elapsed = std::chrono::steady_clock::now() - started;
        if (elapsed > std::chrono::seconds(3) || concurrent.output != "zipwright\n") {
            slowRun = true;
            break;
        }
    }
    launching = false;
    launcher.join();
    registry.Purge();
    if (slowRun) {
        return Fail("Run waited on a process launched by another thread.");
    }

    return 0;
#endif
}
