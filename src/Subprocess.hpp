#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct LaunchOptions {
    // Pipe the child's stdout so it can be read back with ReadOutput().
    bool captureOutput = false;
    // Connect the child's stdin to the null device instead of ours.
    bool detachInput = false;
    std::string workingDirectory;
};

struct RunResult {
    int exitCode = -1;
    std::string output;
};

class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int Pid() const = 0;
    virtual const std::vector<std::string>& Args() const = 0;
    // Exit code once the process has finished. A process killed by a signal
    // reports the negated signal number.
    virtual std::optional<int> Poll() = 0;
    virtual int Wait() = 0;
    virtual void Terminate() = 0;
    // Reads captured stdout until end of stream. Empty when not captured.
    virtual std::string ReadOutput() = 0;
};

class Subprocess {
public:
    // Starts |argv| without waiting and registers it with ProcessRegistry.
    // Throws ProcessError when the program cannot be started.
    static std::shared_ptr<ProcessHandle> Launch(const std::vector<std::string>& argv,
                                                 const LaunchOptions& options = LaunchOptions());

    // Runs |argv| to completion and returns its stdout.
    static RunResult Run(const std::vector<std::string>& argv);
};

// Keeps track of launched processes. Still-running ones are terminated when
// the registry is destroyed at exit.
class ProcessRegistry {
public:
    static ProcessRegistry& Instance();

    ProcessRegistry() = default;
    ~ProcessRegistry();
    ProcessRegistry(const ProcessRegistry&) = delete;
    ProcessRegistry& operator=(const ProcessRegistry&) = delete;

    void Add(std::shared_ptr<ProcessHandle> handle);
    // Throws NotFoundError for unknown pids.
    std::shared_ptr<ProcessHandle> Find(int pid) const;
    std::vector<std::shared_ptr<ProcessHandle>> All() const;
    // Processes whose space-joined command line matches the ECMAScript |pattern|.
    std::vector<std::shared_ptr<ProcessHandle>> Matching(const std::string& pattern) const;
    size_t Size() const;

    // Drops finished processes and returns how many were dropped.
    size_t Tidy();
    void Purge();

    // name / pid / status / command table of |handles|.
    static std::string Describe(const std::vector<std::shared_ptr<ProcessHandle>>& handles);

private:
    mutable std::mutex mutex_;
    std::map<int, std::shared_ptr<ProcessHandle>> processes_;
};
