#include "Subprocess.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <csignal>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace {
std::string JoinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += arg;
    }
    return joined;
}

std::string LimitString(const std::string& value, size_t width) {
    if (value.size() <= width) {
        return value;
    }
    return value.substr(0, width - 1) + "~";
}

#ifdef _WIN32
std::string QuoteArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (const char ch : arg) {
        if (ch == '\\') {
            ++backslashes;
            continue;
        }
        if (ch == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            backslashes = 0;
            quoted.push_back(ch);
            continue;
        }
        if (backslashes > 0) {
            quoted.append(backslashes, '\\');
            backslashes = 0;
        }
        quoted.push_back(ch);
    }
    if (backslashes > 0) {
        quoted.append(backslashes * 2, '\\');
    }
    quoted.push_back('"');
    return quoted;
}

std::string LastErrorMessage() {
    const DWORD error = GetLastError();
    LPSTR buffer = nullptr;
    const DWORD flags = FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS;
    std::string message = "error " + std::to_string(error);
    if (FormatMessageA(flags, nullptr, error, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr) && buffer) {
        message = buffer;
        LocalFree(buffer);
    }
    return message;
}

class WindowsProcess : public ProcessHandle {
public:
    WindowsProcess(std::vector<std::string> args, PROCESS_INFORMATION info, HANDLE output)
        : args_(std::move(args)),
          info_(info),
          output_(output) {}

    ~WindowsProcess() override {
        if (output_ != nullptr) {
            CloseHandle(output_);
        }
        CloseHandle(info_.hThread);
        CloseHandle(info_.hProcess);
    }

    int Pid() const override {
        return static_cast<int>(info_.dwProcessId);
    }

    const std::vector<std::string>& Args() const override {
        return args_;
    }

    std::optional<int> Poll() override {
        if (WaitForSingleObject(info_.hProcess, 0) != WAIT_OBJECT_0) {
            return std::nullopt;
        }
        return ExitCode();
    }

    int Wait() override {
        WaitForSingleObject(info_.hProcess, INFINITE);
        return ExitCode();
    }

    void Terminate() override {
        if (!Poll()) {
            TerminateProcess(info_.hProcess, 1);
        }
    }

    std::string ReadOutput() override {
        std::string output;
        if (output_ == nullptr) {
            return output;
        }

        char buffer[4096];
        DWORD read = 0;
        while (ReadFile(output_, buffer, static_cast<DWORD>(sizeof(buffer)), &read, nullptr) && read > 0) {
            output.append(buffer, read);
        }
        return output;
    }

private:
    int ExitCode() const {
        DWORD code = 0;
        GetExitCodeProcess(info_.hProcess, &code);
        return static_cast<int>(code);
    }

    std::vector<std::string> args_;
    PROCESS_INFORMATION info_;
    HANDLE output_;
};

std::shared_ptr<ProcessHandle> Spawn(const std::vector<std::string>& argv, const LaunchOptions& options) {
    if (argv.empty()) {
        throw ProcessError("cannot launch an empty command");
    }

    std::string commandLine;
    for (const auto& arg : argv) {
        if (!commandLine.empty()) {
            commandLine.push_back(' ');
        }
        commandLine += QuoteArgument(arg);
    }
    std::vector<char> mutableCommand(commandLine.begin(), commandLine.end());
    mutableCommand.push_back('\0');

    SECURITY_ATTRIBUTES security{};
    security.nLength = sizeof(security);
    security.bInheritHandle = TRUE;

    HANDLE readPipe = nullptr;
    HANDLE writePipe = nullptr;
    if (options.captureOutput) {
        if (!CreatePipe(&readPipe, &writePipe, &security, 0)) {
            throw ProcessError("CreatePipe failed: " + LastErrorMessage());
        }
        SetHandleInformation(readPipe, HANDLE_FLAG_INHERIT, 0);
    }

    STARTUPINFOA startupInfo{};
    startupInfo.cb = sizeof(startupInfo);
    if (options.captureOutput || options.detachInput) {
        startupInfo.dwFlags |= STARTF_USESTDHANDLES;
        startupInfo.hStdInput = options.detachInput ? nullptr : GetStdHandle(STD_INPUT_HANDLE);
        startupInfo.hStdOutput = options.captureOutput ? writePipe : GetStdHandle(STD_OUTPUT_HANDLE);
        startupInfo.hStdError = GetStdHandle(STD_ERROR_HANDLE);
    }

    PROCESS_INFORMATION info{};
    const BOOL created = CreateProcessA(
        nullptr,
        mutableCommand.data(),
        nullptr,
        nullptr,
        TRUE,
        0,
        nullptr,
        options.workingDirectory.empty() ? nullptr : options.workingDirectory.c_str(),
        &startupInfo,
        &info);

    if (writePipe != nullptr) {
        CloseHandle(writePipe);
    }
    if (!created) {
        const std::string message = LastErrorMessage();
        if (readPipe != nullptr) {
            CloseHandle(readPipe);
        }
        throw ProcessError("failed to launch " + argv.front() + ": " + message);
    }

    return std::make_shared<WindowsProcess>(argv, info, readPipe);
}
#else
class PosixProcess : public ProcessHandle {
public:
    PosixProcess(std::vector<std::string> args, pid_t pid, int outputFd)
        : args_(std::move(args)),
          pid_(pid),
          outputFd_(outputFd) {}

    ~PosixProcess() override {
        if (outputFd_ >= 0) {
            ::close(outputFd_);
        }
    }

    int Pid() const override {
        return static_cast<int>(pid_);
    }

    const std::vector<std::string>& Args() const override {
        return args_;
    }

    std::optional<int> Poll() override {
        if (exitCode_) {
            return exitCode_;
        }

        int status = 0;
        const pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            exitCode_ = DecodeStatus(status);
        }
        return exitCode_;
    }

    int Wait() override {
        if (exitCode_) {
            return *exitCode_;
        }

        int status = 0;
        pid_t result = -1;
        do {
            result = ::waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);

        if (result < 0) {
            throw ProcessError("waitpid failed for pid " + std::to_string(pid_) + ": " + std::strerror(errno));
        }
        exitCode_ = DecodeStatus(status);
        return *exitCode_;
    }

    void Terminate() override {
        if (!Poll()) {
            ::kill(pid_, SIGTERM);
        }
    }

    std::string ReadOutput() override {
        std::string output;
        if (outputFd_ < 0) {
            return output;
        }

        char buffer[4096];
        while (true) {
            const ssize_t count = ::read(outputFd_, buffer, sizeof(buffer));
            if (count > 0) {
                output.append(buffer, static_cast<size_t>(count));
                continue;
            }
            if (count < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        return output;
    }

private:
    static int DecodeStatus(int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return -WTERMSIG(status);
        }
        return -1;
    }

    std::vector<std::string> args_;
    pid_t pid_;
    int outputFd_;
    std::optional<int> exitCode_;
};

// Both ends are close-on-exec from creation, so a child forked by another
// thread never inherits them.
bool OpenPipe(int fds[2]) {
#ifdef __linux__
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

std::shared_ptr<ProcessHandle> Spawn(const std::vector<std::string>& argv, const LaunchOptions& options) {
    if (argv.empty()) {
        throw ProcessError("cannot launch an empty command");
    }

    int outputPipe[2] = {-1, -1};
    if (options.captureOutput && !OpenPipe(outputPipe)) {
        throw ProcessError(std::string("pipe failed: ") + std::strerror(errno));
    }

    // Reports exec failures back to the parent; closed on successful exec.
    int errorPipe[2] = {-1, -1};
    if (!OpenPipe(errorPipe)) {
        const int error = errno;
        if (options.captureOutput) {
            ::close(outputPipe[0]);
            ::close(outputPipe[1]);
        }
        throw ProcessError(std::string("pipe failed: ") + std::strerror(error));
    }

    std::vector<std::string> argvStorage = argv;
    std::vector<char*> argvPtrs;
    argvPtrs.reserve(argvStorage.size() + 1);
    for (auto& value : argvStorage) {
        argvPtrs.push_back(value.data());
    }
    argvPtrs.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int error = errno;
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        if (options.captureOutput) {
            ::close(outputPipe[0]);
            ::close(outputPipe[1]);
        }
        throw ProcessError(std::string("fork failed: ") + std::strerror(error));
    }

    if (pid == 0) {
        ::close(errorPipe[0]);
        if (options.captureOutput) {
            ::close(outputPipe[0]);
            // dup2 clears close-on-exec on the new descriptor.
            ::dup2(outputPipe[1], STDOUT_FILENO);
            ::close(outputPipe[1]);
        }
        if (options.detachInput) {
            const int devNull = ::open("/dev/null", O_RDONLY);
            if (devNull >= 0) {
                ::dup2(devNull, STDIN_FILENO);
                ::close(devNull);
            }
        }
        if (!options.workingDirectory.empty() && ::chdir(options.workingDirectory.c_str()) != 0) {
            const int error = errno;
            (void)!::write(errorPipe[1], &error, sizeof(error));
            _exit(127);
        }

        ::execvp(argvPtrs.front(), argvPtrs.data());
        const int error = errno;
        (void)!::write(errorPipe[1], &error, sizeof(error));
        _exit(127);
    }

    ::close(errorPipe[1]);
    if (options.captureOutput) {
        ::close(outputPipe[1]);
    }

    int childError = 0;
    ssize_t count = 0;
    do {
        count = ::read(errorPipe[0], &childError, sizeof(childError));
    } while (count < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (count > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        if (options.captureOutput) {
            ::close(outputPipe[0]);
        }
        throw ProcessError("failed to launch " + argv.front() + ": " + std::strerror(childError));
    }

    return std::make_shared<PosixProcess>(argv, pid, options.captureOutput ? outputPipe[0] : -1);
}
#endif
} // namespace

std::shared_ptr<ProcessHandle> Subprocess::Launch(const std::vector<std::string>& argv, const LaunchOptions& options) {
    auto handle = Spawn(argv, options);
    ProcessRegistry::Instance().Add(handle);
    return handle;
}

RunResult Subprocess::Run(const std::vector<std::string>& argv) {
    LaunchOptions options;
    options.captureOutput = true;
    options.detachInput = true;

    auto handle = Spawn(argv, options);
    RunResult result;
    result.output = handle->ReadOutput();
    result.exitCode = handle->Wait();
    return result;
}

ProcessRegistry& ProcessRegistry::Instance() {
    static ProcessRegistry instance;
    return instance;
}

ProcessRegistry::~ProcessRegistry() {
    Purge();
}

void ProcessRegistry::Add(std::shared_ptr<ProcessHandle> handle) {
    if (!handle) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    processes_[handle->Pid()] = std::move(handle);
}

std::shared_ptr<ProcessHandle> ProcessRegistry::Find(int pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = processes_.find(pid);
    if (it == processes_.end()) {
        throw NotFoundError("no registered process with pid " + std::to_string(pid));
    }
    return it->second;
}

std::vector<std::shared_ptr<ProcessHandle>> ProcessRegistry::All() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<ProcessHandle>> handles;
    handles.reserve(processes_.size());
    for (const auto& entry : processes_) {
        handles.push_back(entry.second);
    }
    return handles;
}

std::vector<std::shared_ptr<ProcessHandle>> ProcessRegistry::Matching(const std::string& pattern) const {
    const std::regex expression(pattern);
    std::vector<std::shared_ptr<ProcessHandle>> matches;
    for (auto& handle : All()) {
        if (std::regex_search(JoinArgs(handle->Args()), expression)) {
            matches.push_back(std::move(handle));
        }
    }
    return matches;
}

size_t ProcessRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

size_t ProcessRegistry::Tidy() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = processes_.begin(); it != processes_.end();) {
        if (it->second->Poll()) {
            it = processes_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ProcessRegistry::Purge() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : processes_) {
        if (!entry.second->Poll()) {
            std::cerr << "[Zipwright] Terminating pid " << entry.first << std::endl;
            entry.second->Terminate();
        }
    }
}

std::string ProcessRegistry::Describe(const std::vector<std::shared_ptr<ProcessHandle>>& handles) {
    constexpr size_t kNameWidth = 16;

    std::vector<std::string> names;
    names.reserve(handles.size());
    size_t nameColumn = 4;
    for (const auto& handle : handles) {
        const auto& args = handle->Args();
        std::string name = args.empty() ? std::string() : std::filesystem::path(args.front()).filename().string();
        name = LimitString(name, kNameWidth);
        nameColumn = std::max(nameColumn, name.size());
        names.push_back(std::move(name));
    }

    std::ostringstream out;
    out << std::left << std::setw(static_cast<int>(nameColumn)) << "name" << "  "
        << std::setw(7) << "pid" << "  "
        << std::setw(6) << "status" << "  "
        << "command" << '\n';

    for (size_t index = 0; index < handles.size(); ++index) {
        const auto& handle = handles[index];
        const auto exitCode = handle->Poll();
        out << std::left << std::setw(static_cast<int>(nameColumn)) << names[index] << "  "
            << std::setw(7) << handle->Pid() << "  "
            << std::setw(6) << (exitCode ? std::to_string(*exitCode) : std::string("-")) << "  "
            << JoinArgs(handle->Args()) << '\n';
    }
    return out.str();
}
