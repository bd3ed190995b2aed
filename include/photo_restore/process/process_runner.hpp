#pragma once

#include "photo_restore/core/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace photo_restore::process {

namespace fs = std::filesystem;

// Owning file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd();

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& o) noexcept;
    UniqueFd& operator=(UniqueFd&& o) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;
    fs::path cwd;
    // Added to (or replacing entries of) the inherited environment.
    std::map<std::string, std::string> env;
};

struct ExitStatus {
    bool exited = false;  // false: terminated by a signal
    int code = -1;
    int signal = 0;

    bool success() const { return exited && code == 0; }
    std::string describe() const;
};

/**
 * A spawned child with piped stdout/stderr.
 * The handle owns the process: destroying it while the child still runs
 * blocks until the child is reaped.
 */
class ChildProcess {
public:
    // Throws SpawnError when the program cannot be located or started.
    static ChildProcess spawn(const ProcessSpec& spec);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& o) noexcept;
    ChildProcess& operator=(ChildProcess&& o) = delete;

    pid_t pid() const { return pid_; }

    // Transfers ownership of the read ends to the caller.
    UniqueFd take_stdout();
    UniqueFd take_stderr();

    // Non-blocking; nullopt while the child is still running.
    std::optional<ExitStatus> try_wait();
    ExitStatus wait();

private:
    ChildProcess(pid_t pid, UniqueFd out, UniqueFd err);

    pid_t pid_ = -1;
    UniqueFd stdout_;
    UniqueFd stderr_;
    std::optional<ExitStatus> status_;
};

/**
 * Resolves program to an executable path. Names containing '/' are checked
 * as given; bare names are searched in $PATH.
 */
std::optional<fs::path> find_executable(const std::string& program);

/**
 * Worker command line after the interpreter:
 * -u <entry> --input_folder <in> --output_folder <out> --GPU <gpu> [--with_scratch] [--HR]
 */
std::vector<std::string> build_worker_args(const fs::path& entry_script,
                                           const fs::path& input_folder,
                                           const fs::path& output_folder,
                                           const RunOptions& options);

} // namespace photo_restore::process
