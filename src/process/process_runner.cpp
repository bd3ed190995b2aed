#include "photo_restore/process/process_runner.hpp"
#include "photo_restore/core/errors.hpp"
#include "photo_restore/core/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace photo_restore::process {

UniqueFd::~UniqueFd() {
    reset();
}

UniqueFd::UniqueFd(UniqueFd&& o) noexcept : fd_(o.fd_) {
    o.fd_ = -1;
}

UniqueFd& UniqueFd::operator=(UniqueFd&& o) noexcept {
    if (this != &o) {
        reset(o.fd_);
        o.fd_ = -1;
    }
    return *this;
}

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

std::string ExitStatus::describe() const {
    std::ostringstream oss;
    if (exited) {
        oss << "exit status: " << code;
    } else {
        oss << "signal: " << signal;
        const char* name = ::strsignal(signal);
        if (name) {
            oss << " (" << name << ")";
        }
    }
    return oss.str();
}

namespace {

ExitStatus decode_wait_status(int status) {
    ExitStatus es;
    if (WIFEXITED(status)) {
        es.exited = true;
        es.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        es.exited = false;
        es.signal = WTERMSIG(status);
    }
    return es;
}

bool is_executable_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        const auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

Pipe make_pipe(const std::string& what) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw SpawnError("Failed to create " + what + " pipe: " + std::strerror(errno));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void check_file_action(int rc, const std::string& what) {
    if (rc != 0) {
        throw SpawnError("Failed to " + what + ": " + std::strerror(rc));
    }
}

class SpawnFileActions {
public:
    SpawnFileActions() { posix_spawn_file_actions_init(&fa_); }
    ~SpawnFileActions() { posix_spawn_file_actions_destroy(&fa_); }

    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    posix_spawn_file_actions_t* get() { return &fa_; }

private:
    posix_spawn_file_actions_t fa_;
};

} // namespace

ChildProcess::ChildProcess(pid_t pid, UniqueFd out, UniqueFd err)
    : pid_(pid), stdout_(std::move(out)), stderr_(std::move(err)) {}

ChildProcess::ChildProcess(ChildProcess&& o) noexcept
    : pid_(o.pid_),
      stdout_(std::move(o.stdout_)),
      stderr_(std::move(o.stderr_)),
      status_(o.status_) {
    o.pid_ = -1;
}

ChildProcess::~ChildProcess() {
    if (pid_ <= 0 || status_) {
        return;
    }
    stdout_.reset();
    stderr_.reset();
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
}

ChildProcess ChildProcess::spawn(const ProcessSpec& spec) {
    const auto found = find_executable(spec.program);
    if (!found) {
        throw SpawnError("Failed to start " + spec.program + ": executable not found");
    }
    // The child changes directory before exec; relative paths would resolve there.
    std::error_code ec;
    const fs::path exe = fs::absolute(*found, ec);
    if (ec) {
        throw SpawnError("Failed to start " + spec.program + ": " + ec.message());
    }

    Pipe out = make_pipe("stdout");
    Pipe err = make_pipe("stderr");

    SpawnFileActions actions;
    check_file_action(posix_spawn_file_actions_adddup2(actions.get(), out.write.get(),
                                                       STDOUT_FILENO),
                      "redirect stdout");
    check_file_action(posix_spawn_file_actions_adddup2(actions.get(), err.write.get(),
                                                       STDERR_FILENO),
                      "redirect stderr");
    if (!spec.cwd.empty()) {
        check_file_action(posix_spawn_file_actions_addchdir_np(actions.get(), spec.cwd.c_str()),
                          "change directory to " + spec.cwd.string());
    }

    std::vector<std::string> argv_strings;
    argv_strings.reserve(spec.args.size() + 1);
    argv_strings.push_back(spec.program);
    argv_strings.insert(argv_strings.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> env_strings = build_environment(spec.env);

    std::vector<char*> argv = to_c_array(argv_strings);
    std::vector<char*> envp = to_c_array(env_strings);

    pid_t pid = -1;
    const int rc = ::posix_spawn(&pid, exe.c_str(), actions.get(), nullptr,
                                 argv.data(), envp.data());
    if (rc != 0) {
        throw SpawnError("Failed to start " + spec.program + ": " + std::strerror(rc));
    }

    std::cerr << "[SPAWN] pid " << pid << ": " << exe.string() << " "
              << core::join(spec.args, " ") << std::endl;

    // Write ends close here; the child holds the only remaining copies.
    return ChildProcess(pid, std::move(out.read), std::move(err.read));
}

UniqueFd ChildProcess::take_stdout() {
    return std::move(stdout_);
}

UniqueFd ChildProcess::take_stderr() {
    return std::move(stderr_);
}

std::optional<ExitStatus> ChildProcess::try_wait() {
    if (status_) {
        return status_;
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (r == 0) {
        return std::nullopt;
    }
    status_ = decode_wait_status(status);
    return status_;
}

ExitStatus ChildProcess::wait() {
    if (status_) {
        return *status_;
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    status_ = decode_wait_status(status);
    return *status_;
}

std::optional<fs::path> find_executable(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        fs::path p(program);
        if (is_executable_file(p)) return p;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    const std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= search.size()) {
        size_t end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        const std::string dir = search.substr(start, end - start);
        const fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / program;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::vector<std::string> build_worker_args(const fs::path& entry_script,
                                           const fs::path& input_folder,
                                           const fs::path& output_folder,
                                           const RunOptions& options) {
    std::vector<std::string> args = {
        "-u",
        entry_script.string(),
        "--input_folder", input_folder.string(),
        "--output_folder", output_folder.string(),
        "--GPU", options.gpu,
    };
    if (options.with_scratch) {
        args.push_back("--with_scratch");
    }
    if (options.hr) {
        args.push_back("--HR");
    }
    return args;
}

} // namespace photo_restore::process
