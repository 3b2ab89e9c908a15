#include "Subprocess.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpgate {

namespace {

std::once_flag sigpipe_once;

void ignore_sigpipe() {
    // Writes to a dead child must surface as EPIPE instead of killing us
    std::call_once(sigpipe_once, [] {
        signal(SIGPIPE, SIG_IGN);
        spdlog::debug("SIGPIPE ignored process-wide");
    });
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) < 0) {
        throw SubprocessError(errno_message("Failed to create pipe"));
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Only async-signal-safe calls from here on; runs between fork and exec
void redirect(int from, int to) {
    if (from == to) {
        int flags = fcntl(from, F_GETFD);
        fcntl(from, F_SETFD, flags & ~FD_CLOEXEC);
    } else {
        dup2(from, to);
    }
}

[[noreturn]] void child_fail(int report_fd) {
    int err = errno;
    ssize_t ignored = write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            entries.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_pointers(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

} // namespace

Subprocess::Subprocess(ProcessSpec spec)
    : spec_(std::move(spec)) {
    if (spec_.command.empty()) {
        throw std::invalid_argument("Command cannot be empty");
    }
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && is_alive()) {
        spdlog::debug("Subprocess {} still running at destruction, terminating", pid_);
        terminate(std::chrono::seconds(1));
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void Subprocess::start() {
    if (pid_ > 0) {
        throw std::logic_error("Subprocess already started");
    }

    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};

    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, report_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    try {
        make_pipe(in_pipe);
        make_pipe(out_pipe);
        make_pipe(err_pipe);
        make_pipe(report_pipe);
    } catch (...) {
        close_all();
        throw;
    }

    // Everything the child needs is allocated before fork
    std::vector<std::string> argv_strings;
    argv_strings.push_back(spec_.command);
    argv_strings.insert(argv_strings.end(), spec_.args.begin(), spec_.args.end());
    std::vector<char*> argv = to_pointers(argv_strings);

    std::vector<std::string> env_strings = build_environment(spec_.env);
    std::vector<char*> envp = to_pointers(env_strings);

    const char* workdir = spec_.working_dir.empty() ? nullptr : spec_.working_dir.c_str();

    pid_t pid = fork();
    if (pid < 0) {
        close_all();
        throw SubprocessError(errno_message("fork() failed"));
    }

    if (pid == 0) {
        signal(SIGPIPE, SIG_DFL);

        redirect(in_pipe[0], STDIN_FILENO);
        redirect(out_pipe[1], STDOUT_FILENO);
        redirect(err_pipe[1], STDERR_FILENO);

        if (workdir && chdir(workdir) < 0) {
            child_fail(report_pipe[1]);
        }

        execvpe(argv[0], argv.data(), envp.data());
        child_fail(report_pipe[1]);
    }

    pid_ = pid;
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(report_pipe[1]);

    // The report pipe closes on successful exec; an errno arrives otherwise
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(report_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(report_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        int status = 0;
        waitpid(pid_, &status, 0);
        exit_code_ = 127;
        throw SubprocessError("Failed to execute '" + spec_.command + "': " +
                              std::strerror(child_errno));
    }

    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    spdlog::debug("Spawned '{}' (pid={})", spec_.command, pid_);
}

void Subprocess::close_stdin() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    close_fd(stdin_fd_);
}

bool Subprocess::try_reap(int options) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (exit_code_) {
        return true;
    }
    if (pid_ <= 0) {
        return false;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, options);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            return false;
        }
        spdlog::debug("Process {} exited with code {}", pid_, *exit_code_);
        return true;
    }
    if (result < 0) {
        // ECHILD: somebody else reaped it; nothing more to learn
        spdlog::warn("waitpid({}) failed: {}", pid_, std::strerror(errno));
        exit_code_ = -1;
        return true;
    }
    return false;
}

bool Subprocess::is_alive() {
    if (pid_ <= 0) {
        return false;
    }
    return !try_reap(WNOHANG);
}

bool Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) {
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (try_reap(WNOHANG)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Subprocess::wait() {
    while (!wait_for_exit(std::chrono::seconds(1))) {
    }
    return exit_code().value_or(-1);
}

void Subprocess::terminate(std::chrono::milliseconds grace) {
    if (!is_alive()) {
        return;
    }

    spdlog::debug("Terminating '{}' (pid={})", spec_.command, pid_);
    if (::kill(pid_, SIGTERM) == 0 && wait_for_exit(grace)) {
        return;
    }

    spdlog::warn("Process {} ignored SIGTERM for {} ms, killing", pid_, grace.count());
    kill();
}

void Subprocess::kill() {
    if (!is_alive()) {
        return;
    }
    ::kill(pid_, SIGKILL);
    wait_for_exit(std::chrono::seconds(5));
}

std::optional<int> Subprocess::exit_code() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

void Subprocess::close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

ProcessResult Subprocess::run(const ProcessSpec& spec, const std::string& input,
                              std::chrono::milliseconds timeout) {
    Subprocess proc(spec);
    proc.start();

    set_nonblocking(proc.stdin_fd_);
    set_nonblocking(proc.stdout_fd_);
    set_nonblocking(proc.stderr_fd_);

    ProcessResult result;
    size_t written = 0;
    if (input.empty()) {
        proc.close_stdin();
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[8192];

    while (proc.stdout_fd_ >= 0 || proc.stderr_fd_ >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd fds[3];
        int count = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (proc.stdin_fd_ >= 0) {
            in_idx = count;
            fds[count++] = {proc.stdin_fd_, POLLOUT, 0};
        }
        if (proc.stdout_fd_ >= 0) {
            out_idx = count;
            fds[count++] = {proc.stdout_fd_, POLLIN, 0};
        }
        if (proc.stderr_fd_ >= 0) {
            err_idx = count;
            fds[count++] = {proc.stderr_fd_, POLLIN, 0};
        }

        int ready = poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw SubprocessError(errno_message("poll() failed"));
        }
        if (ready == 0) {
            continue;
        }

        if (in_idx >= 0 && fds[in_idx].revents) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                proc.close_stdin();
            } else {
                ssize_t n = write(proc.stdin_fd_, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written >= input.size()) {
                        proc.close_stdin();
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: the child stopped reading; its output still decides
                    proc.close_stdin();
                }
            }
        }

        auto drain = [&](int idx, int& fd, std::string& sink) {
            if (idx < 0 || fds[idx].revents == 0) {
                return;
            }
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(fd);
            }
        };
        drain(out_idx, proc.stdout_fd_, result.stdout_data);
        drain(err_idx, proc.stderr_fd_, result.stderr_data);
    }

    if (!result.timed_out) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }
        if (!proc.wait_for_exit(remaining)) {
            result.timed_out = true;
        }
    }

    if (result.timed_out) {
        spdlog::debug("'{}' exceeded {} ms deadline, killing pid {}", spec.command,
                      timeout.count(), proc.pid());
        proc.kill();
    }

    result.exit_code = proc.exit_code().value_or(-1);
    return result;
}

} // namespace mcpgate
