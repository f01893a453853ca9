/**
 * @file command_runner.cpp
 * @brief ProcessCommandRunner: fork/exec with stdout capture and timeout.
 * @author Dimitris Kafetzis
 *
 * The child's stdout is read through a pipe with poll() so the parent never
 * blocks past the deadline. On timeout the child is killed and reaped.
 */

#include "platform/command_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace thermal_guard {

namespace {

int remaining_ms(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

}  // namespace

ProcessCommandRunner::ProcessCommandRunner(std::string search_path)
    : search_path_(std::move(search_path)) {
    if (search_path_.empty()) {
        const char* env = std::getenv("PATH");
        search_path_ = env ? env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    }
}

std::string ProcessCommandRunner::resolve(std::string_view program) const {
    if (program.empty()) return {};
    if (program.find('/') != std::string_view::npos) {
        std::string p{program};
        return ::access(p.c_str(), X_OK) == 0 ? p : std::string{};
    }

    std::istringstream dirs(search_path_);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + std::string{program};
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return {};
}

bool ProcessCommandRunner::available(std::string_view program) const {
    return !resolve(program).empty();
}

Result<CommandOutput> ProcessCommandRunner::run(const std::vector<std::string>& argv,
                                                Duration timeout) {
    if (argv.empty()) {
        return Error{ErrorCode::BackendUnavailable, "Empty command line"};
    }
    auto executable = resolve(argv.front());
    if (executable.empty()) {
        return Error{ErrorCode::BackendUnavailable, argv.front() + ": not found"};
    }

    // Build the exec argument vector before fork(); the child may only make
    // async-signal-safe calls.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) cargv.push_back(const_cast<char*>(arg.c_str()));
    cargv.push_back(nullptr);

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Io, "pipe failed: " + std::string(std::strerror(errno))};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        return Error{ErrorCode::Io, "fork failed: " + std::string(std::strerror(errno))};
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::dup2(pipe_fds[1], STDOUT_FILENO);
        ::execv(executable.c_str(), cargv.data());
        ::_exit(127);
    }

    ::close(pipe_fds[1]);
    const int read_fd = pipe_fds[0];
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    CommandOutput output;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            ::close(read_fd);
            kill_and_reap(pid);
            return Error{ErrorCode::Timeout, argv.front() + " timed out after "
                         + std::to_string(timeout.count()) + "ms"};
        }

        pollfd pfd{};
        pfd.fd = read_fd;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            ::close(read_fd);
            kill_and_reap(pid);
            return Error{ErrorCode::Io, "poll failed: " + std::string(std::strerror(errno))};
        }
        if (ready == 0) continue;

        ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (output.stdout_text.size() < kMaxOutputBytes) {
                output.stdout_text.append(buffer, static_cast<size_t>(n));
            }
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof = true;
        }
    }
    ::close(read_fd);

    // stdout is closed; give the process the rest of the budget to exit.
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            return Error{ErrorCode::Io, "waitpid failed: " + std::string(std::strerror(errno))};
        }
        if (remaining_ms(deadline) == 0) {
            kill_and_reap(pid);
            return Error{ErrorCode::Timeout, argv.front() + " did not exit before deadline"};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else {
        output.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return output;
}

}  // namespace thermal_guard
