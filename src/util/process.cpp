#include <ferry/process.hpp>
#include <ferry/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ferry {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Appends what is available on `fd`; closes it at EOF
void drain(int& fd, std::string& out) {
    if (fd < 0) return;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n == 0 || errno != EAGAIN) close_fd(fd);
        return;
    }
}

int exit_code_of(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options) {
    if (args.empty()) {
        return FerryError{FerryError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // carries errno when exec fails

    if (options.capture && (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0)) {
        return FerryError{FerryError::IO, std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(exec_pipe) != 0) {
        close_fd(stdout_pipe[0]); close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]); close_fd(stderr_pipe[1]);
        return FerryError{FerryError::IO, std::string("pipe() failed: ") + strerror(errno)};
    }
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        close_fd(stdout_pipe[0]); close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]); close_fd(stderr_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return FerryError{FerryError::IO, std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        ::close(exec_pipe[0]);
        if (options.capture) {
            ::close(stdout_pipe[0]);
            ::close(stderr_pipe[0]);
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
            ::close(stdout_pipe[1]);
            ::close(stderr_pipe[1]);
        }
        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            int err = errno;
            (void)!::write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        int err = errno;
        (void)!::write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec succeeded iff the CLOEXEC pipe closes without data
    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        waitpid(pid, nullptr, 0);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return FerryError{FerryError::NotFound,
            "cannot execute '" + args[0] + "': " + strerror(exec_errno)};
    }
    log::debug("started %s (pid %d)", args[0].c_str(), static_cast<int>(pid));

    if (stdout_pipe[0] >= 0) fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    if (stderr_pipe[0] >= 0) fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    CommandResult result;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (options.timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= options.timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close_fd(stdout_pipe[0]);
                close_fd(stderr_pipe[0]);
                return FerryError{FerryError::IO,
                    "'" + args[0] + "' timed out after " +
                        std::to_string(options.timeout_seconds) + "s"};
            }
        }

        if (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0) {
            struct pollfd fds[2] = {{stdout_pipe[0], POLLIN, 0}, {stderr_pipe[0], POLLIN, 0}};
            ::poll(fds, 2, 50);
            drain(stdout_pipe[0], result.stdout_str);
            drain(stderr_pipe[0], result.stderr_str);
        }

        int status = 0;
        pid_t w = waitpid(pid, &status,
                          options.timeout_seconds > 0 || options.capture ? WNOHANG : 0);
        if (w == pid) {
            // Drain remaining data
            if (stdout_pipe[0] >= 0) fcntl(stdout_pipe[0], F_SETFL, 0);
            if (stderr_pipe[0] >= 0) fcntl(stderr_pipe[0], F_SETFL, 0);
            while (stdout_pipe[0] >= 0) drain(stdout_pipe[0], result.stdout_str);
            while (stderr_pipe[0] >= 0) drain(stderr_pipe[0], result.stderr_str);

            result.exit_code = exit_code_of(status);
            return Result<CommandResult>::ok(std::move(result));
        }
        if (w < 0 && errno != EINTR) {
            close_fd(stdout_pipe[0]);
            close_fd(stderr_pipe[0]);
            return FerryError{FerryError::IO, std::string("waitpid failed: ") + strerror(errno)};
        }
        if (w == 0 && !options.capture) {
            struct timespec ts = {0, 50 * 1000 * 1000};
            nanosleep(&ts, nullptr);
        }
    }
}

} // namespace ferry
