// EN: Implementation of the POSIX command runner.
// FR: Implémentation du runner de commandes POSIX.

#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <thread>

namespace SSD {

namespace {

void checkRc(bool ok, const std::string& what) {
    if (!ok) {
        throw std::system_error(std::error_code(errno, std::system_category()), what);
    }
}

// EN: Closes a file descriptor on scope exit.
// FR: Ferme un descripteur de fichier en sortie de portée.
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

// EN: Child side. Only async-signal-safe calls between fork() and exec().
// FR: Côté enfant. Uniquement des appels async-signal-safe entre fork() et exec().
[[noreturn]] void execChild(char* const* argv, const char* workdir, int stdin_fd, int stdout_fd,
                            int stderr_fd) {
    ::setpgid(0, 0);
    if (::dup2(stdin_fd, STDIN_FILENO) == -1 || ::dup2(stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_fd, STDERR_FILENO) == -1) {
        std::_Exit(127);
    }
    if (::chdir(workdir) == -1) {
        const char* message = "[ssdctl] cannot change to working directory: ";
        (void)!::write(STDERR_FILENO, message, std::strlen(message));
        (void)!::write(STDERR_FILENO, workdir, std::strlen(workdir));
        std::_Exit(127);
    }

    ::execvp(argv[0], argv);

    const char* message = "[ssdctl] could not execute ";
    const char* reason = std::strerror(errno);
    (void)!::write(STDERR_FILENO, message, std::strlen(message));
    (void)!::write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
    (void)!::write(STDERR_FILENO, ": ", 2);
    (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
    std::_Exit(127);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// EN: SIGTERM the group, wait up to the grace period, then SIGKILL.
// FR: SIGTERM au groupe, attente du délai de grâce, puis SIGKILL.
void terminateChild(pid_t child) {
    ::kill(-child, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        const pid_t rc = ::waitpid(child, &status, WNOHANG);
        if (rc == child || (rc == -1 && errno != EINTR)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ::kill(-child, SIGKILL);
    while (::waitpid(child, &status, 0) == -1 && errno == EINTR) {
    }
}

} // namespace

std::string CommandSpec::display() const {
    std::string result;
    for (const auto& argument : arguments) {
        if (!result.empty()) {
            result += ' ';
        }
        result += argument;
    }
    return result;
}

PosixCommandRunner::PosixCommandRunner(ThreadPool& pool) : pool_(pool) {}

std::future<CommandResult> PosixCommandRunner::run(const CommandSpec& command,
                                                   const std::filesystem::path& working_directory,
                                                   const CancellationToken& token) {
    return pool_.submitNamed("command: " + command.display(), TaskPriority::NORMAL,
                             [this, command, working_directory, token]() {
                                 return execute(command, working_directory, token);
                             });
}

CommandResult PosixCommandRunner::execute(const CommandSpec& command,
                                          const std::filesystem::path& working_directory,
                                          const CancellationToken& token) const {
    if (command.arguments.empty()) {
        throw std::invalid_argument("Cannot run an empty command");
    }
    token.throwIfCancellationRequested();

    SSD_LOG_DEBUG_META("process", "Spawning subprocess: " + command.display(),
                       (std::unordered_map<std::string, std::string>{{"cwd", working_directory.string()}}));

    // EN: Allocate before fork().
    // FR: Allocation avant fork().
    std::vector<char*> argv;
    argv.reserve(command.arguments.size() + 1);
    for (const auto& argument : command.arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);
    const std::string workdir = working_directory.string();

    int out_pipe[2];
    checkRc(::pipe2(out_pipe, O_CLOEXEC) == 0, "Create stdout pipe for subprocess");
    FdGuard out_read(out_pipe[0]);
    FdGuard out_write(out_pipe[1]);

    int err_pipe[2];
    checkRc(::pipe2(err_pipe, O_CLOEXEC) == 0, "Create stderr pipe for subprocess");
    FdGuard err_read(err_pipe[0]);
    FdGuard err_write(err_pipe[1]);

    FdGuard dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    checkRc(dev_null.get() >= 0, "Open /dev/null for subprocess stdin");

    const pid_t child = ::fork();
    checkRc(child >= 0, "Failed to fork() for subprocess");
    if (child == 0) {
        execChild(argv.data(), workdir.c_str(), dev_null.get(), out_write.get(), err_write.get());
    }

    // EN: Also set from the parent so kill(-child) cannot race the child's own setpgid().
    //     EACCES once the child has exec'd is expected.
    // FR: Aussi positionné par le parent pour que kill(-child) ne dépende pas du setpgid() de l'enfant.
    //     EACCES après l'exec de l'enfant est attendu.
    if (::setpgid(child, child) == -1 && errno != EACCES) {
        SSD_LOG_DEBUG("process", std::string("setpgid failed: ") + std::strerror(errno));
    }

    out_write.reset();
    err_write.reset();
    dev_null.reset();

    CommandResult result;
    pollfd fds[2];
    fds[0].fd = out_read.get();
    fds[0].events = POLLIN;
    fds[1].fd = err_read.get();
    fds[1].events = POLLIN;
    int open_streams = 2;
    char buffer[4096];

    while (open_streams > 0) {
        if (token.isCancellationRequested()) {
            SSD_LOG_WARN("process", "Cancelling subprocess: " + command.display());
            terminateChild(child);
            throw OperationCancelledError("Command cancelled: " + command.display());
        }

        const int rc = ::poll(fds, 2, 50);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int poll_errno = errno;
            terminateChild(child);
            errno = poll_errno;
            checkRc(false, "Failed in poll()");
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const ssize_t nread = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (nread > 0) {
                (i == 0 ? result.standard_output : result.standard_error).append(buffer, static_cast<size_t>(nread));
            } else if (nread == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(child, &status, 0);
    } while (waited == -1 && errno == EINTR);
    checkRc(waited == child, "Failed in waitpid()");

    result.exit_code = decodeStatus(status);
    SSD_LOG_DEBUG("process", command.display() + " exited with code " + std::to_string(result.exit_code));
    return result;
}

} // namespace SSD
