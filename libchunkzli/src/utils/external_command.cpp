#include "../../include/external_command.hpp"
#include "../../include/errors.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace chunkzli {

namespace {

constexpr size_t kMaxCapturedOutput = 16 * 1024;

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

struct FdCloser {
    int fd = -1;
    ~FdCloser() {
        if (fd >= 0) ::close(fd);
    }
};

} // namespace

CommandResult run_command(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        throw CommandError("empty command line");
    }

    std::vector<std::string> argv_str = argv;
    std::vector<char*> c_argv;
    c_argv.reserve(argv_str.size() + 1);
    for (auto& s : argv_str) {
        c_argv.push_back(s.data());
    }
    c_argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw CommandError(errno_message("pipe failed"));
    }
    FdCloser read_end{fds[0]};
    FdCloser write_end{fds[1]};

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw CommandError(errno_message("fork failed"));
    }
    if (pid == 0) {
        // only async-signal-safe calls from here on
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(c_argv[0], c_argv.data());
        ::_exit(kExecFailedStatus);
    }

    ::close(write_end.fd);
    write_end.fd = -1;

    CommandResult result;
    std::array<char, 4096> buf{};
    for (;;) {
        const ssize_t n = ::read(read_end.fd, buf.data(), buf.size());
        if (n > 0) {
            result.output.append(buf.data(), static_cast<size_t>(n));
            if (result.output.size() > kMaxCapturedOutput) {
                result.output.erase(0, result.output.size() - kMaxCapturedOutput);
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break; // EOF or unrecoverable read error, the exit status decides
    }
    ::close(read_end.fd);
    read_end.fd = -1;

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw CommandError(errno_message("waitpid failed"));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_status = 128 + WTERMSIG(status);
    } else {
        result.exit_status = -1;
    }
    return result;
}

} // namespace chunkzli
