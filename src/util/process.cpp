#include <depwatch/process.hpp>
#include <depwatch/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace depwatch {

namespace {

void drain(int fd, std::string& into) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        into.append(buf, static_cast<size_t>(n));
    }
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    log::debug("exec: %s (in %s)", args[0].c_str(),
               working_dir.empty() ? "." : working_dir.c_str());

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        return DepwatchError{DepwatchError::IO,
            std::string("pipe() failed: ") + std::strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return DepwatchError{DepwatchError::IO,
            std::string("pipe() failed: ") + std::strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return DepwatchError{DepwatchError::IO,
            std::string("fork() failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);
                return DepwatchError{DepwatchError::IO,
                    args[0] + " timed out after " + std::to_string(timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            if (exit_code == 127 && out_buf.empty()) {
                return DepwatchError{DepwatchError::IO,
                    "cannot execute " + args[0],
                    "check that it is installed and on PATH"};
            }
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return DepwatchError{DepwatchError::IO,
                std::string("waitpid failed: ") + std::strerror(errno)};
        }

        usleep(1000);
    }
}

} // namespace depwatch
