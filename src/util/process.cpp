#include <moo/process.hpp>
#include <moo/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace moo {

// Forward everything currently readable from `fd`
static void drain(int fd, OutputChannel channel, const OutputSink& sink) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        if (sink) sink(channel, std::string(buf, static_cast<size_t>(n)));
    }
}

Result<ProcessResult> run_process(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  const OutputSink& sink,
                                  int timeout_seconds) {
    if (args.empty()) {
        return MooError{MooError::InvalidArg, "run_process: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return MooError{MooError::Process,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return MooError{MooError::Process,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    log::debug("running %s in %s", args[0].c_str(),
               working_dir.empty() ? "." : working_dir.c_str());

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return MooError{MooError::Process,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(kExecFailedExitCode);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(kExecFailedExitCode);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    auto close_pipes = [&]() {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
    };

    auto start = std::chrono::steady_clock::now();
    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_pipes();
            return MooError{MooError::Process,
                args[0] + " timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        drain(stdout_pipe[0], OutputChannel::Stdout, sink);
        drain(stderr_pipe[0], OutputChannel::Stderr, sink);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], OutputChannel::Stdout, sink);
            drain(stderr_pipe[0], OutputChannel::Stderr, sink);
            close_pipes();

            ProcessResult result;
            result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<ProcessResult>::ok(result);
        }
        if (w < 0) {
            close_pipes();
            return MooError{MooError::Process,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

} // namespace moo
