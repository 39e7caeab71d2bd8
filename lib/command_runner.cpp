#include "command_runner.h"
#include "utils.h"

#include <ev.h>
#include <glog/logging.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

std::string CommandResult::diagnostic() const {
    if (!err.empty()) {
        return err;
    }
    if (!out.empty()) {
        return out;
    }
    return "unknown error (exit status " + std::to_string(exit_status) + ")";
}

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

namespace {

struct PipeReader {
    ev_io watcher;
    std::string data;
    bool open = true;
};

// everything the watchers of one invocation share
struct ChildIo {
    PipeReader out;
    PipeReader err;
    ev_timer timeout_watcher;
    bool timed_out = false;
};

void pipe_cb(EV_P_ ev_io* w, int revents) {
    ChildIo* io = static_cast<ChildIo*>(w->data);
    PipeReader& reader = (w == &io->out.watcher) ? io->out : io->err;

    char buffer[4096];
    while (true) {
        ssize_t n = read(w->fd, buffer, sizeof(buffer));
        if (n > 0) {
            reader.data.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EOF, or the pipe broke
        ev_io_stop(EV_A_ w);
        reader.open = false;
        break;
    }

    if (!io->out.open && !io->err.open) {
        ev_timer_stop(EV_A_ &io->timeout_watcher);
    }
}

void timeout_cb(EV_P_ ev_timer* w, int revents) {
    ChildIo* io = static_cast<ChildIo*>(w->data);
    io->timed_out = true;
    ev_break(EV_A_ EVBREAK_ALL);
}

bool setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

CommandResult localFailure(const std::string& what) {
    CommandResult result;
    result.exit_status = -1;
    result.err = what + ": " + std::strerror(errno);
    LOG(ERROR) << result.err;
    return result;
}

} // namespace

SubprocessRunner::SubprocessRunner(std::chrono::milliseconds timeout) : timeout_(timeout) {}

CommandResult SubprocessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        CommandResult result;
        result.exit_status = 127;
        result.err = "empty command";
        return result;
    }

    LOG(INFO) << "Executing: " << describeCommand(argv);

    // built before fork(): the child may only make async-signal-safe calls
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    const std::string exec_failure = "failed to execute " + argv[0] + "\n";

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        return localFailure("pipe2");
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        CommandResult result = localFailure("pipe2");
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        CommandResult result = localFailure("fork");
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        ssize_t ignored = write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    setNonBlocking(out_pipe[0]);
    setNonBlocking(err_pipe[0]);

    ChildIo io;
    struct ev_loop* loop = ev_loop_new(EVFLAG_AUTO);
    if (loop == nullptr) {
        CommandResult result = localFailure("ev_loop_new");
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        return result;
    }

    ev_io_init(&io.out.watcher, pipe_cb, out_pipe[0], EV_READ);
    io.out.watcher.data = &io;
    ev_io_start(loop, &io.out.watcher);

    ev_io_init(&io.err.watcher, pipe_cb, err_pipe[0], EV_READ);
    io.err.watcher.data = &io;
    ev_io_start(loop, &io.err.watcher);

    const double timeout_sec = static_cast<double>(timeout_.count()) / 1000.0;
    ev_timer_init(&io.timeout_watcher, timeout_cb, timeout_sec, 0);
    io.timeout_watcher.data = &io;
    ev_timer_start(loop, &io.timeout_watcher);

    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    // returns once both pipes hit EOF, or the timer breaks out
    ev_run(loop, 0);

    ev_io_stop(loop, &io.out.watcher);
    ev_io_stop(loop, &io.err.watcher);
    ev_timer_stop(loop, &io.timeout_watcher);
    ev_loop_destroy(loop);
    close(out_pipe[0]);
    close(err_pipe[0]);

    bool timed_out = io.timed_out;
    if (timed_out) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (true) {
        pid_t reaped = waitpid(pid, &status, timed_out ? 0 : WNOHANG);
        if (reaped == pid) {
            break;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            return localFailure("waitpid");
        }
        // pipes closed but the child lingers
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            kill(pid, SIGKILL);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    CommandResult result;
    result.out = trim(io.out.data);
    result.err = trim(io.err.data);
    result.timed_out = timed_out;
    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_status = 128 + WTERMSIG(status);
    } else {
        result.exit_status = -1;
    }

    if (timed_out) {
        std::string message = "timed out after " + std::to_string(timeout_.count()) + "ms";
        result.err = result.err.empty() ? message : message + ": " + result.err;
        LOG(ERROR) << "Command " << describeCommand(argv) << " " << message;
    } else if (result.exit_status != 0) {
        LOG(INFO) << "Command exited with status " << result.exit_status << ": " << describeCommand(argv);
    }
    return result;
}
