#include "runguard.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <cstring>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

// 子进程结束后最多再等待这么久来读完输出管道
static const chrono::milliseconds DRAIN_WINDOW(500);

static const int PIPE_OUT = 0;
static const int PIPE_IN = 1;

// 子进程在 exec 之前失败时通过 CLOEXEC 管道告诉父进程失败的阶段和 errno
enum child_stage : int {
    STAGE_STDIO = 1,
    STAGE_CHDIR = 2,
    STAGE_EXEC = 3
};

struct child_failure {
    int stage;
    int err;
};

template <typename... Args>
[[noreturn]] static void error(int err, fmt::format_string<Args...> format, Args &&...args) {
    throw internal_error(fmt::format("{}: {}", fmt::format(format, std::forward<Args>(args)...), strerror(err)));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        if (close(fd) != 0) PLOG(WARNING) << "unable to close fd " << fd;
        fd = -1;
    }
}

bool runguard_result::timed_out() const {
    return !time_result.empty();
}

bool runguard_result::started() const {
    return internal_error.empty();
}

/**
 * 子进程：fork 之后 exec 之前只能调用异步信号安全的函数，
 * 所有需要分配内存的准备工作都在 fork 之前完成。
 */
[[noreturn]] static void child_exec(char **argv, const char *work_dir, int stdio[3], int errfd, long max_fd) {
    auto fail = [errfd](int stage) {
        child_failure failure = {stage, errno};
        ssize_t written = write(errfd, &failure, sizeof(failure));
        (void)written;
        _exit(127);
    };

    setpgid(0, 0);

    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);
    signal(SIGPIPE, SIG_DFL);

    struct rlimit core = {0, 0};
    setrlimit(RLIMIT_CORE, &core);

    for (int i = 0; i <= 2; ++i)
        if (dup2(stdio[i], i) < 0) fail(STAGE_STDIO);

    // 不让学生程序拿到 runner 打开的数据库连接等文件描述符
    for (int fd = 3; fd < max_fd; ++fd)
        if (fd != errfd) close(fd);

    if (chdir(work_dir) != 0) fail(STAGE_CHDIR);

    execvp(argv[0], argv);
    fail(STAGE_EXEC);
    _exit(127);
}

static void terminate_group(pid_t child_pid) {
    /* First try to kill graciously, then hard.
       Don't report an already exited process as error. */
    VLOG(1) << "sending SIGTERM to process group " << child_pid;
    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH)
        error(errno, "sending SIGTERM to command");

    nanosleep(&killdelay, nullptr);

    VLOG(1) << "sending SIGKILL to process group " << child_pid;
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
}

runguard_result run_guarded(const runguard_options &opt) {
    if (opt.command.empty()) throw internal_error("run_guarded: empty command");

    runguard_result result;

    // 学生程序不读标准输入就退出时，写管道会产生 SIGPIPE
    signal(SIGPIPE, SIG_IGN);

    vector<string> command = opt.command;
    vector<char *> argv;
    for (auto &arg : command) argv.push_back(arg.data());
    argv.push_back(nullptr);
    string work_dir = opt.work_dir.empty() ? "." : opt.work_dir.string();
    long max_fd = min(sysconf(_SC_OPEN_MAX), 65536L);
    if (max_fd < 0) max_fd = 1024;

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    int devnull = -1;
    defer {
        for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe, err_pipe}) {
            close_fd(fds[PIPE_OUT]);
            close_fd(fds[PIPE_IN]);
        }
        close_fd(devnull);
    };

    if (opt.use_stdin) {
        if (pipe2(stdin_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stdin");
    } else {
        devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull < 0) error(errno, "opening /dev/null");
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stdout");
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stderr");
    if (pipe2(err_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for exec status");

    int child_stdio[3] = {opt.use_stdin ? stdin_pipe[PIPE_OUT] : devnull, stdout_pipe[PIPE_IN], stderr_pipe[PIPE_IN]};

    int status = 0;
    bool exited = false, killed = false;
    chrono::milliseconds exited_at(0);

    elapsed_time timer;
    pid_t child_pid = fork();
    if (child_pid < 0) error(errno, "unable to fork");
    if (child_pid == 0) child_exec(argv.data(), work_dir.c_str(), child_stdio, err_pipe[PIPE_IN], max_fd);

    // 出现异常时也不能留下子进程
    defer {
        if (!exited) {
            if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                PLOG(WARNING) << "unable to kill process group " << child_pid;
            if (waitpid(child_pid, nullptr, 0) < 0)
                PLOG(WARNING) << "unable to wait on child " << child_pid;
        }
    };

    // 父子进程都设置进程组，避免 kill(-pid) 时子进程还没来得及调用 setpgid
    if (setpgid(child_pid, child_pid) != 0 && errno != EACCES && errno != ESRCH)
        PLOG(WARNING) << "unable to set process group of " << child_pid;

    close_fd(stdin_pipe[PIPE_OUT]);
    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(err_pipe[PIPE_IN]);
    close_fd(devnull);

    size_t stdin_written = 0;
    if (opt.use_stdin) {
        int flags = fcntl(stdin_pipe[PIPE_IN], F_GETFL);
        if (flags == -1 || fcntl(stdin_pipe[PIPE_IN], F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "fcntl, setting flags");
        if (opt.stdin_content.empty()) close_fd(stdin_pipe[PIPE_IN]);
    }

    child_failure failure = {0, 0};
    size_t failure_read = 0;
    char buf[BUF_SIZE];

    auto kill_child = [&]() {
        if (!killed) {
            killed = true;
            terminate_group(child_pid);
        }
    };

    auto pump = [&](int &fd, string &content) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
            error(errno, "reading output of child");
        }
        if (nread == 0) {
            close_fd(fd);
            return;
        }
        size_t room = opt.stream_size > content.size() ? opt.stream_size - content.size() : 0;
        content.append(buf, min(room, (size_t)nread));
        if ((size_t)nread > room && !result.output_truncated) {
            result.output_truncated = true;
            LOG(INFO) << "output limit of " << opt.stream_size << " bytes reached by " << command[0];
            if (opt.kill_on_output_limit && !exited) kill_child();
        }
    };

    while (true) {
        if (exited && stdout_pipe[PIPE_OUT] < 0 && stderr_pipe[PIPE_OUT] < 0 && err_pipe[PIPE_OUT] < 0) break;

        vector<pollfd> fds;
        for (int fd : {stdout_pipe[PIPE_OUT], stderr_pipe[PIPE_OUT], err_pipe[PIPE_OUT]})
            if (fd >= 0) fds.push_back({fd, POLLIN, 0});
        if (stdin_pipe[PIPE_IN] >= 0) fds.push_back({stdin_pipe[PIPE_IN], POLLOUT, 0});

        // 没有 SIGCHLD 处理函数，通过较短的 poll 超时来轮询子进程状态
        int r = poll(fds.data(), fds.size(), fds.empty() ? 0 : 20);
        if (r < 0 && errno != EINTR) error(errno, "waiting for child data");
        if (fds.empty()) nanosleep(&killdelay, nullptr);

        for (auto &pfd : fds) {
            if (!(pfd.revents & (POLLIN | POLLOUT | POLLHUP | POLLERR))) continue;
            if (pfd.fd == stdout_pipe[PIPE_OUT]) {
                pump(stdout_pipe[PIPE_OUT], result.stdout_content);
            } else if (pfd.fd == stderr_pipe[PIPE_OUT]) {
                pump(stderr_pipe[PIPE_OUT], result.stderr_content);
            } else if (pfd.fd == err_pipe[PIPE_OUT]) {
                ssize_t nread = read(err_pipe[PIPE_OUT], (char *)&failure + failure_read, sizeof(failure) - failure_read);
                if (nread > 0) failure_read += nread;
                else if (nread == 0 || (errno != EINTR && errno != EAGAIN)) close_fd(err_pipe[PIPE_OUT]);
            } else if (pfd.fd == stdin_pipe[PIPE_IN]) {
                if (pfd.revents & (POLLHUP | POLLERR)) {
                    close_fd(stdin_pipe[PIPE_IN]);
                    continue;
                }
                ssize_t nwritten = write(stdin_pipe[PIPE_IN], opt.stdin_content.data() + stdin_written, opt.stdin_content.size() - stdin_written);
                if (nwritten < 0) {
                    // EPIPE: 子进程没有读完标准输入就关闭了它
                    if (errno != EINTR && errno != EAGAIN) close_fd(stdin_pipe[PIPE_IN]);
                } else {
                    stdin_written += nwritten;
                    if (stdin_written == opt.stdin_content.size()) close_fd(stdin_pipe[PIPE_IN]);
                }
            }
        }

        if (!exited) {
            pid_t pid = waitpid(child_pid, &status, WNOHANG);
            if (pid < 0 && errno != EINTR) error(errno, "waiting on child");
            if (pid == child_pid) {
                exited = true;
                exited_at = timer.duration<chrono::milliseconds>();
                result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;
                // 结束进程组内残留的进程，这样输出管道才会关闭
                if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
                    PLOG(WARNING) << "unable to kill process group " << child_pid;
                close_fd(stdin_pipe[PIPE_IN]);
            }
        }

        // 脱离了进程组的后代进程（setsid、daemon）可能一直持有输出管道
        if (exited && timer.duration<chrono::milliseconds>() - exited_at >= DRAIN_WINDOW) {
            if (stdout_pipe[PIPE_OUT] >= 0 || stderr_pipe[PIPE_OUT] >= 0)
                LOG(WARNING) << "descendants of " << command[0] << " still hold its output open, stop reading";
            close_fd(stdout_pipe[PIPE_OUT]);
            close_fd(stderr_pipe[PIPE_OUT]);
            close_fd(err_pipe[PIPE_OUT]);
            break;
        }

        if (!exited && !killed && timer.duration<chrono::milliseconds>().count() >= opt.wall_limit * 1000) {
            result.time_result = "hard-timelimit";
            LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command {}", opt.wall_limit, command[0]);
            kill_child();
        }
    }

    if (failure_read == sizeof(failure)) {
        switch (failure.stage) {
            case STAGE_CHDIR:
                result.internal_error = fmt::format("unable to change directory to {}: {}", work_dir, strerror(failure.err));
                break;
            case STAGE_EXEC:
                result.internal_error = fmt::format("unable to start command {}: {}", command[0], strerror(failure.err));
                break;
            default:
                result.internal_error = fmt::format("unable to redirect standard streams: {}", strerror(failure.err));
                break;
        }
        LOG(WARNING) << result.internal_error;
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (!killed)
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }

    VLOG(1) << fmt::format("run time of {}: real {:.3f}, exitcode {}", command[0], result.wall_time, result.exitcode);
    return result;
}

}  // namespace grader
