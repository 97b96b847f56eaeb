#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <chrono>
#include <system_error>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "limits.hpp"

namespace runner {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

// poll interval while the child is running
static const int POLL_INTERVAL_MS = 50;

// how long to keep reading pipes after the process group has been killed
static const int DRAIN_TIMEOUT_MS = 200;

/**
 * @brief 子进程在 execve 之前失败时，通过 close-on-exec 管道报告的信息
 */
struct child_error {
    enum stage_t : int {
        REDIRECT = 0,
        SETSID = 1,
        RESTRICT = 2,
        CHDIR = 3,
        EXEC = 4
    };

    int stage;
    int err;
};

static const char *stage_name(int stage) {
    switch (stage) {
        case child_error::REDIRECT: return "redirecting standard streams";
        case child_error::SETSID: return "creating session";
        case child_error::RESTRICT: return "setting resource limits";
        case child_error::CHDIR: return "changing working directory";
        case child_error::EXEC: return "executing command";
        default: return "unknown stage";
    }
}

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw spawn_error(fmt::format(args...) + ": " + system_category().message(err));
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0)
        PLOG(WARNING) << "closing fd " << fd;
    fd = -1;
}

[[noreturn]] static void report_child_error(int fd, int stage) {
    child_error report{stage, errno};
    ssize_t ignored = write(fd, &report, sizeof(report));
    (void)ignored;
    _exit(127);
}

/**
 * @brief fork 之后子进程执行的部分
 * 父进程可能是多线程的，这里不能分配内存、不能加锁、不能抛出异常
 */
[[noreturn]] static void run_child(const runguard_options &opt, char *const *argv, char *const *envp,
                                   int stdin_fd, int child_pipefd[3][2], int errfd) {
    if (setsid() == -1)
        report_child_error(errfd, child_error::SETSID);

    if (dup2(stdin_fd, STDIN_FILENO) < 0)
        report_child_error(errfd, child_error::REDIRECT);
    for (int i = 1; i <= 2; ++i) {
        if (dup2(child_pipefd[i][PIPE_IN], i) < 0)
            report_child_error(errfd, child_error::REDIRECT);
    }

    if (int err = set_restrictions(opt); err != 0) {
        errno = err;
        report_child_error(errfd, child_error::RESTRICT);
    }

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
        report_child_error(errfd, child_error::CHDIR);

    // SIG_IGN dispositions and the signal mask survive execve
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_DFL;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGPIPE, &sigact, nullptr);
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    // descriptors opened concurrently by other threads without O_CLOEXEC
    struct rlimit nofile;
    int maxfd = 1024;
    if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY)
        maxfd = (int)min<rlim_t>(nofile.rlim_cur, 65536);
    for (int fd = STDERR_FILENO + 1; fd < maxfd; ++fd)
        if (fd != errfd) close(fd);

    execve(argv[0], argv, envp);
    report_child_error(errfd, child_error::EXEC);
}

/**
 * @brief 读取管道中可读的数据
 * 超过 stream_size 的数据被读取后丢弃，但仍然统计读取的字节数。
 * 读到 EOF 时关闭管道并将描述符标记为 -1。
 */
static void pump_pipes(const runguard_options &opt, int child_pipefd[3][2], string *outputs[3], bool truncated[3], size_t data_read[3]) {
    char buf[BUF_SIZE];
    for (int i = 1; i <= 2; i++) {
        while (child_pipefd[i][PIPE_OUT] != -1) {
            ssize_t nread = read(child_pipefd[i][PIPE_OUT], buf, BUF_SIZE);
            if (nread == -1) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) break;
                PLOG(WARNING) << "copying data fd " << i;
                close_fd(child_pipefd[i][PIPE_OUT]);
                break;
            }
            if (nread == 0) {
                /* EOF detected: close fd and indicate this with -1 */
                close_fd(child_pipefd[i][PIPE_OUT]);
                break;
            }

            data_read[i] += nread;
            size_t to_write = nread;
            if (opt.stream_size >= 0) {
                size_t left = (size_t)opt.stream_size > outputs[i]->size() ? (size_t)opt.stream_size - outputs[i]->size() : 0;
                if (to_write > left) {
                    to_write = left;
                    if (!truncated[i]) LOG(INFO) << "child fd " << i << " limit reached";
                    truncated[i] = true;
                }
            }
            outputs[i]->append(buf, to_write);
        }
    }
}

/**
 * @brief 在 timeout_ms 毫秒内等待管道可读并读取数据
 */
static void wait_pipes(const runguard_options &opt, int child_pipefd[3][2], string *outputs[3], bool truncated[3], size_t data_read[3], int timeout_ms) {
    struct pollfd fds[2];
    nfds_t nfds = 0;
    for (int i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT] >= 0) {
            fds[nfds].fd = child_pipefd[i][PIPE_OUT];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
    }

    int r = poll(fds, nfds, max(timeout_ms, 0));
    if (r == -1 && errno != EINTR)
        PLOG(WARNING) << "waiting for child data";
    if (r > 0)
        pump_pipes(opt, child_pipefd, outputs, truncated, data_read);
}

/**
 * @brief 终止整个进程组
 * 先尝试让进程正常退出，0.1s 后强制杀死
 */
static void terminate(pid_t child_pid) {
    LOG(INFO) << "sending SIGTERM";
    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH)
        PLOG(ERROR) << "sending SIGTERM to command";

    /* Prefer nanosleep over sleep because of higher resolution and
       it does not interfere with signals. */
    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL";
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(ERROR) << "sending SIGKILL to command";
}

static int wait_child(pid_t pid, int options) {
    int wstatus = 0;
    while (true) {
        pid_t r = waitpid(pid, &wstatus, options);
        if (r == pid) return wstatus;
        if (r == 0) return -1;  // WNOHANG, still running
        if (errno == EINTR) continue;
        throw internal_error(fmt::format("waiting on child {}: {}", pid, system_category().message(errno)));
    }
}

static execution_result run_once(const runguard_options &opt) {
    if (opt.command.empty())
        throw spawn_error("empty command");

    DLOG(INFO) << "Running " << boost::algorithm::join(opt.command, " ");

    // argv and envp must be ready before fork
    vector<string> args(opt.command), envs(opt.env);
    vector<char *> argv, envp;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);
    for (auto &env : envs) envp.push_back(env.data());
    envp.push_back(nullptr);

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int errpipe[2] = {-1, -1};
    int stdin_fd = -1;
    defer {
        for (int i = 1; i <= 2; ++i) {
            close_fd(child_pipefd[i][PIPE_IN]);
            close_fd(child_pipefd[i][PIPE_OUT]);
        }
        close_fd(errpipe[PIPE_IN]);
        close_fd(errpipe[PIPE_OUT]);
        close_fd(stdin_fd);
    };

    const char *stdin_filename = opt.stdin_filename.empty() ? "/dev/null" : opt.stdin_filename.c_str();
    if ((stdin_fd = open(stdin_filename, O_RDONLY | O_CLOEXEC)) < 0)
        error(errno, "opening standard input file");

    /* Setup pipes connecting to child stdout/err streams (ignore stdin). */
    for (int i = 1; i <= 2; i++) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(errpipe, O_CLOEXEC) != 0) error(errno, "creating error pipe");

    elapsed_time timer;
    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0:  // child process, run the command
            run_child(opt, argv.data(), envp.data(), stdin_fd, child_pipefd, errpipe[PIPE_IN]);
        default:
            break;
    }

    /* Close unused file descriptors */
    for (int i = 1; i <= 2; i++) close_fd(child_pipefd[i][PIPE_IN]);
    close_fd(errpipe[PIPE_IN]);
    close_fd(stdin_fd);

    {
        // EOF means execve succeeded and the close-on-exec pipe went away
        child_error report;
        ssize_t nread;
        do {
            nread = read(errpipe[PIPE_OUT], &report, sizeof(report));
        } while (nread == -1 && errno == EINTR);

        if (nread == (ssize_t)sizeof(report)) {
            wait_child(child_pid, 0);
            throw spawn_error(fmt::format("{} '{}': {}", stage_name(report.stage), opt.command[0], system_category().message(report.err)));
        }
    }

    for (int i = 1; i <= 2; i++) {
        int flags = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
        if (flags == -1 || fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, flags | O_NONBLOCK) == -1) {
            kill(-child_pid, SIGKILL);
            wait_child(child_pid, 0);
            throw internal_error("unable to set pipe non-blocking");
        }
    }

    execution_result result;
    string *outputs[3] = {nullptr, &result.stdout_data, &result.stderr_data};
    bool truncated[3] = {false, false, false};
    size_t data_read[3] = {0, 0, 0};

    int wstatus = -1;
    try {
        auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(opt.wall_limit));
        while (true) {
            wstatus = wait_child(child_pid, WNOHANG);
            if (wstatus != -1) break;

            if (opt.use_wall_limit && chrono::steady_clock::now() >= deadline) {
                LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command", opt.wall_limit);
                result.timed_out = true;
                terminate(child_pid);
                wstatus = wait_child(child_pid, 0);
                break;
            }

            bool pipes_open = child_pipefd[1][PIPE_OUT] >= 0 || child_pipefd[2][PIPE_OUT] >= 0;
            int timeout_ms = pipes_open ? POLL_INTERVAL_MS : 5;
            if (opt.use_wall_limit) {
                auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
                timeout_ms = (int)min<long long>(timeout_ms, max<long long>(remaining, 0) + 1);
            }
            wait_pipes(opt, child_pipefd, outputs, truncated, data_read, timeout_ms);
        }
    } catch (...) {
        kill(-child_pid, SIGKILL);
        waitpid(child_pid, nullptr, 0);
        throw;
    }

    // 杀死进程组内所有的进程，以确保父进程结束后不会有子进程留驻系统
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        PLOG(WARNING) << "unable to kill process group " << child_pid;

    {
        auto drain_deadline = chrono::steady_clock::now() + chrono::milliseconds(DRAIN_TIMEOUT_MS);
        while ((child_pipefd[1][PIPE_OUT] >= 0 || child_pipefd[2][PIPE_OUT] >= 0) &&
               chrono::steady_clock::now() < drain_deadline) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(drain_deadline - chrono::steady_clock::now()).count();
            wait_pipes(opt, child_pipefd, outputs, truncated, data_read, (int)remaining + 1);
        }
    }

    result.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;
    result.stdout_truncated = truncated[STDOUT_FILENO];
    result.stderr_truncated = truncated[STDERR_FILENO];

    if (WIFEXITED(wstatus)) {
        if (!result.timed_out) result.exitcode = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        int sig = WTERMSIG(wstatus);
        result.signal = sig;
        if (!result.timed_out) result.exitcode = sig + 128;
        switch (sig) {
            case SIGXCPU:
                result.timed_out = true;
                result.exitcode.reset();
                LOG(WARNING) << "Time Limit Exceeded (hard cpu limit)";
                break;
            default:
                if (!result.timed_out)
                    LOG(WARNING) << "Command terminated with signal (" << sig << ", " << strsignal(sig) << ")";
                break;
        }
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", wstatus));
    }

    if (result.timed_out)
        result.status = status::EXECUTION_TIMEOUT;
    else if (result.exitcode == 0)
        result.status = status::SUCCESS;
    else
        result.status = status::EXECUTION_FAILED;
    result.success = result.status == status::SUCCESS;

    LOG(INFO) << fmt::format("run time: real {:.3f}, stdout {} bytes, stderr {} bytes",
                             result.wall_time, data_read[STDOUT_FILENO], data_read[STDERR_FILENO]);
    return result;
}

execution_result runit(const runguard_options &opt) {
    for (int attempt = 1;; ++attempt) {
        try {
            return run_once(opt);
        } catch (spawn_error &ex) {
            if (attempt < 2) {
                LOG(WARNING) << "Unable to start command, retrying: " << ex.what();
                continue;
            }
            LOG(ERROR) << "Unable to start command: " << ex.what();
            return make_result(status::INTERNAL_ERROR, ex.what());
        } catch (std::exception &ex) {
            LOG(ERROR) << "Runguard failed: " << ex.what();
            return make_result(status::INTERNAL_ERROR, ex.what());
        }
    }
}

}  // namespace runner
