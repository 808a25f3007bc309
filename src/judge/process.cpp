#include "judge/process.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codejudge {
using namespace std;

#define PIPE_OUT 0  // 管道的读端
#define PIPE_IN 1   // 管道的写端

static const size_t BUF_SIZE = 65536;

/**
 * @brief 子进程在 exec 之前失败时通过管道告知父进程失败的步骤和 errno
 */
struct exec_failure {
    int stage;
    int error;
};

static const char *stage_names[] = {"redirecting standard streams", "changing directory", "setting resource limits", "executing command"};

static void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

static void create_pipe(int fd[2]) {
    if (pipe2(fd, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        throw system_error(errno, system_category(), "unable to set O_NONBLOCK");
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// 在子进程中调用，不能抛出异常或者申请内存
static bool set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

/**
 * @brief 计算 RLIMIT_CPU 的软限制
 * @return 单位为秒，RLIM_INFINITY 表示不限制
 */
static rlim_t cpu_soft_limit(const process_options &options) {
    if (!options.limit_cpu_time || !(options.timeout_seconds < MAX_CPU_LIMIT))
        return RLIM_INFINITY;
    return (rlim_t)ceil(max(options.timeout_seconds, 0.0)) + 1;
}

static bool set_restrictions(const process_options &options, rlim_t cpu) {
    if (!set_rlimit(RLIMIT_CORE, 0, 0)) return false;
    if (options.memory_limit_bytes > 0 &&
        !set_rlimit(RLIMIT_AS, options.memory_limit_bytes, options.memory_limit_bytes))
        return false;
    // 软限制到达时发送 SIGXCPU，硬限制多留一秒
    if (cpu != RLIM_INFINITY && !set_rlimit(RLIMIT_CPU, cpu, cpu + 1)) return false;
    return true;
}

process_result run_process(const process_options &options) {
    if (options.command.empty())
        throw internal_error("Empty command");

    ignore_sigpipe();

    int stdin_pipe[2] = {-1, -1}, stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    defer {
        for (int *fds : {stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe})
            close_fd(fds[PIPE_OUT]), close_fd(fds[PIPE_IN]);
    };
    create_pipe(stdin_pipe);
    create_pipe(stdout_pipe);
    create_pipe(stderr_pipe);
    create_pipe(exec_pipe);

    // fork 之后子进程不能申请内存，提前准备好参数
    vector<string> command = options.command;
    vector<char *> argv;
    for (auto &arg : command) argv.push_back(arg.data());
    argv.push_back(nullptr);
    string work_dir = options.work_dir.string();
    rlim_t cpu_limit = cpu_soft_limit(options);

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0)
        throw system_error(errno, system_category(), "unable to fork");

    if (pid == 0) {  // child process
        setsid();
        signal(SIGPIPE, SIG_DFL);

        exec_failure failure{0, 0};
        if (dup2(stdin_pipe[PIPE_OUT], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[PIPE_IN], STDERR_FILENO) < 0) {
            failure = {0, errno};
        } else if (!work_dir.empty() && chdir(work_dir.c_str()) != 0) {
            failure = {1, errno};
        } else if (!set_restrictions(options, cpu_limit)) {
            failure = {2, errno};
        } else {
            execvp(argv[0], argv.data());
            failure = {3, errno};
        }
        ssize_t ignored = write(exec_pipe[PIPE_IN], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    bool reaped = false;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            int status;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
        }
    };

    close_fd(stdin_pipe[PIPE_OUT]);
    close_fd(stdout_pipe[PIPE_IN]);
    close_fd(stderr_pipe[PIPE_IN]);
    close_fd(exec_pipe[PIPE_IN]);

    // exec 成功时 O_CLOEXEC 关闭管道，read 返回 0
    exec_failure failure;
    ssize_t nread;
    do {
        nread = read(exec_pipe[PIPE_OUT], &failure, sizeof(failure));
    } while (nread < 0 && errno == EINTR);
    if (nread == (ssize_t)sizeof(failure)) {
        throw internal_error(fmt::format("Unable to start {}: {} failed: {}",
                                         options.command[0], stage_names[failure.stage],
                                         generic_category().message(failure.error)));
    }

    process_result result;
    int64_t output_limit = options.output_limit < 0 ? OUTPUT_LIMIT : options.output_limit;
    int &input_fd = stdin_pipe[PIPE_IN];
    int *output_fds[2] = {&stdout_pipe[PIPE_OUT], &stderr_pipe[PIPE_OUT]};
    string *outputs[2] = {&result.stdout_text, &result.stderr_text};
    size_t written = 0;

    if (options.stdin_data.empty())
        close_fd(input_fd);
    else
        set_nonblock(input_fd);
    for (int *fd : output_fds) set_nonblock(*fd);

    auto write_input = [&]() {
        size_t chunk = min(options.stdin_data.size() - written, BUF_SIZE);
        ssize_t n = write(input_fd, options.stdin_data.data() + written, chunk);
        if (n > 0) {
            written += n;
        } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
            // 选手程序没有读完输入就关闭了标准输入
            close_fd(input_fd);
            return;
        }
        if (written >= options.stdin_data.size()) close_fd(input_fd);
    };

    auto read_output = [&](int i) {
        char buffer[BUF_SIZE];
        ssize_t n = read(*output_fds[i], buffer, sizeof(buffer));
        if (n > 0) {
            int64_t room = output_limit - (int64_t)outputs[i]->size();
            if (room > 0) outputs[i]->append(buffer, (size_t)min<int64_t>(n, room));
            if (n > room) result.output_truncated = true;
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
            close_fd(*output_fds[i]);
        }
    };

    auto pump = [&](int timeout_ms) {
        pollfd fds[3];
        int owners[3];
        nfds_t count = 0;
        if (input_fd >= 0) {
            fds[count] = {input_fd, POLLOUT, 0};
            owners[count++] = -1;
        }
        for (int i = 0; i < 2; ++i) {
            if (*output_fds[i] >= 0) {
                fds[count] = {*output_fds[i], POLLIN, 0};
                owners[count++] = i;
            }
        }

        if (poll(fds, count, timeout_ms) < 0) {
            if (errno == EINTR) return;
            throw system_error(errno, system_category(), "poll");
        }
        for (nfds_t k = 0; k < count; ++k) {
            if (!fds[k].revents) continue;
            if (owners[k] < 0)
                write_input();
            else
                read_output(owners[k]);
        }
    };

    auto outputs_open = [&]() {
        return *output_fds[0] >= 0 || *output_fds[1] >= 0;
    };

    bool exited = false;
    double end_time = 0;
    while (true) {
        if (!exited) {
            // WNOWAIT 保留僵尸进程，在杀死进程组之前进程组 id 不会被复用
            siginfo_t info;
            info.si_pid = 0;
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0 && errno != EINTR)
                throw system_error(errno, system_category(), "waitid");
            if (info.si_pid == pid) {
                exited = true;
                end_time = timer.seconds();
            }
        }

        double now = timer.seconds();
        double remaining;
        if (exited) {
            if (!outputs_open()) break;
            remaining = KILL_DELAY - (now - end_time);
            if (remaining <= 0) break;
        } else {
            remaining = options.timeout_seconds - now;
            if (remaining <= 0) {
                result.timed_out = true;
                end_time = now;
                break;
            }
        }

        int wait_ms = (int)ceil(min(remaining, 1.0) * 1000);
        wait_ms = max(1, min(wait_ms, outputs_open() || input_fd >= 0 ? 50 : 1));
        pump(wait_ms);
    }

    if (result.timed_out)
        LOG(WARNING) << "Process " << options.command[0] << " exceeded time limit of " << options.timeout_seconds << "s, killing process group " << pid;

    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to kill process group " << pid << ": " << generic_category().message(errno);
    if (!exited) kill(pid, SIGKILL);

    int status = 0;
    struct rusage usage = {};
    while (wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "wait4");
    }
    reaped = true;
    result.cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
                      usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;

    // 进程组被杀死后读取管道中残留的数据
    elapsed_time drain;
    close_fd(input_fd);
    while (outputs_open() && drain.seconds() < KILL_DELAY)
        pump(10);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;

        // 多线程程序的 CPU 时间可能先于时钟时间达到 RLIMIT_CPU
        if (!result.timed_out &&
            (result.signal == SIGXCPU ||
             (result.signal == SIGKILL && cpu_limit != RLIM_INFINITY && result.cpu_time >= cpu_limit))) {
            result.timed_out = true;
            LOG(WARNING) << "Process " << options.command[0] << " exceeded cpu time limit of " << cpu_limit << "s";
        }
    }
    result.wall_time = end_time;
    return result;
}

}  // namespace codejudge
