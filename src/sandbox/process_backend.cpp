#include "sandbox/process_backend.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <poll.h>
#include <pwd.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/trim.hpp>
#include <algorithm>
#include <system_error>
#include <vector>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

const int BUF_SIZE = 4096;

// 每轮 poll 每条管道最多读多少次，避免持续输出的程序让父进程错过 deadline
const int MAX_READS_PER_ROUND = 16;

const chrono::milliseconds POLL_INTERVAL(10);

/**
 * @brief 子进程在 exec 之前失败的阶段
 */
enum child_stage {
    STAGE_SETSID = 1,
    STAGE_REDIRECT,
    STAGE_CHDIR,
    STAGE_RLIMIT,
    STAGE_SETUID,
    STAGE_UNSHARE,
    STAGE_PRCTL,
    STAGE_FORK,
    STAGE_EXEC
};

/**
 * @brief 子进程通过错误管道发给父进程的失败信息
 */
struct child_failure {
    int stage;
    int err;
};

static const char *describe_stage(int stage) {
    switch (stage) {
        case STAGE_SETSID: return "unable to create session";
        case STAGE_REDIRECT: return "unable to redirect standard streams";
        case STAGE_CHDIR: return "unable to enter scratch directory";
        case STAGE_RLIMIT: return "unable to set resource limits";
        case STAGE_SETUID: return "unable to drop privileges";
        case STAGE_UNSHARE: return "unable to create namespaces";
        case STAGE_PRCTL: return "unable to set process attributes";
        case STAGE_FORK: return "unable to start init process of pid namespace";
        case STAGE_EXEC: return "unable to start interpreter";
        default: return "unknown failure";
    }
}

template <typename... Args>
[[noreturn]] static void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

/**
 * @brief fork 之前准备好的子进程参数
 * fork 之后的子进程只允许调用 async-signal-safe 的函数，因此字符串和指针数组都必须提前构造
 */
struct child_context {
    vector<string> args;
    vector<string> env;
    vector<char *> argv;
    vector<char *> envp;
    string workdir;

    int stdout_fd = -1;
    int stderr_fd = -1;
    int error_fd = -1;

    rlim_t cpu_seconds = 0;
    rlim_t memory_bytes = 0;
    rlim_t file_bytes = 0;
    rlim_t processes = 0;

    optional<pair<uid_t, gid_t>> run_as;
    pid_isolation pid_mode = pid_isolation::none;
    bool unshare_network = false;
    bool strict_isolation = false;

    void seal() {
        for (auto &arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);
        for (auto &entry : env) envp.push_back(entry.data());
        envp.push_back(nullptr);
    }
};

[[noreturn]] static void child_fail(const child_context &ctx, int stage) {
    child_failure failure = {stage, errno};
    // 父进程读不到失败信息时会把子进程的退出当作正常结束，这里已经无法做更多处理
    if (write(ctx.error_fd, &failure, sizeof(failure)) < 0) _exit(126);
    _exit(127);
}

static bool set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    return setrlimit(resource, &lim) == 0;
}

/**
 * @brief 关闭除 stdin/stdout/stderr 和 keep 以外的所有文件描述符
 * 避免用户程序拿到服务端监听的 socket 或者其他请求的管道
 */
static void close_other_fds(int keep) {
#ifdef SYS_close_range
    bool closed = true;
    if (keep > 3 && syscall(SYS_close_range, 3u, (unsigned)keep - 1, 0u) != 0) closed = false;
    if (closed && syscall(SYS_close_range, (unsigned)keep + 1, ~0u, 0u) == 0) return;
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;
    for (int fd = 3; fd < max_fd; ++fd)
        if (fd != keep) close(fd);
}

/**
 * @brief 新 pid 命名空间外的中间进程：等待命名空间内的 1 号进程退出，并以相同的方式退出
 * 1 号进程退出时内核会杀死命名空间中的所有进程，包括调用 setsid 离开进程组的后代
 */
[[noreturn]] static void wait_for_init(const child_context &ctx, pid_t init) {
    close(ctx.error_fd);
    close(STDOUT_FILENO);
    close(STDERR_FILENO);

    int status = 0;
    while (waitpid(init, &status, 0) == -1) {
        if (errno != EINTR) _exit(127);
    }
    if (WIFSIGNALED(status)) {
        signal(WTERMSIG(status), SIG_DFL);
        ::kill(getpid(), WTERMSIG(status));
    }
    _exit(WIFEXITED(status) ? WEXITSTATUS(status) : 127);
}

[[noreturn]] static void run_child(const child_context &ctx) {
    // 服务端可能屏蔽或忽略了部分信号，这些设置会被 exec 继承
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);
    signal(SIGPIPE, SIG_DFL);

    // 成为新的进程组组长，之后可以用 kill(-pid) 杀死用户程序产生的所有进程
    if (setsid() == -1) child_fail(ctx, STAGE_SETSID);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0) child_fail(ctx, STAGE_REDIRECT);
    if (dup2(devnull, STDIN_FILENO) < 0 ||
        dup2(ctx.stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(ctx.stderr_fd, STDERR_FILENO) < 0)
        child_fail(ctx, STAGE_REDIRECT);
    close_other_fds(ctx.error_fd);

    if (chdir(ctx.workdir.c_str()) != 0) child_fail(ctx, STAGE_CHDIR);

    /* 硬限制比软限制多一秒：到达软限制时内核发送 SIGXCPU，到达硬限制时发送 SIGKILL */
    if (!set_rlimit(RLIMIT_CPU, ctx.cpu_seconds, ctx.cpu_seconds + 1)) child_fail(ctx, STAGE_RLIMIT);
    if (ctx.memory_bytes > 0 && !set_rlimit(RLIMIT_AS, ctx.memory_bytes, ctx.memory_bytes))
        child_fail(ctx, STAGE_RLIMIT);
    if (!set_rlimit(RLIMIT_FSIZE, ctx.file_bytes, ctx.file_bytes)) child_fail(ctx, STAGE_RLIMIT);
    if (!set_rlimit(RLIMIT_CORE, 0, 0)) child_fail(ctx, STAGE_RLIMIT);

    bool pid_namespace = false;

    // root 可以直接创建 pid 命名空间，必须在切换用户之前完成
    if (ctx.pid_mode == pid_isolation::privileged) {
        if (unshare(CLONE_NEWPID) == 0)
            pid_namespace = true;
        else if (ctx.strict_isolation)
            child_fail(ctx, STAGE_UNSHARE);
    }

    if (ctx.run_as) {
        gid_t gid = ctx.run_as->second;
        if (setgroups(1, &gid) != 0 || setgid(gid) != 0 || setuid(ctx.run_as->first) != 0)
            child_fail(ctx, STAGE_SETUID);
    }

    // 新的网络命名空间中只有未启用的 lo，用户程序无法访问任何网络
    int flags = 0;
    if (ctx.unshare_network) flags |= CLONE_NEWUSER | CLONE_NEWNET;
    if (ctx.pid_mode == pid_isolation::user_namespace) flags |= CLONE_NEWUSER | CLONE_NEWPID;
    if (flags) {
        if (unshare(flags) == 0)
            pid_namespace = pid_namespace || (flags & CLONE_NEWPID);
        else if (ctx.strict_isolation)
            child_fail(ctx, STAGE_UNSHARE);
    }

    // 切换用户和进入新的用户命名空间都会清除 PDEATHSIG，因此放在最后设置
    // 服务端异常退出时不留下孤儿进程
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) child_fail(ctx, STAGE_PRCTL);

    if (pid_namespace) {
        // unshare(CLONE_NEWPID) 只对之后 fork 出的子进程生效，解释器将成为命名空间的 1 号进程
        pid_t init = fork();
        if (init == -1) child_fail(ctx, STAGE_FORK);
        if (init > 0) wait_for_init(ctx, init);
        if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) child_fail(ctx, STAGE_PRCTL);
    }

    // 在创建 1 号进程之后再设置，限制很小时中间进程也能 fork 成功
    if (ctx.processes > 0 && !set_rlimit(RLIMIT_NPROC, ctx.processes, ctx.processes))
        child_fail(ctx, STAGE_RLIMIT);

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) child_fail(ctx, STAGE_PRCTL);

    execve(ctx.argv[0], ctx.argv.data(), ctx.envp.data());
    child_fail(ctx, STAGE_EXEC);
}

/**
 * @brief 试探当前系统能否 unshare 出 flags 指定的命名空间
 * 容器内或者关闭了 unprivileged_userns_clone 的系统上会失败
 */
static bool try_unshare(int flags) {
    pid_t pid = fork();
    if (pid == -1) return false;
    if (pid == 0) _exit(unshare(flags) == 0 ? EXIT_SUCCESS : EXIT_FAILURE);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == EXIT_SUCCESS;
}

/**
 * @brief 保存一条输出流，超出 limit 的部分只计数不保存
 */
struct stream_capture {
    explicit stream_capture(size_t limit) : limit(limit) {}

    void append(const char *buf, size_t n) {
        total += n;
        if (data.size() < limit)
            data.append(buf, min(n, limit - data.size()));
    }

    bool truncated() const { return total > limit; }

    /**
     * @brief 截断时追加提示，并去除首尾空白字符
     */
    string finish(const char *sentinel) {
        string text = move(data);
        if (truncated()) text += sentinel;
        boost::algorithm::trim(text);
        return text;
    }

    string data;
    size_t total = 0;
    size_t limit;
};

/**
 * @brief 从管道读出当前可读的数据
 * 读到 EOF 时关闭管道
 */
static void pump_pipe(scoped_fd &pipe, stream_capture &capture) {
    char buf[BUF_SIZE];
    for (int i = 0; i < MAX_READS_PER_ROUND && pipe.valid(); ++i) {
        ssize_t nread = read(pipe.get(), buf, BUF_SIZE);
        if (nread > 0) {
            capture.append(buf, nread);
        } else if (nread == 0) {
            pipe.reset();
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else if (errno != EINTR) {
            error(errno, "reading output of child process");
        }
    }
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error(errno, "setting O_NONBLOCK on fd {}", fd);
}

static int64_t elapsed_ms(chrono::steady_clock::time_point start) {
    return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
}

process_unit::~process_unit() {
    release();
}

void process_unit::terminate() noexcept {
    if (pid <= 0 || reaped) return;
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << system_category().message(errno);
    // 子进程可能在 setsid 之前就失败了，此时进程组不存在
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to process " << pid << ": " << system_category().message(errno);
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            LOG(ERROR) << "unable to reap process " << pid << ": " << system_category().message(errno);
            break;
        }
    }
    reaped = true;
}

void process_unit::release() noexcept {
    terminate();
    stdout_pipe.reset();
    stderr_pipe.reset();
    scratch.release();
}

process_backend::process_backend(const resource_limits &limits, const sandbox_options &options)
    : limits(limits), options(options), can_isolate_network(false), pid_mode(pid_isolation::none) {
    if (getuid() == 0) {
        if (options.run_user) {
            struct passwd *pwd = getpwnam(options.run_user->c_str());
            if (!pwd)
                throw internal_error(fmt::format("run user {} does not exist", *options.run_user));
            run_as = make_pair(pwd->pw_uid, pwd->pw_gid);
        } else {
            LOG(WARNING) << "Running as root without --run-user, user programs will keep root's uid";
        }
    } else if (options.run_user) {
        LOG(WARNING) << "Ignoring --run-user " << *options.run_user << " since the service is not running as root";
    }

    if (options.isolate_network) {
        can_isolate_network = try_unshare(CLONE_NEWUSER | CLONE_NEWNET);
        if (!can_isolate_network)
            LOG(WARNING) << "Network namespaces are unavailable, user programs will share the host network";
    }

    if (getuid() == 0 && try_unshare(CLONE_NEWPID))
        pid_mode = pid_isolation::privileged;
    else if (try_unshare(CLONE_NEWUSER | CLONE_NEWPID))
        pid_mode = pid_isolation::user_namespace;
    else
        LOG(WARNING) << "PID namespaces are unavailable, descendants leaving the process group may outlive user programs";
}

bool process_backend::network_isolation_available() const {
    return can_isolate_network;
}

bool process_backend::process_isolation_available() const {
    return pid_mode != pid_isolation::none;
}

unique_ptr<execution_unit> process_backend::launch(const string &source) {
    if (options.strict_isolation) {
        if (getuid() == 0 && !run_as)
            throw launch_error("Refusing to run user program as root");
        if (options.isolate_network && !can_isolate_network)
            throw launch_error("Network isolation is unavailable");
        if (pid_mode == pid_isolation::none)
            throw launch_error("Process isolation is unavailable");
    }

    fs::path interpreter = which(options.interpreter);
    if (interpreter.empty())
        throw launch_error(fmt::format("Interpreter {} not found", options.interpreter));

    auto unit = make_unique<process_unit>();
    try {
        fs::path root = options.scratch_dir.empty() ? fs::temp_directory_path() : options.scratch_dir;
        unit->scratch = scoped_scratch_dir(root, "run");
        fs::path program = unit->scratch.path() / "main.py";
        write_file_content(program, source);
        if (run_as) {
            if (chown(unit->scratch.path().c_str(), run_as->first, run_as->second) != 0 ||
                chown(program.c_str(), run_as->first, run_as->second) != 0)
                error(errno, "changing owner of {}", unit->scratch.path().string());
        }
    } catch (std::exception &ex) {
        throw launch_error(fmt::format("Unable to create scratch area: {}", ex.what()));
    }

    int stdout_fds[2], stderr_fds[2], error_fds[2];
    if (pipe2(stdout_fds, O_CLOEXEC) != 0)
        throw launch_error(fmt::format("Unable to create pipe: {}", system_category().message(errno)));
    scoped_fd stdout_read(stdout_fds[PIPE_READ]), stdout_write(stdout_fds[PIPE_WRITE]);
    if (pipe2(stderr_fds, O_CLOEXEC) != 0)
        throw launch_error(fmt::format("Unable to create pipe: {}", system_category().message(errno)));
    scoped_fd stderr_read(stderr_fds[PIPE_READ]), stderr_write(stderr_fds[PIPE_WRITE]);
    if (pipe2(error_fds, O_CLOEXEC) != 0)
        throw launch_error(fmt::format("Unable to create pipe: {}", system_category().message(errno)));
    scoped_fd error_read(error_fds[PIPE_READ]), error_write(error_fds[PIPE_WRITE]);

    child_context ctx;
    ctx.args = {interpreter.string(), "-u", "main.py"};
    ctx.env = {
        "PATH=" + get_env("PATH", "/usr/local/bin:/usr/bin:/bin"),
        "HOME=" + unit->scratch.path().string(),
        "TMPDIR=" + unit->scratch.path().string(),
        "PYTHONUNBUFFERED=1",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONIOENCODING=utf-8"};
    ctx.workdir = unit->scratch.path().string();
    ctx.stdout_fd = stdout_write.get();
    ctx.stderr_fd = stderr_write.get();
    ctx.error_fd = error_write.get();
    ctx.cpu_seconds = cpu_limit_seconds(limits);
    ctx.memory_bytes = limits.max_memory_bytes;
    ctx.file_bytes = limits.max_file_bytes > 0 ? limits.max_file_bytes : limits.max_output_bytes;
    ctx.processes = limits.max_processes;
    ctx.run_as = run_as;
    ctx.pid_mode = pid_mode;
    ctx.unshare_network = options.isolate_network && can_isolate_network;
    ctx.strict_isolation = options.strict_isolation;
    ctx.seal();

    pid_t pid = fork();
    if (pid == -1)
        throw launch_error(fmt::format("Unable to fork: {}", system_category().message(errno)));
    if (pid == 0)
        run_child(ctx);

    unit->pid = pid;
    unit->start = chrono::steady_clock::now();

    stdout_write.reset();
    stderr_write.reset();
    error_write.reset();

    // exec 成功时错误管道因 O_CLOEXEC 被关闭，这里读到 EOF
    child_failure failure;
    ssize_t nread;
    do {
        nread = read(error_read.get(), &failure, sizeof(failure));
    } while (nread == -1 && errno == EINTR);
    if (nread == -1) {
        int err = errno;
        unit->terminate();
        throw launch_error(fmt::format("Unable to read child status: {}", system_category().message(err)));
    }
    if (nread == sizeof(failure)) {
        unit->terminate();
        throw launch_error(fmt::format("{}: {}", describe_stage(failure.stage), system_category().message(failure.err)));
    }

    try {
        set_nonblocking(stdout_read.get());
        set_nonblocking(stderr_read.get());
    } catch (system_error &ex) {
        throw launch_error(ex.what());
    }
    unit->stdout_pipe = move(stdout_read);
    unit->stderr_pipe = move(stderr_read);
    return unit;
}

execution_outcome process_backend::wait(execution_unit &base, chrono::steady_clock::time_point deadline) {
    auto &unit = dynamic_cast<process_unit &>(base);
    stream_capture out(limits.max_output_bytes), err(limits.max_output_bytes);
    execution_outcome outcome;
    bool exited = unit.reaped;

    while (!exited || unit.stdout_pipe.valid() || unit.stderr_pipe.valid()) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            if (exited) {
                // 用户程序已经退出，但是有逃出进程组的后代进程仍然持有管道
                LOG(WARNING) << "Output pipes of process " << unit.pid << " are still open after it exited";
                break;
            }
            unit.terminate();
            outcome.timed_out = true;
            outcome.stderr_text = timeout_message(format_wall_limit(limits));
            outcome.duration_ms = elapsed_ms(unit.start);
            return outcome;
        }

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now);
        int timeout = (int)max<int64_t>(1, min(remaining, POLL_INTERVAL).count());

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (unit.stdout_pipe.valid()) fds[nfds++] = {unit.stdout_pipe.get(), POLLIN, 0};
        if (unit.stderr_pipe.valid()) fds[nfds++] = {unit.stderr_pipe.get(), POLLIN, 0};

        int r = poll(fds, nfds, timeout);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child output");
        if (r > 0) {
            for (nfds_t i = 0; i < nfds; ++i) {
                if (!fds[i].revents) continue;
                if (unit.stdout_pipe.valid() && fds[i].fd == unit.stdout_pipe.get())
                    pump_pipe(unit.stdout_pipe, out);
                else if (unit.stderr_pipe.valid() && fds[i].fd == unit.stderr_pipe.get())
                    pump_pipe(unit.stderr_pipe, err);
            }
        }

        if (!exited) {
            pid_t pid = waitpid(unit.pid, &unit.status, WNOHANG);
            if (pid == -1 && errno != EINTR) error(errno, "waiting on child {}", unit.pid);
            if (pid == unit.pid) {
                unit.reaped = exited = true;
                outcome.duration_ms = elapsed_ms(unit.start);
                // 主进程结束后立刻清理进程组里残留的后代进程，管道随之关闭
                if (::kill(-unit.pid, SIGKILL) != 0 && errno != ESRCH)
                    LOG(WARNING) << "unable to kill remaining processes of group " << unit.pid;
            }
        }
    }

    if (WIFSIGNALED(unit.status))
        LOG(INFO) << "Process " << unit.pid << " terminated with signal " << WTERMSIG(unit.status);

    outcome.stdout_text = out.finish(STDOUT_TRUNCATED_SENTINEL);
    outcome.stderr_text = err.finish(STDERR_TRUNCATED_SENTINEL);
    outcome.truncated_stdout = out.truncated();
    outcome.truncated_stderr = err.truncated();
    return outcome;
}

void process_backend::kill(execution_unit &unit) {
    dynamic_cast<process_unit &>(unit).terminate();
}

void process_backend::cleanup(execution_unit &unit) noexcept {
    // dynamic_cast 引用版本会抛出 bad_cast，这里使用指针版本
    if (auto process = dynamic_cast<process_unit *>(&unit))
        process->release();
}

}  // namespace runner
