#include "process_sandbox.h"
#include "sandbox_internal.h"
#include "sandbox_isolation.h"
#include "sandbox_error.h"
#include "script_staging.h"
#include "result_format.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

// 父进程使用的系统调用
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <sched.h>
#include <signal.h>

extern char** environ;

namespace mcp_gateway
{

    const char* GetExitCodeDescription(int code)
    {
        switch (code)
        {
            // Stage 1: Basic Setup / Exec
            case ERR_DUP2:           return "dup2 failed (IO redirect)";
            case ERR_SETPGID_FAILED: return "setpgid failed";
            case ERR_EXEC_FAILED:    return "execve failed (interpreter could not be started)";
            case ERR_CHDIR_FAILED:   return "chdir into the staging directory failed";
            case ERR_SETGID_FAILED:  return "setgid/setgroups failed (privilege drop)";
            case ERR_SETUID_FAILED:  return "setuid failed (privilege drop)";
            case ERR_CAPS_FAILED:    return "dropping capabilities failed";
            case ERR_NO_NEW_PRIVS:   return "PR_SET_NO_NEW_PRIVS failed";

            // Stage 2: Resource Limits
            case ERR_RLIMIT_CPU:     return "setrlimit(CPU) failed";
            case ERR_RLIMIT_MEMORY:  return "setrlimit(AS) failed";
            case ERR_RLIMIT_NPROC:   return "setrlimit(NPROC) failed";
            case ERR_RLIMIT_FSIZE:   return "setrlimit(FSIZE) failed";
            case ERR_RLIMIT_CORE:    return "setrlimit(CORE) failed";

            // Stage 3: Isolation
            case ERR_MOUNT_PRIVATE:     return "mount --make-rprivate failed";
            case ERR_MOUNT_PROC:        return "mount /proc failed";
            case ERR_SECCOMP_FAILED:    return "loading seccomp filter failed";
            case ERR_SANDBOX_EXCEPTION: return "internal sandbox error";

            default: return "unknown sandbox setup error";
        }
    }

    std::string FormatSystemError(const std::string& prefix, int err)
    {
        return prefix + ": " + std::strerror(err);
    }

    namespace {

        const int kNamespaceFlags = CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWUTS;

        // 子进程退出后，继续等待孙进程释放管道的最长时间
        const auto kDrainGrace = std::chrono::milliseconds(200);

        // 收割孤儿进程时最多扫描的轮数 (每轮杀掉一层后代)
        const int kMaxReapRounds = 256;

        // 已 clone 但尚未收割的直接子进程。挂在本进程下的其他子进程都是逃逸的后代
        std::mutex g_children_mutex;
        std::multiset<pid_t> g_children;

        pid_t CloneTracked(int flags, RunChildArgs& args, char* stack_top, int& err)
        {
            std::lock_guard<std::mutex> lock(g_children_mutex);
            pid_t pid = clone(RunChildFn, stack_top, flags | SIGCHLD, &args);
            if (pid == -1) {
                err = errno;
            } else {
                g_children.insert(pid);
            }
            return pid;
        }

        void Untrack(pid_t pid)
        {
            std::lock_guard<std::mutex> lock(g_children_mutex);
            auto it = g_children.find(pid);
            if (it != g_children.end()) g_children.erase(it);
        }

        // 扫描 /proc/<pid>/stat，返回父进程是本进程的所有 PID
        std::vector<pid_t> ListOwnChildren()
        {
            std::vector<pid_t> children;
            const pid_t self = getpid();
            std::error_code ec;
            for (std::filesystem::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
                const std::string name = it->path().filename().string();
                if (name.empty() ||
                    !std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); })) {
                    continue;
                }
                std::ifstream in(it->path() / "stat");
                std::string line;
                if (!std::getline(in, line)) continue;
                // comm 字段可能包含空格和括号，从最后一个 ')' 之后开始解析
                auto paren = line.rfind(')');
                if (paren == std::string::npos) continue;
                std::istringstream fields(line.substr(paren + 1));
                char state;
                pid_t ppid;
                if (fields >> state >> ppid && ppid == self) {
                    children.push_back(static_cast<pid_t>(std::stol(name)));
                }
            }
            return children;
        }

        /**
         * 没有 PID 命名空间时，setsid 逃出进程组的后台进程不会被 kill(-pgid) 波及。
         * 本进程是 child subreaper，这些进程的父进程退出后会挂到本进程下:
         * 逐层杀掉并收割，直到不再出现未登记的子进程。
         */
        void ReapOrphans()
        {
            std::lock_guard<std::mutex> lock(g_children_mutex);
            for (int round = 0; round < kMaxReapRounds; ++round) {
                std::vector<pid_t> orphans;
                for (pid_t child : ListOwnChildren()) {
                    if (g_children.count(child) == 0) orphans.push_back(child);
                }
                if (orphans.empty()) return;

                for (pid_t orphan : orphans) {
                    if (::kill(orphan, SIGKILL) != 0 && errno != ESRCH) {
                        std::cerr << "[沙箱] kill(" << orphan << ") 失败: " << std::strerror(errno) << std::endl;
                    }
                }
                // waitpid 返回时，被杀进程的子进程已经挂到本进程下，下一轮处理
                for (pid_t orphan : orphans) {
                    int status;
                    while (waitpid(orphan, &status, 0) == -1 && errno == EINTR) {}
                }
                std::cerr << "[沙箱] 已清理 " << orphans.size() << " 个逃逸的后台进程" << std::endl;
            }
            std::cerr << "[沙箱] 后台进程清理轮数已达上限 (" << kMaxReapRounds << ")" << std::endl;
        }

        // RAII helpers for parent process management (只在父进程使用，允许 C++ 特性)
        class ProcessGuard
        {
        public:
            ProcessGuard(pid_t pid, bool reap_orphans)
                : pid_(pid), released_(false), reaped_(false), reap_orphans_(reap_orphans) {}

            // 禁止拷贝
            ProcessGuard(const ProcessGuard&) = delete;
            ProcessGuard& operator=(const ProcessGuard&) = delete;

            ~ProcessGuard()
            {
                cleanup();
            }

            pid_t wait_nonblock(int& status)
            {
                if (pid_ <= 0) return -1;
                for (;;) {
                    pid_t w = waitpid(pid_, &status, WNOHANG);
                    if (w == -1 && errno == EINTR) continue;
                    if (w == pid_) mark_reaped();
                    return w;
                }
            }

            pid_t wait(int& status)
            {
                if (pid_ <= 0) return -1;
                for (;;) {
                    pid_t w = waitpid(pid_, &status, 0);
                    if (w == -1 && errno == EINTR) continue;
                    if (w == pid_) mark_reaped();
                    return w;
                }
            }

            // 子进程在 setpgid(0, 0) 之后是进程组长，杀掉整个组 (包括后台孙进程)
            void kill_group()
            {
                if (pid_ <= 0) return;
                if (::kill(-pid_, SIGKILL) != 0 && errno != ESRCH) {
                    // 进程组尚未建立 (子进程还没执行到 setpgid)，退回到只杀子进程
                    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
                        std::cerr << "[沙箱] kill(" << pid_ << ") 失败: " << std::strerror(errno) << std::endl;
                    }
                }
            }

            void release() { released_ = true; }

        private:
            // 核心私有函数：统一处理进程收割
            void cleanup()
            {
                if (pid_ <= 0) return;
                // 子进程已被收割时，组内可能还有残留的孙进程
                kill_group();
                if (!released_) {
                    int status;
                    wait(status);
                }
                if (reap_orphans_) ReapOrphans();
            }

            void mark_reaped()
            {
                if (reaped_) return;
                reaped_ = true;
                Untrack(pid_);
            }

            pid_t pid_;
            bool released_;
            bool reaped_;
            bool reap_orphans_;
        };

        class AutoCloseFd {
        public:
            explicit AutoCloseFd(int fd = -1) : fd_(fd) {}
            ~AutoCloseFd() { reset(); }
            AutoCloseFd(const AutoCloseFd&) = delete;
            AutoCloseFd& operator=(const AutoCloseFd&) = delete;
            int get() const { return fd_; }
            void reset(int fd = -1)
            {
                if (fd_ >= 0) ::close(fd_);
                fd_ = fd;
            }
        private:
            int fd_;
        };

        // 带上限的输出缓冲，超出部分读走丢弃，防止管道写满阻塞子进程
        class OutputCollector {
        public:
            explicit OutputCollector(size_t limit) : limit_(limit), truncated_(false) {}

            void Append(const char* data, size_t n)
            {
                size_t room = data_.size() < limit_ ? limit_ - data_.size() : 0;
                if (n > room) {
                    truncated_ = true;
                    n = room;
                }
                data_.append(data, n);
            }

            std::string Finish() const
            {
                std::string text = SanitizeUtf8(data_);
                if (truncated_) text += "\n[output truncated]";
                return text;
            }

        private:
            std::string data_;
            size_t limit_;
            bool truncated_;
        };

        // 读一次；返回 false 表示该管道已关闭
        bool ReadOnce(int fd, OutputCollector& sink)
        {
            char buf[8192];
            for (;;) {
                ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n > 0) {
                    sink.Append(buf, static_cast<size_t>(n));
                    return true;
                }
                if (n == 0) return false;
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
                return false;
            }
        }

        void MakePipe(AutoCloseFd& read_end, AutoCloseFd& write_end)
        {
            int fds[2];
            if (pipe2(fds, O_CLOEXEC) != 0) {
                throw SandboxError(FormatSystemError("pipe2 失败", errno));
            }
            read_end.reset(fds[0]);
            write_end.reset(fds[1]);
        }

        void SetNonBlocking(int fd)
        {
            int flags = fcntl(fd, F_GETFL);
            if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
                throw SandboxError(FormatSystemError("fcntl(O_NONBLOCK) 失败", errno));
            }
        }

        bool IsNamespaceRefusal(int err)
        {
            return err == EPERM || err == EINVAL || err == ENOSPC || err == EUSERS;
        }

        std::string DescribeChildFailure(const ChildFailure& failure, const std::string& tool_path)
        {
            if (failure.stage == ERR_EXEC_FAILED && failure.err == ENOENT) {
                return "interpreter not found: " + tool_path;
            }
            return std::string("sandbox setup failed (") + GetExitCodeDescription(failure.stage) +
                   ", code " + std::to_string(failure.stage) + "): " + std::strerror(failure.err);
        }

    } // anonymous namespace

    ProcessSandbox::ProcessSandbox(ProcessSandboxOptions options) : options_(std::move(options))
    {
        if (options_.interpreter_path.empty()) {
            throw SandboxConfigError("Python interpreter is not configured (process.interpreter_path or SANDBOX_PYTHON)");
        }
        if (options_.interpreter_path.front() != '/') {
            throw SandboxConfigError("process.interpreter_path must be an absolute path: " + options_.interpreter_path);
        }
        ValidateProfile(options_.limits);

        // 成为 child subreaper: 逃出进程组的后代在父进程退出后挂到本进程下，而不是 init
        if (prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0) != 0) {
            std::cerr << "[沙箱] PR_SET_CHILD_SUBREAPER 失败: " << std::strerror(errno)
                      << "，无命名空间时后台进程可能在调用结束后残留" << std::endl;
        }
    }

    ExecutionResult ProcessSandbox::Execute(const ExecutionRequest& request)
    {
        ExecutionResult result;

        std::string tool_path;
        const std::vector<std::string>* tool_args = nullptr;
        if (request.lint) {
            if (options_.linter_path.empty()) {
                throw SandboxConfigError("Lint tool is not configured (process.linter_path or SANDBOX_RUFF)");
            }
            if (options_.linter_path.front() != '/') {
                throw SandboxConfigError("process.linter_path must be an absolute path: " + options_.linter_path);
            }
            tool_path = options_.linter_path;
            tool_args = &options_.linter_args;
            result.time_limit_s = 0; // lint 只受工具自身行为约束
        } else {
            tool_path = options_.interpreter_path;
            tool_args = &options_.interpreter_args;
            int limit = request.time_limit_s > 0 ? request.time_limit_s : options_.default_time_limit_s;
            result.time_limit_s = std::min(limit, options_.max_time_limit_s);
        }

        try {
            // 宿主以 root 运行时，临时目录交给降权后的用户
            const bool as_root = (geteuid() == 0);
            StagedScript staged = StagedScript::Create(
                options_.staging_root,
                options_.script_name,
                request.code_or_command,
                as_root ? options_.run_uid : static_cast<uid_t>(-1),
                as_root ? options_.run_gid : static_cast<gid_t>(-1));

            RunStaged(tool_path, *tool_args, staged.directory().string(), staged.script_path().string(), result);
        } catch (const SandboxConfigError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[沙箱] 执行失败: " << e.what() << std::endl;
            result.status = ExecutionStatus::FAILED;
            result.error_message = e.what();
        }

        return result;
    }

    void ProcessSandbox::RunStaged(const std::string& tool_path,
                                   const std::vector<std::string>& tool_args,
                                   const std::string& work_dir,
                                   const std::string& script_path,
                                   ExecutionResult& result)
    {
        // 1. 准备命令行与环境 (必须在 clone 之前完成，子进程中禁止分配内存)
        std::vector<std::string> argv_storage;
        argv_storage.push_back(tool_path);
        argv_storage.insert(argv_storage.end(), tool_args.begin(), tool_args.end());
        argv_storage.push_back(script_path);

        std::vector<std::string> env_storage = BuildAllowedEnvironment(options_.allowed_env, environ);

        std::vector<char*> argv;
        for (auto& a : argv_storage) argv.push_back(a.data());
        argv.push_back(nullptr);
        std::vector<char*> envp;
        for (auto& e : env_storage) envp.push_back(e.data());
        envp.push_back(nullptr);

        // 2. 准备 FD
        int dev_null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (dev_null_fd < 0) {
            throw SandboxError(FormatSystemError("open /dev/null", errno));
        }
        AutoCloseFd null_guard(dev_null_fd);

        AutoCloseFd out_r, out_w, err_r, err_w, status_r, status_w;
        MakePipe(out_r, out_w);
        MakePipe(err_r, err_w);
        MakePipe(status_r, status_w);

        RunChildArgs args;
        std::memset(&args, 0, sizeof(args));
        args.exe_path = argv_storage.front().c_str();
        args.argv = argv.data();
        args.envp = envp.data();
        args.work_dir = work_dir.c_str();
        args.limits = options_.limits;
        args.drop_privileges = (geteuid() == 0);
        args.run_uid = options_.run_uid;
        args.run_gid = options_.run_gid;
        args.enable_seccomp = options_.enable_seccomp;
        args.stdin_fd = null_guard.get();
        args.stdout_fd = out_w.get();
        args.stderr_fd = err_w.get();
        args.status_fd = status_w.get();

        auto stack_mem = std::make_unique<char[]>(STACK_SIZE);
        char* stack_top = stack_mem.get() + STACK_SIZE;

        // 3. Clone 子进程 (隔离层)，平台不支持命名空间时降级为仅资源限制
        pid_t pid = -1;
        if (options_.use_namespaces) {
            args.isolated = true;
            int err = 0;
            pid = CloneTracked(kNamespaceFlags, args, stack_top, err);
            if (pid == -1) {
                if (!IsNamespaceRefusal(err)) {
                    throw SandboxError(FormatSystemError("系统调用 clone 失败", err));
                }
                if (options_.require_namespaces) {
                    throw SandboxError(FormatSystemError("namespace isolation is required but unavailable", err));
                }
                std::cerr << "[沙箱] 命名空间不可用 (" << std::strerror(err) << ")，降级为仅资源限制模式" << std::endl;
            }
        }
        if (pid == -1) {
            args.isolated = false;
            result.degraded_isolation = true;
            int err = 0;
            pid = CloneTracked(0, args, stack_top, err);
            if (pid == -1) {
                throw SandboxError(FormatSystemError("系统调用 clone 失败", err));
            }
        }

        // ================= 父进程 =================
        // PID 命名空间的 init 退出时内核会杀掉整个命名空间，只有降级模式需要收割逃逸的后代
        ProcessGuard proc(pid, !args.isolated);

        // 关闭写端，子进程退出后读端才能收到 EOF
        out_w.reset();
        err_w.reset();
        status_w.reset();

        // 4. exec-status: EOF 表示 execve 成功
        ChildFailure failure;
        size_t got = 0;
        while (got < sizeof(failure)) {
            ssize_t n = ::read(status_r.get(), reinterpret_cast<char*>(&failure) + got, sizeof(failure) - got);
            if (n > 0) { got += static_cast<size_t>(n); continue; }
            if (n == -1 && errno == EINTR) continue;
            break;
        }
        if (got > 0) {
            int status;
            proc.wait(status);
            proc.release();
            result.status = ExecutionStatus::FAILED;
            result.error_message = (got == sizeof(failure))
                ? DescribeChildFailure(failure, tool_path)
                : "sandbox child reported a truncated failure";
            std::cerr << "[沙箱] 子进程启动失败: " << result.error_message << std::endl;
            return;
        }

        // 5. 带超时地收集输出
        OutputCollector out(options_.max_output_bytes);
        OutputCollector err(options_.max_output_bytes);
        SetNonBlocking(out_r.get());
        SetNonBlocking(err_r.get());

        const auto start_time = std::chrono::steady_clock::now();
        const bool timed = result.time_limit_s > 0;
        const auto deadline = start_time + std::chrono::seconds(result.time_limit_s);

        bool out_open = true, err_open = true;
        bool exited = false, timed_out = false;
        int status = 0;
        std::chrono::steady_clock::time_point exit_time;

        while (true)
        {
            auto now = std::chrono::steady_clock::now();
            if (!exited) {
                pid_t w = proc.wait_nonblock(status);
                if (w == -1) {
                    throw SandboxError(FormatSystemError("系统调用 waitpid 失败", errno));
                }
                if (w != 0) {
                    proc.release();
                    exited = true;
                    exit_time = now;
                }
            }

            if (!out_open && !err_open && exited) break;
            // 子进程已退出，但后台孙进程仍持有管道: 只再等一个宽限期
            if (exited && now - exit_time > kDrainGrace) break;

            if (!exited && timed && now >= deadline) {
                timed_out = true;
                break;
            }

            int wait_ms = 50;
            if (!exited && timed) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
                wait_ms = static_cast<int>(std::max<long long>(1, std::min<long long>(remaining, 50)));
            }

            if (!out_open && !err_open) {
                // 两路输出都关闭了但进程还在运行
                std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
                continue;
            }

            pollfd pfds[2];
            nfds_t nfds = 0;
            if (out_open) pfds[nfds++] = {out_r.get(), POLLIN, 0};
            if (err_open) pfds[nfds++] = {err_r.get(), POLLIN, 0};

            int rc = poll(pfds, nfds, wait_ms);
            if (rc == -1) {
                if (errno == EINTR) continue;
                throw SandboxError(FormatSystemError("系统调用 poll 失败", errno));
            }
            for (nfds_t i = 0; i < nfds; ++i) {
                if (pfds[i].revents == 0) continue;
                if (pfds[i].fd == out_r.get()) out_open = ReadOnce(out_r.get(), out);
                else err_open = ReadOnce(err_r.get(), err);
            }
        }

        if (timed_out) {
            // 超时: 强杀整个进程组，再把管道里残留的部分输出读干净
            proc.kill_group();
            proc.wait(status);
            proc.release();
            while (out_open && ReadOnce(out_r.get(), out)) {
                pollfd p{out_r.get(), POLLIN, 0};
                if (poll(&p, 1, 0) <= 0) break;
            }
            while (err_open && ReadOnce(err_r.get(), err)) {
                pollfd p{err_r.get(), POLLIN, 0};
                if (poll(&p, 1, 0) <= 0) break;
            }
            std::cerr << "[沙箱] 执行超时 (> " << result.time_limit_s << "s)，已强制终止 (PID=" << pid << ")" << std::endl;
        }

        result.output.stdout_text = out.Finish();
        result.output.stderr_text = err.Finish();

        if (timed_out) {
            result.status = ExecutionStatus::TIMED_OUT;
            return;
        }

        result.status = ExecutionStatus::COMPLETED;
        if (WIFEXITED(status))
        {
            result.output.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            int signal = WTERMSIG(status);
            result.output.exit_code = 128 + signal;
            if (!result.output.stderr_text.empty() && result.output.stderr_text.back() != '\n') {
                result.output.stderr_text += '\n';
            }
            result.output.stderr_text += std::string("Terminated by signal ") + std::to_string(signal) +
                                         " (" + strsignal(signal) + ")";
        }
    }

} // namespace mcp_gateway
