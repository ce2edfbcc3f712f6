#include "sandbox_isolation.h"
#include "sandbox_internal.h"
#include "resource_limiter.h"
#include "seccomp_rules.h"

#include <unistd.h>
#include <fcntl.h>
#include <grp.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/resource.h>
#include <cerrno>

// 严重警告: 必须严格遵守 Async-Signal-Safe C 风格
// 禁止使用: malloc/new, exceptions, STL, iostream
// 只能使用: glibc 系统调用, stack memory。

namespace mcp_gateway {

    namespace {

        // 把失败阶段写回父进程，然后退出
        [[noreturn]] void ExitChild(const RunChildArgs* args, int code)
        {
            ChildFailure failure;
            failure.stage = code;
            failure.err = errno;
            ssize_t wrote = write(args->status_fd, &failure, sizeof(failure));
            (void)wrote;
            _exit(code);
        }

        void CloseFdRange(unsigned int first, unsigned int last)
        {
            if (first > last) return;

            #ifdef __NR_close_range
                // 如果返回 -1 且 errno == ENOSYS (内核不支持)，则回退到循环关闭
                if (syscall(__NR_close_range, first, last, 0) == 0) return;
            #endif

            // 获取最大 FD 限制，防止循环过大
            long max_fd = sysconf(_SC_OPEN_MAX);
            if (max_fd < 0) max_fd = 4096;
            if (max_fd > 65536) max_fd = 65536;
            for (long fd = first; fd < max_fd && fd <= (long)last; ++fd) {
                close((int)fd);
            }
        }

        // 清理附加组 + 清空 capability + 降权 (nobody)
        void DropPrivileges(const RunChildArgs* args)
        {
            // ambient capability 在旧内核上不存在 (EINVAL)，视为已清空
            if (prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0) != 0 && errno != EINVAL) {
                ExitChild(args, ERR_CAPS_FAILED);
            }

            if (!args->drop_privileges) return;

            // bounding set: 一直丢弃到内核不认识的编号 (EINVAL) 为止
            for (int cap = 0; cap < 64; ++cap) {
                if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0) {
                    if (errno == EINVAL) break;
                    ExitChild(args, ERR_CAPS_FAILED);
                }
            }

            if (setgroups(0, nullptr) != 0) ExitChild(args, ERR_SETGID_FAILED);
            if (setgid(args->run_gid) != 0) ExitChild(args, ERR_SETGID_FAILED);
            if (setuid(args->run_uid) != 0) ExitChild(args, ERR_SETUID_FAILED);

            // 降权必须不可逆
            if (args->run_uid != 0 && setuid(0) == 0) {
                errno = EPERM;
                ExitChild(args, ERR_SETUID_FAILED);
            }
        }

    } // anonymous namespace

    int RunChildFn(void* arg)
    {
        auto* args = (RunChildArgs*)(arg);

        // -----------------------------------------------------
        // 0. 信号与进程组
        // -----------------------------------------------------
        // 父进程可能忽略了 SIGPIPE，被忽略的信号会跨 exec 继承
        signal(SIGPIPE, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        // 独立进程组: 超时时父进程可以一次杀掉整个进程组
        if (setpgid(0, 0) != 0) ExitChild(args, ERR_SETPGID_FAILED);

        // -----------------------------------------------------
        // 1. IO 重定向 (最先执行)
        // -----------------------------------------------------
        if (dup2(args->stdin_fd, STDIN_FILENO) == -1) ExitChild(args, ERR_DUP2);
        if (dup2(args->stdout_fd, STDOUT_FILENO) == -1) ExitChild(args, ERR_DUP2);
        if (dup2(args->stderr_fd, STDERR_FILENO) == -1) ExitChild(args, ERR_DUP2);

        // [安全]: 关闭除 0,1,2 与 exec-status 管道以外的所有文件描述符
        unsigned int status_fd = (unsigned int)args->status_fd;
        CloseFdRange(3, status_fd - 1);
        CloseFdRange(status_fd + 1, ~0U);

        // -----------------------------------------------------
        // 2. 工作目录
        // -----------------------------------------------------
        if (chdir(args->work_dir) != 0) ExitChild(args, ERR_CHDIR_FAILED);

        // -----------------------------------------------------
        // 3. 隔离: 私有挂载传播 + 新 PID 命名空间专属的 /proc
        // -----------------------------------------------------
        if (args->isolated) {
            if (mount(nullptr, "/", nullptr, MS_PRIVATE | MS_REC, nullptr) == -1) {
                ExitChild(args, ERR_MOUNT_PRIVATE);
            }
            if (mount("proc", "/proc", "proc", MS_NOSUID | MS_NOEXEC | MS_NODEV | MS_RDONLY, nullptr) == -1) {
                ExitChild(args, ERR_MOUNT_PROC);
            }
        }

        // -----------------------------------------------------
        // 4. 资源限制 (setrlimit)，任何一项失败都不允许继续
        // -----------------------------------------------------
        int limit_rc = ApplyResourceLimits(args->limits);
        if (limit_rc != EXIT_OK) ExitChild(args, limit_rc);

        // -----------------------------------------------------
        // 5. 降权
        // -----------------------------------------------------
        DropPrivileges(args);

        // -----------------------------------------------------
        // 6. 安全增强：禁止提升特权 + 加载 Seccomp 黑名单 (exec 前最后一步)
        // -----------------------------------------------------
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) ExitChild(args, ERR_NO_NEW_PRIVS);
        if (args->enable_seccomp) {
            int seccomp_rc = LoadSandboxSeccompRules();
            if (seccomp_rc != EXIT_OK) ExitChild(args, seccomp_rc);
        }

        // -----------------------------------------------------
        // 7. 执行: 环境变量整体替换为白名单子集
        // -----------------------------------------------------
        execve(args->exe_path, args->argv, args->envp);

        ExitChild(args, ERR_EXEC_FAILED); // 如果 exec 失败
        return 0;
    }

} // namespace mcp_gateway
