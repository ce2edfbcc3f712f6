#ifndef MCP_GATEWAY_SANDBOX_INTERNAL_H
#define MCP_GATEWAY_SANDBOX_INTERNAL_H

#include <sys/types.h>
#include <sys/resource.h>
#include <unistd.h>

#include "resource_limiter.h"

namespace mcp_gateway {

    // 定义子进程栈大小: 8MB (防止 glibc 爆栈)
    const int STACK_SIZE = 8 * 1024 * 1024;

    // 子进程阶段错误码 (通过 exec-status 管道回传，同时作为 _exit 退出码)
    enum SandboxExitCode {
        EXIT_OK = 0, // 正常退出

        // 第一阶段: 基础设置与执行 (120-139)
        ERR_DUP2             = 121, // 重定向标准输入/输出失败
        ERR_SETPGID_FAILED   = 122, // 创建进程组失败
        ERR_EXEC_FAILED      = 127, // execve 执行失败
        ERR_CHDIR_FAILED     = 128, // 切换工作目录失败
        ERR_SETGID_FAILED    = 129, // 设置组 ID 失败
        ERR_SETUID_FAILED    = 130, // 设置用户 ID 失败
        ERR_CAPS_FAILED      = 131, // 清理 capability 失败
        ERR_NO_NEW_PRIVS     = 132, // PR_SET_NO_NEW_PRIVS 失败

        // 第二阶段: 资源限制 (140-159)
        ERR_RLIMIT_CPU       = 141, // 设置 CPU 时间限制失败
        ERR_RLIMIT_MEMORY    = 142, // 设置内存限制失败
        ERR_RLIMIT_NPROC     = 144, // 设置进程数限制失败
        ERR_RLIMIT_FSIZE     = 145, // 设置文件大小限制失败
        ERR_RLIMIT_CORE      = 146, // 关闭 core dump 失败

        // 第三阶段: 隔离 (190-199)
        ERR_MOUNT_PRIVATE    = 190, // mount --make-rprivate 失败
        ERR_MOUNT_PROC       = 197, // 挂载 /proc 失败
        ERR_SECCOMP_FAILED   = 198, // 加载 Seccomp 规则失败
        ERR_SANDBOX_EXCEPTION = 199 // 沙箱内部异常
    };

    /**
     * @brief 子进程经 exec-status 管道回传的失败报告
     * exec 成功时管道因 O_CLOEXEC 被关闭，父进程读到 EOF。
     */
    struct ChildFailure {
        int stage = 0; // SandboxExitCode
        int err = 0;   // errno
    };

    /**
     * @brief 运行子进程所需的参数 (C 风格结构体)
     * 由父进程在 clone 前准备好，子进程中只读，禁止分配内存。
     */
    struct RunChildArgs {
        const char* exe_path;     // 解释器或 lint 工具的绝对路径
        char* const* argv;        // 以 nullptr 结尾
        char* const* envp;        // 白名单环境变量，以 nullptr 结尾
        const char* work_dir;     // 临时工作目录

        ResourceLimitProfile limits;

        bool isolated;            // 是否处于新的命名空间中
        bool drop_privileges;     // 宿主以 root 运行时才需要降权
        uid_t run_uid;
        gid_t run_gid;
        bool enable_seccomp;

        int stdin_fd;
        int stdout_fd;
        int stderr_fd;
        int status_fd;            // exec-status 管道写端 (O_CLOEXEC)
    };

    /**
     * @brief 阶段错误码的可读描述
     */
    const char* GetExitCodeDescription(int code);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_SANDBOX_INTERNAL_H
