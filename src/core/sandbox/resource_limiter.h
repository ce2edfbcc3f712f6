#ifndef MCP_GATEWAY_RESOURCE_LIMITER_H
#define MCP_GATEWAY_RESOURCE_LIMITER_H

#include <sys/resource.h>

#include <string>
#include <vector>

namespace mcp_gateway {

    /**
     * @brief 资源限制配置
     * 0 表示不设上限 (RLIM_INFINITY)；core dump 永远为 0，不可配置。
     */
    struct ResourceLimitProfile {
        rlim_t address_space_bytes = 512ULL * 1024 * 1024; // RLIMIT_AS
        rlim_t cpu_time_seconds = 30;                      // RLIMIT_CPU
        rlim_t max_processes = 64;                         // RLIMIT_NPROC
        rlim_t max_file_size_bytes = 16ULL * 1024 * 1024;  // RLIMIT_FSIZE
    };

    /**
     * @brief 在子进程 exec 之前应用资源限制
     *
     * 严重警告: 运行在 clone 出来的子进程中，必须 Async-Signal-Safe。
     * 顺序: AS -> CPU -> NPROC -> FSIZE -> CORE(0)。
     *
     * @return 0 表示全部成功，否则返回第一个失败项对应的 SandboxExitCode。
     *         调用方必须据此终止子进程，绝不能继续 exec。
     */
    int ApplyResourceLimits(const ResourceLimitProfile& profile);

    /**
     * @brief 父进程侧检查配置合法性
     * @throw SandboxConfigError 配置不合法
     */
    void ValidateProfile(const ResourceLimitProfile& profile);

    /**
     * @brief 按白名单从父进程环境中挑选变量
     * @param allow_list 允许透传的变量名
     * @param source_env 以 nullptr 结尾的 "NAME=value" 数组 (通常是 environ)
     * @return 子进程的完整环境，未列入白名单的变量一律丢弃
     */
    std::vector<std::string> BuildAllowedEnvironment(const std::vector<std::string>& allow_list,
                                                     char* const* source_env);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_RESOURCE_LIMITER_H
