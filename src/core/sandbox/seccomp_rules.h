#ifndef MCP_GATEWAY_SECCOMP_RULES_H
#define MCP_GATEWAY_SECCOMP_RULES_H

namespace mcp_gateway {

    /**
     * @brief 加载执行阶段 Seccomp 规则
     * 解释器需要的系统调用非常多，因此采用默认允许 + 危险系统调用黑名单策略，
     * 被禁止的调用返回 EPERM 而不是直接杀死进程。
     * @return 0 成功；失败返回 ERR_SECCOMP_FAILED，调用方必须终止子进程。
     */
    int LoadSandboxSeccompRules();

} // namespace mcp_gateway

#endif // MCP_GATEWAY_SECCOMP_RULES_H
