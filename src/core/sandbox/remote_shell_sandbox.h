#ifndef MCP_GATEWAY_REMOTE_SHELL_SANDBOX_H
#define MCP_GATEWAY_REMOTE_SHELL_SANDBOX_H

#include "config.h"
#include "sandbox.h"

namespace mcp_gateway
{
    /**
     * @brief Shell 模式沙箱
     * 命令在外部提供的持久 Shell 中执行 (一般是单独的容器)，隔离由该环境负责。
     * 每次调用新建一条连接，失步的连接不会被复用。
     */
    class RemoteShellSandbox : public Sandbox
    {
    public:
        explicit RemoteShellSandbox(ShellOptions options);

        /**
         * @throw SandboxConfigError 沙箱地址未配置
         */
        ExecutionResult Execute(const ExecutionRequest& request) override;

        const char* Mode() const override { return "remote_shell"; }

        const ShellOptions& options() const { return options_; }

    private:
        ShellOptions options_;
    };

} // namespace mcp_gateway

#endif // MCP_GATEWAY_REMOTE_SHELL_SANDBOX_H
