#include "sandbox.h"
#include "config.h"
#include "process_sandbox.h"
#include "remote_shell_sandbox.h"
#include "sandbox_error.h"

#include <iostream>

namespace mcp_gateway
{

    std::unique_ptr<Sandbox> CreateSandbox(const SandboxConfig& config)
    {
        if (config.mode == "process") {
            std::cerr << "[Server] 沙箱模式: process (解释器 " << config.process.interpreter_path << ")" << std::endl;
            return std::make_unique<ProcessSandbox>(config.process);
        }
        if (config.mode == "remote_shell") {
            if (config.shell.address.empty()) {
                // 每次调用都会以配置错误返回，不阻止服务启动
                std::cerr << "[配置] 警告: 未设置 SANDBOX / SANDBOX_SOCKET，shell 工具不可用" << std::endl;
            } else {
                std::cerr << "[Server] 沙箱模式: remote_shell (" << config.shell.address << ")" << std::endl;
            }
            return std::make_unique<RemoteShellSandbox>(config.shell);
        }
        throw SandboxConfigError("unknown sandbox.mode: " + config.mode + " (expected process or remote_shell)");
    }

} // namespace mcp_gateway
