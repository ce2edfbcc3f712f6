#ifndef MCP_GATEWAY_PROCESS_SANDBOX_H
#define MCP_GATEWAY_PROCESS_SANDBOX_H

#include <string>
#include <vector>

#include "config.h"
#include "sandbox.h"

namespace mcp_gateway
{
    /**
     * @brief 进程模式沙箱
     *
     * 每次调用: 写入临时目录 -> clone 子进程 (命名空间 + 资源限制 + 降权 + 白名单环境)
     *          -> 带超时的输出收集 -> 清理。
     * 状态机: CREATED -> RUNNING -> {COMPLETED, TIMED_OUT, FAILED}
     * 多个实例之间除 OS 进程表外没有共享的可变状态。
     */
    class ProcessSandbox : public Sandbox
    {
    public:
        /**
         * @throw SandboxConfigError 解释器路径缺失或资源限制不合法
         */
        explicit ProcessSandbox(ProcessSandboxOptions options);

        /**
         * @brief 执行或 lint 一段代码
         * lint 模式用静态检查工具替换解释器，且不计墙钟时间。
         * @throw SandboxConfigError lint 工具未配置
         */
        ExecutionResult Execute(const ExecutionRequest& request) override;

        const char* Mode() const override { return "process"; }

        const ProcessSandboxOptions& options() const { return options_; }

    private:
        void RunStaged(const std::string& tool_path,
                       const std::vector<std::string>& tool_args,
                       const std::string& work_dir,
                       const std::string& script_path,
                       ExecutionResult& result);

        ProcessSandboxOptions options_;
    };

} // namespace mcp_gateway

#endif // MCP_GATEWAY_PROCESS_SANDBOX_H
