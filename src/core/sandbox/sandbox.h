#ifndef MCP_GATEWAY_SANDBOX_H
#define MCP_GATEWAY_SANDBOX_H

#include <memory>
#include <optional>
#include <string>

namespace mcp_gateway
{
    struct SandboxConfig;

    /**
     * @brief 单次工具调用的执行请求
     * 进程模式使用 lint；Shell 模式使用 screen_session 与 cwd。
     */
    struct ExecutionRequest
    {
        std::string code_or_command;
        int time_limit_s = 0;          // 0 表示使用默认值 (lint 模式不计时)
        bool lint = false;             // 进程模式: 以静态检查工具替换解释器
        std::string screen_session;    // Shell 模式: 复用/创建的 screen 会话名
        bool new_screen_session = false; // Shell 模式: 生成随机会话名
        std::string cwd;               // Shell 模式: 执行前切换的目录
    };

    /**
     * @brief 捕获到的三路输出
     */
    struct CommandResult
    {
        std::string stdout_text;
        std::string stderr_text;
        std::optional<int> exit_code; // screen 模式或被强杀时未知
        bool timed_out = false;
    };

    enum class ExecutionStatus {
        COMPLETED = 0,   // 进程退出 (任意退出码)
        TIMED_OUT,       // 超时被强杀
        FAILED           // spawn/连接失败，与程序输出严格区分
    };

    struct ExecutionResult
    {
        ExecutionStatus status = ExecutionStatus::COMPLETED;
        CommandResult output;
        int time_limit_s = 0;            // 实际生效的时间限制
        std::string error_message;       // FAILED 时的系统错误详情
        bool degraded_isolation = false; // 命名空间不可用，仅有资源限制
        std::string screen_session;      // 实际使用的 screen 会话名
    };

    /**
     * @brief 沙箱抽象接口
     * 两种部署模式在配置阶段选定其一，不按调用混用。
     */
    class Sandbox
    {
    public:
        virtual ~Sandbox() = default;

        /**
         * @brief 执行一次请求
         * 内部异常在此边界转换为 FAILED 结果，只有配置错误会继续抛出。
         * @throw SandboxConfigError 沙箱未正确配置
         */
        virtual ExecutionResult Execute(const ExecutionRequest& request) = 0;

        // "process" 或 "remote_shell"
        virtual const char* Mode() const = 0;
    };

    /**
     * @brief 按 sandbox.mode 创建沙箱实现
     * @throw SandboxConfigError 模式未知或必要配置缺失
     */
    std::unique_ptr<Sandbox> CreateSandbox(const SandboxConfig& config);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_SANDBOX_H
