#ifndef MCP_GATEWAY_SANDBOX_ERROR_H
#define MCP_GATEWAY_SANDBOX_ERROR_H

#include <stdexcept>
#include <string>

namespace mcp_gateway {

    /**
     * @brief 沙箱运行期错误 (文件系统、spawn、网络)
     * 只在沙箱内部抛出，由 Sandbox::Execute 转换为 FAILED 结果。
     */
    class SandboxError : public std::runtime_error {
    public:
        explicit SandboxError(const std::string& message) : std::runtime_error(message) {}
    };

    /**
     * @brief 配置错误 (沙箱地址、解释器路径缺失等)
     * 不会被转换为文本结果，工具层将其作为结构化错误上报。
     */
    class SandboxConfigError : public std::runtime_error {
    public:
        explicit SandboxConfigError(const std::string& message) : std::runtime_error(message) {}
    };

    // "prefix: strerror(errno)"
    std::string FormatSystemError(const std::string& prefix, int err);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_SANDBOX_ERROR_H
