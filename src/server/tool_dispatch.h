#ifndef MCP_GATEWAY_TOOL_DISPATCH_H
#define MCP_GATEWAY_TOOL_DISPATCH_H

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "sandbox.h"

namespace mcp_gateway
{
    // JSON-RPC 错误码
    constexpr int kParseError = -32700;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams = -32602;
    constexpr int kInternalError = -32603;

    /**
     * @brief 工具调用的结果
     * is_error 为 false 时 text 是交给模型的文本；为 true 时 code/text 是结构化错误。
     */
    struct ToolResponse
    {
        bool is_error = false;
        int code = 0;
        std::string text;
    };

    /**
     * @brief 工具层: 参数校验 -> 沙箱执行 -> 结果渲染
     * process 模式暴露 python 工具，remote_shell 模式暴露 shell 工具。
     */
    class ToolDispatcher
    {
    public:
        explicit ToolDispatcher(std::unique_ptr<Sandbox> sandbox);

        // tools/list 的 "tools" 数组
        nlohmann::json ListTools() const;

        /**
         * @brief 调用一个工具
         * 未知工具/参数错误 -> kInvalidParams；沙箱配置错误 -> kInternalError；
         * 其余失败都以文本结果返回。
         */
        ToolResponse CallTool(const std::string& name, const nlohmann::json& arguments);

    private:
        ToolResponse CallPython(const nlohmann::json& arguments);
        ToolResponse CallShell(const nlohmann::json& arguments);

        std::unique_ptr<Sandbox> sandbox_;
        std::string tool_name_;
    };

} // namespace mcp_gateway

#endif // MCP_GATEWAY_TOOL_DISPATCH_H
