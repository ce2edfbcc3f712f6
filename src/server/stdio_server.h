#ifndef MCP_GATEWAY_STDIO_SERVER_H
#define MCP_GATEWAY_STDIO_SERVER_H

#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "tool_dispatch.h"

namespace mcp_gateway
{
    /**
     * @brief 换行分隔的 JSON-RPC 2.0 服务端 (MCP stdio 传输)
     *
     * 约束:
     * 1. 输出流上每个响应占一行 JSON
     * 2. 日志只写 stderr
     * 3. 通知 (没有 id) 不回复
     */
    class StdioServer
    {
    public:
        StdioServer(std::string server_name, ToolDispatcher& dispatcher);

        // 处理一行请求；需要回复时返回响应
        std::optional<nlohmann::json> HandleLine(const std::string& line);

        // 读到 EOF 为止
        void Serve(std::istream& in, std::ostream& out);

    private:
        nlohmann::json HandleRequest(const std::string& method, const nlohmann::json& params);

        std::string server_name_;
        ToolDispatcher& dispatcher_;
    };

} // namespace mcp_gateway

#endif // MCP_GATEWAY_STDIO_SERVER_H
