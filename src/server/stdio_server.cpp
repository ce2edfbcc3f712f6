#include "stdio_server.h"

#include <iostream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace mcp_gateway
{
    namespace {

        const char* kProtocolVersion = "2024-11-05";
        const char* kServerVersion = "0.1.0";

        // 协议层错误，直接映射为 JSON-RPC error 对象
        class RpcError : public std::runtime_error {
        public:
            RpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
            int code() const { return code_; }
        private:
            int code_;
        };

        json ErrorResponse(const json& id, int code, const std::string& message)
        {
            return {
                {"jsonrpc", "2.0"},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}
            };
        }

    } // anonymous namespace

    StdioServer::StdioServer(std::string server_name, ToolDispatcher& dispatcher)
        : server_name_(std::move(server_name)), dispatcher_(dispatcher)
    {
    }

    json StdioServer::HandleRequest(const std::string& method, const json& params)
    {
        if (method == "initialize") {
            return {
                {"protocolVersion", kProtocolVersion},
                {"capabilities", {{"tools", json::object()}}},
                {"serverInfo", {{"name", server_name_}, {"version", kServerVersion}}}
            };
        }
        if (method == "ping") {
            return json::object();
        }
        if (method == "tools/list") {
            return {{"tools", dispatcher_.ListTools()}};
        }
        if (method == "tools/call") {
            if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
                throw RpcError(kInvalidParams, "tools/call requires a string 'name'");
            }
            json arguments = params.contains("arguments") ? params["arguments"] : json::object();
            ToolResponse resp = dispatcher_.CallTool(params["name"].get<std::string>(), arguments);
            if (resp.is_error) {
                throw RpcError(resp.code, resp.text);
            }
            return {
                {"content", json::array({{{"type", "text"}, {"text", resp.text}}})},
                {"isError", false}
            };
        }
        throw RpcError(kMethodNotFound, "Method not found: " + method);
    }

    std::optional<json> StdioServer::HandleLine(const std::string& line)
    {
        json message = json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            std::cerr << "[Server] 无法解析的请求: " << line.substr(0, 200) << std::endl;
            return ErrorResponse(nullptr, kParseError, "Parse error");
        }
        if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
            // 客户端发来的响应或非法请求
            if (message.is_object() && message.contains("id") && !message.contains("result") && !message.contains("error")) {
                return ErrorResponse(message["id"], -32600, "Invalid Request");
            }
            return std::nullopt;
        }

        const std::string method = message["method"].get<std::string>();
        const bool is_notification = !message.contains("id");
        const json params = message.contains("params") ? message["params"] : json::object();

        if (is_notification) {
            std::cerr << "[Server] 收到通知: " << method << std::endl;
            return std::nullopt;
        }

        const json id = message["id"];
        try {
            json result = HandleRequest(method, params);
            return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
        } catch (const RpcError& e) {
            return ErrorResponse(id, e.code(), e.what());
        } catch (const std::exception& e) {
            std::cerr << "[Server] 处理 " << method << " 时出错: " << e.what() << std::endl;
            return ErrorResponse(id, kInternalError, e.what());
        }
    }

    void StdioServer::Serve(std::istream& in, std::ostream& out)
    {
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty() || line == "\r") continue;
            auto response = HandleLine(line);
            if (response) {
                // 非法 UTF-8 已在结果渲染时替换，这里仍用 replace 兜底
                out << response->dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
                out.flush();
            }
        }
        std::cerr << "[Server] 输入流结束，退出" << std::endl;
    }

} // namespace mcp_gateway
