#include "tool_dispatch.h"
#include "result_format.h"
#include "sandbox_error.h"
#include "shell_connection.h"

#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace mcp_gateway
{
    namespace {

        // 参数不合法，转换为 kInvalidParams
        class InvalidArguments : public std::runtime_error {
        public:
            explicit InvalidArguments(const std::string& message) : std::runtime_error(message) {}
        };

        std::string RequireString(const json& args, const char* key)
        {
            if (!args.contains(key)) {
                throw InvalidArguments(std::string("missing required argument '") + key + "'");
            }
            if (!args[key].is_string()) {
                throw InvalidArguments(std::string("argument '") + key + "' must be a string");
            }
            return args[key].get<std::string>();
        }

        int OptionalTimeLimit(const json& args, const char* key)
        {
            if (!args.contains(key) || args[key].is_null()) return 0;
            if (!args[key].is_number_integer()) {
                throw InvalidArguments(std::string("argument '") + key + "' must be an integer");
            }
            // 超出 int 范围的值先截到 INT_MAX，再由沙箱按 max_time_limit_s 收紧
            const long long kMax = std::numeric_limits<int>::max();
            long long value = args[key].is_number_unsigned()
                ? static_cast<long long>(std::min<unsigned long long>(args[key].get<unsigned long long>(), kMax))
                : args[key].get<long long>();
            if (value <= 0) {
                throw InvalidArguments(std::string("argument '") + key + "' must be positive");
            }
            return static_cast<int>(std::min(value, kMax));
        }

        bool OptionalBool(const json& args, const char* key)
        {
            if (!args.contains(key) || args[key].is_null()) return false;
            if (!args[key].is_boolean()) {
                throw InvalidArguments(std::string("argument '") + key + "' must be a boolean");
            }
            return args[key].get<bool>();
        }

        ToolResponse TextResult(std::string text)
        {
            ToolResponse resp;
            resp.text = std::move(text);
            return resp;
        }

        ToolResponse ErrorResult(int code, std::string message)
        {
            ToolResponse resp;
            resp.is_error = true;
            resp.code = code;
            resp.text = std::move(message);
            return resp;
        }

        json PythonToolSchema()
        {
            return {
                {"name", "python"},
                {"description",
                 "Execute Python code in an isolated sandbox and return its exit code, stdout and stderr. "
                 "Set lint to check the code with a static analyzer instead of running it."},
                {"inputSchema", {
                    {"type", "object"},
                    {"properties", {
                        {"code", {{"type", "string"}, {"description", "Python source code to run"}}},
                        {"time_limit", {{"type", "integer"}, {"default", 10},
                                        {"description", "Wall-clock limit in seconds"}}},
                        {"lint", {{"type", "boolean"}, {"default", false},
                                  {"description", "Lint the code instead of executing it"}}}
                    }},
                    {"required", json::array({"code"})}
                }}
            };
        }

        json ShellToolSchema()
        {
            return {
                {"name", "shell"},
                {"description",
                 "Run a command in a sandboxed shell. Each call starts in a fresh shell, so pass cwd "
                 "instead of relying on an earlier cd. Use screen for long-running or interactive "
                 "programs; a named screen session persists between calls."},
                {"inputSchema", {
                    {"type", "object"},
                    {"properties", {
                        {"command", {{"type", "string"}, {"description", "Shell command to run"}}},
                        {"time_limit", {{"type", "integer"}, {"default", 5},
                                        {"description", "Seconds to wait for output"}}},
                        {"screen", {{"type", json::array({"string", "boolean"})},
                                    {"description", "Run inside a screen session: a session name to reuse, "
                                                    "or true for a new one"}}},
                        {"cwd", {{"type", "string"}, {"description", "Directory to change into first"}}}
                    }},
                    {"required", json::array({"command"})}
                }}
            };
        }

    } // anonymous namespace

    ToolDispatcher::ToolDispatcher(std::unique_ptr<Sandbox> sandbox)
        : sandbox_(std::move(sandbox))
    {
        if (!sandbox_) {
            throw SandboxConfigError("tool dispatcher requires a sandbox");
        }
        tool_name_ = std::string(sandbox_->Mode()) == "process" ? "python" : "shell";
    }

    json ToolDispatcher::ListTools() const
    {
        json tools = json::array();
        tools.push_back(tool_name_ == "python" ? PythonToolSchema() : ShellToolSchema());
        return tools;
    }

    ToolResponse ToolDispatcher::CallTool(const std::string& name, const json& arguments)
    {
        if (name != tool_name_) {
            return ErrorResult(kInvalidParams, "Unknown tool: " + name);
        }
        if (!arguments.is_null() && !arguments.is_object()) {
            return ErrorResult(kInvalidParams, "arguments must be an object");
        }
        const json args = arguments.is_null() ? json::object() : arguments;

        try {
            return name == "python" ? CallPython(args) : CallShell(args);
        } catch (const InvalidArguments& e) {
            return ErrorResult(kInvalidParams, e.what());
        } catch (const SandboxConfigError& e) {
            std::cerr << "[Server] 沙箱配置错误: " << e.what() << std::endl;
            return ErrorResult(kInternalError, e.what());
        }
    }

    ToolResponse ToolDispatcher::CallPython(const json& args)
    {
        ExecutionRequest request;
        request.code_or_command = RequireString(args, "code");
        request.time_limit_s = OptionalTimeLimit(args, "time_limit");
        request.lint = OptionalBool(args, "lint");

        ExecutionResult result = sandbox_->Execute(request);
        return TextResult(FormatExecutionResult(result, request.lint));
    }

    ToolResponse ToolDispatcher::CallShell(const json& args)
    {
        ExecutionRequest request;
        request.code_or_command = RequireString(args, "command");
        // timeout 是 time_limit 的别名
        request.time_limit_s = OptionalTimeLimit(args, "time_limit");
        if (request.time_limit_s == 0) {
            request.time_limit_s = OptionalTimeLimit(args, "timeout");
        }

        if (args.contains("screen") && !args["screen"].is_null()) {
            const json& screen = args["screen"];
            if (screen.is_boolean()) {
                request.new_screen_session = screen.get<bool>();
            } else if (screen.is_string()) {
                request.screen_session = screen.get<std::string>();
                if (!request.screen_session.empty() && !IsValidScreenSessionName(request.screen_session)) {
                    throw InvalidArguments("invalid screen session name (allowed: [A-Za-z0-9_.-], up to 64 characters)");
                }
            } else {
                throw InvalidArguments("argument 'screen' must be a string or a boolean");
            }
        }

        if (args.contains("cwd") && !args["cwd"].is_null()) {
            request.cwd = RequireString(args, "cwd");
        }

        ExecutionResult result = sandbox_->Execute(request);
        return TextResult(FormatExecutionResult(result));
    }

} // namespace mcp_gateway
