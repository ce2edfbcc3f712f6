#include "remote_shell_sandbox.h"
#include "shell_connection.h"
#include "sandbox_error.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace mcp_gateway
{

    RemoteShellSandbox::RemoteShellSandbox(ShellOptions options)
        : options_(std::move(options))
    {
        if (options_.prompt_marker.empty()) {
            throw SandboxConfigError("shell.prompt_marker must not be empty");
        }
    }

    ExecutionResult RemoteShellSandbox::Execute(const ExecutionRequest& request)
    {
        ExecutionResult result;
        int limit = request.time_limit_s > 0 ? request.time_limit_s : options_.default_time_limit_s;
        result.time_limit_s = std::min(limit, options_.max_time_limit_s);

        std::string session = request.screen_session;
        if (session.empty() && request.new_screen_session) {
            session = GenerateScreenSessionName();
        }
        result.screen_session = session;

        try {
            auto connection = ShellConnection::Connect(options_);
            result.output = connection->RunCommand(request.code_or_command, result.time_limit_s, session, request.cwd);
            result.status = result.output.timed_out ? ExecutionStatus::TIMED_OUT : ExecutionStatus::COMPLETED;
        } catch (const SandboxConfigError&) {
            throw;
        } catch (const std::exception& e) {
            result.status = ExecutionStatus::FAILED;
            result.error_message = e.what();
            std::cerr << "[Shell] 执行失败: " << e.what() << std::endl;
        }
        return result;
    }

} // namespace mcp_gateway
