#ifndef MCP_GATEWAY_CONFIG_H
#define MCP_GATEWAY_CONFIG_H

#include <string>
#include <vector>
#include <sys/types.h>

#include "resource_limiter.h"

namespace mcp_gateway {

    /**
     * @brief 进程模式配置
     */
    struct ProcessSandboxOptions {
        std::string interpreter_path;             // SANDBOX_PYTHON 可覆盖
        std::vector<std::string> interpreter_args;
        std::string linter_path;                  // SANDBOX_RUFF 可覆盖
        std::vector<std::string> linter_args = {"check", "--output-format", "concise", "--no-cache"};
        std::string staging_root = "/tmp";
        std::string script_name = "script.py";

        int default_time_limit_s = 10;
        int max_time_limit_s = 60;
        size_t max_output_bytes = 1024 * 1024;    // 每一路输出的上限

        bool use_namespaces = true;
        bool require_namespaces = false;          // true: 命名空间不可用时直接失败
        bool enable_seccomp = true;

        ResourceLimitProfile limits;
        uid_t run_uid = 65534;                    // nobody
        gid_t run_gid = 65534;                    // nogroup
        std::vector<std::string> allowed_env = {
            "LANG", "LC_ALL", "LC_CTYPE", "TZ", "PATH",
            "PYTHONIOENCODING", "PYTHONPATH", "PYTHONDONTWRITEBYTECODE",
            "HTTP_PROXY", "HTTPS_PROXY", "NO_PROXY", "http_proxy", "https_proxy", "no_proxy",
            "USER_AGENT"
        };
    };

    /**
     * @brief Shell 模式配置
     */
    struct ShellOptions {
        std::string address;                      // host:port / unix:/path / 绝对路径；SANDBOX、SANDBOX_SOCKET 可覆盖
        std::string prompt_marker = "$ ";
        int default_time_limit_s = 5;
        int max_time_limit_s = 300;
        int connect_timeout_ms = 3000;
        int initial_prompt_timeout_ms = 1000;
        int control_timeout_ms = 2000;            // screen 控制命令、退出码查询
        bool capture_exit_code = true;
        int screen_settle_ms = 100;
        std::string screen_log_path = "/tmp/mcp_screen.log";
        size_t max_output_bytes = 1024 * 1024;
    };

    struct SandboxConfig {
        std::string server_name = "mcp-gateway";
        std::string mode = "process";             // process | remote_shell
        ProcessSandboxOptions process;
        ShellOptions shell;
    };

    /**
     * @brief 读取 YAML 配置文件，并应用环境变量覆盖
     * @throw SandboxConfigError 文件无法解析或字段不合法
     */
    SandboxConfig LoadConfig(const std::string& path);

    /**
     * @brief 应用部署环境中的覆盖项 (SANDBOX, SANDBOX_SOCKET, SANDBOX_PYTHON, SANDBOX_RUFF)
     */
    void ApplyEnvironmentOverrides(SandboxConfig& config);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_CONFIG_H
