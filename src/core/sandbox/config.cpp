// mcp_gateway/src/core/sandbox/config.cpp

#include <sys/types.h>
#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <yaml-cpp/yaml.h>

#include "config.h"
#include "sandbox_error.h"

namespace mcp_gateway {

    namespace {

        // 辅助宏：检查节点是否存在，不存在则抛出配置错误
        #define CHECK_NODE(node, name) \
            if (!node) { \
                throw SandboxConfigError(std::string("配置文件缺少关键节点 '") + name + "'"); \
            }

        template <typename T>
        void ReadOptional(const YAML::Node& parent, const char* key, T& out)
        {
            if (parent[key]) {
                out = parent[key].as<T>();
            }
        }

        void ReadStringList(const YAML::Node& parent, const char* key, std::vector<std::string>& out)
        {
            if (!parent[key]) return;
            YAML::Node list = parent[key];
            if (!list.IsSequence()) {
                throw SandboxConfigError(std::string("'") + key + "' 必须是一个列表");
            }
            out.clear();
            for (std::size_t i = 0; i < list.size(); ++i) {
                out.push_back(list[i].as<std::string>());
            }
        }

        long long ReadMegabytes(const YAML::Node& parent, const char* key, long long fallback_bytes)
        {
            if (!parent[key]) return fallback_bytes;
            long long mb = parent[key].as<long long>();
            if (mb < 0) {
                throw SandboxConfigError(std::string("limits.") + key + " 不能为负数");
            }
            return mb * 1024LL * 1024LL;
        }

        void CheckPositive(int value, const char* name)
        {
            if (value <= 0) {
                throw SandboxConfigError(std::string(name) + " 必须为正整数");
            }
        }

    } // anonymous namespace

    void ApplyEnvironmentOverrides(SandboxConfig& config)
    {
        if (const char* env = std::getenv("SANDBOX"); env != nullptr && *env != '\0') {
            config.shell.address = env;
        } else if (const char* sock = std::getenv("SANDBOX_SOCKET"); sock != nullptr && *sock != '\0') {
            config.shell.address = std::string("unix:") + sock;
        }
        if (const char* py = std::getenv("SANDBOX_PYTHON"); py != nullptr && *py != '\0') {
            config.process.interpreter_path = py;
        }
        if (const char* ruff = std::getenv("SANDBOX_RUFF"); ruff != nullptr && *ruff != '\0') {
            config.process.linter_path = ruff;
        }
    }

    SandboxConfig LoadConfig(const std::string& path) {
        SandboxConfig cfg;
        try {
            std::cerr << "[配置] 正在读取: " << path << " ..." << std::endl;
            YAML::Node config = YAML::LoadFile(path);

            if (config["server"]) {
                ReadOptional(config["server"], "name", cfg.server_name);
            }

            CHECK_NODE(config["sandbox"], "sandbox");
            CHECK_NODE(config["sandbox"]["mode"], "sandbox.mode");
            cfg.mode = config["sandbox"]["mode"].as<std::string>();
            if (cfg.mode != "process" && cfg.mode != "remote_shell") {
                throw SandboxConfigError("sandbox.mode 只能是 process 或 remote_shell，实际为 '" + cfg.mode + "'");
            }

            // Process 配置
            if (config["process"]) {
                YAML::Node proc = config["process"];
                ReadOptional(proc, "interpreter_path", cfg.process.interpreter_path);
                ReadStringList(proc, "interpreter_args", cfg.process.interpreter_args);
                ReadOptional(proc, "linter_path", cfg.process.linter_path);
                ReadStringList(proc, "linter_args", cfg.process.linter_args);
                ReadOptional(proc, "staging_root", cfg.process.staging_root);
                ReadOptional(proc, "script_name", cfg.process.script_name);
                ReadOptional(proc, "default_time_limit_s", cfg.process.default_time_limit_s);
                ReadOptional(proc, "max_time_limit_s", cfg.process.max_time_limit_s);
                ReadOptional(proc, "max_output_bytes", cfg.process.max_output_bytes);
                ReadOptional(proc, "namespaces", cfg.process.use_namespaces);
                ReadOptional(proc, "require_namespaces", cfg.process.require_namespaces);
                ReadOptional(proc, "seccomp", cfg.process.enable_seccomp);
            }
            CheckPositive(cfg.process.default_time_limit_s, "process.default_time_limit_s");
            CheckPositive(cfg.process.max_time_limit_s, "process.max_time_limit_s");

            // Limits 配置 (单位 MB / 秒)
            if (config["limits"]) {
                YAML::Node lim = config["limits"];
                ResourceLimitProfile& p = cfg.process.limits;
                p.address_space_bytes = static_cast<rlim_t>(
                    ReadMegabytes(lim, "address_space_mb", static_cast<long long>(p.address_space_bytes)));
                p.max_file_size_bytes = static_cast<rlim_t>(
                    ReadMegabytes(lim, "max_file_size_mb", static_cast<long long>(p.max_file_size_bytes)));
                if (lim["cpu_time_s"]) {
                    long long cpu = lim["cpu_time_s"].as<long long>();
                    if (cpu < 0) throw SandboxConfigError("limits.cpu_time_s 不能为负数");
                    p.cpu_time_seconds = static_cast<rlim_t>(cpu);
                }
                if (lim["max_processes"]) {
                    long long nproc = lim["max_processes"].as<long long>();
                    if (nproc < 0) throw SandboxConfigError("limits.max_processes 不能为负数");
                    p.max_processes = static_cast<rlim_t>(nproc);
                }
            }

            // Security 配置
            if (config["security"]) {
                YAML::Node sec = config["security"];
                if (sec["run_as_uid"]) {
                    cfg.process.run_uid = static_cast<uid_t>(sec["run_as_uid"].as<unsigned long>());
                }
                if (sec["run_as_gid"]) {
                    cfg.process.run_gid = static_cast<gid_t>(sec["run_as_gid"].as<unsigned long>());
                }
                ReadStringList(sec, "allowed_env", cfg.process.allowed_env);
            }

            // Shell 配置
            if (config["shell"]) {
                YAML::Node sh = config["shell"];
                ReadOptional(sh, "address", cfg.shell.address);
                ReadOptional(sh, "prompt_marker", cfg.shell.prompt_marker);
                ReadOptional(sh, "default_time_limit_s", cfg.shell.default_time_limit_s);
                ReadOptional(sh, "max_time_limit_s", cfg.shell.max_time_limit_s);
                ReadOptional(sh, "connect_timeout_ms", cfg.shell.connect_timeout_ms);
                ReadOptional(sh, "initial_prompt_timeout_ms", cfg.shell.initial_prompt_timeout_ms);
                ReadOptional(sh, "control_timeout_ms", cfg.shell.control_timeout_ms);
                ReadOptional(sh, "capture_exit_code", cfg.shell.capture_exit_code);
                ReadOptional(sh, "screen_settle_ms", cfg.shell.screen_settle_ms);
                ReadOptional(sh, "screen_log_path", cfg.shell.screen_log_path);
                ReadOptional(sh, "max_output_bytes", cfg.shell.max_output_bytes);
            }
            if (cfg.shell.prompt_marker.empty()) {
                throw SandboxConfigError("shell.prompt_marker 不能为空");
            }
            CheckPositive(cfg.shell.default_time_limit_s, "shell.default_time_limit_s");
            CheckPositive(cfg.shell.max_time_limit_s, "shell.max_time_limit_s");
            CheckPositive(cfg.shell.connect_timeout_ms, "shell.connect_timeout_ms");
            CheckPositive(cfg.shell.initial_prompt_timeout_ms, "shell.initial_prompt_timeout_ms");
            CheckPositive(cfg.shell.control_timeout_ms, "shell.control_timeout_ms");
            if (cfg.shell.screen_settle_ms < 0) {
                throw SandboxConfigError("shell.screen_settle_ms 不能为负数");
            }
            if (cfg.shell.max_output_bytes == 0) {
                throw SandboxConfigError("shell.max_output_bytes 必须为正整数");
            }

        } catch (const YAML::Exception& ex) {
            throw SandboxConfigError(std::string("YAML 解析失败: ") + ex.what());
        }

        ApplyEnvironmentOverrides(cfg);

        std::cerr << "[配置] 加载完成。Mode: " << cfg.mode
                  << ", Interpreter: " << (cfg.process.interpreter_path.empty() ? "-" : cfg.process.interpreter_path)
                  << ", Shell: " << (cfg.shell.address.empty() ? "-" : cfg.shell.address) << std::endl;
        return cfg;
    } // End LoadConfig

} // namespace mcp_gateway
