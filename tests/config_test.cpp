#include <stdlib.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "config.h"
#include "sandbox_error.h"
#include "test_harness.h"

using namespace mcp_gateway;
using namespace test_harness;

namespace {

const std::string kPath = "/tmp/mcp_gateway_config_test.yaml";

void WriteConfig(const std::string& text) {
    std::ofstream out(kPath, std::ios::trunc);
    out << text;
}

void ClearEnvironment() {
    unsetenv("SANDBOX");
    unsetenv("SANDBOX_SOCKET");
    unsetenv("SANDBOX_PYTHON");
    unsetenv("SANDBOX_RUFF");
}

bool LoadFails(const std::string& text) {
    WriteConfig(text);
    try {
        LoadConfig(kPath);
    } catch (const SandboxConfigError&) {
        return true;
    }
    return false;
}

void TestFullConfig() {
    WriteConfig(
        "server:\n"
        "  name: test-gateway\n"
        "sandbox:\n"
        "  mode: process\n"
        "process:\n"
        "  interpreter_path: /usr/bin/python3\n"
        "  interpreter_args: [\"-I\"]\n"
        "  default_time_limit_s: 4\n"
        "  max_time_limit_s: 20\n"
        "  namespaces: false\n"
        "limits:\n"
        "  address_space_mb: 256\n"
        "  cpu_time_s: 9\n"
        "  max_processes: 0\n"
        "security:\n"
        "  run_as_uid: 1234\n"
        "  run_as_gid: 4321\n"
        "  allowed_env: [PATH, TZ]\n"
        "shell:\n"
        "  prompt_marker: \"# \"\n"
        "  screen_settle_ms: 250\n");

    SandboxConfig cfg = LoadConfig(kPath);
    Expect(cfg.server_name == "test-gateway" && cfg.mode == "process", "config_server_and_mode");
    Expect(cfg.process.interpreter_path == "/usr/bin/python3" && cfg.process.interpreter_args.size() == 1 &&
           cfg.process.interpreter_args[0] == "-I",
           "config_interpreter");
    Expect(cfg.process.default_time_limit_s == 4 && cfg.process.max_time_limit_s == 20 &&
           !cfg.process.use_namespaces,
           "config_process_options");
    Expect(cfg.process.limits.address_space_bytes == 256ULL * 1024 * 1024 &&
           cfg.process.limits.cpu_time_seconds == 9 && cfg.process.limits.max_processes == 0,
           "config_limits");
    Expect(cfg.process.limits.max_file_size_bytes == 16ULL * 1024 * 1024, "config_limits_default_kept");
    Expect(cfg.process.run_uid == 1234 && cfg.process.run_gid == 4321 && cfg.process.allowed_env.size() == 2,
           "config_security");
    Expect(cfg.shell.prompt_marker == "# " && cfg.shell.screen_settle_ms == 250 &&
           cfg.shell.default_time_limit_s == 5,
           "config_shell");
}

void TestInvalidConfigs() {
    Expect(LoadFails("server:\n  name: x\n"), "config_missing_sandbox_section");
    Expect(LoadFails("sandbox:\n  mode: docker\n"), "config_unknown_mode");
    Expect(LoadFails("sandbox:\n  mode: process\nlimits:\n  cpu_time_s: -1\n"), "config_negative_limit");
    Expect(LoadFails("sandbox:\n  mode: process\nprocess:\n  default_time_limit_s: 0\n"), "config_zero_time_limit");
    Expect(LoadFails("sandbox:\n  mode: remote_shell\nshell:\n  max_time_limit_s: 0\n"),
           "config_zero_shell_max_time_limit");
    Expect(LoadFails("sandbox:\n  mode: remote_shell\nshell:\n  control_timeout_ms: 0\n"),
           "config_zero_control_timeout");
    Expect(LoadFails("sandbox:\n  mode: remote_shell\nshell:\n  initial_prompt_timeout_ms: -5\n"),
           "config_negative_initial_prompt_timeout");
    Expect(LoadFails("sandbox:\n  mode: process\nsecurity:\n  allowed_env: PATH\n"), "config_env_not_a_list");
    Expect(LoadFails("sandbox: [unterminated\n"), "config_yaml_syntax_error");

    bool threw = false;
    try {
        LoadConfig("/tmp/mcp_gateway_no_such_config.yaml");
    } catch (const SandboxConfigError&) {
        threw = true;
    }
    Expect(threw, "config_missing_file");
}

void TestEnvironmentOverrides() {
    WriteConfig("sandbox:\n  mode: remote_shell\nshell:\n  address: 10.0.0.1:22\n");

    ClearEnvironment();
    Expect(LoadConfig(kPath).shell.address == "10.0.0.1:22", "env_no_override");

    setenv("SANDBOX_SOCKET", "/run/sandbox.sock", 1);
    Expect(LoadConfig(kPath).shell.address == "unix:/run/sandbox.sock", "env_sandbox_socket");

    setenv("SANDBOX", "sandbox:2222", 1);
    Expect(LoadConfig(kPath).shell.address == "sandbox:2222", "env_sandbox_wins_over_socket");

    setenv("SANDBOX_PYTHON", "/opt/python/bin/python3", 1);
    setenv("SANDBOX_RUFF", "/opt/ruff", 1);
    SandboxConfig cfg = LoadConfig(kPath);
    Expect(cfg.process.interpreter_path == "/opt/python/bin/python3" && cfg.process.linter_path == "/opt/ruff",
           "env_tool_paths");
    ClearEnvironment();
}

} // namespace

int main() {
    std::cout << "=== Config Test ===" << std::endl;
    ClearEnvironment();
    TestFullConfig();
    TestInvalidConfigs();
    TestEnvironmentOverrides();
    std::remove(kPath.c_str());
    return Finish("Config Test");
}
