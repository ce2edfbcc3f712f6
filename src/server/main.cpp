/**
 * @file main.cpp (mcp_gateway)
 * @brief MCP 沙箱网关 (stdio 传输)
 *
 * 约束:
 * 1. stdout 只输出 JSON-RPC 响应，每行一个
 * 2. 日志仅输出到 stderr
 */
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

#include "config.h"
#include "sandbox.h"
#include "sandbox_error.h"
#include "stdio_server.h"
#include "tool_dispatch.h"

namespace {

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " -C <config.yaml>\n"
              << "  -C <path>         Config file path (required)\n"
              << "  -h, --help        Show this help\n"
              << "Environment:\n"
              << "  SANDBOX           host:port of the remote shell sandbox\n"
              << "  SANDBOX_SOCKET    unix socket of the remote shell sandbox\n"
              << "  SANDBOX_PYTHON    interpreter used by the python tool\n"
              << "  SANDBOX_RUFF      linter used by python lint mode\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    int opt;
    static struct option long_opts[] = {
        {"config", required_argument, nullptr, 'C'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    while ((opt = getopt_long(argc, argv, "C:h", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'C':
                config_path = optarg;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    if (config_path.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    std::unique_ptr<mcp_gateway::ToolDispatcher> dispatcher;
    mcp_gateway::SandboxConfig config;
    try {
        config = mcp_gateway::LoadConfig(config_path);
        dispatcher = std::make_unique<mcp_gateway::ToolDispatcher>(mcp_gateway::CreateSandbox(config));
    } catch (const mcp_gateway::SandboxConfigError& e) {
        std::cerr << "[配置] 致命错误: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    std::cerr << "[Server] " << config.server_name << " 已启动，等待 stdin 上的请求..." << std::endl;
    mcp_gateway::StdioServer server(config.server_name, *dispatcher);
    server.Serve(std::cin, std::cout);
    return 0;
}
