#ifndef MCP_GATEWAY_SANDBOX_ISOLATION_H
#define MCP_GATEWAY_SANDBOX_ISOLATION_H

namespace mcp_gateway {

    /**
     * @brief 运行子进程的入口点 (隔离层)
     * 兼容 clone() 函数签名。任何一步失败都会经 exec-status 管道上报并 _exit，
     * 绝不会在未受限的状态下执行不可信代码。
     * @param arg 指向 RunChildArgs 结构体的指针
     * @return int 退出码 (正常情况下 execve 不返回)
     */
    int RunChildFn(void* arg);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_SANDBOX_ISOLATION_H
