#ifndef MCP_GATEWAY_RESULT_FORMAT_H
#define MCP_GATEWAY_RESULT_FORMAT_H

#include <string>

#include "sandbox.h"

namespace mcp_gateway {

    /**
     * @brief 将执行结果渲染为交给 LLM 的单个字符串
     *
     * 段落之间以空行分隔:
     *   Execution failed / Execution terminated -> Exit code -> Output -> Error -> Note
     * 错误信息优先展示，但不会吞掉已经捕获的 stdout；stdout 与 stderr 同时存在时两段都保留。
     *
     * @param lint 为 true 时，退出码 0 且无诊断输出被规范化为 "No issues found!"
     */
    std::string FormatExecutionResult(const ExecutionResult& result, bool lint = false);

    /**
     * @brief 把任意字节序列转换为合法 UTF-8，非法序列替换为 U+FFFD
     */
    std::string SanitizeUtf8(const std::string& bytes);

    // 去掉首尾空白
    std::string Trim(const std::string& text);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_RESULT_FORMAT_H
