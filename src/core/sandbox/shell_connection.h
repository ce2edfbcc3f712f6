#ifndef MCP_GATEWAY_SHELL_CONNECTION_H
#define MCP_GATEWAY_SHELL_CONNECTION_H

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "config.h"
#include "sandbox.h"

namespace mcp_gateway {

/**
 * @brief 与远端持久 Shell 的双向文本连接
 *
 * 协议 (纯文本，无长度前缀):
 *   - 请求: 一行命令 + '\n'
 *   - 响应: 若干行输出，以提示符 (默认 "$ ") 结束
 *
 * 提示符匹配存在天然的二义性: 输出中恰好出现提示符会导致帧错位。
 * 退出码查询带有每条命令唯一的 nonce，用于发现错位；所有读取都有硬超时。
 *
 * 同一连接上的命令由内部互斥锁串行化，协议本身无法区分交错的命令。
 */
class ShellConnection {
public:
    /**
     * @brief 按配置建立连接
     * @throw SandboxConfigError 未配置沙箱地址或地址格式错误 (立即失败，不等待超时)
     * @throw SandboxError 连接失败 (附带系统错误信息)
     */
    static std::unique_ptr<ShellConnection> Connect(const ShellOptions& options);

    /**
     * @brief 接管一个已连接的 socket (测试或自定义传输使用)
     */
    ShellConnection(int fd, ShellOptions options);
    ~ShellConnection();

    // 禁止拷贝
    ShellConnection(const ShellConnection&) = delete;
    ShellConnection& operator=(const ShellConnection&) = delete;

    /**
     * @brief 执行一条命令
     *
     * @param command Shell 命令 (可多行，多行命令以 eval $'...' 一行发送)
     * @param time_limit_s 等待输出的秒数
     * @param screen_session 非空时在该 screen 会话中执行，输出来自 hardcopy
     * @param cwd 非空且不为 "~" 时先切换目录，切换失败则返回 cd 的报错和退出码
     * @return 超时: stderr = "Command timed out", exit_code = 1, stdout 为已缓冲的部分输出
     * @throw SandboxError 网络读写失败或控制命令无响应
     */
    CommandResult RunCommand(const std::string& command,
                             int time_limit_s,
                             const std::string& screen_session = "",
                             const std::string& cwd = "");

    // 超时后命令仍在远端运行，后续输出无法与新命令区分
    bool desynchronized() const { return desynchronized_; }

    void Close();

private:
    enum class ReadStatus { PROMPT, TIMEOUT, CLOSED };

    struct ReadOutcome {
        std::string text;
        ReadStatus status;
    };

    using Clock = std::chrono::steady_clock;

    ReadOutcome ReadUntilPrompt(Clock::time_point deadline);
    void WriteLine(const std::string& line);

    // 发送一条控制命令并等待提示符，返回其输出
    std::string Exchange(const std::string& line);

    std::optional<int> QueryExitCode();

    // 切换工作目录；失败时返回带 cd 报错的结果，命令不再执行
    std::optional<CommandResult> ChangeDirectory(const std::string& cwd);

    static std::string CommandLine(const std::string& command);
    CommandResult RunInScreen(const std::string& command, int time_limit_s, const std::string& session);

    bool IsPromptLine(const std::string& line) const;
    bool IsPromptTail(const std::string& tail) const;

    int fd_;
    ShellOptions options_;
    std::string pending_;
    bool greeted_;
    bool desynchronized_;
    std::mutex mutex_;
};

/**
 * @brief 单引号转义 (等价于 shlex.quote)
 */
std::string ShellQuote(const std::string& value);

/**
 * @brief $'...' 形式的 ANSI-C 转义，换行等控制字符保持在同一行内
 */
std::string AnsiCQuote(const std::string& value);

/**
 * @brief screen 会话名校验: [A-Za-z0-9_.-]{1,64}
 */
bool IsValidScreenSessionName(const std::string& name);

/**
 * @brief 生成 "mcp_" + 8 位随机十六进制的会话名
 */
std::string GenerateScreenSessionName();

/**
 * @brief 解析退出码查询的响应，找不到 nonce 或不是数字时返回 1
 */
int ParseExitCodeResponse(const std::string& response, const std::string& nonce);

} // namespace mcp_gateway

#endif // MCP_GATEWAY_SHELL_CONNECTION_H
