#include "shell_connection.h"
#include "sandbox_error.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/un.h>

namespace mcp_gateway {

namespace {

const char* kTimeoutMessage = "Command timed out";

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { if (info) freeaddrinfo(info); }
};

int RemainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) return 0;
    return left > 1000000 ? 1000000 : static_cast<int>(left);
}

// 非阻塞 connect + poll 等待，超时或失败返回 -1 并设置 err
int ConnectWithTimeout(int domain, const sockaddr* addr, socklen_t len, int timeout_ms, int& err) {
    int fd = ::socket(domain, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        err = errno;
        return -1;
    }

    if (::connect(fd, addr, len) != 0) {
        if (errno != EINPROGRESS && errno != EAGAIN) {
            err = errno;
            ::close(fd);
            return -1;
        }

        pollfd pfd{fd, POLLOUT, 0};
        int ret;
        do {
            ret = ::poll(&pfd, 1, timeout_ms);
        } while (ret < 0 && errno == EINTR);

        if (ret == 0) {
            err = ETIMEDOUT;
            ::close(fd);
            return -1;
        }
        if (ret < 0) {
            err = errno;
            ::close(fd);
            return -1;
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
            err = errno;
            ::close(fd);
            return -1;
        }
        if (so_error != 0) {
            err = so_error;
            ::close(fd);
            return -1;
        }
    }
    return fd;
}

int ConnectUnix(const std::string& path, int timeout_ms) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        throw SandboxConfigError("sandbox socket path is too long: " + path);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int err = 0;
    int fd = ConnectWithTimeout(AF_UNIX, reinterpret_cast<sockaddr*>(&addr), sizeof(addr), timeout_ms, err);
    if (fd < 0) {
        throw SandboxError(FormatSystemError("Failed to connect to sandbox at " + path, err));
    }
    return fd;
}

int ConnectTcp(const std::string& address, int timeout_ms) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        throw SandboxConfigError("invalid sandbox address (expected host:port): " + address);
    }
    std::string host = address.substr(0, colon);
    std::string port = address.substr(colon + 1);
    if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw SandboxConfigError("invalid sandbox port: " + port);
    }
    // [::1]:2222
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &raw);
    if (rc != 0) {
        throw SandboxError("Failed to connect to sandbox at " + address + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> info(raw);

    int err = ECONNREFUSED;
    for (addrinfo* ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ConnectWithTimeout(ai->ai_family, ai->ai_addr, ai->ai_addrlen, timeout_ms, err);
        if (fd >= 0) {
            int one = 1;
            if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
                std::cerr << "[Shell] TCP_NODELAY 设置失败: " << std::strerror(errno) << std::endl;
            }
            return fd;
        }
    }
    throw SandboxError(FormatSystemError("Failed to connect to sandbox at " + address, err));
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// 去掉终端控制序列 (ESC [ ... 终止字节)，例如 bash 的 bracketed paste 开关
std::string StripTerminalControls(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
            size_t j = i + 2;
            while (j < line.size() && !(line[j] >= 0x40 && line[j] <= 0x7e)) ++j;
            i = j;
            continue;
        }
        if (line[i] == '\r') continue;
        out.push_back(line[i]);
    }
    return out;
}

std::string RandomHex(size_t digits) {
    static const char* kHex = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    for (size_t i = 0; i < digits; ++i) out.push_back(kHex[dist(gen)]);
    return out;
}

} // namespace

std::string ShellQuote(const std::string& value) {
    if (value.empty()) return "''";
    bool safe = std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || std::strchr("@%+=:,./-_", c) != nullptr;
    });
    if (safe) return value;

    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

std::string AnsiCQuote(const std::string& value) {
    std::string out = "$'";
    char buf[8];
    for (unsigned char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out += "'";
    return out;
}

bool IsValidScreenSessionName(const std::string& name) {
    if (name.empty() || name.size() > 64) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

std::string GenerateScreenSessionName() {
    return "mcp_" + RandomHex(8);
}

int ParseExitCodeResponse(const std::string& response, const std::string& nonce) {
    std::istringstream in(response);
    std::string line;
    const std::string tag = nonce + ":";
    while (std::getline(in, line)) {
        line = StripTerminalControls(line);
        auto pos = line.find(tag);
        if (pos == std::string::npos) continue;

        std::string digits = line.substr(pos + tag.size());
        while (!digits.empty() && std::isspace(static_cast<unsigned char>(digits.back()))) digits.pop_back();
        if (digits.empty() || digits.size() > 3 ||
            !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
            // 终端回显的 "echo <nonce>:$?" 也会命中，继续找真正的响应行
            continue;
        }
        return std::stoi(digits);
    }
    return 1;
}

std::unique_ptr<ShellConnection> ShellConnection::Connect(const ShellOptions& options) {
    if (options.address.empty()) {
        throw SandboxConfigError("SANDBOX environment variable is not set (expected host:port or SANDBOX_SOCKET)");
    }

    int fd;
    if (StartsWith(options.address, "unix:")) {
        fd = ConnectUnix(options.address.substr(5), options.connect_timeout_ms);
    } else if (options.address.front() == '/') {
        fd = ConnectUnix(options.address, options.connect_timeout_ms);
    } else {
        fd = ConnectTcp(options.address, options.connect_timeout_ms);
    }
    return std::make_unique<ShellConnection>(fd, options);
}

ShellConnection::ShellConnection(int fd, ShellOptions options)
    : fd_(fd), options_(std::move(options)), greeted_(false), desynchronized_(false) {
    int flags = ::fcntl(fd_, F_GETFL);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw SandboxError(FormatSystemError("fcntl(O_NONBLOCK) on sandbox socket", err));
    }
}

ShellConnection::~ShellConnection() {
    Close();
}

void ShellConnection::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool ShellConnection::IsPromptLine(const std::string& line) const {
    return StartsWith(line, options_.prompt_marker);
}

bool ShellConnection::IsPromptTail(const std::string& tail) const {
    return !tail.empty() && EndsWith(tail, options_.prompt_marker);
}

ShellConnection::ReadOutcome ShellConnection::ReadUntilPrompt(Clock::time_point deadline) {
    ReadOutcome outcome{"", ReadStatus::TIMEOUT};
    bool truncated = false;
    // 提示符只会出现在缓冲区末尾，检查时只看这么长的后缀 (含终端控制序列的余量)
    const size_t tail_window = options_.prompt_marker.size() + 64;

    auto append = [&](const std::string& line) {
        if (truncated) return;
        if (outcome.text.size() + line.size() + 1 > options_.max_output_bytes) {
            outcome.text += "[output truncated]\n";
            truncated = true;
            return;
        }
        outcome.text += line;
        outcome.text += '\n';
    };

    char buf[16384];
    for (;;) {
        size_t start = 0;
        size_t nl;
        while ((nl = pending_.find('\n', start)) != std::string::npos) {
            std::string line = StripTerminalControls(pending_.substr(start, nl - start));
            start = nl + 1;
            if (IsPromptLine(line)) {
                pending_.erase(0, start);
                outcome.status = ReadStatus::PROMPT;
                return outcome;
            }
            append(line);
        }
        pending_.erase(0, start);

        std::string tail = pending_.size() > tail_window ? pending_.substr(pending_.size() - tail_window) : pending_;
        if (IsPromptTail(StripTerminalControls(tail))) {
            pending_.clear();
            outcome.status = ReadStatus::PROMPT;
            return outcome;
        }

        // 没有换行的超长输出: 超过上限的部分按截断处理，只留末尾用于识别提示符
        if (pending_.size() > options_.max_output_bytes + tail_window) {
            append(pending_.substr(0, pending_.size() - tail_window));
            pending_.erase(0, pending_.size() - tail_window);
        }

        int wait_ms = RemainingMs(deadline);
        if (wait_ms == 0) {
            if (!pending_.empty()) append(StripTerminalControls(pending_));
            pending_.clear();
            outcome.status = ReadStatus::TIMEOUT;
            return outcome;
        }

        pollfd pfd{fd_, POLLIN, 0};
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw SandboxError(FormatSystemError("poll on sandbox socket", errno));
        }
        if (ret == 0) continue;

        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            pending_.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            if (!pending_.empty()) append(StripTerminalControls(pending_));
            pending_.clear();
            outcome.status = ReadStatus::CLOSED;
            return outcome;
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            throw SandboxError(FormatSystemError("read from sandbox", errno));
        }
    }
}

void ShellConnection::WriteLine(const std::string& line) {
    if (fd_ < 0) throw SandboxError("sandbox connection is closed");

    std::string data = line + "\n";
    size_t off = 0;
    auto deadline = Clock::now() + std::chrono::milliseconds(options_.control_timeout_ms);
    while (off < data.size()) {
        ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int wait_ms = RemainingMs(deadline);
            if (wait_ms == 0) throw SandboxError("write to sandbox timed out");
            pollfd pfd{fd_, POLLOUT, 0};
            if (::poll(&pfd, 1, wait_ms) < 0 && errno != EINTR) {
                throw SandboxError(FormatSystemError("poll on sandbox socket", errno));
            }
            continue;
        }
        throw SandboxError(FormatSystemError("write to sandbox", errno));
    }
}

std::string ShellConnection::Exchange(const std::string& line) {
    WriteLine(line);
    auto outcome = ReadUntilPrompt(Clock::now() + std::chrono::milliseconds(options_.control_timeout_ms));
    if (outcome.status == ReadStatus::TIMEOUT) {
        desynchronized_ = true;
        throw SandboxError("sandbox shell did not answer within " +
                           std::to_string(options_.control_timeout_ms) + " ms");
    }
    if (outcome.status == ReadStatus::CLOSED) {
        throw SandboxError("sandbox shell closed the connection");
    }
    return outcome.text;
}

std::optional<int> ShellConnection::QueryExitCode() {
    std::string nonce = "__mcp_rc_" + RandomHex(12);
    WriteLine("echo " + nonce + ":$?");
    auto outcome = ReadUntilPrompt(Clock::now() + std::chrono::milliseconds(options_.control_timeout_ms));
    if (outcome.status == ReadStatus::TIMEOUT) {
        desynchronized_ = true;
        std::cerr << "[Shell] 退出码查询超时，连接已失步" << std::endl;
    }
    return ParseExitCodeResponse(outcome.text, nonce);
}

std::optional<CommandResult> ShellConnection::ChangeDirectory(const std::string& cwd) {
    const std::string nonce = "__mcp_cd_" + RandomHex(12);
    std::string response = Exchange("cd " + ShellQuote(cwd) + "; echo " + nonce + ":$?");
    int rc = ParseExitCodeResponse(response, nonce);
    if (rc == 0) return std::nullopt;

    // 保留 cd 的报错，去掉回显的命令行和 nonce 行
    std::string message;
    std::istringstream in(response);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find(nonce) != std::string::npos) continue;
        if (!message.empty()) message += '\n';
        message += line;
    }
    std::cerr << "[Shell] 切换目录失败，命令未执行: " << cwd << std::endl;

    CommandResult result;
    result.stderr_text = message.empty() ? "cd: " + cwd + ": failed" : message;
    result.exit_code = rc;
    return result;
}

std::string ShellConnection::CommandLine(const std::string& command) {
    // 多行命令逐行送给交互式 Shell 时，中间会夹杂续行提示符；用 eval 合成一行
    if (command.find_first_of("\r\n") == std::string::npos) return command;
    return "eval " + AnsiCQuote(command);
}

CommandResult ShellConnection::RunCommand(const std::string& command,
                                          int time_limit_s,
                                          const std::string& screen_session,
                                          const std::string& cwd) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (desynchronized_) {
        throw SandboxError("sandbox shell is out of sync after an earlier timeout; reconnect required");
    }

    if (!greeted_) {
        // 没有初始提示符的 Shell 也可以使用
        auto greeting = ReadUntilPrompt(Clock::now() + std::chrono::milliseconds(options_.initial_prompt_timeout_ms));
        if (greeting.status == ReadStatus::CLOSED) {
            throw SandboxError("sandbox shell closed the connection");
        }
        greeted_ = true;
    }

    if (!cwd.empty() && cwd != "~") {
        // 目录不存在时不能在原目录里继续执行命令
        if (auto failed = ChangeDirectory(cwd)) return *failed;
    }

    if (!screen_session.empty()) {
        return RunInScreen(command, time_limit_s, screen_session);
    }

    CommandResult result;
    WriteLine(CommandLine(command));
    auto outcome = ReadUntilPrompt(Clock::now() + std::chrono::seconds(time_limit_s));
    result.stdout_text = outcome.text;

    switch (outcome.status) {
        case ReadStatus::TIMEOUT:
            desynchronized_ = true;
            result.stderr_text = kTimeoutMessage;
            result.exit_code = 1;
            result.timed_out = true;
            std::cerr << "[Shell] 命令超时 (" << time_limit_s << "s)，连接已失步" << std::endl;
            return result;
        case ReadStatus::CLOSED:
            result.stderr_text = "sandbox shell closed the connection";
            result.exit_code = 1;
            return result;
        case ReadStatus::PROMPT:
            break;
    }

    result.exit_code = options_.capture_exit_code ? QueryExitCode() : std::optional<int>(0);
    return result;
}

CommandResult ShellConnection::RunInScreen(const std::string& command, int time_limit_s, const std::string& session) {
    if (!IsValidScreenSessionName(session)) {
        throw SandboxError("invalid screen session name: " + session);
    }

    const std::string target = "screen -S " + session + " -X ";
    // 复用已有会话，不存在时创建 (分离状态)
    Exchange(target + "select . >/dev/null 2>&1 || screen -dmS " + session);
    Exchange(target + "stuff " + AnsiCQuote(command + "\n"));

    // hardcopy 只反映当前屏幕内容，给命令留出产生输出的时间
    std::this_thread::sleep_for(std::chrono::milliseconds(options_.screen_settle_ms));

    Exchange(target + "hardcopy " + ShellQuote(options_.screen_log_path));
    Exchange(target + "detach >/dev/null 2>&1");

    CommandResult result;
    WriteLine("cat " + ShellQuote(options_.screen_log_path));
    auto outcome = ReadUntilPrompt(Clock::now() + std::chrono::seconds(time_limit_s));
    result.stdout_text = outcome.text;
    if (outcome.status == ReadStatus::TIMEOUT) {
        desynchronized_ = true;
        result.stderr_text = kTimeoutMessage;
        result.exit_code = 1;
        result.timed_out = true;
    }
    // 交互式会话的退出码无法获取
    return result;
}

} // namespace mcp_gateway
