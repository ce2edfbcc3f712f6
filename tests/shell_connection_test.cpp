#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "config.h"
#include "remote_shell_sandbox.h"
#include "result_format.h"
#include "sandbox_error.h"
#include "shell_connection.h"
#include "test_harness.h"

using namespace mcp_gateway;
using namespace test_harness;

namespace {

/**
 * 进程内的假 Shell: 收到一行命令，写回输出和提示符 (默认 "$ ")。
 * 识别少量命令，其余命令原样回显。
 */
class FakeShell {
public:
    explicit FakeShell(int fd, bool greet = true, std::string prompt = "$ ")
        : fd_(fd), greet_(greet), prompt_(std::move(prompt)), last_rc_("0") {
        thread_ = std::thread([this] { Loop(); });
    }

    ~FakeShell() {
        ::shutdown(fd_, SHUT_RDWR);
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

private:
    void Send(const std::string& text) {
        size_t off = 0;
        while (off < text.size()) {
            ssize_t n = ::send(fd_, text.data() + off, text.size() - off, MSG_NOSIGNAL);
            if (n <= 0) return;
            off += static_cast<size_t>(n);
        }
    }

    // nullopt 表示不回复 (模拟挂起的命令)
    std::optional<std::string> Respond(const std::string& line) {
        if (line.rfind("echo __mcp_rc_", 0) == 0) {
            std::string tag = line.substr(5, line.size() - 5 - 2); // 去掉 "echo " 和 "$?"
            return tag + last_rc_ + "\n";
        }
        if (line == "echo hi") { last_rc_ = "0"; return std::string("hi\n"); }
        if (line == "false") { last_rc_ = "1"; return std::string(); }
        if (line == "exit 3") { last_rc_ = "3"; return std::string(); }
        if (line == "weird_rc") { last_rc_ = "abc"; return std::string("odd\n"); }
        if (line == "printf 'a\\nb\\n'") { last_rc_ = "0"; return std::string("a\r\nb\r\n"); }
        if (line == "sleep 100") return std::nullopt;
        if (line.rfind("cd ", 0) == 0) {
            // "cd <dir>; echo <nonce>:$?"
            auto echo = line.find("; echo ");
            std::string tag = line.substr(echo + 7, line.size() - echo - 7 - 2);
            if (line.find("missing") != std::string::npos) {
                last_rc_ = "1";
                return "bash: cd: " + line.substr(3, echo - 3) + ": No such file or directory\n" + tag + "1\n";
            }
            last_rc_ = "0";
            return tag + "0\n";
        }
        if (line == "eval $'echo a\\necho b'") { last_rc_ = "0"; return std::string("a\nb\n"); }
        if (line == "bigline") {
            last_rc_ = "0";
            return std::string(8 * 1024 * 1024, 'x') + "\n";
        }
        if (line.rfind("cat ", 0) == 0) return std::string("screen line 1\nscreen line 2\n");
        if (line.rfind("screen ", 0) == 0) return std::string();
        last_rc_ = "0";
        return line + "\n";
    }

    void Loop() {
        if (greet_) Send("welcome\n" + prompt_);
        std::string buffer;
        char buf[1024];
        for (;;) {
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n <= 0) return;
            buffer.append(buf, static_cast<size_t>(n));
            size_t nl;
            while ((nl = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, nl);
                buffer.erase(0, nl + 1);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    lines_.push_back(line);
                }
                auto reply = Respond(line);
                if (reply) Send(*reply + prompt_);
            }
        }
    }

    int fd_;
    bool greet_;
    std::string prompt_;
    std::string last_rc_;
    std::mutex mutex_;
    std::vector<std::string> lines_;
    std::thread thread_;
};

ShellOptions FastOptions() {
    ShellOptions options;
    options.initial_prompt_timeout_ms = 300;
    options.control_timeout_ms = 1000;
    options.screen_settle_ms = 10;
    options.screen_log_path = "/tmp/mcp_screen_test.log";
    return options;
}

struct Pair {
    int client;
    int server;
};

Pair MakePair() {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw std::runtime_error("socketpair failed");
    }
    return {fds[0], fds[1]};
}

void TestEchoAndExitCode() {
    Pair p = MakePair();
    FakeShell shell(p.server);
    ShellConnection conn(p.client, FastOptions());

    CommandResult r = conn.RunCommand("echo hi", 5);
    Expect(r.stdout_text == "hi\n", "shell_echo_stdout", "[" + r.stdout_text + "]");
    Expect(r.exit_code && *r.exit_code == 0, "shell_echo_exit_code_zero");
    Expect(r.stderr_text.empty() && !r.timed_out, "shell_echo_no_error");

    CommandResult f = conn.RunCommand("false", 5);
    Expect(f.exit_code && *f.exit_code == 1 && f.stdout_text.empty(), "shell_false_exit_code_one");

    CommandResult e = conn.RunCommand("exit 3", 5);
    Expect(e.exit_code && *e.exit_code == 3, "shell_exit_code_three");

    CommandResult crlf = conn.RunCommand("printf 'a\\nb\\n'", 5);
    Expect(crlf.stdout_text == "a\nb\n", "shell_crlf_normalized", "[" + crlf.stdout_text + "]");
}

void TestNonNumericExitCode() {
    Pair p = MakePair();
    FakeShell shell(p.server);
    ShellConnection conn(p.client, FastOptions());

    CommandResult r = conn.RunCommand("weird_rc", 5);
    Expect(r.stdout_text == "odd\n", "shell_weird_rc_stdout", "[" + r.stdout_text + "]");
    Expect(r.exit_code && *r.exit_code == 1, "shell_non_numeric_exit_code_is_one");
}

void TestWithoutGreeting() {
    Pair p = MakePair();
    FakeShell shell(p.server, false);
    ShellConnection conn(p.client, FastOptions());

    CommandResult r = conn.RunCommand("echo hi", 5);
    Expect(r.stdout_text == "hi\n" && r.exit_code && *r.exit_code == 0, "shell_missing_initial_prompt_tolerated",
           "[" + r.stdout_text + "]");
}

void TestTimeout() {
    Pair p = MakePair();
    FakeShell shell(p.server);
    ShellConnection conn(p.client, FastOptions());

    auto start = std::chrono::steady_clock::now();
    CommandResult r = conn.RunCommand("sleep 100", 1);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    Expect(r.timed_out && r.stderr_text == "Command timed out", "shell_timeout_reported", r.stderr_text);
    Expect(r.exit_code && *r.exit_code == 1, "shell_timeout_exit_code_one");
    Expect(elapsed.count() >= 900 && elapsed.count() < 3000, "shell_timeout_bounded",
           std::to_string(elapsed.count()) + "ms");
    Expect(conn.desynchronized(), "shell_timeout_marks_desynchronized");

    bool threw = false;
    try {
        conn.RunCommand("echo hi", 1);
    } catch (const SandboxError&) {
        threw = true;
    }
    Expect(threw, "shell_desynchronized_connection_refused");
}

void TestCwdAndScreenSequence() {
    Pair p = MakePair();
    FakeShell shell(p.server);
    ShellConnection conn(p.client, FastOptions());

    CommandResult r = conn.RunCommand("python3 app.py", 5, "mcp_test01", "/work dir");
    Expect(Contains(r.stdout_text, "screen line 1") && Contains(r.stdout_text, "screen line 2"),
           "screen_output_from_hardcopy", "[" + r.stdout_text + "]");
    Expect(!r.exit_code, "screen_exit_code_unknown");

    auto lines = shell.received();
    std::vector<std::string> expected_prefixes = {
        "cd '/work dir'",
        "screen -S mcp_test01 -X select . >/dev/null 2>&1 || screen -dmS mcp_test01",
        "screen -S mcp_test01 -X stuff $'python3 app.py\\n'",
        "screen -S mcp_test01 -X hardcopy /tmp/mcp_screen_test.log",
        "screen -S mcp_test01 -X detach",
        "cat /tmp/mcp_screen_test.log",
    };
    bool ordered = lines.size() == expected_prefixes.size();
    for (size_t i = 0; ordered && i < lines.size(); ++i) {
        if (lines[i].rfind(expected_prefixes[i], 0) != 0) ordered = false;
    }
    std::string got;
    for (const auto& l : lines) got += "\n    " + l;
    Expect(ordered, "screen_command_sequence", got);

    bool threw = false;
    try {
        conn.RunCommand("ls", 5, "bad name; rm -rf /");
    } catch (const SandboxError&) {
        threw = true;
    }
    Expect(threw, "screen_rejects_invalid_session_name");
}

void TestMissingCwdStopsCommand() {
    Pair p = MakePair();
    FakeShell shell(p.server);
    ShellConnection conn(p.client, FastOptions());

    CommandResult r = conn.RunCommand("pwd", 5, "", "/definitely/missing/dir");
    Expect(r.exit_code && *r.exit_code == 1, "shell_missing_cwd_exit_code");
    Expect(Contains(r.stderr_text, "No such file or directory") && !Contains(r.stderr_text, "__mcp_cd_"),
           "shell_missing_cwd_error_kept", "[" + r.stderr_text + "]");
    Expect(r.stdout_text.empty(), "shell_missing_cwd_no_output", "[" + r.stdout_text + "]");

    bool sent_pwd = false;
    for (const auto& line : shell.received()) {
        if (line == "pwd") sent_pwd = true;
    }
    Expect(!sent_pwd, "shell_missing_cwd_command_not_sent");

    CommandResult ok = conn.RunCommand("echo hi", 5, "", "/work");
    Expect(ok.stdout_text == "hi\n" && ok.exit_code && *ok.exit_code == 0 && ok.stderr_text.empty(),
           "shell_existing_cwd_runs_command", "[" + ok.stdout_text + ok.stderr_text + "]");
}

// 部署环境的提示符不在行首: "(sandbox) user@host:dir$ "
void TestMultiLineCommandSentAsOneLine() {
    Pair p = MakePair();
    FakeShell shell(p.server, true, "(sandbox) root@vm:/tmp$ ");
    ShellConnection conn(p.client, FastOptions());

    CommandResult r = conn.RunCommand("echo a\necho b", 5);
    Expect(r.stdout_text == "a\nb\n", "shell_multi_line_output_complete", "[" + r.stdout_text + "]");
    Expect(!Contains(r.stdout_text, "(sandbox)"), "shell_multi_line_no_prompt_leak");
    Expect(r.exit_code && *r.exit_code == 0, "shell_multi_line_exit_code");

    auto lines = shell.received();
    Expect(!lines.empty() && lines[0] == "eval $'echo a\\necho b'", "shell_multi_line_single_eval",
           lines.empty() ? "nothing sent" : lines[0]);
}

void TestLongLineTruncatedNotTimedOut() {
    Pair p = MakePair();
    FakeShell shell(p.server);
    ShellOptions options = FastOptions();
    options.max_output_bytes = 64 * 1024;
    ShellConnection conn(p.client, options);

    auto start = std::chrono::steady_clock::now();
    CommandResult r = conn.RunCommand("bigline", 10);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    Expect(!r.timed_out && r.stderr_text.empty(), "shell_long_line_not_timed_out", r.stderr_text);
    Expect(Contains(r.stdout_text, "[output truncated]") && r.stdout_text.size() <= options.max_output_bytes + 64,
           "shell_long_line_truncated", std::to_string(r.stdout_text.size()) + " bytes");
    Expect(elapsed.count() < 5000, "shell_long_line_fast", std::to_string(elapsed.count()) + "ms");
    Expect(r.exit_code && *r.exit_code == 0 && !conn.desynchronized(), "shell_long_line_still_in_sync");

    CommandResult next = conn.RunCommand("echo hi", 5);
    Expect(next.stdout_text == "hi\n", "shell_long_line_next_command", "[" + next.stdout_text + "]");
}

void TestHomeCwdSkipped() {
    Pair p = MakePair();
    FakeShell shell(p.server);
    ShellConnection conn(p.client, FastOptions());
    conn.RunCommand("echo hi", 5, "", "~");
    auto lines = shell.received();
    Expect(!lines.empty() && lines[0] == "echo hi", "shell_home_cwd_not_sent");
}

void TestQuoting() {
    Expect(ShellQuote("simple/path.txt") == "simple/path.txt", "quote_safe_unchanged");
    Expect(ShellQuote("") == "''", "quote_empty");
    Expect(ShellQuote("it's") == "'it'\"'\"'s'", "quote_single_quote");
    Expect(AnsiCQuote("a'b\\c\n") == "$'a\\'b\\\\c\\n'", "ansi_c_quote_escapes", AnsiCQuote("a'b\\c\n"));
    Expect(IsValidScreenSessionName("mcp_1a2b.session-2"), "screen_name_valid");
    Expect(!IsValidScreenSessionName("") && !IsValidScreenSessionName("a b") &&
           !IsValidScreenSessionName(std::string(65, 'a')),
           "screen_name_invalid");
    std::string generated = GenerateScreenSessionName();
    Expect(generated.size() == 12 && generated.rfind("mcp_", 0) == 0 && IsValidScreenSessionName(generated),
           "screen_name_generated", generated);
    Expect(ParseExitCodeResponse("echo N:$?\nN:42\n", "N") == 42, "parse_exit_code_skips_echo");
    Expect(ParseExitCodeResponse("garbage\n", "N") == 1, "parse_exit_code_missing_nonce");
}

void TestConnectErrors() {
    ShellOptions options = FastOptions();
    options.address = "";
    bool config_error = false;
    try {
        ShellConnection::Connect(options);
    } catch (const SandboxConfigError&) {
        config_error = true;
    }
    Expect(config_error, "connect_missing_address_is_config_error");

    options.address = "no-port-here";
    config_error = false;
    try {
        ShellConnection::Connect(options);
    } catch (const SandboxConfigError&) {
        config_error = true;
    }
    Expect(config_error, "connect_malformed_address_is_config_error");

    options.address = "unix:/tmp/mcp_gateway_no_such_socket";
    bool runtime_error = false;
    try {
        ShellConnection::Connect(options);
    } catch (const SandboxConfigError&) {
    } catch (const SandboxError& e) {
        runtime_error = Contains(e.what(), "Failed to connect");
    }
    Expect(runtime_error, "connect_refused_is_sandbox_error");
}

// 监听 127.0.0.1 的临时端口，接受一个连接并交给 FakeShell
void TestTcpConnectThroughSandbox() {
    int listener = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (listener < 0 || ::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listener, 1) != 0) {
        Skip("remote_shell_sandbox_tcp", "cannot listen on loopback");
        if (listener >= 0) ::close(listener);
        return;
    }
    socklen_t len = sizeof(addr);
    getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len);
    int port = ntohs(addr.sin_port);

    std::unique_ptr<FakeShell> shell;
    std::thread acceptor([&] {
        int fd = ::accept4(listener, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) shell = std::make_unique<FakeShell>(fd);
    });

    ShellOptions options = FastOptions();
    options.address = "127.0.0.1:" + std::to_string(port);
    RemoteShellSandbox sandbox(options);

    ExecutionRequest request;
    request.code_or_command = "echo hi";
    ExecutionResult result = sandbox.Execute(request);
    acceptor.join();

    Expect(result.status == ExecutionStatus::COMPLETED, "remote_shell_sandbox_tcp_status", result.error_message);
    Expect(result.time_limit_s == 5, "remote_shell_sandbox_default_time_limit");
    std::string text = FormatExecutionResult(result);
    Expect(text == "Exit code: 0\n\nOutput:\n```\nhi\n```", "remote_shell_sandbox_tcp_text", text);

    shell.reset();
    ::close(listener);

    // 端口已关闭: 连接失败转换为 FAILED 文本结果
    ExecutionResult failed = sandbox.Execute(request);
    Expect(failed.status == ExecutionStatus::FAILED &&
           Contains(FormatExecutionResult(failed), "Failed to connect"),
           "remote_shell_sandbox_connect_failure_text", FormatExecutionResult(failed));
}

void TestMissingAddressThroughSandbox() {
    RemoteShellSandbox sandbox(FastOptions());
    ExecutionRequest request;
    request.code_or_command = "echo hi";
    bool config_error = false;
    try {
        sandbox.Execute(request);
    } catch (const SandboxConfigError&) {
        config_error = true;
    }
    Expect(config_error, "remote_shell_sandbox_missing_address");
}

} // namespace

int main() {
    std::cout << "=== Shell Connection Test ===" << std::endl;
    TestEchoAndExitCode();
    TestNonNumericExitCode();
    TestWithoutGreeting();
    TestTimeout();
    TestCwdAndScreenSequence();
    TestHomeCwdSkipped();
    TestMissingCwdStopsCommand();
    TestMultiLineCommandSentAsOneLine();
    TestLongLineTruncatedNotTimedOut();
    TestQuoting();
    TestConnectErrors();
    TestTcpConnectThroughSandbox();
    TestMissingAddressThroughSandbox();
    return Finish("Shell Connection Test");
}
