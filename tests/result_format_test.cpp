#include <string>

#include "result_format.h"
#include "sandbox.h"
#include "test_harness.h"

using namespace mcp_gateway;
using namespace test_harness;

namespace {

ExecutionResult Completed(int exit_code, const std::string& out, const std::string& err) {
    ExecutionResult r;
    r.status = ExecutionStatus::COMPLETED;
    r.output.exit_code = exit_code;
    r.output.stdout_text = out;
    r.output.stderr_text = err;
    r.time_limit_s = 10;
    return r;
}

void TestSuccessfulRun() {
    std::string text = FormatExecutionResult(Completed(0, "hello world\n", ""));
    Expect(text == "Exit code: 0\n\nOutput:\n```\nhello world\n```", "format_success", text);
}

void TestBothStreamsKept() {
    std::string text = FormatExecutionResult(Completed(1, "partial\n", "Traceback: boom\n"));
    Expect(Contains(text, "Exit code: 1") && Contains(text, "Output:\n```\npartial\n```") &&
           Contains(text, "Error:\n```\nTraceback: boom\n```"),
           "format_keeps_stdout_and_stderr", text);
    Expect(text.find("Output:") < text.find("Error:"), "format_output_before_error", text);
}

void TestTimeout() {
    ExecutionResult r;
    r.status = ExecutionStatus::TIMED_OUT;
    r.time_limit_s = 2;
    r.output.stdout_text = "tick\n";
    std::string text = FormatExecutionResult(r);
    Expect(Contains(text, "Execution terminated after 2 seconds"), "format_timeout_banner", text);
    Expect(Contains(text, "tick"), "format_timeout_partial_output", text);
    Expect(!Contains(text, "Exit code"), "format_timeout_no_exit_code", text);
}

void TestShellTimeout() {
    ExecutionResult r;
    r.status = ExecutionStatus::TIMED_OUT;
    r.time_limit_s = 5;
    r.output.exit_code = 1;
    r.output.stderr_text = "Command timed out";
    std::string text = FormatExecutionResult(r);
    Expect(Contains(text, "Exit code: 1") && Contains(text, "Command timed out") &&
           !Contains(text, "Execution terminated"),
           "format_shell_timeout", text);
}

void TestFailure() {
    ExecutionResult r;
    r.status = ExecutionStatus::FAILED;
    r.error_message = "interpreter not found: /nonexistent/python3";
    std::string text = FormatExecutionResult(r);
    Expect(text == "Execution failed: interpreter not found: /nonexistent/python3", "format_failed", text);
}

void TestLint() {
    Expect(FormatExecutionResult(Completed(0, "All checks passed!\n", ""), true) == "No issues found!",
           "format_lint_clean");

    std::string text = FormatExecutionResult(Completed(1, "script.py:1:8: F401 `os` imported but unused\n", ""), true);
    Expect(Contains(text, "F401") && Contains(text, "Exit code: 1"), "format_lint_diagnostics", text);
}

void TestNoOutput() {
    ExecutionResult r;
    Expect(FormatExecutionResult(r) == "No output", "format_nothing_at_all");

    std::string text = FormatExecutionResult(Completed(0, "   \n\n", ""));
    Expect(text == "Exit code: 0", "format_whitespace_only_output", text);
}

void TestNotes() {
    ExecutionResult r = Completed(0, "ok", "");
    r.degraded_isolation = true;
    r.screen_session = "mcp_1a2b3c4d";
    std::string text = FormatExecutionResult(r);
    Expect(Contains(text, "namespace isolation is unavailable"), "format_degraded_note", text);
    Expect(Contains(text, "Screen session: mcp_1a2b3c4d"), "format_screen_note", text);
}

void TestSanitizeUtf8() {
    Expect(SanitizeUtf8("plain ascii") == "plain ascii", "utf8_ascii_unchanged");
    Expect(SanitizeUtf8("\xE4\xBD\xA0\xE5\xA5\xBD") == "\xE4\xBD\xA0\xE5\xA5\xBD", "utf8_valid_multibyte_unchanged");
    Expect(SanitizeUtf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b", "utf8_invalid_byte_replaced");
    Expect(SanitizeUtf8("\xE4\xBD") == "\xEF\xBF\xBD\xEF\xBF\xBD", "utf8_truncated_sequence_replaced");
    Expect(SanitizeUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD", "utf8_overlong_replaced");

    std::string text = FormatExecutionResult(Completed(0, "bytes: \xFE\xFF\n", ""));
    Expect(Contains(text, "\xEF\xBF\xBD"), "format_sanitizes_output", text);
}

void TestTrim() {
    Expect(Trim("  \n hi \t\n") == "hi", "trim_both_ends");
    Expect(Trim(" \n ").empty(), "trim_whitespace_only");
}

} // namespace

int main() {
    std::cout << "=== Result Format Test ===" << std::endl;
    TestSuccessfulRun();
    TestBothStreamsKept();
    TestTimeout();
    TestShellTimeout();
    TestFailure();
    TestLint();
    TestNoOutput();
    TestNotes();
    TestSanitizeUtf8();
    TestTrim();
    return Finish("Result Format Test");
}
