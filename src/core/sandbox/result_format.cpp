#include "result_format.h"

#include <vector>

namespace mcp_gateway {

    namespace {

        const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

        std::string Fenced(const char* label, const std::string& body)
        {
            return std::string(label) + ":\n```\n" + body + "\n```";
        }

        // 返回从 i 开始的合法 UTF-8 序列长度，非法返回 0
        size_t ValidSequenceLength(const unsigned char* s, size_t i, size_t n)
        {
            unsigned char c = s[i];
            if (c < 0x80) return 1;

            size_t len;
            unsigned char lo = 0x80, hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) lo = 0xA0;       // 过短编码
                if (c == 0xED) hi = 0x9F;       // UTF-16 代理区
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) lo = 0x90;
                if (c == 0xF4) hi = 0x8F;       // > U+10FFFF
            } else {
                return 0;
            }

            if (i + len > n) return 0;
            if (s[i + 1] < lo || s[i + 1] > hi) return 0;
            for (size_t k = 2; k < len; ++k) {
                if (s[i + k] < 0x80 || s[i + k] > 0xBF) return 0;
            }
            return len;
        }

    } // anonymous namespace

    std::string SanitizeUtf8(const std::string& bytes)
    {
        const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
        const size_t n = bytes.size();

        std::string out;
        out.reserve(n);
        size_t i = 0;
        while (i < n) {
            size_t len = ValidSequenceLength(s, i, n);
            if (len == 0) {
                out += kReplacement;
                ++i;
                continue;
            }
            out.append(bytes, i, len);
            i += len;
        }
        return out;
    }

    std::string Trim(const std::string& text)
    {
        const char* ws = " \t\r\n\v\f";
        size_t begin = text.find_first_not_of(ws);
        if (begin == std::string::npos) return "";
        size_t end = text.find_last_not_of(ws);
        return text.substr(begin, end - begin + 1);
    }

    std::string FormatExecutionResult(const ExecutionResult& result, bool lint)
    {
        const std::string stdout_text = Trim(SanitizeUtf8(result.output.stdout_text));
        const std::string stderr_text = Trim(SanitizeUtf8(result.output.stderr_text));

        if (lint && result.status == ExecutionStatus::COMPLETED &&
            result.output.exit_code && *result.output.exit_code == 0 &&
            stderr_text.empty()) {
            // ruff 在没有问题时只打印 "All checks passed!"，统一规范化
            return "No issues found!";
        }

        std::vector<std::string> sections;

        if (result.status == ExecutionStatus::FAILED) {
            sections.push_back("Execution failed: " + SanitizeUtf8(result.error_message));
        } else if (result.status == ExecutionStatus::TIMED_OUT && !result.output.exit_code) {
            sections.push_back("Execution terminated after " + std::to_string(result.time_limit_s) + " seconds");
        }

        if (result.output.exit_code) {
            sections.push_back("Exit code: " + std::to_string(*result.output.exit_code));
        }
        if (!stdout_text.empty()) {
            sections.push_back(Fenced("Output", stdout_text));
        }
        if (!stderr_text.empty()) {
            sections.push_back(Fenced("Error", stderr_text));
        }

        if (result.degraded_isolation) {
            sections.push_back("Note: namespace isolation is unavailable on this host; "
                               "the code ran with resource limits and privilege drop only.");
        }
        if (!result.screen_session.empty()) {
            sections.push_back("Screen session: " + result.screen_session);
        }

        if (sections.empty()) {
            return "No output";
        }

        std::string joined;
        for (size_t i = 0; i < sections.size(); ++i) {
            if (i > 0) joined += "\n\n";
            joined += sections[i];
        }
        return joined;
    }

} // namespace mcp_gateway
