#include "resource_limiter.h"
#include "sandbox_internal.h"
#include "sandbox_error.h"

#include <cstring>
#include <unordered_set>

// 严重警告: ApplyResourceLimits 运行在子进程中，必须遵守 Async-Signal-Safe C 风格
// 禁止使用: malloc/new, exceptions, STL, iostream

namespace mcp_gateway {

    namespace {

        bool SetLimit(int resource, rlim_t value)
        {
            rlimit lim;
            lim.rlim_cur = (value == 0) ? RLIM_INFINITY : value;
            lim.rlim_max = lim.rlim_cur;
            return setrlimit(resource, &lim) == 0;
        }

    } // anonymous namespace

    int ApplyResourceLimits(const ResourceLimitProfile& profile)
    {
        if (!SetLimit(RLIMIT_AS, profile.address_space_bytes)) return ERR_RLIMIT_MEMORY;
        if (!SetLimit(RLIMIT_CPU, profile.cpu_time_seconds)) return ERR_RLIMIT_CPU;
        if (!SetLimit(RLIMIT_NPROC, profile.max_processes)) return ERR_RLIMIT_NPROC;
        if (!SetLimit(RLIMIT_FSIZE, profile.max_file_size_bytes)) return ERR_RLIMIT_FSIZE;

        rlimit core_limit;
        core_limit.rlim_cur = 0;
        core_limit.rlim_max = 0;
        if (setrlimit(RLIMIT_CORE, &core_limit) == -1) return ERR_RLIMIT_CORE;

        return EXIT_OK;
    }

    void ValidateProfile(const ResourceLimitProfile& profile)
    {
        // rlim_t 为无符号类型，负数在配置加载时已被拒绝；这里只挡住明显不可用的值
        if (profile.address_space_bytes != 0 && profile.address_space_bytes < 16ULL * 1024 * 1024) {
            throw SandboxConfigError("limits.address_space_mb 过小，解释器无法启动 (最少 16MB)");
        }
        if (profile.max_file_size_bytes != 0 && profile.max_file_size_bytes < 4096) {
            throw SandboxConfigError("limits.max_file_size_mb 过小，无法写入脚本文件");
        }
    }

    std::vector<std::string> BuildAllowedEnvironment(const std::vector<std::string>& allow_list,
                                                     char* const* source_env)
    {
        std::vector<std::string> result;
        if (source_env == nullptr) return result;

        std::unordered_set<std::string> allowed(allow_list.begin(), allow_list.end());
        for (char* const* entry = source_env; *entry != nullptr; ++entry) {
            const char* eq = std::strchr(*entry, '=');
            if (eq == nullptr) continue;
            std::string name(*entry, static_cast<size_t>(eq - *entry));
            if (allowed.count(name) != 0) {
                result.emplace_back(*entry);
            }
        }
        return result;
    }

} // namespace mcp_gateway
