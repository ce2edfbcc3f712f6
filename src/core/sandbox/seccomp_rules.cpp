// mcp_gateway/src/core/sandbox/seccomp_rules.cpp
#include "seccomp_rules.h"
#include "sandbox_internal.h"

#include <cerrno>
#include <seccomp.h>

namespace mcp_gateway {

    namespace {

        // 逃逸、内核攻击面与宿主状态修改相关的系统调用
        const char* const kDeniedSyscalls[] = {
            "ptrace", "process_vm_readv", "process_vm_writev",
            "mount", "umount2", "pivot_root", "chroot", "move_mount", "open_tree", "fsopen", "fsmount",
            "setns", "unshare",
            "reboot", "kexec_load", "kexec_file_load",
            "init_module", "finit_module", "delete_module",
            "bpf", "perf_event_open", "userfaultfd",
            "keyctl", "add_key", "request_key",
            "acct", "swapon", "swapoff", "quotactl",
            "settimeofday", "clock_settime", "clock_adjtime", "adjtimex",
            "iopl", "ioperm", "syslog", "vhangup",
            "open_by_handle_at", "name_to_handle_at", "lookup_dcookie",
        };

    } // anonymous namespace

    int LoadSandboxSeccompRules() {
        scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
        if (!ctx) return ERR_SECCOMP_FAILED;

        for (const char* name : kDeniedSyscalls) {
            int nr = seccomp_syscall_resolve_name(name);
            // 当前架构没有该系统调用，跳过
            if (nr == __NR_SCMP_ERROR) continue;
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), nr, 0) != 0) {
                seccomp_release(ctx);
                return ERR_SECCOMP_FAILED;
            }
        }

        if (seccomp_load(ctx) != 0) {
            seccomp_release(ctx);
            return ERR_SECCOMP_FAILED;
        }
        seccomp_release(ctx);
        return EXIT_OK;
    }

} // namespace mcp_gateway
