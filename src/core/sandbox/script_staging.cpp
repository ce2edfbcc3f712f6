#include "script_staging.h"
#include "sandbox_error.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mcp_gateway
{

    namespace fs = std::filesystem;

    namespace {

        bool IsValidFileName(const std::string& name)
        {
            if (name.empty() || name.length() > 64) return false;
            if (name == "." || name == "..") return false;
            return name.find('/') == std::string::npos;
        }

        void WriteAll(int fd, const std::string& data)
        {
            size_t written = 0;
            while (written < data.size()) {
                ssize_t n = ::write(fd, data.data() + written, data.size() - written);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    throw SandboxError(FormatSystemError("写入脚本失败", errno));
                }
                written += static_cast<size_t>(n);
            }
        }

        void RemoveTree(const fs::path& dir)
        {
            std::error_code ec;
            fs::remove_all(dir, ec);
            if (ec) {
                std::cerr << "[沙箱] Cleanup Warning: 无法删除 " << dir << ": " << ec.message() << std::endl;
            }
        }

    } // anonymous namespace

    StagedScript StagedScript::Create(const std::string& staging_root,
                                      const std::string& file_name,
                                      const std::string& source,
                                      uid_t owner_uid,
                                      gid_t owner_gid)
    {
        if (!IsValidFileName(file_name)) {
            throw SandboxError("非法脚本文件名: '" + file_name + "'");
        }

        std::error_code ec;
        fs::create_directories(staging_root, ec);
        if (ec) {
            throw SandboxError("无法创建临时根目录 '" + staging_root + "': " + ec.message());
        }

        // 1. mkdtemp: 名称随机且由内核保证独占创建 (0700)
        std::string tmpl = (fs::path(staging_root) / "mcp_sandbox_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data()) == nullptr) {
            throw SandboxError(FormatSystemError("mkdtemp 失败 (" + tmpl + ")", errno));
        }

        // 从这里开始由 StagedScript 负责清理
        StagedScript staged(fs::path(buf.data()), fs::path(buf.data()) / file_name);

        // 2. 写入脚本: O_EXCL 防止被预先放置的符号链接劫持
        int fd = ::open(staged.script_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
        if (fd < 0) {
            throw SandboxError(FormatSystemError("无法创建脚本文件 " + staged.script_.string(), errno));
        }
        try {
            WriteAll(fd, source);
        } catch (...) {
            ::close(fd);
            throw;
        }
        if (::close(fd) != 0) {
            throw SandboxError(FormatSystemError("关闭脚本文件失败", errno));
        }

        // 3. 宿主以 root 运行时把目录交给降权后的用户，子进程才能读写工作目录
        if (owner_uid != static_cast<uid_t>(-1)) {
            if (::chown(staged.dir_.c_str(), owner_uid, owner_gid) != 0 ||
                ::chown(staged.script_.c_str(), owner_uid, owner_gid) != 0) {
                throw SandboxError(FormatSystemError("无法修改临时目录所有者", errno));
            }
        }

        return staged;
    }

    StagedScript::StagedScript(fs::path dir, fs::path script)
        : dir_(std::move(dir)), script_(std::move(script)), released_(false)
    {
    }

    StagedScript::StagedScript(StagedScript&& other) noexcept
        : dir_(std::move(other.dir_)), script_(std::move(other.script_)), released_(other.released_)
    {
        other.released_ = true;
    }

    StagedScript::~StagedScript()
    {
        if (released_ || dir_.empty()) return;
        RemoveTree(dir_);
    }

} // namespace mcp_gateway
