#ifndef MCP_GATEWAY_SCRIPT_STAGING_H
#define MCP_GATEWAY_SCRIPT_STAGING_H

#include <filesystem>
#include <string>
#include <sys/types.h>

namespace mcp_gateway {

    /**
     * @brief 临时脚本目录 (RAII)
     *
     * 每次调用独占一个由 mkdtemp 创建的目录，脚本写入其中的固定文件名。
     * 析构时递归删除整个目录，无论执行成功、失败、超时还是抛出异常。
     */
    class StagedScript {
    public:
        /**
         * @brief 创建临时目录并写入源代码
         * @param staging_root 临时目录的父目录 (例如 /tmp)
         * @param file_name 脚本文件名 (例如 script.py)
         * @param source 原样写入的源代码
         * @param owner_uid 宿主为 root 时目录与脚本的属主 (降权后的用户)，-1 表示不修改
         * @param owner_gid 同上
         * @throw SandboxError 创建、写入或修改属主失败
         */
        static StagedScript Create(const std::string& staging_root,
                                   const std::string& file_name,
                                   const std::string& source,
                                   uid_t owner_uid = static_cast<uid_t>(-1),
                                   gid_t owner_gid = static_cast<gid_t>(-1));

        ~StagedScript();

        // 禁止拷贝
        StagedScript(const StagedScript&) = delete;
        StagedScript& operator=(const StagedScript&) = delete;

        // 移动构造
        StagedScript(StagedScript&& other) noexcept;

        // 明确禁止移动赋值，防止作用域哨兵被误用
        StagedScript& operator=(StagedScript&&) = delete;

        const std::filesystem::path& directory() const { return dir_; }
        const std::filesystem::path& script_path() const { return script_; }

    private:
        StagedScript(std::filesystem::path dir, std::filesystem::path script);

        std::filesystem::path dir_;
        std::filesystem::path script_;
        bool released_;
    };

} // namespace mcp_gateway

#endif // MCP_GATEWAY_SCRIPT_STAGING_H
