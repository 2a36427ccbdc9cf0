#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "ferry/remote_session.hpp"

namespace ferry::client
{

    // Session whose remote tree is a directory on this machine; the site's hostname names
    // that directory. Registered under the "file" protocol.
    class LocalSession : public RemoteSession
    {
    public:
        static constexpr const char *kProtocol = "file";

        explicit LocalSession(Site site);

        void connect() override;
        void disconnect() override;
        bool is_connected() const override;

        std::vector<RemoteFile> list_directory(const std::string &path) override;
        RemoteFile stat(const std::string &path) override;

        void mkdir(const std::string &path, bool recursive) override;
        void rmdir(const std::string &path) override;
        void remove(const std::string &path) override;
        void rename(const std::string &from, const std::string &to) override;

        void upload(const std::filesystem::path &local_path, const std::string &remote_path,
                    const ProgressCallback &progress) override;
        void download(const std::string &remote_path, const std::filesystem::path &local_path,
                      const ProgressCallback &progress) override;

        void chmod(const std::string &path, std::uint32_t mode) override;
        std::optional<std::string> checksum(const std::string &path, std::string_view algorithm) override;

    private:
        void ensure_connected() const;
        std::filesystem::path resolve(const std::string &requested) const;
        std::string remote_path_of(const std::filesystem::path &target) const;
        RemoteFile describe(const std::filesystem::path &target) const;

        std::filesystem::path root_;
        std::atomic<bool> connected_{false};
    };

    void register_builtin_protocols(SessionFactory &factory);

} // namespace ferry::client
