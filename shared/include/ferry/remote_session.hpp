/**
 * Ferry - Remote session capability consumed by the transfer queue and the sync engine.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/models.hpp"

namespace ferry
{

    // Called with (bytes transferred so far, total bytes) zero or more times per transfer.
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

    class RemoteSession
    {
    public:
        explicit RemoteSession(Site site);
        virtual ~RemoteSession() = default;

        RemoteSession(const RemoteSession &) = delete;
        RemoteSession &operator=(const RemoteSession &) = delete;

        const Site &site() const noexcept { return site_; }

        virtual void connect() = 0;
        // Safe to call on a session that is not connected.
        virtual void disconnect() = 0;
        virtual bool is_connected() const = 0;

        virtual std::vector<RemoteFile> list_directory(const std::string &path) = 0;
        virtual RemoteFile stat(const std::string &path) = 0;
        virtual bool exists(const std::string &path);

        virtual void mkdir(const std::string &path, bool recursive) = 0;
        virtual void rmdir(const std::string &path) = 0;
        virtual void remove(const std::string &path) = 0;
        virtual void rename(const std::string &from, const std::string &to) = 0;

        virtual void upload(const std::filesystem::path &local_path, const std::string &remote_path,
                            const ProgressCallback &progress) = 0;
        virtual void download(const std::string &remote_path, const std::filesystem::path &local_path,
                              const ProgressCallback &progress) = 0;

        virtual void chmod(const std::string &path, std::uint32_t mode) = 0;
        virtual void chown(const std::string &path, std::uint32_t uid, std::uint32_t gid);
        // std::nullopt when the backend cannot compute `algorithm`.
        virtual std::optional<std::string> checksum(const std::string &path, std::string_view algorithm);

        void change_directory(const std::string &path);
        std::string working_directory() const;

    private:
        Site site_;
        mutable std::mutex path_mutex_;
        std::string current_path_{"/"};
    };

    class SessionFactory
    {
    public:
        using Creator = std::function<std::shared_ptr<RemoteSession>(const Site &)>;

        void register_protocol(const std::string &protocol, Creator creator);

        // Unconnected session for `site`; throws ConfigurationError for an unknown protocol.
        std::shared_ptr<RemoteSession> create(const Site &site) const;

        std::vector<std::string> supported_protocols() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, Creator> creators_;
    };

} // namespace ferry
