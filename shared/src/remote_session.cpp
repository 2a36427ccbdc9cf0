#include "ferry/remote_session.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "ferry/errors.hpp"

namespace ferry
{

    namespace
    {

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

    } // namespace

    RemoteSession::RemoteSession(Site site) : site_(std::move(site)) {}

    bool RemoteSession::exists(const std::string &path)
    {
        try
        {
            (void)stat(path);
            return true;
        }
        catch (const FileOperationError &ex)
        {
            if (ex.code() == ErrorCode::NotFound)
            {
                return false;
            }
            throw;
        }
    }

    void RemoteSession::chown(const std::string &path, std::uint32_t /*uid*/, std::uint32_t /*gid*/)
    {
        throw FileOperationError("chown not supported by protocol " + site_.protocol + ": " + path,
                                 ErrorCode::Unsupported);
    }

    std::optional<std::string> RemoteSession::checksum(const std::string & /*path*/, std::string_view /*algorithm*/)
    {
        return std::nullopt;
    }

    void RemoteSession::change_directory(const std::string &path)
    {
        const auto info = stat(path);
        if (!info.is_directory())
        {
            throw FileOperationError("Not a directory: " + path, ErrorCode::NotADirectory);
        }
        std::lock_guard lock(path_mutex_);
        current_path_ = info.path.empty() ? path : info.path;
    }

    std::string RemoteSession::working_directory() const
    {
        std::lock_guard lock(path_mutex_);
        return current_path_;
    }

    void SessionFactory::register_protocol(const std::string &protocol, Creator creator)
    {
        std::lock_guard lock(mutex_);
        creators_[lowercase(protocol)] = std::move(creator);
    }

    std::shared_ptr<RemoteSession> SessionFactory::create(const Site &site) const
    {
        Creator creator;
        {
            std::lock_guard lock(mutex_);
            const auto it = creators_.find(lowercase(site.protocol));
            if (it == creators_.end())
            {
                throw ConfigurationError("Unsupported protocol: " + site.protocol);
            }
            creator = it->second;
        }
        return creator(site);
    }

    std::vector<std::string> SessionFactory::supported_protocols() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> protocols;
        protocols.reserve(creators_.size());
        for (const auto &[name, creator] : creators_)
        {
            protocols.push_back(name);
        }
        return protocols;
    }

} // namespace ferry
