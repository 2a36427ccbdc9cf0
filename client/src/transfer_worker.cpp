#include "ferry/client/transfer_manager.hpp"

#include <filesystem>
#include <system_error>

#include "ferry/crypto.hpp"
#include "ferry/errors.hpp"
#include "ferry/file_time.hpp"

namespace ferry::client
{

    namespace
    {

        std::string remote_parent(const std::string &remote_path)
        {
            const auto slash = remote_path.find_last_of('/');
            if (slash == std::string::npos)
            {
                return {};
            }
            if (slash == 0)
            {
                return "/";
            }
            return remote_path.substr(0, slash);
        }

        // "report.txt" -> "report (1).txt", "report (2).txt", ...
        std::string numbered_name(const std::string &name, int counter)
        {
            const std::filesystem::path as_path(name);
            const auto stem = as_path.stem().string();
            const auto extension = as_path.extension().string();
            return stem + " (" + std::to_string(counter) + ")" + extension;
        }

        std::string sibling(const std::string &remote_path, const std::string &name)
        {
            const auto parent = remote_parent(remote_path);
            if (parent.empty())
            {
                return name;
            }
            if (parent == "/")
            {
                return "/" + name;
            }
            return parent + "/" + name;
        }

        std::string remote_name(const std::string &remote_path)
        {
            const auto slash = remote_path.find_last_of('/');
            return slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
        }

    } // namespace

    void TransferManager::execute(TransferItem item, const CancelToken &token)
    {
        try
        {
            auto session = acquire_session(item.site_id);

            if (!prepare_destination(*session, item))
            {
                logger_.transfer(spdlog::level::info, item, "destination exists, skipped");
                mark_completed(item.id);
                return;
            }

            const auto id = item.id;
            const ProgressCallback progress = [this, id, token](std::uint64_t transferred, std::uint64_t total)
            {
                if (*token)
                {
                    throw TransferCancelled();
                }
                update_progress(id, transferred, total);
            };

            if (item.direction == TransferDirection::Upload)
            {
                session->upload(item.local_path, item.remote_path, progress);
            }
            else
            {
                session->download(item.remote_path, item.local_path, progress);
                if (item.preserve_timestamp)
                {
                    apply_remote_timestamp(*session, item);
                }
            }

            if (*token)
            {
                throw TransferCancelled();
            }
            if (item.verify_checksum)
            {
                verify_checksum(*session, item);
            }
            mark_completed(item.id);
        }
        catch (const TransferCancelled &)
        {
            logger_.transfer(spdlog::level::info, item, "abandoned after cancellation");
        }
        catch (const std::exception &ex)
        {
            mark_failed(item.id, ex.what());
        }
    }

    bool TransferManager::prepare_destination(RemoteSession &session, TransferItem &item)
    {
        const bool upload = item.direction == TransferDirection::Upload;

        if (upload && item.size == 0)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(item.local_path, ec);
            if (ec)
            {
                throw LocalIOError("Cannot read " + item.local_path.string() + ": " + ec.message());
            }
            item.size = size;
            update_progress(item.id, 0, size);
        }

        if (item.create_directories)
        {
            if (upload)
            {
                const auto parent = remote_parent(item.remote_path);
                if (!parent.empty() && parent != "/" && !session.exists(parent))
                {
                    session.mkdir(parent, true);
                }
            }
            else if (item.local_path.has_parent_path())
            {
                std::error_code ec;
                std::filesystem::create_directories(item.local_path.parent_path(), ec);
                if (ec)
                {
                    throw LocalIOError("Cannot create " + item.local_path.parent_path().string() + ": " +
                                       ec.message());
                }
            }
        }

        auto destination_exists = [&]()
        {
            if (upload)
            {
                return session.exists(item.remote_path);
            }
            std::error_code ec;
            return std::filesystem::exists(item.local_path, ec);
        };

        switch (item.overwrite_mode)
        {
        case OverwriteMode::Ask:
        case OverwriteMode::Overwrite:
            return true;
        case OverwriteMode::Skip:
            return !destination_exists();
        case OverwriteMode::Rename:
            if (!destination_exists())
            {
                return true;
            }
            break;
        }

        const auto original_remote = item.remote_path;
        const auto original_local = item.local_path;
        for (int counter = 1;; ++counter)
        {
            if (upload)
            {
                item.remote_path = sibling(original_remote, numbered_name(remote_name(original_remote), counter));
            }
            else
            {
                item.local_path = original_local.parent_path() /
                                  numbered_name(original_local.filename().string(), counter);
            }
            if (!destination_exists())
            {
                break;
            }
        }
        update_paths(item.id, item.local_path, item.remote_path);
        logger_.transfer(spdlog::level::info, item,
                         "destination exists, writing to " +
                             (upload ? item.remote_path : item.local_path.string()));
        return true;
    }

    void TransferManager::verify_checksum(RemoteSession &session, const TransferItem &item) const
    {
        const auto remote_sum = session.checksum(item.remote_path, crypto::kChecksumAlgorithm);
        if (!remote_sum)
        {
            return;
        }
        const auto local_sum = crypto::hash_file(item.local_path);
        if (*remote_sum != local_sum)
        {
            throw FileOperationError("Checksum mismatch for " + item.remote_path, ErrorCode::ChecksumMismatch);
        }
    }

    void TransferManager::apply_remote_timestamp(RemoteSession &session, const TransferItem &item) const
    {
        const auto info = session.stat(item.remote_path);
        if (!info.modified)
        {
            return;
        }
        std::error_code ec;
        std::filesystem::last_write_time(item.local_path, to_file_time(*info.modified), ec);
        if (ec)
        {
            logger_.transfer(spdlog::level::warn, item, "cannot preserve modification time: " + ec.message());
        }
    }

    std::shared_ptr<RemoteSession> TransferManager::acquire_session(const std::string &site_id)
    {
        {
            std::lock_guard lock(sessions_mutex_);
            auto it = sessions_.find(site_id);
            if (it != sessions_.end() && it->second->is_connected())
            {
                return it->second;
            }
        }

        // Connect outside the lock; two workers may both reconnect a stale session.
        auto session = provider_(site_id);
        if (!session)
        {
            throw ConfigurationError("No session available for site " + site_id);
        }
        session->connect();

        std::lock_guard lock(sessions_mutex_);
        auto &cached = sessions_[site_id];
        if (cached && cached != session && cached->is_connected())
        {
            session->disconnect();
            return cached;
        }
        cached = session;
        logger_.info("session", "Connected to site ", site_id);
        return session;
    }

    void TransferManager::close_sessions()
    {
        std::unordered_map<std::string, std::shared_ptr<RemoteSession>> sessions;
        {
            std::lock_guard lock(sessions_mutex_);
            sessions.swap(sessions_);
        }
        for (auto &[site_id, session] : sessions)
        {
            try
            {
                session->disconnect();
            }
            catch (const std::exception &ex)
            {
                logger_.warn("session", "Ignoring error while closing session for ", site_id, ": ", ex.what());
            }
        }
    }

} // namespace ferry::client
