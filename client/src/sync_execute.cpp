#include "ferry/client/sync_engine.hpp"

#include <system_error>
#include <utility>

#include "ferry/crypto.hpp"
#include "ferry/errors.hpp"
#include "ferry/file_time.hpp"

namespace ferry::client
{

    namespace
    {

        const std::filesystem::path &require_local(const SyncAction &action)
        {
            if (!action.local_path)
            {
                throw Error(ErrorCode::InvalidPath, std::string(to_string(action.kind)) + " action has no local path");
            }
            return *action.local_path;
        }

        const std::string &require_remote(const SyncAction &action)
        {
            if (!action.remote_path)
            {
                throw Error(ErrorCode::InvalidPath, std::string(to_string(action.kind)) + " action has no remote path");
            }
            return *action.remote_path;
        }

        void ensure_local_directory(const std::filesystem::path &directory)
        {
            if (directory.empty())
            {
                return;
            }
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec)
            {
                throw LocalIOError("Cannot create " + directory.string() + ": " + ec.message());
            }
        }

    } // namespace

    SyncResult SyncEngine::execute(const SyncProfile &profile, RemoteSession &session,
                                   std::optional<std::vector<SyncAction>> actions)
    {
        cancelled_ = false;

        SyncResult result;
        result.start_time = std::chrono::system_clock::now();
        result.dry_run = profile.dry_run;
        events_.emit(SyncEvent{.kind = SyncEventKind::Started, .profile_id = profile.id});
        logger_.info("sync", "Starting ", to_string(profile.mode), " sync for ", profile.name,
                     profile.dry_run ? " (dry run)" : "");

        try
        {
            if (!actions)
            {
                actions = compare(profile, session);
            }
            result.actions_planned = std::move(*actions);

            if (profile.dry_run)
            {
                for (const auto &action : result.actions_planned)
                {
                    logger_.info("sync", "[dry run] ", action.describe());
                }
            }
            else
            {
                execute_actions(profile, session, result);
            }
        }
        catch (const std::exception &ex)
        {
            result.end_time = std::chrono::system_clock::now();
            logger_.error("sync", "Sync of ", profile.name, " failed: ", ex.what());
            events_.emit(SyncEvent{.kind = SyncEventKind::Failed, .profile_id = profile.id, .error = ex.what()});
            throw;
        }

        result.end_time = std::chrono::system_clock::now();
        const auto summary = result.summary();
        logger_.info("sync", "Sync of ", profile.name, " finished: ", result.success_count(), " succeeded, ",
                     result.error_count(), " failed", cancelled_ ? " (cancelled)" : "");
        events_.emit(SyncEvent{.kind = SyncEventKind::Completed, .profile_id = profile.id, .summary = summary});
        return result;
    }

    void SyncEngine::execute_actions(const SyncProfile &profile, RemoteSession &session, SyncResult &result)
    {
        const auto total = result.actions_planned.size();
        for (std::size_t index = 0; index < total; ++index)
        {
            if (cancelled_)
            {
                logger_.warn("sync", "Cancelled with ", total - index, " actions remaining");
                break;
            }

            const auto &action = result.actions_planned[index];
            try
            {
                apply(action, profile, session);
            }
            catch (const std::exception &ex)
            {
                logger_.warn("sync", "Failed: ", action.describe(), ": ", ex.what());
                result.errors.push_back(SyncError{.action = action, .message = ex.what()});
                continue;
            }

            result.actions_executed.push_back(action);
            logger_.debug("sync", "Done: ", action.describe());
            events_.emit(SyncEvent{
                .kind = SyncEventKind::Progress,
                .profile_id = profile.id,
                .current = index + 1,
                .total = total,
            });
        }
    }

    void SyncEngine::apply(const SyncAction &action, const SyncProfile &profile, RemoteSession &session)
    {
        switch (action.kind)
        {
        case SyncActionKind::Upload:
            session.upload(require_local(action), require_remote(action), {});
            if (profile.verify_checksums)
            {
                verify_transfer(action, session);
            }
            break;

        case SyncActionKind::Download:
        {
            const auto &local = require_local(action);
            const auto &remote = require_remote(action);
            ensure_local_directory(local.parent_path());
            session.download(remote, local, {});
            if (profile.preserve_timestamps)
            {
                const auto info = session.stat(remote);
                std::error_code ec;
                if (info.modified)
                {
                    std::filesystem::last_write_time(local, to_file_time(*info.modified), ec);
                }
                if (ec)
                {
                    logger_.warn("sync", "Cannot preserve modification time of ", local.string(), ": ",
                                 ec.message());
                }
            }
            if (profile.verify_checksums)
            {
                verify_transfer(action, session);
            }
            break;
        }

        case SyncActionKind::DeleteLocal:
        {
            const auto &local = require_local(action);
            std::error_code ec;
            if (!std::filesystem::remove(local, ec) && !ec)
            {
                throw LocalIOError("Nothing to delete at " + local.string(), ErrorCode::NotFound);
            }
            if (ec)
            {
                throw LocalIOError("Cannot delete " + local.string() + ": " + ec.message());
            }
            break;
        }

        case SyncActionKind::DeleteRemote:
        {
            const auto &remote = require_remote(action);
            if (session.stat(remote).is_directory())
            {
                session.rmdir(remote);
            }
            else
            {
                session.remove(remote);
            }
            break;
        }

        case SyncActionKind::MkdirLocal:
            ensure_local_directory(require_local(action));
            break;

        case SyncActionKind::MkdirRemote:
            try
            {
                session.mkdir(require_remote(action), true);
            }
            catch (const FileOperationError &ex)
            {
                if (ex.code() != ErrorCode::AlreadyExists)
                {
                    throw;
                }
            }
            break;
        }
    }

    void SyncEngine::verify_transfer(const SyncAction &action, RemoteSession &session) const
    {
        const auto remote_sum = session.checksum(*action.remote_path, crypto::kChecksumAlgorithm);
        if (!remote_sum)
        {
            return;
        }
        if (*remote_sum != crypto::hash_file(*action.local_path))
        {
            throw FileOperationError("Checksum mismatch for " + *action.remote_path, ErrorCode::ChecksumMismatch);
        }
    }

} // namespace ferry::client
