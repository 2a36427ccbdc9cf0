#include "ferry/client/sync_engine.hpp"

#include <fnmatch.h>

#include <cmath>
#include <limits>
#include <system_error>
#include <utility>

#include "ferry/errors.hpp"
#include "ferry/file_time.hpp"

namespace ferry::client
{

    namespace
    {
        // Timestamps closer than this are treated as equal when checking for modifications.
        constexpr double kTimestampToleranceSeconds = 2.0;

        bool glob_match(const std::string &pattern, const std::string &path)
        {
            return ::fnmatch(pattern.c_str(), path.c_str(), FNM_NOESCAPE) == 0;
        }

        ErrorCode scan_error_code(const std::error_code &ec)
        {
            return ec == std::errc::permission_denied ? ErrorCode::PermissionDenied : ErrorCode::IoFailure;
        }

        SyncAction make_action(SyncActionKind kind, std::optional<std::filesystem::path> local_path,
                               std::optional<std::string> remote_path, std::uint64_t size, std::string reason)
        {
            return SyncAction{
                .kind = kind,
                .local_path = std::move(local_path),
                .remote_path = std::move(remote_path),
                .size = size,
                .reason = std::move(reason),
            };
        }

        // True when an ancestor of `relative` is a local directory that was never scanned. Remote
        // entries below it are unknown to the local side and must not be treated as extra.
        bool inside_opaque_directory(const LocalTree &local, const std::string &relative)
        {
            auto slash = relative.rfind('/');
            while (slash != std::string::npos)
            {
                const auto parent = local.find(relative.substr(0, slash));
                if (parent != local.end() && parent->second.opaque)
                {
                    return true;
                }
                slash = slash == 0 ? std::string::npos : relative.rfind('/', slash - 1);
            }
            return false;
        }

        // Local side authoritative; shared by mirror and upload-only.
        void plan_uploads(const LocalTree &local, const RemoteTree &remote, const SyncProfile &profile,
                          std::vector<SyncAction> &actions)
        {
            for (const auto &[relative, entry] : local)
            {
                if (entry.opaque && !entry.is_directory)
                {
                    continue;
                }
                const auto remote_path = join_remote_path(profile.remote_path, relative);
                const auto remote_it = remote.find(relative);
                if (remote_it == remote.end())
                {
                    if (entry.is_directory)
                    {
                        actions.push_back(make_action(SyncActionKind::MkdirRemote, entry.path, remote_path, 0,
                                                      "new directory"));
                    }
                    else
                    {
                        actions.push_back(make_action(SyncActionKind::Upload, entry.path, remote_path, entry.size,
                                                      "new file"));
                    }
                }
                else if (!entry.is_directory && SyncEngine::is_modified(&entry, remote_it->second, profile))
                {
                    actions.push_back(make_action(SyncActionKind::Upload, entry.path, remote_path, entry.size,
                                                  "modified"));
                }
            }
        }

        std::vector<SyncAction> plan_mirror(const LocalTree &local, const RemoteTree &remote,
                                            const SyncProfile &profile)
        {
            std::vector<SyncAction> actions;
            plan_uploads(local, remote, profile, actions);
            if (!profile.delete_extra)
            {
                return actions;
            }
            // Descending order removes a directory's contents before the directory itself.
            for (auto it = remote.rbegin(); it != remote.rend(); ++it)
            {
                const auto &[relative, file] = *it;
                if (local.find(relative) == local.end() && !inside_opaque_directory(local, relative))
                {
                    actions.push_back(make_action(SyncActionKind::DeleteRemote, std::nullopt,
                                                  join_remote_path(profile.remote_path, relative), 0,
                                                  file.is_directory() ? "extra directory" : "extra file"));
                }
            }
            return actions;
        }

        std::vector<SyncAction> plan_upload_only(const LocalTree &local, const RemoteTree &remote,
                                                 const SyncProfile &profile)
        {
            std::vector<SyncAction> actions;
            plan_uploads(local, remote, profile, actions);
            return actions;
        }

        std::vector<SyncAction> plan_download_only(const LocalTree &local, const RemoteTree &remote,
                                                   const SyncProfile &profile)
        {
            std::vector<SyncAction> actions;
            for (const auto &[relative, file] : remote)
            {
                if (inside_opaque_directory(local, relative))
                {
                    continue;
                }
                const auto local_path = profile.local_path / relative;
                const auto remote_path = join_remote_path(profile.remote_path, relative);
                const auto local_it = local.find(relative);
                if (local_it == local.end())
                {
                    if (file.is_directory())
                    {
                        actions.push_back(make_action(SyncActionKind::MkdirLocal, local_path, remote_path, 0,
                                                      "new directory"));
                    }
                    else
                    {
                        actions.push_back(make_action(SyncActionKind::Download, local_path, remote_path, file.size,
                                                      "new file"));
                    }
                }
                else if (!file.is_directory() && !local_it->second.opaque &&
                         SyncEngine::is_modified(&local_it->second, file, profile))
                {
                    actions.push_back(make_action(SyncActionKind::Download, local_path, remote_path, file.size,
                                                  "modified"));
                }
            }
            return actions;
        }

        std::int64_t seconds_or_oldest(const std::optional<TimePoint> &time)
        {
            return time ? rounded_unix_seconds(*time) : std::numeric_limits<std::int64_t>::min();
        }

        std::vector<SyncAction> plan_bidirectional(const LocalTree &local, const RemoteTree &remote,
                                                   const SyncProfile &profile)
        {
            std::set<std::string> paths;
            for (const auto &[relative, entry] : local)
            {
                paths.insert(relative);
            }
            for (const auto &[relative, file] : remote)
            {
                paths.insert(relative);
            }

            std::vector<SyncAction> actions;
            for (const auto &relative : paths)
            {
                const auto local_it = local.find(relative);
                const auto remote_it = remote.find(relative);
                const auto remote_path = join_remote_path(profile.remote_path, relative);

                if (local_it != local.end() && remote_it != remote.end())
                {
                    const auto &entry = local_it->second;
                    const auto &file = remote_it->second;
                    if (entry.is_directory || file.is_directory() || entry.opaque)
                    {
                        continue;
                    }
                    const auto local_seconds = seconds_or_oldest(entry.modified);
                    const auto remote_seconds = seconds_or_oldest(file.modified);
                    if (local_seconds > remote_seconds)
                    {
                        actions.push_back(make_action(SyncActionKind::Upload, entry.path, remote_path, entry.size,
                                                      "local newer"));
                    }
                    else if (remote_seconds > local_seconds)
                    {
                        actions.push_back(make_action(SyncActionKind::Download, entry.path, remote_path, file.size,
                                                      "remote newer"));
                    }
                }
                else if (local_it != local.end())
                {
                    const auto &entry = local_it->second;
                    if (entry.opaque && !entry.is_directory)
                    {
                        continue;
                    }
                    if (entry.is_directory)
                    {
                        actions.push_back(make_action(SyncActionKind::MkdirRemote, entry.path, remote_path, 0,
                                                      "local only"));
                    }
                    else
                    {
                        actions.push_back(make_action(SyncActionKind::Upload, entry.path, remote_path, entry.size,
                                                      "local only"));
                    }
                }
                else if (!inside_opaque_directory(local, relative))
                {
                    const auto &file = remote_it->second;
                    const auto local_path = profile.local_path / relative;
                    if (file.is_directory())
                    {
                        actions.push_back(make_action(SyncActionKind::MkdirLocal, local_path, remote_path, 0,
                                                      "remote only"));
                    }
                    else
                    {
                        actions.push_back(make_action(SyncActionKind::Download, local_path, remote_path, file.size,
                                                      "remote only"));
                    }
                }
            }
            return actions;
        }

    } // namespace

    std::string join_remote_path(const std::string &root, const std::string &relative)
    {
        auto base = root;
        while (!base.empty() && base.back() == '/')
        {
            base.pop_back();
        }
        if (relative.empty())
        {
            return base.empty() ? std::string("/") : base;
        }
        return base + "/" + relative;
    }

    SyncEngine::SyncEngine(Logger logger) : logger_(std::move(logger)) {}

    std::vector<SyncAction> SyncEngine::compare(const SyncProfile &profile, RemoteSession &session)
    {
        cancelled_ = false;
        try
        {
            const auto local = scan_local(profile);
            const auto remote = scan_remote(profile, session);
            if (cancelled_)
            {
                throw Error(ErrorCode::Cancelled, "Comparison of " + profile.name + " was cancelled");
            }
            auto actions = plan(local, remote, profile);
            logger_.info("sync", "Profile ", profile.name, ": ", local.size(), " local and ", remote.size(),
                         " remote entries, ", actions.size(), " actions planned (", to_string(profile.mode), ")");
            return actions;
        }
        catch (const std::exception &ex)
        {
            logger_.error("sync", "Failed to compare folders for ", profile.name, ": ", ex.what());
            throw;
        }
    }

    void SyncEngine::cancel() noexcept
    {
        cancelled_ = true;
    }

    LocalTree SyncEngine::scan_local(const SyncProfile &profile)
    {
        LocalTree tree;
        std::error_code ec;
        const auto status = std::filesystem::status(profile.local_path, ec);
        if (!std::filesystem::exists(status))
        {
            logger_.info("sync", "Local root ", profile.local_path.string(), " does not exist yet");
            return tree;
        }
        if (!std::filesystem::is_directory(status))
        {
            throw LocalIOError("Local root is not a directory: " + profile.local_path.string(),
                               ErrorCode::NotADirectory);
        }

        std::set<std::filesystem::path> ancestors;
        ancestors.insert(std::filesystem::weakly_canonical(profile.local_path, ec));
        scan_local_directory(profile.local_path, profile, tree, ancestors);
        return tree;
    }

    void SyncEngine::scan_local_directory(const std::filesystem::path &directory, const SyncProfile &profile,
                                          LocalTree &tree, std::set<std::filesystem::path> &ancestors)
    {
        std::error_code ec;
        std::filesystem::directory_iterator it(directory, ec);
        if (ec)
        {
            throw LocalIOError("Cannot scan " + directory.string() + ": " + ec.message(), scan_error_code(ec));
        }

        for (; it != std::filesystem::directory_iterator(); it.increment(ec))
        {
            if (ec || cancelled_)
            {
                break;
            }
            const auto &path = it->path();
            const auto relative = path.lexically_relative(profile.local_path).generic_string();
            if (!should_include(relative, profile))
            {
                continue;
            }

            std::error_code entry_ec;
            LocalEntry entry;
            entry.path = path;
            entry.is_symlink = it->is_symlink(entry_ec);
            entry.is_directory = it->is_directory(entry_ec);
            if (!entry.is_directory)
            {
                entry.size = it->file_size(entry_ec);
                if (entry_ec && !entry.is_symlink)
                {
                    throw LocalIOError("Cannot read size of " + path.string() + ": " + entry_ec.message(),
                                       scan_error_code(entry_ec));
                }
                if (entry_ec)
                {
                    logger_.warn("sync", "Leaving dangling link ", path.string(), " untouched");
                    entry.size = 0;
                    entry.opaque = true;
                    tree[relative] = entry;
                    continue;
                }
            }
            const auto modified = it->last_write_time(entry_ec);
            if (!entry_ec)
            {
                entry.modified = to_system_time(modified);
            }
            if (!entry.is_directory)
            {
                tree[relative] = entry;
                continue;
            }
            if (entry.is_symlink && !profile.follow_symlinks)
            {
                entry.opaque = true;
                tree[relative] = entry;
                continue;
            }

            // A followed link that resolves to one of its own ancestors would recurse forever.
            const auto canonical = std::filesystem::weakly_canonical(path, entry_ec);
            if (entry_ec || !ancestors.insert(canonical).second)
            {
                logger_.warn("sync", "Not descending into ", path.string(), " (symlink loop)");
                entry.opaque = true;
                tree[relative] = entry;
                continue;
            }
            tree[relative] = entry;
            scan_local_directory(path, profile, tree, ancestors);
            ancestors.erase(canonical);
        }
        if (ec)
        {
            throw LocalIOError("Error scanning " + directory.string() + ": " + ec.message(), scan_error_code(ec));
        }
    }

    RemoteTree SyncEngine::scan_remote(const SyncProfile &profile, RemoteSession &session)
    {
        RemoteTree tree;
        if (!session.exists(profile.remote_path))
        {
            logger_.info("sync", "Remote root ", profile.remote_path, " does not exist yet");
            return tree;
        }
        scan_remote_directory(profile.remote_path, {}, profile, session, tree);
        return tree;
    }

    void SyncEngine::scan_remote_directory(const std::string &path, const std::string &relative_prefix,
                                           const SyncProfile &profile, RemoteSession &session, RemoteTree &tree)
    {
        if (cancelled_)
        {
            return;
        }
        const auto items = session.list_directory(path);
        for (const auto &item : items)
        {
            if (cancelled_)
            {
                break;
            }
            if (item.name.empty() || item.name == "." || item.name == "..")
            {
                continue;
            }
            const auto relative = relative_prefix.empty() ? item.name : relative_prefix + "/" + item.name;
            if (!should_include(relative, profile))
            {
                continue;
            }
            tree[relative] = item;

            if (item.is_directory())
            {
                scan_remote_directory(item.path.empty() ? join_remote_path(path, item.name) : item.path, relative,
                                      profile, session, tree);
            }
        }
    }

    std::vector<SyncAction> SyncEngine::plan(const LocalTree &local, const RemoteTree &remote,
                                             const SyncProfile &profile)
    {
        switch (profile.mode)
        {
        case SyncMode::Mirror:
            return plan_mirror(local, remote, profile);
        case SyncMode::Bidirectional:
            return plan_bidirectional(local, remote, profile);
        case SyncMode::UploadOnly:
            return plan_upload_only(local, remote, profile);
        case SyncMode::DownloadOnly:
            return plan_download_only(local, remote, profile);
        }
        return {};
    }

    bool SyncEngine::should_include(const std::string &relative_path, const SyncProfile &profile)
    {
        if (!profile.include_patterns.empty())
        {
            bool included = false;
            for (const auto &pattern : profile.include_patterns)
            {
                if (glob_match(pattern, relative_path))
                {
                    included = true;
                    break;
                }
            }
            if (!included)
            {
                return false;
            }
        }
        for (const auto &pattern : profile.exclude_patterns)
        {
            if (glob_match(pattern, relative_path))
            {
                return false;
            }
        }
        return true;
    }

    bool SyncEngine::is_modified(const LocalEntry *local, const RemoteFile &remote, const SyncProfile &profile)
    {
        if (!local)
        {
            return true;
        }
        if (local->is_directory || remote.is_directory())
        {
            return false;
        }
        std::error_code ec;
        if (!std::filesystem::exists(local->path, ec))
        {
            return true;
        }
        if (local->size != remote.size)
        {
            return true;
        }
        if (profile.preserve_timestamps && remote.modified && local->modified)
        {
            const auto delta = std::chrono::duration<double>(*local->modified - *remote.modified).count();
            if (std::abs(delta) > kTimestampToleranceSeconds)
            {
                return true;
            }
        }
        return false;
    }

    SubscriptionId SyncEngine::subscribe(EventChannel<SyncEvent>::Listener listener)
    {
        return events_.subscribe(std::move(listener));
    }

    void SyncEngine::unsubscribe(SubscriptionId id)
    {
        events_.unsubscribe(id);
    }

} // namespace ferry::client
