#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "ferry/client/logger.hpp"
#include "ferry/events.hpp"
#include "ferry/models.hpp"
#include "ferry/remote_session.hpp"

namespace ferry::client
{

    struct LocalEntry
    {
        std::filesystem::path path;
        bool is_directory{};
        bool is_symlink{};
        // Not scanned: an unfollowed or looping directory link, or a dangling link. Opaque
        // entries are never transferred, and remote entries below them are left alone.
        bool opaque{};
        std::uint64_t size{};
        std::optional<TimePoint> modified{};
    };

    // Keyed by root-relative, forward-slash paths. Ascending order puts every directory
    // before its contents.
    using LocalTree = std::map<std::string, LocalEntry>;
    using RemoteTree = std::map<std::string, RemoteFile>;

    class SyncEngine
    {
    public:
        explicit SyncEngine(Logger logger = Logger());

        // Throws when either tree cannot be scanned completely, including after cancel().
        std::vector<SyncAction> compare(const SyncProfile &profile, RemoteSession &session);

        // Plans first when `actions` is empty. Per-action failures are collected in the result.
        SyncResult execute(const SyncProfile &profile, RemoteSession &session,
                           std::optional<std::vector<SyncAction>> actions = std::nullopt);

        // Stops the running scan or execution before its next entry or action.
        void cancel() noexcept;
        bool cancelled() const noexcept { return cancelled_; }

        LocalTree scan_local(const SyncProfile &profile);
        RemoteTree scan_remote(const SyncProfile &profile, RemoteSession &session);

        static std::vector<SyncAction> plan(const LocalTree &local, const RemoteTree &remote,
                                            const SyncProfile &profile);

        static bool should_include(const std::string &relative_path, const SyncProfile &profile);

        static bool is_modified(const LocalEntry *local, const RemoteFile &remote, const SyncProfile &profile);

        SubscriptionId subscribe(EventChannel<SyncEvent>::Listener listener);
        void unsubscribe(SubscriptionId id);

    private:
        void scan_local_directory(const std::filesystem::path &directory, const SyncProfile &profile,
                                  LocalTree &tree, std::set<std::filesystem::path> &ancestors);
        void scan_remote_directory(const std::string &path, const std::string &relative_prefix,
                                   const SyncProfile &profile, RemoteSession &session, RemoteTree &tree);

        // sync_execute.cpp
        void execute_actions(const SyncProfile &profile, RemoteSession &session, SyncResult &result);
        void apply(const SyncAction &action, const SyncProfile &profile, RemoteSession &session);
        void verify_transfer(const SyncAction &action, RemoteSession &session) const;

        Logger logger_;
        std::atomic<bool> cancelled_{false};
        EventChannel<SyncEvent> events_;
    };

    std::string join_remote_path(const std::string &root, const std::string &relative);

} // namespace ferry::client
