#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ferry/client/dispatch_queue.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/events.hpp"
#include "ferry/models.hpp"
#include "ferry/remote_session.hpp"

namespace ferry::client
{

    struct TransferManagerConfig
    {
        std::size_t max_workers{3};
        std::size_t queue_capacity{1024};
        // Upper bound on how long an idle worker waits before rechecking its stop flag.
        std::chrono::milliseconds poll_interval{250};
    };

    struct QueueStats
    {
        std::size_t total{};
        std::size_t pending{};
        std::size_t running{};
        std::size_t completed{};
        std::size_t failed{};
        std::size_t paused{};
        std::size_t cancelled{};
    };

    // Returns a new, not yet connected session for a site id. Throws ConfigurationError when
    // the site is unknown.
    using SessionProvider = std::function<std::shared_ptr<RemoteSession>(const std::string &site_id)>;

    using CancelToken = std::shared_ptr<std::atomic<bool>>;

    class TransferManager
    {
    public:
        TransferManager(TransferManagerConfig config, SessionProvider provider, Logger logger = Logger());
        ~TransferManager();

        TransferManager(const TransferManager &) = delete;
        TransferManager &operator=(const TransferManager &) = delete;

        void start();
        void stop();
        bool running() const noexcept { return running_; }

        void add(TransferItem item);
        void remove(const std::string &id);
        void pause(const std::string &id);
        void resume(const std::string &id);
        void retry(const std::string &id);
        void clear_completed();

        std::optional<TransferItem> get(const std::string &id) const;
        std::vector<TransferItem> all() const;
        std::vector<TransferItem> active() const;
        QueueStats stats() const;

        SubscriptionId subscribe_transfers(EventChannel<TransferEvent>::Listener listener);
        void unsubscribe_transfers(SubscriptionId id);
        SubscriptionId subscribe_queue(EventChannel<QueueEvent>::Listener listener);
        void unsubscribe_queue(SubscriptionId id);

        const TransferManagerConfig &config() const noexcept { return config_; }

    private:
        struct Worker
        {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> stop;
        };

        struct Claim
        {
            TransferItem item;
            CancelToken token;
        };

        void worker_loop(std::size_t index, std::shared_ptr<std::atomic<bool>> stop_flag);
        std::optional<Claim> claim(const std::string &id);
        void release(const std::string &id);

        // transfer_worker.cpp
        void execute(TransferItem item, const CancelToken &token);
        bool prepare_destination(RemoteSession &session, TransferItem &item);
        void verify_checksum(RemoteSession &session, const TransferItem &item) const;
        void apply_remote_timestamp(RemoteSession &session, const TransferItem &item) const;
        std::shared_ptr<RemoteSession> acquire_session(const std::string &site_id);
        void close_sessions();

        void update_progress(const std::string &id, std::uint64_t transferred, std::uint64_t total);
        void update_paths(const std::string &id, const std::filesystem::path &local_path,
                          const std::string &remote_path);
        void mark_completed(const std::string &id);
        void mark_failed(const std::string &id, const std::string &error);
        void enqueue(const std::string &id);
        void emit(TransferEventKind kind, const TransferItem &item, std::string error = {});
        void notify_if_drained();

        TransferManagerConfig config_;
        SessionProvider provider_;
        Logger logger_;
        DispatchQueue<std::string> queue_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, TransferItem> items_;
        std::unordered_set<std::string> paused_;
        std::unordered_map<std::string, CancelToken> cancel_tokens_;

        std::mutex sessions_mutex_;
        std::unordered_map<std::string, std::shared_ptr<RemoteSession>> sessions_;

        std::mutex lifecycle_mutex_;
        std::vector<Worker> workers_;
        std::atomic<bool> running_{false};

        EventChannel<TransferEvent> transfer_events_;
        EventChannel<QueueEvent> queue_events_;
    };

} // namespace ferry::client
