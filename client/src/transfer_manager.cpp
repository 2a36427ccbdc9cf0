#include "ferry/client/transfer_manager.hpp"

#include <algorithm>
#include <utility>

#include "ferry/errors.hpp"

namespace ferry::client
{

    TransferManager::TransferManager(TransferManagerConfig config, SessionProvider provider, Logger logger)
        : config_(std::move(config)),
          provider_(std::move(provider)),
          logger_(std::move(logger)),
          queue_(config_.queue_capacity)
    {
        if (config_.max_workers == 0)
        {
            throw ConfigurationError("max_workers must be at least 1");
        }
        if (!provider_)
        {
            throw ConfigurationError("Transfer manager requires a session provider");
        }
    }

    TransferManager::~TransferManager()
    {
        stop();
    }

    void TransferManager::start()
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (running_)
        {
            return;
        }
        running_ = true;

        // Dispatch requests dropped by an earlier stop() are re-issued; duplicates are harmless
        // because a worker only claims items that are still pending.
        std::vector<std::string> pending;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[id, item] : items_)
            {
                if (item.status == TransferStatus::Pending)
                {
                    pending.push_back(id);
                }
            }
        }
        for (const auto &id : pending)
        {
            enqueue(id);
        }

        workers_.reserve(config_.max_workers);
        for (std::size_t i = 0; i < config_.max_workers; ++i)
        {
            auto stop_flag = std::make_shared<std::atomic<bool>>(false);
            workers_.push_back(Worker{std::thread([this, i, stop_flag]
                                                  { worker_loop(i, stop_flag); }),
                                      stop_flag});
        }

        queue_events_.emit(QueueEvent{QueueEventKind::Started});
        logger_.info("queue", "Transfer manager started with ", config_.max_workers, " workers");
    }

    void TransferManager::stop()
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (!running_)
        {
            return;
        }
        running_ = false;

        for (auto &worker : workers_)
        {
            *worker.stop = true;
        }
        for (auto &worker : workers_)
        {
            if (worker.thread.joinable())
            {
                worker.thread.join();
            }
        }
        workers_.clear();

        close_sessions();

        queue_events_.emit(QueueEvent{QueueEventKind::Paused});
        logger_.info("queue", "Transfer manager stopped");
    }

    void TransferManager::add(TransferItem item)
    {
        if (item.id.empty())
        {
            item.id = generate_id();
        }
        const auto id = item.id;
        bool paused = false;
        {
            std::lock_guard lock(mutex_);
            paused = paused_.contains(id);
            items_[id] = item;
        }
        if (!paused)
        {
            enqueue(id);
        }
        emit(TransferEventKind::Added, item);
        logger_.info("queue", "Added transfer: ", item.local_path.string(), " <-> ", item.remote_path);
    }

    void TransferManager::remove(const std::string &id)
    {
        std::optional<TransferItem> cancelled;
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end())
            {
                paused_.erase(id);
                return;
            }
            if (it->second.status == TransferStatus::Running)
            {
                it->second.status = TransferStatus::Cancelled;
                if (auto token = cancel_tokens_.find(id); token != cancel_tokens_.end())
                {
                    *token->second = true;
                }
                cancelled = it->second;
            }
            items_.erase(it);
            paused_.erase(id);
        }
        if (cancelled)
        {
            emit(TransferEventKind::Cancelled, *cancelled);
            logger_.transfer(spdlog::level::info, *cancelled, "cancelled while running");
        }
    }

    void TransferManager::pause(const std::string &id)
    {
        std::optional<TransferItem> paused;
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end() || it->second.status != TransferStatus::Pending)
            {
                return;
            }
            it->second.status = TransferStatus::Paused;
            paused_.insert(id);
            paused = it->second;
        }
        emit(TransferEventKind::Paused, *paused);
    }

    void TransferManager::resume(const std::string &id)
    {
        std::optional<TransferItem> resumed;
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end() || it->second.status != TransferStatus::Paused)
            {
                return;
            }
            it->second.status = TransferStatus::Pending;
            paused_.erase(id);
            resumed = it->second;
        }
        enqueue(id);
        emit(TransferEventKind::Resumed, *resumed);
    }

    void TransferManager::retry(const std::string &id)
    {
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end() || !it->second.can_retry())
            {
                return;
            }
            auto &item = it->second;
            item.status = TransferStatus::Pending;
            item.retry_count += 1;
            item.error_message.reset();
            item.transferred = 0;
            item.started_at.reset();
            item.completed_at.reset();
        }
        enqueue(id);
    }

    void TransferManager::clear_completed()
    {
        {
            std::lock_guard lock(mutex_);
            std::erase_if(items_, [](const auto &entry)
                          { return entry.second.status == TransferStatus::Completed ||
                                   entry.second.status == TransferStatus::Cancelled; });
        }
        queue_events_.emit(QueueEvent{QueueEventKind::Cleared});
    }

    std::optional<TransferItem> TransferManager::get(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        auto it = items_.find(id);
        if (it == items_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<TransferItem> TransferManager::all() const
    {
        std::lock_guard lock(mutex_);
        std::vector<TransferItem> result;
        result.reserve(items_.size());
        for (const auto &[id, item] : items_)
        {
            result.push_back(item);
        }
        return result;
    }

    std::vector<TransferItem> TransferManager::active() const
    {
        std::lock_guard lock(mutex_);
        std::vector<TransferItem> result;
        for (const auto &[id, item] : items_)
        {
            if (item.status == TransferStatus::Pending || item.status == TransferStatus::Running)
            {
                result.push_back(item);
            }
        }
        return result;
    }

    QueueStats TransferManager::stats() const
    {
        std::lock_guard lock(mutex_);
        QueueStats stats;
        stats.total = items_.size();
        for (const auto &[id, item] : items_)
        {
            switch (item.status)
            {
            case TransferStatus::Pending:
                ++stats.pending;
                break;
            case TransferStatus::Running:
                ++stats.running;
                break;
            case TransferStatus::Paused:
                ++stats.paused;
                break;
            case TransferStatus::Completed:
                ++stats.completed;
                break;
            case TransferStatus::Failed:
                ++stats.failed;
                break;
            case TransferStatus::Cancelled:
                ++stats.cancelled;
                break;
            }
        }
        return stats;
    }

    SubscriptionId TransferManager::subscribe_transfers(EventChannel<TransferEvent>::Listener listener)
    {
        return transfer_events_.subscribe(std::move(listener));
    }

    void TransferManager::unsubscribe_transfers(SubscriptionId id)
    {
        transfer_events_.unsubscribe(id);
    }

    SubscriptionId TransferManager::subscribe_queue(EventChannel<QueueEvent>::Listener listener)
    {
        return queue_events_.subscribe(std::move(listener));
    }

    void TransferManager::unsubscribe_queue(SubscriptionId id)
    {
        queue_events_.unsubscribe(id);
    }

    void TransferManager::worker_loop(std::size_t index, std::shared_ptr<std::atomic<bool>> stop_flag)
    {
        logger_.debug("worker", "Worker ", index, " started");
        while (!*stop_flag)
        {
            std::optional<std::string> current;
            try
            {
                auto next = queue_.pop_for(config_.poll_interval);
                if (!next)
                {
                    continue;
                }
                if (*stop_flag)
                {
                    enqueue(*next);
                    break;
                }
                auto claimed = claim(*next);
                if (!claimed)
                {
                    continue;
                }
                current = claimed->item.id;
                execute(std::move(claimed->item), claimed->token);
            }
            catch (const std::exception &ex)
            {
                logger_.error("worker", "Worker ", index, " error: ", ex.what());
                if (current)
                {
                    mark_failed(*current, ex.what());
                }
            }
            if (current)
            {
                release(*current);
                notify_if_drained();
            }
        }
        logger_.debug("worker", "Worker ", index, " stopped");
    }

    std::optional<TransferManager::Claim> TransferManager::claim(const std::string &id)
    {
        Claim claimed;
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end() || it->second.status != TransferStatus::Pending)
            {
                return std::nullopt;
            }
            auto &item = it->second;
            item.status = TransferStatus::Running;
            item.started_at = std::chrono::system_clock::now();
            claimed.token = std::make_shared<std::atomic<bool>>(false);
            cancel_tokens_[id] = claimed.token;
            claimed.item = item;
        }
        emit(TransferEventKind::Started, claimed.item);
        logger_.transfer(spdlog::level::info, claimed.item, "started");
        return claimed;
    }

    void TransferManager::release(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        cancel_tokens_.erase(id);
    }

    void TransferManager::update_progress(const std::string &id, std::uint64_t transferred, std::uint64_t total)
    {
        TransferItem snapshot;
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end() || it->second.status != TransferStatus::Running)
            {
                return;
            }
            auto &item = it->second;
            if (total > 0)
            {
                item.size = total;
            }
            item.transferred = std::max(item.transferred, transferred);
            snapshot = item;
        }
        transfer_events_.emit(TransferEvent{
            .kind = TransferEventKind::Progress,
            .transfer_id = snapshot.id,
            .site_id = snapshot.site_id,
            .transferred = transferred,
            .total = total,
            .error = {},
        });
    }

    void TransferManager::update_paths(const std::string &id, const std::filesystem::path &local_path,
                                       const std::string &remote_path)
    {
        std::lock_guard lock(mutex_);
        if (auto it = items_.find(id); it != items_.end())
        {
            it->second.local_path = local_path;
            it->second.remote_path = remote_path;
        }
    }

    void TransferManager::mark_completed(const std::string &id)
    {
        TransferItem snapshot;
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end() || it->second.status != TransferStatus::Running)
            {
                return;
            }
            auto &item = it->second;
            item.status = TransferStatus::Completed;
            item.completed_at = std::chrono::system_clock::now();
            item.transferred = item.size;
            snapshot = item;
        }
        emit(TransferEventKind::Completed, snapshot);
        logger_.transfer(spdlog::level::info, snapshot, "completed");
    }

    void TransferManager::mark_failed(const std::string &id, const std::string &error)
    {
        TransferItem snapshot;
        {
            std::lock_guard lock(mutex_);
            auto it = items_.find(id);
            if (it == items_.end() || it->second.status != TransferStatus::Running)
            {
                return;
            }
            auto &item = it->second;
            item.status = TransferStatus::Failed;
            item.error_message = error;
            snapshot = item;
        }
        emit(TransferEventKind::Failed, snapshot, error);
        logger_.transfer(spdlog::level::err, snapshot, "failed: " + error);
    }

    void TransferManager::enqueue(const std::string &id)
    {
        if (!queue_.try_push(id))
        {
            logger_.warn("queue", "Transfer queue is full, dropping dispatch of ", id);
        }
    }

    void TransferManager::emit(TransferEventKind kind, const TransferItem &item, std::string error)
    {
        transfer_events_.emit(TransferEvent{
            .kind = kind,
            .transfer_id = item.id,
            .site_id = item.site_id,
            .transferred = item.transferred,
            .total = item.size,
            .error = std::move(error),
        });
    }

    void TransferManager::notify_if_drained()
    {
        {
            std::lock_guard lock(mutex_);
            for (const auto &[id, item] : items_)
            {
                if (item.status == TransferStatus::Pending || item.status == TransferStatus::Running)
                {
                    return;
                }
            }
        }
        queue_events_.emit(QueueEvent{QueueEventKind::Completed});
    }

} // namespace ferry::client
