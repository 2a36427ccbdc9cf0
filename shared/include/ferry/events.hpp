/**
 * Ferry - Listener registration for transfer, queue and sync notifications.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ferry
{

    enum class TransferEventKind : std::uint8_t
    {
        Added,
        Started,
        Progress,
        Completed,
        Failed,
        Paused,
        Resumed,
        Cancelled
    };

    // Carries copies only; listeners never see the manager's live record.
    struct TransferEvent
    {
        TransferEventKind kind{};
        std::string transfer_id;
        std::string site_id;
        std::uint64_t transferred{};
        std::uint64_t total{};
        std::string error;
    };

    enum class QueueEventKind : std::uint8_t
    {
        Started,
        Paused,
        Completed,
        Cleared
    };

    struct QueueEvent
    {
        QueueEventKind kind{};
    };

    enum class SyncEventKind : std::uint8_t
    {
        Started,
        Progress,
        Completed,
        Failed
    };

    struct SyncEvent
    {
        SyncEventKind kind{};
        std::string profile_id;
        std::size_t current{};
        std::size_t total{};
        nlohmann::json summary{};
        std::string error;
    };

    using SubscriptionId = std::uint64_t;

    template <typename Event>
    class EventChannel
    {
    public:
        using Listener = std::function<void(const Event &)>;

        SubscriptionId subscribe(Listener listener)
        {
            std::lock_guard lock(mutex_);
            const auto id = ++last_id_;
            listeners_.emplace(id, std::move(listener));
            return id;
        }

        void unsubscribe(SubscriptionId id)
        {
            std::lock_guard lock(mutex_);
            listeners_.erase(id);
        }

        // Listeners run on the emitting thread, outside the registration lock.
        void emit(const Event &event) const
        {
            std::vector<Listener> snapshot;
            {
                std::lock_guard lock(mutex_);
                snapshot.reserve(listeners_.size());
                for (const auto &[id, listener] : listeners_)
                {
                    snapshot.push_back(listener);
                }
            }
            for (const auto &listener : snapshot)
            {
                try
                {
                    listener(event);
                }
                catch (const std::exception &ex)
                {
                    spdlog::warn("Event listener failed: {}", ex.what());
                }
            }
        }

    private:
        mutable std::mutex mutex_;
        SubscriptionId last_id_{0};
        std::map<SubscriptionId, Listener> listeners_;
    };

} // namespace ferry
