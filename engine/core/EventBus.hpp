#pragma once

#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace engine::core
{
struct Event
{
    std::string name;
    std::vector<std::string> args;
};

/// Deferred string-keyed notification queue. Publishers enqueue; the owner
/// drains the queue with DispatchQueued() at a point of its choosing.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint32_t;

    static constexpr SubscriptionId kInvalidSubscription = 0;

    SubscriptionId Subscribe(const std::string& eventName, Handler handler);
    bool Unsubscribe(SubscriptionId id);

    void Publish(Event event);

    /// Delivers every queued event. Events published by handlers are delivered
    /// in the same call, after the ones already queued. Returns handler calls made.
    std::size_t DispatchQueued();
    void Clear();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }
    [[nodiscard]] std::size_t HandlerCount(const std::string& eventName) const;

private:
    struct Registration
    {
        SubscriptionId id = kInvalidSubscription;
        Handler handler;
    };

    [[nodiscard]] const Handler* FindHandler(const std::string& eventName, SubscriptionId id) const;

    std::unordered_map<std::string, std::vector<Registration>> m_handlers;
    std::queue<Event> m_queue;
    SubscriptionId m_nextId = 1;
};
} // namespace engine::core
