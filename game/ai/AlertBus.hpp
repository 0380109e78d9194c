#pragma once

#include <cstdint>
#include <vector>

#include <glm/vec3.hpp>

#include "game/ai/AgentState.hpp"

namespace game::ai
{
struct AlertEvent
{
    glm::vec3 origin{0.0F};              ///< Where receivers go to investigate
    glm::vec3 broadcasterPosition{0.0F}; ///< Radius is measured from here
    float radius = 10.0F;
    double timestamp = 0.0;
    AgentId sourceId = kInvalidAgentId;
};

class IAlertListener
{
public:
    virtual ~IAlertListener() = default;

    [[nodiscard]] virtual AgentId ListenerId() const = 0;
    [[nodiscard]] virtual glm::vec3 ListenerPosition() const = 0;
    [[nodiscard]] virtual bool IsListening() const = 0;
    virtual void OnAlert(const AlertEvent& event) = 0;
};

class AlertBus;

/// Scoped registration. Unsubscribes when destroyed or reset; the bus must outlive it.
class AlertSubscription
{
public:
    AlertSubscription() = default;
    ~AlertSubscription();

    AlertSubscription(const AlertSubscription&) = delete;
    AlertSubscription& operator=(const AlertSubscription&) = delete;
    AlertSubscription(AlertSubscription&& other) noexcept;
    AlertSubscription& operator=(AlertSubscription&& other) noexcept;

    void Reset();
    [[nodiscard]] bool IsActive() const { return m_bus != nullptr; }

private:
    friend class AlertBus;
    AlertSubscription(AlertBus* bus, std::uint32_t id);

    AlertBus* m_bus = nullptr;
    std::uint32_t m_id = 0;
};

/// Guard-to-guard alert channel. Alerts are queued while agents update and
/// delivered together by DispatchQueued() at the end of the tick, so an alert
/// can never cause another alert within the same step.
class AlertBus
{
public:
    AlertBus() = default;
    AlertBus(const AlertBus&) = delete;
    AlertBus& operator=(const AlertBus&) = delete;

    [[nodiscard]] AlertSubscription Subscribe(IAlertListener& listener);

    /// Rejected (returns false) while a dispatch is in progress.
    bool Publish(const AlertEvent& event);

    /// Delivers queued alerts to every listening subscriber other than the
    /// source whose XZ distance to the broadcaster is within the alert radius.
    /// Returns the number of deliveries.
    std::size_t DispatchQueued();
    void Clear() { m_queue.clear(); }

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }
    [[nodiscard]] std::size_t ListenerCount() const { return m_listeners.size(); }
    [[nodiscard]] bool IsDispatching() const { return m_dispatching; }

private:
    friend class AlertSubscription;

    struct Entry
    {
        std::uint32_t id = 0;
        IAlertListener* listener = nullptr;
    };

    void Unsubscribe(std::uint32_t id);
    [[nodiscard]] IAlertListener* FindListener(std::uint32_t id) const;

    std::vector<Entry> m_listeners;
    std::vector<AlertEvent> m_queue;
    std::uint32_t m_nextId = 1;
    bool m_dispatching = false;
};
} // namespace game::ai
