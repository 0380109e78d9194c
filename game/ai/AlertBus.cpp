#include "game/ai/AlertBus.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "game/ai/AgentMath.hpp"

namespace game::ai
{
AlertSubscription::AlertSubscription(AlertBus* bus, std::uint32_t id)
    : m_bus(bus)
    , m_id(id)
{
}

AlertSubscription::~AlertSubscription()
{
    Reset();
}

AlertSubscription::AlertSubscription(AlertSubscription&& other) noexcept
    : m_bus(std::exchange(other.m_bus, nullptr))
    , m_id(std::exchange(other.m_id, 0U))
{
}

AlertSubscription& AlertSubscription::operator=(AlertSubscription&& other) noexcept
{
    if (this != &other)
    {
        Reset();
        m_bus = std::exchange(other.m_bus, nullptr);
        m_id = std::exchange(other.m_id, 0U);
    }
    return *this;
}

void AlertSubscription::Reset()
{
    if (m_bus != nullptr)
    {
        m_bus->Unsubscribe(m_id);
        m_bus = nullptr;
        m_id = 0;
    }
}

AlertSubscription AlertBus::Subscribe(IAlertListener& listener)
{
    const std::uint32_t id = m_nextId++;
    m_listeners.push_back(Entry{id, &listener});
    return AlertSubscription{this, id};
}

void AlertBus::Unsubscribe(std::uint32_t id)
{
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(), [id](const Entry& entry) { return entry.id == id; }),
        m_listeners.end()
    );
}

IAlertListener* AlertBus::FindListener(std::uint32_t id) const
{
    for (const Entry& entry : m_listeners)
    {
        if (entry.id == id)
        {
            return entry.listener;
        }
    }
    return nullptr;
}

bool AlertBus::Publish(const AlertEvent& event)
{
    if (m_dispatching)
    {
        std::cout << "AlertBus: WARNING - Alert from agent " << event.sourceId << " published during dispatch, dropped\n";
        return false;
    }
    m_queue.push_back(event);
    return true;
}

std::size_t AlertBus::DispatchQueued()
{
    if (m_queue.empty())
    {
        return 0;
    }

    m_dispatching = true;
    std::vector<AlertEvent> events;
    events.swap(m_queue);

    std::vector<std::uint32_t> ids;
    ids.reserve(m_listeners.size());
    for (const Entry& entry : m_listeners)
    {
        ids.push_back(entry.id);
    }

    std::size_t deliveries = 0;
    for (const AlertEvent& event : events)
    {
        for (const std::uint32_t id : ids)
        {
            IAlertListener* listener = FindListener(id);
            if (listener == nullptr || listener->ListenerId() == event.sourceId || !listener->IsListening())
            {
                continue;
            }

            if (DistanceXZ(listener->ListenerPosition(), event.broadcasterPosition) > event.radius)
            {
                continue;
            }

            listener->OnAlert(event);
            ++deliveries;
        }
    }

    m_dispatching = false;
    return deliveries;
}
} // namespace game::ai
