#include "engine/core/EventBus.hpp"

#include <algorithm>

namespace engine::core
{
EventBus::SubscriptionId EventBus::Subscribe(const std::string& eventName, Handler handler)
{
    if (!handler)
    {
        return kInvalidSubscription;
    }

    const SubscriptionId id = m_nextId++;
    m_handlers[eventName].push_back(Registration{id, std::move(handler)});
    return id;
}

bool EventBus::Unsubscribe(SubscriptionId id)
{
    if (id == kInvalidSubscription)
    {
        return false;
    }

    for (auto& [name, registrations] : m_handlers)
    {
        const auto it = std::find_if(registrations.begin(), registrations.end(), [id](const Registration& registration) {
            return registration.id == id;
        });
        if (it != registrations.end())
        {
            registrations.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

std::size_t EventBus::DispatchQueued()
{
    std::size_t calls = 0;
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();

        const auto it = m_handlers.find(event.name);
        if (it == m_handlers.end())
        {
            continue;
        }

        // Handlers may subscribe or unsubscribe while running; ids are
        // re-resolved so a handler removed mid-dispatch is never called.
        std::vector<SubscriptionId> ids;
        ids.reserve(it->second.size());
        for (const Registration& registration : it->second)
        {
            ids.push_back(registration.id);
        }

        for (const SubscriptionId id : ids)
        {
            const Handler* handler = FindHandler(event.name, id);
            if (handler == nullptr)
            {
                continue;
            }
            // Copy so the handler survives its own unsubscription.
            const Handler call = *handler;
            call(event);
            ++calls;
        }
    }
    return calls;
}

void EventBus::Clear()
{
    std::queue<Event> empty;
    m_queue.swap(empty);
}

const EventBus::Handler* EventBus::FindHandler(const std::string& eventName, SubscriptionId id) const
{
    const auto it = m_handlers.find(eventName);
    if (it == m_handlers.end())
    {
        return nullptr;
    }
    for (const Registration& registration : it->second)
    {
        if (registration.id == id)
        {
            return &registration.handler;
        }
    }
    return nullptr;
}

std::size_t EventBus::HandlerCount(const std::string& eventName) const
{
    const auto it = m_handlers.find(eventName);
    return it == m_handlers.end() ? 0 : it->second.size();
}
} // namespace engine::core
