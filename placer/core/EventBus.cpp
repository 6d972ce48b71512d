#include "placer/core/EventBus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace placer::core
{
EventBus::HandlerPtr EventBus::MakeHandler(Handler handler)
{
    return std::make_shared<const Handler>(std::move(handler));
}

bool EventBus::On(const std::string& topic, const HandlerPtr& handler)
{
    if (!handler || !*handler)
    {
        return false;
    }

    std::vector<HandlerPtr>& handlers = m_handlers[topic];
    if (std::find(handlers.begin(), handlers.end(), handler) != handlers.end())
    {
        return false;
    }
    handlers.push_back(handler);
    return true;
}

bool EventBus::Off(const std::string& topic, const HandlerPtr& handler)
{
    const auto it = m_handlers.find(topic);
    if (it == m_handlers.end())
    {
        return false;
    }

    std::vector<HandlerPtr>& handlers = it->second;
    const auto found = std::find(handlers.begin(), handlers.end(), handler);
    if (found == handlers.end())
    {
        return false;
    }
    handlers.erase(found);
    if (handlers.empty())
    {
        m_handlers.erase(it);
    }
    return true;
}

EventBus::HandlerPtr EventBus::Once(const std::string& topic, Handler handler)
{
    auto self = std::make_shared<std::weak_ptr<const Handler>>();
    HandlerPtr wrapper = MakeHandler([this, topic, self, inner = std::move(handler)](const Payload& payload) {
        // Drop the registration before running so a re-entrant emit cannot fire it twice.
        const HandlerPtr registered = self->lock();
        if (!registered || !Off(topic, registered))
        {
            return;
        }
        inner(payload);
    });
    *self = wrapper;
    On(topic, wrapper);
    return wrapper;
}

void EventBus::Emit(const std::string& topic, const Payload& payload)
{
    const auto it = m_handlers.find(topic);
    if (it == m_handlers.end())
    {
        return;
    }

    // Handlers may subscribe or unsubscribe while running; iterate over a snapshot.
    const std::vector<HandlerPtr> snapshot = it->second;
    for (const HandlerPtr& handler : snapshot)
    {
        try
        {
            (*handler)(payload);
        }
        catch (const std::exception& ex)
        {
            std::cerr << "[EventBus] Handler for '" << topic << "' threw: " << ex.what() << "\n";
        }
        catch (...)
        {
            std::cerr << "[EventBus] Handler for '" << topic << "' threw an unknown exception\n";
        }
    }
}

void EventBus::Clear(const std::optional<std::string>& topic)
{
    if (topic.has_value())
    {
        m_handlers.erase(*topic);
        return;
    }
    m_handlers.clear();
}

std::size_t EventBus::HandlerCount(const std::string& topic) const
{
    const auto it = m_handlers.find(topic);
    return it == m_handlers.end() ? 0U : it->second.size();
}
} // namespace placer::core
