#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "placer/core/Events.hpp"

namespace placer::core
{
// Synchronous topic bus. One instance per scene session, passed by reference to every subsystem.
class EventBus
{
public:
    using Handler = std::function<void(const Payload&)>;
    using HandlerPtr = std::shared_ptr<const Handler>;

    static HandlerPtr MakeHandler(Handler handler);

    // Returns false when this exact handler is already registered for the topic.
    bool On(const std::string& topic, const HandlerPtr& handler);
    bool Off(const std::string& topic, const HandlerPtr& handler);
    HandlerPtr Once(const std::string& topic, Handler handler);

    void Emit(const std::string& topic, const Payload& payload = Payload{});

    void Clear(const std::optional<std::string>& topic = std::nullopt);

    [[nodiscard]] std::size_t HandlerCount(const std::string& topic) const;

private:
    std::unordered_map<std::string, std::vector<HandlerPtr>> m_handlers;
};

template <typename T>
const T* PayloadAs(const Payload& payload)
{
    return std::get_if<T>(&payload);
}
} // namespace placer::core
