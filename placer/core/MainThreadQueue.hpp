#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace placer::core
{
// Completions posted from worker threads, drained by the frame loop.
class MainThreadQueue
{
public:
    using Task = std::function<void()>;

    void Post(Task task);

    // Runs everything posted before the call. Tasks posted while draining run next time.
    std::size_t Drain();

    [[nodiscard]] std::size_t PendingCount() const;

private:
    mutable std::mutex m_mutex;
    std::vector<Task> m_tasks;
};
} // namespace placer::core
