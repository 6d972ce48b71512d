#include "placer/core/MainThreadQueue.hpp"

#include <exception>
#include <iostream>

namespace placer::core
{
void MainThreadQueue::Post(Task task)
{
    if (!task)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.push_back(std::move(task));
}

std::size_t MainThreadQueue::Drain()
{
    std::vector<Task> ready;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ready.swap(m_tasks);
    }

    for (Task& task : ready)
    {
        try
        {
            task();
        }
        catch (const std::exception& ex)
        {
            std::cerr << "[MainThreadQueue] Completion threw: " << ex.what() << "\n";
        }
    }
    return ready.size();
}

std::size_t MainThreadQueue::PendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}
} // namespace placer::core
