#include "placer/core/JobSystem.hpp"

#include <exception>
#include <iostream>
#include <system_error>
#include <utility>

namespace placer::core
{
void JobCounter::Decrement()
{
    if (m_count.fetch_sub(1, std::memory_order_acq_rel) <= 1)
    {
        m_count.store(0, std::memory_order_release);
        m_count.notify_all();
    }
}

void JobCounter::Wait() const
{
    for (long value = m_count.load(std::memory_order_acquire); value > 0; value = m_count.load(std::memory_order_acquire))
    {
        m_count.wait(value, std::memory_order_acquire);
    }
}

JobSystem::~JobSystem()
{
    Shutdown();
}

bool JobSystem::Initialize(std::size_t workerCount)
{
    if (IsRunning())
    {
        return true;
    }
    if (workerCount == 0)
    {
        const unsigned int hardware = std::thread::hardware_concurrency();
        workerCount = hardware > 1 ? hardware - 1 : 1;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = false;
        m_busyWorkers = 0;
    }
    try
    {
        for (std::size_t i = 0; i < workerCount; ++i)
        {
            m_workers.emplace_back(&JobSystem::WorkerLoop, this);
        }
    }
    catch (const std::system_error& ex)
    {
        std::cerr << "[JobSystem] Could not start worker " << m_workers.size() << ": " << ex.what() << "\n";
        if (m_workers.empty())
        {
            return false;
        }
    }

    m_running.store(true, std::memory_order_release);
    std::cout << "[JobSystem] " << m_workers.size() << " workers\n";
    return true;
}

void JobSystem::Shutdown()
{
    if (m_workers.empty())
    {
        return;
    }
    m_running.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_wake.notify_all();
    for (std::thread& worker : m_workers)
    {
        worker.join();
    }
    m_workers.clear();
}

bool JobSystem::Submit(std::string name, Job job, JobCounter* counter)
{
    if (!job || !IsRunning())
    {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping)
        {
            return false;
        }
        if (counter != nullptr)
        {
            counter->Increment();
        }
        m_tasks.push_back(Task{std::move(name), std::move(job), counter});
    }
    m_wake.notify_one();
    return true;
}

void JobSystem::WaitForAll()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this]() { return m_tasks.empty() && m_busyWorkers == 0; });
}

std::size_t JobSystem::QueuedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void JobSystem::WorkerLoop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true)
    {
        m_wake.wait(lock, [this]() { return m_stopping || !m_tasks.empty(); });
        if (m_tasks.empty())
        {
            return;
        }

        Task task = std::move(m_tasks.front());
        m_tasks.pop_front();
        ++m_busyWorkers;
        lock.unlock();

        try
        {
            task.job();
        }
        catch (const std::exception& ex)
        {
            std::cerr << "[JobSystem] Job '" << task.name << "' failed: " << ex.what() << "\n";
        }
        if (task.counter != nullptr)
        {
            task.counter->Decrement();
        }

        lock.lock();
        --m_busyWorkers;
        if (m_tasks.empty() && m_busyWorkers == 0)
        {
            m_idle.notify_all();
        }
    }
}
} // namespace placer::core
