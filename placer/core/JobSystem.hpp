#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace placer::core
{
// Outstanding jobs of one owner, so it can wait for its own work without draining the pool.
class JobCounter
{
public:
    void Increment() { m_count.fetch_add(1, std::memory_order_relaxed); }
    void Decrement();
    [[nodiscard]] bool IsZero() const { return m_count.load(std::memory_order_acquire) <= 0; }
    void Wait() const;

private:
    std::atomic<long> m_count{0};
};

// Worker pool for file reads and model parsing. Owned by the application and injected; jobs run
// in submission order.
class JobSystem
{
public:
    using Job = std::function<void()>;

    JobSystem() = default;
    ~JobSystem();

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    // 0 picks one worker less than the hardware threads.
    bool Initialize(std::size_t workerCount = 0);
    // Queued jobs still run before the workers exit.
    void Shutdown();

    [[nodiscard]] bool IsRunning() const { return m_running.load(std::memory_order_acquire); }

    // Returns false when the pool is not running; the caller does the work itself.
    bool Submit(std::string name, Job job, JobCounter* counter = nullptr);

    void WaitForAll();

    [[nodiscard]] std::size_t WorkerCount() const { return m_workers.size(); }
    [[nodiscard]] std::size_t QueuedCount() const;

private:
    struct Task
    {
        std::string name;
        Job job;
        JobCounter* counter = nullptr;
    };

    void WorkerLoop();

    std::vector<std::thread> m_workers;
    std::deque<Task> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::size_t m_busyWorkers = 0;
    bool m_stopping = false;
    std::atomic<bool> m_running{false};
};
} // namespace placer::core
