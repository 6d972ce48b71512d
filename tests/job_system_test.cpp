#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "placer/core/JobSystem.hpp"
#include "placer/core/Time.hpp"

using placer::core::JobCounter;
using placer::core::JobSystem;

TEST(JobSystemTest, RunsSubmittedJobs)
{
    JobSystem jobs;
    ASSERT_TRUE(jobs.Initialize(3));
    EXPECT_EQ(jobs.WorkerCount(), 3U);

    std::atomic<int> total{0};
    for (int i = 1; i <= 10; ++i)
    {
        EXPECT_TRUE(jobs.Submit("add", [&total, i]() { total += i; }));
    }
    jobs.WaitForAll();
    EXPECT_EQ(total.load(), 55);
    EXPECT_EQ(jobs.QueuedCount(), 0U);
}

TEST(JobSystemTest, SingleWorkerKeepsSubmissionOrder)
{
    JobSystem jobs;
    ASSERT_TRUE(jobs.Initialize(1));

    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i)
    {
        jobs.Submit("ordered", [&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    jobs.WaitForAll();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(JobSystemTest, RejectsWorkWhenNotRunning)
{
    JobSystem jobs;
    bool ran = false;
    EXPECT_FALSE(jobs.Submit("idle", [&ran]() { ran = true; }));
    EXPECT_FALSE(ran);

    ASSERT_TRUE(jobs.Initialize(1));
    jobs.Shutdown();
    EXPECT_FALSE(jobs.IsRunning());
    EXPECT_FALSE(jobs.Submit("stopped", [&ran]() { ran = true; }));
    EXPECT_FALSE(ran);
}

TEST(JobSystemTest, ThrowingJobDoesNotStopTheWorker)
{
    JobSystem jobs;
    ASSERT_TRUE(jobs.Initialize(1));
    JobCounter counter;

    std::atomic<bool> after{false};
    jobs.Submit("throws", []() { throw std::runtime_error("corrupt buffer"); }, &counter);
    jobs.Submit("after", [&after]() { after = true; }, &counter);

    counter.Wait();
    EXPECT_TRUE(counter.IsZero());
    EXPECT_TRUE(after.load());
}

TEST(JobSystemTest, CounterTracksOnlyItsOwnJobs)
{
    JobSystem jobs;
    ASSERT_TRUE(jobs.Initialize(2));
    JobCounter mine;

    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i)
    {
        jobs.Submit("mine", [&done]() { ++done; }, &mine);
    }
    mine.Wait();
    EXPECT_EQ(done.load(), 4);
    EXPECT_TRUE(mine.IsZero());
}

TEST(TimeTest, SmoothsFrameRateAndClampsStalls)
{
    placer::core::Time time;
    time.BeginFrame(10.0);
    EXPECT_FLOAT_EQ(time.DeltaSeconds(), 0.0F);
    EXPECT_FLOAT_EQ(time.SmoothedFps(), 0.0F);

    time.BeginFrame(10.02);
    EXPECT_NEAR(time.DeltaSeconds(), 0.02F, 1.0e-5F);
    EXPECT_NEAR(time.SmoothedFps(), 50.0F, 1.0e-2F);

    time.BeginFrame(15.0);
    EXPECT_FLOAT_EQ(time.DeltaSeconds(), 0.25F);
    EXPECT_NEAR(time.SmoothedFps(), 50.0F + (4.0F - 50.0F) * 0.1F, 1.0e-2F);
}

TEST(TimeTest, WallClockIsEpochMillis)
{
    // 2020-01-01 in milliseconds.
    EXPECT_GT(placer::core::WallClockMillis(), 1577836800000LL);
}
