// tests/core/test_job_system.cpp

#include <doctest/doctest.h>

#include "core/JobSystem.h"

#include <atomic>
#include <vector>

using fractal::core::JobSystem;

TEST_CASE("ParallelForIndex visits every index exactly once")
{
    JobSystem jobs(4);
    std::vector<std::atomic<int>> hits(1000);
    jobs.ParallelForIndex(0, 1000, 1, [&](int i) { hits[static_cast<std::size_t>(i)].fetch_add(1); });
    for (const auto& h : hits)
        CHECK(h.load() == 1);
}

TEST_CASE("ParallelForIndex on an empty range is a no-op")
{
    JobSystem jobs(2);
    std::atomic<int> calls{0};
    jobs.ParallelForIndex(5, 5, 1, [&](int) { ++calls; });
    jobs.ParallelForIndex(9, 3, 1, [&](int) { ++calls; });
    CHECK(calls.load() == 0);
}

TEST_CASE("RunAndWait runs dependent tasks in order")
{
    JobSystem jobs(2);
    std::vector<int> order;
    tf::Taskflow flow;
    auto a = flow.emplace([&] { order.push_back(1); });
    auto b = flow.emplace([&] { order.push_back(2); });
    a.precede(b);
    jobs.RunAndWait(flow);
    REQUIRE(order.size() == 2);
    CHECK(order[0] == 1);
    CHECK(order[1] == 2);
    CHECK(jobs.workerCount() == 2);
}
