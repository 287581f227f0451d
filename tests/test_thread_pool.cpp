#include "cellpipe/core/errors.hpp"
#include "cellpipe/pipeline/thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <future>
#include <set>
#include <stdexcept>

using cellpipe::pipeline::ThreadPool;

TEST_CASE("thread_pool_runs_every_task") {
    ThreadPool pool(3);
    REQUIRE(pool.size() == 3);

    std::vector<std::future<int>> futures;
    std::set<size_t> ids;
    for (int i = 0; i < 10; ++i) {
        auto submitted = pool.submit([i]() { return i * i; });
        ids.insert(submitted.first);
        futures.push_back(std::move(submitted.second));
    }
    REQUIRE(ids.size() == 10);

    std::set<size_t> finished;
    for (int i = 0; i < 10; ++i) finished.insert(pool.wait_completion());
    REQUIRE(finished == ids);

    for (int i = 0; i < 10; ++i) REQUIRE(futures[static_cast<size_t>(i)].get() == i * i);
}

TEST_CASE("thread_pool_delivers_task_exceptions_through_the_future") {
    ThreadPool pool(1);
    auto submitted = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE(pool.wait_completion() == submitted.first);
    REQUIRE_THROWS_AS(submitted.second.get(), std::runtime_error);
}

TEST_CASE("thread_pool_cancel_pending_drops_queued_tasks") {
    ThreadPool pool(1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::promise<void> started;

    auto first = pool.submit([opened, &started]() {
        started.set_value();
        opened.wait();
        return 1;
    });
    started.get_future().wait();

    std::atomic<int> ran{0};
    auto second = pool.submit([&ran]() { return ++ran; });
    auto third = pool.submit([&ran]() { return ++ran; });

    REQUIRE(pool.cancel_pending() == 2);
    gate.set_value();

    REQUIRE(pool.wait_completion() == first.first);
    REQUIRE(first.second.get() == 1);
    REQUIRE(ran.load() == 0);
    REQUIRE_THROWS_AS(second.second.get(), std::future_error);
    REQUIRE_THROWS_AS(third.second.get(), std::future_error);
}

TEST_CASE("thread_pool_requires_a_worker") {
    REQUIRE_THROWS_AS(ThreadPool(0), cellpipe::ValidationError);
}
