#include <catch2/catch.hpp>

#include "core/ThreadPool.hpp"
#include "test_support.hpp"

using downlink::core::ThreadPool;

TEST_CASE("A single worker runs tasks in submission order") {
    ThreadPool pool(1, "test.ordered");
    std::vector<int> order;

    std::vector<std::future<void>> done;
    for (int i = 0; i < 10; ++i) {
        done.push_back(pool.submit([&order, i] { order.push_back(i); }));
    }
    for (auto& f : done) f.get();

    std::vector<int> expected{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    REQUIRE(order == expected);
}

TEST_CASE("Growing the pool lets blocked tasks run side by side") {
    ThreadPool pool(1, "test.grow");
    std::atomic<bool> release{false};
    std::atomic<int> running{0};

    auto blocker = [&] {
        ++running;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    };

    auto first = pool.submit(blocker);
    pool.ensureWorkers(2);
    auto second = pool.submit(blocker);

    REQUIRE(downlink::test::waitUntil([&] { return running == 2; }));
    release = true;
    first.get();
    second.get();
}

TEST_CASE("Shutdown runs pending tasks and rejects new ones") {
    ThreadPool pool(1, "test.shutdown");
    std::atomic<int> ran{0};

    for (int i = 0; i < 5; ++i) {
        pool.submit([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++ran;
        });
    }
    pool.shutdown();

    REQUIRE(ran == 5);
    REQUIRE_THROWS_AS(pool.submit([] {}), std::runtime_error);
    pool.ensureWorkers(3);
    pool.shutdown();
}

TEST_CASE("Tasks can tell they run on the pool") {
    ThreadPool pool(1, "test.worker");
    REQUIRE_FALSE(pool.isWorkerThread());
    REQUIRE(pool.submit([&] { return pool.isWorkerThread(); }).get());
}

TEST_CASE("Task exceptions reach the future") {
    ThreadPool pool(1, "test.throw");
    auto failed = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    REQUIRE_THROWS_WITH(failed.get(), "boom");
    REQUIRE(pool.submit([] { return 7; }).get() == 7);
}
