#include <catch2/catch.hpp>
#include <ferry/task_pool.hpp>

#include <atomic>
#include <stdexcept>

using namespace ferry;

TEST_CASE("runs submitted tasks", "[task_pool]") {
    TaskPool pool(4);
    REQUIRE(pool.size() == 4);

    std::atomic<int> count{0};
    for (int i = 0; i < 100; ++i) {
        REQUIRE(pool.submit([&count] { ++count; }));
    }
    pool.wait_idle();
    REQUIRE(count == 100);
}

TEST_CASE("tasks may submit tasks", "[task_pool]") {
    TaskPool pool(2);
    std::atomic<int> count{0};

    // Binary fan-out, depth 5: 1 + 2 + 4 + 8 + 16 + 32 tasks
    std::function<void(int)> spawn = [&](int depth) {
        ++count;
        if (depth == 0) return;
        pool.submit([&spawn, depth] { spawn(depth - 1); });
        pool.submit([&spawn, depth] { spawn(depth - 1); });
    };
    pool.submit([&spawn] { spawn(5); });
    pool.wait_idle();
    REQUIRE(count == 63);
}

TEST_CASE("zero threads still gets one worker", "[task_pool]") {
    TaskPool pool(0);
    REQUIRE(pool.size() >= 1);
    std::atomic<bool> ran{false};
    pool.submit([&ran] { ran = true; });
    pool.wait_idle();
    REQUIRE(ran);
}

TEST_CASE("submit fails after shutdown", "[task_pool]") {
    TaskPool pool(2);
    pool.shutdown();
    REQUIRE_FALSE(pool.submit([] {}));
    pool.shutdown();
}

TEST_CASE("wait_idle rethrows a task failure once", "[task_pool]") {
    TaskPool pool(2);
    std::atomic<int> count{0};
    pool.submit([] { throw std::runtime_error("boom"); });
    for (int i = 0; i < 10; ++i) pool.submit([&count] { ++count; });
    REQUIRE_THROWS_AS(pool.wait_idle(), std::runtime_error);
    REQUIRE(count == 10);

    pool.submit([&count] { ++count; });
    REQUIRE_NOTHROW(pool.wait_idle());
    REQUIRE(count == 11);
}
