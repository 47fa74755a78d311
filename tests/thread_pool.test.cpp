#include <catch2/catch_all.hpp>
#include <atomic>
#include <stdexcept>
#include "framectl/core/util/thread_pool.hpp"

using namespace framectl;
using namespace std::chrono_literals;

TEST_CASE("shutdown drains queued jobs before joining", "[pool]") {
    std::atomic_int done{ 0 };
    ThreadPool pool(2, "test");
    REQUIRE(pool.workers() == 2);
    for (int i = 0; i < 20; ++i)
        pool.post([&] {
            std::this_thread::sleep_for(1ms);
            ++done;
        });
    pool.shutdown();
    REQUIRE(done == 20);
    REQUIRE(pool.queued() == 0);
    REQUIRE_THROWS_AS(pool.post([] {}), std::logic_error);
}

TEST_CASE("a throwing job does not take its worker down", "[pool]") {
    std::atomic_int done{ 0 };
    ThreadPool pool(1, "test");
    pool.post([] { throw std::runtime_error("probe exploded"); });
    pool.post([&] { ++done; });
    pool.shutdown();
    REQUIRE(done == 1);
}
