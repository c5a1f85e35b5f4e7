#include <catch2/catch_test_macros.hpp>
#include "db/connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"

#include <thread>
#include <vector>

using namespace auditpipe;
using auditpipe::testing::MockConnectionFactory;

namespace {

PoolConfig small_pool(size_t min_conns, size_t max_conns) {
    PoolConfig cfg;
    cfg.connection_string = "postgresql://test";
    cfg.min_connections = min_conns;
    cfg.max_connections = max_conns;
    cfg.connection_timeout = std::chrono::milliseconds(50);
    return cfg;
}

} // anonymous namespace

TEST_CASE("ConnectionPool: pre-warms min connections", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionPool pool("audit", small_pool(2, 4), factory);

    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(factory->created() == 2);
}

TEST_CASE("ConnectionPool: released connections are reused", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionPool pool("audit", small_pool(1, 4), factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        CHECK(conn->is_valid());
        CHECK(pool.get_stats().active_connections == 1);
        const auto rs = (*conn)->execute("SELECT 1");
        CHECK(rs.success);
    }
    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
    }

    const auto stats = pool.get_stats();
    CHECK(factory->created() == 1);
    CHECK(stats.total_acquires == 2);
    CHECK(stats.total_releases == 2);
    CHECK(stats.idle_connections == 1);
}

TEST_CASE("ConnectionPool: acquire times out at max connections", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionPool pool("audit", small_pool(0, 2), factory);

    auto a = pool.acquire();
    auto b = pool.acquire();
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);

    auto c = pool.acquire(std::chrono::milliseconds(20));
    CHECK(c == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    a.reset();
    auto d = pool.acquire(std::chrono::milliseconds(20));
    CHECK(d != nullptr);
}

TEST_CASE("ConnectionPool: waiter wakes when a connection is returned", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig cfg = small_pool(0, 1);
    ConnectionPool pool("audit", cfg, factory);

    auto held = pool.acquire();
    REQUIRE(held != nullptr);

    std::thread releaser([&held] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        held.reset();
    });
    auto next = pool.acquire(std::chrono::milliseconds(2000));
    releaser.join();
    CHECK(next != nullptr);
}

TEST_CASE("ConnectionPool: connect failure does not leak a permit", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionPool pool("audit", small_pool(0, 1), factory);

    factory->set_fail(true);
    CHECK(pool.acquire() == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    factory->set_fail(false);
    CHECK(pool.acquire() != nullptr);
}

TEST_CASE("ConnectionPool: discarded connection is not pooled", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionPool pool("audit", small_pool(1, 2), factory);

    {
        auto conn = pool.acquire();
        REQUIRE(conn != nullptr);
        conn->discard();
        CHECK_FALSE(conn->is_valid());
    }
    CHECK(pool.get_stats().total_connections == 0);

    auto fresh = pool.acquire();
    REQUIRE(fresh != nullptr);
    CHECK(factory->created() == 2);
}

TEST_CASE("ConnectionPool: idle connection failing its health check is replaced", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig cfg = small_pool(1, 2);
    cfg.idle_timeout = std::chrono::milliseconds(0);
    ConnectionPool pool("audit", cfg, factory);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    factory->set_healthy(false);

    auto conn = pool.acquire();
    REQUIRE(conn != nullptr);
    CHECK(pool.get_stats().health_check_failures == 1);
    CHECK(factory->created() == 2);
}

TEST_CASE("ConnectionPool: drain refuses new acquires", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    ConnectionPool pool("audit", small_pool(2, 2), factory);

    pool.drain();
    CHECK(pool.get_stats().total_connections == 0);
    CHECK(pool.acquire() == nullptr);

    // Second drain is a no-op
    pool.drain();
}

TEST_CASE("ConnectionPool: concurrent borrowers never exceed max", "[connection_pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    PoolConfig cfg = small_pool(0, 3);
    cfg.connection_timeout = std::chrono::milliseconds(5000);
    ConnectionPool pool("audit", cfg, factory);

    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; ++i) {
                auto conn = pool.acquire();
                if (!conn) {
                    failures.fetch_add(1);
                    continue;
                }
                const int now = in_use.fetch_add(1) + 1;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
                std::this_thread::yield();
                in_use.fetch_sub(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(failures.load() == 0);
    CHECK(peak.load() <= 3);
    CHECK(factory->created() <= 3);
}
