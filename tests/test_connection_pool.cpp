#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_connection.hpp"
#include <thread>

using namespace sqlguard;
using namespace sqlguard::testing;
using namespace std::chrono_literals;

namespace {

struct PoolFixture {
    std::shared_ptr<MockConnectionState> state = std::make_shared<MockConnectionState>();
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>(state);

    PoolConfig config(size_t min, size_t max) const {
        PoolConfig cfg;
        cfg.connection_string = "postgresql://mock/test";
        cfg.min_connections = min;
        cfg.max_connections = max;
        return cfg;
    }
};

} // anonymous namespace

TEST_CASE("ConnectionPool: min connections are pre-warmed", "[pool]") {
    PoolFixture fx;
    GenericConnectionPool pool(fx.config(2, 4), fx.factory);

    CHECK(fx.factory->created() == 2);
    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(stats.active_connections == 0);
}

TEST_CASE("ConnectionPool: released connections are reused", "[pool]") {
    PoolFixture fx;
    GenericConnectionPool pool(fx.config(1, 4), fx.factory);

    {
        auto conn = pool.acquire(100ms);
        REQUIRE(conn != nullptr);
        CHECK(conn->is_valid());
        CHECK(pool.get_stats().active_connections == 1);
    }
    {
        auto conn = pool.acquire(100ms);
        REQUIRE(conn != nullptr);
    }

    CHECK(fx.factory->created() == 1);
    const auto stats = pool.get_stats();
    CHECK(stats.total_acquires == 2);
    CHECK(stats.total_releases == 2);
    CHECK(stats.idle_connections == 1);
}

TEST_CASE("ConnectionPool: bounded by max_connections", "[pool]") {
    PoolFixture fx;
    GenericConnectionPool pool(fx.config(0, 1), fx.factory);

    auto held = pool.acquire(100ms);
    REQUIRE(held != nullptr);

    auto second = pool.acquire(50ms);
    CHECK(second == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    held.reset();
    auto third = pool.acquire(50ms);
    CHECK(third != nullptr);
}

TEST_CASE("ConnectionPool: waiting acquire succeeds once a lease is returned", "[pool]") {
    PoolFixture fx;
    GenericConnectionPool pool(fx.config(1, 1), fx.factory);

    auto held = pool.acquire(100ms);
    REQUIRE(held != nullptr);

    std::thread releaser([&held] {
        std::this_thread::sleep_for(30ms);
        held.reset();
    });

    auto waited = pool.acquire(2000ms);
    releaser.join();
    CHECK(waited != nullptr);
}

TEST_CASE("ConnectionPool: factory failure does not leak a slot", "[pool]") {
    PoolFixture fx;
    GenericConnectionPool pool(fx.config(0, 1), fx.factory);

    fx.factory->set_fail(true);
    CHECK(pool.acquire(50ms) == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    fx.factory->set_fail(false);
    CHECK(pool.acquire(50ms) != nullptr);
}

TEST_CASE("ConnectionPool: idle connections failing the health check are replaced", "[pool]") {
    PoolFixture fx;
    auto cfg = fx.config(1, 2);
    cfg.idle_timeout = 1ms;
    GenericConnectionPool pool(cfg, fx.factory);

    std::this_thread::sleep_for(10ms);
    fx.state->healthy = false;

    auto conn = pool.acquire(100ms);
    REQUIRE(conn != nullptr);
    CHECK(fx.factory->created() == 2);
    CHECK(fx.state->closed.load() == 1);
    CHECK(pool.get_stats().health_check_failures == 1);
}

TEST_CASE("ConnectionPool: connections past max_lifetime are recycled", "[pool][slow]") {
    PoolFixture fx;
    auto cfg = fx.config(1, 2);
    cfg.max_lifetime = 1s;
    GenericConnectionPool pool(cfg, fx.factory);

    std::this_thread::sleep_for(1100ms);

    auto conn = pool.acquire(100ms);
    REQUIRE(conn != nullptr);
    CHECK(fx.factory->created() == 2);
    CHECK(pool.get_stats().connections_recycled == 1);
}

TEST_CASE("ConnectionPool: broken connections are discarded on release", "[pool]") {
    PoolFixture fx;
    GenericConnectionPool pool(fx.config(0, 2), fx.factory);

    {
        auto conn = pool.acquire(100ms);
        REQUIRE(conn != nullptr);
        conn->close();
    }

    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.idle_connections == 0);
}

TEST_CASE("ConnectionPool: drain closes idle connections and refuses acquires", "[pool]") {
    PoolFixture fx;
    GenericConnectionPool pool(fx.config(2, 2), fx.factory);

    pool.drain();

    CHECK(fx.state->closed.load() == 2);
    CHECK(pool.acquire(10ms) == nullptr);
    CHECK(pool.get_stats().total_connections == 0);

    // Idempotent
    pool.drain();
    CHECK(fx.state->closed.load() == 2);
}
