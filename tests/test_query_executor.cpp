#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "db/generic_query_executor.hpp"
#include "mocks/mock_connection.hpp"
#include <thread>

using namespace sqlguard;
using namespace sqlguard::testing;
using namespace std::chrono_literals;

namespace {

constexpr const char* kQuery = "SELECT id FROM orders WHERE orders.employee_id = 8";

bool is_control(const std::string& sql) {
    return sql == "BEGIN TRANSACTION READ ONLY" || sql == "ROLLBACK";
}

struct ExecutorFixture {
    std::shared_ptr<MockConnectionState> state = std::make_shared<MockConnectionState>();
    std::shared_ptr<MockConnectionFactory> factory = std::make_shared<MockConnectionFactory>(state);
    std::shared_ptr<GenericConnectionPool> pool;
    GenericQueryExecutor::Config config;

    ExecutorFixture() {
        PoolConfig pool_cfg;
        pool_cfg.min_connections = 1;
        pool_cfg.max_connections = 1;
        pool = std::make_shared<GenericConnectionPool>(pool_cfg, factory);
        config.query_timeout_ms = 2500;
        config.max_result_rows = 5;
        config.acquire_timeout = 50ms;
    }

    // Responder for the statement under test; BEGIN/ROLLBACK always succeed
    void respond(std::function<DbResultSet(size_t)> fn) {
        std::lock_guard lock(state->mutex);
        state->responder = [fn = std::move(fn)](const std::string& sql, size_t max_rows) {
            return is_control(sql) ? make_ok() : fn(max_rows);
        };
    }

    GenericQueryExecutor executor() const { return GenericQueryExecutor(pool, config); }
};

} // anonymous namespace

// ============================================================================
// Success path
// ============================================================================

TEST_CASE("QueryExecutor: runs inside a read-only transaction", "[executor]") {
    ExecutorFixture fx;
    fx.respond([](size_t) {
        return make_rows({"id", "ship_region"}, {{std::string("10248"), std::nullopt}});
    });

    auto exec = fx.executor();
    const auto outcome = exec.execute(kQuery);

    REQUIRE(outcome.success);
    CHECK(outcome.result.column_names == std::vector<std::string>{"id", "ship_region"});
    REQUIRE(outcome.result.row_count == 1);
    CHECK(outcome.result.rows[0][0] == "10248");
    CHECK_FALSE(outcome.result.rows[0][1].has_value());
    CHECK(outcome.result.elapsed_ms >= 0.0);

    const auto statements = fx.state->statements();
    REQUIRE(statements.size() == 3);
    CHECK(statements[0] == "BEGIN TRANSACTION READ ONLY");
    CHECK(statements[1] == kQuery);
    CHECK(statements[2] == "ROLLBACK");
    CHECK(fx.state->last_timeout_ms.load() == 2500);

    // Lease returned
    CHECK(fx.pool->get_stats().idle_connections == 1);
}

TEST_CASE("QueryExecutor: fetches one row past the limit", "[executor]") {
    ExecutorFixture fx;
    size_t requested = 0;
    fx.respond([&requested](size_t max_rows) {
        requested = max_rows;
        return make_rows({"id"}, {{std::string("1")}});
    });

    auto exec = fx.executor();
    REQUIRE(exec.execute(kQuery).success);
    CHECK(requested == 6);
}

TEST_CASE("QueryExecutor: statement_timeout failure is not fatal", "[executor]") {
    ExecutorFixture fx;
    fx.state->accept_timeout = false;

    auto exec = fx.executor();
    CHECK(exec.execute(kQuery).success);
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("QueryExecutor: oversized results", "[executor]") {
    ExecutorFixture fx;
    fx.respond([](size_t) {
        auto rs = make_rows({"id"}, {{std::string("1")}});
        rs.total_rows = 6;
        return rs;
    });

    auto exec = fx.executor();
    const auto outcome = exec.execute(kQuery);
    REQUIRE_FALSE(outcome.success);
    CHECK(outcome.error_kind == ExecutionErrorKind::RESULT_TOO_LARGE);
}

TEST_CASE("QueryExecutor: driver errors keep the server message", "[executor]") {
    ExecutorFixture fx;
    fx.respond([](size_t) {
        return DbResultSet::failure("relation \"ordrs\" does not exist", "42P01");
    });

    auto exec = fx.executor();
    const auto outcome = exec.execute("SELECT id FROM ordrs");
    REQUIRE_FALSE(outcome.success);
    CHECK(outcome.error_kind == ExecutionErrorKind::DRIVER_ERROR);
    CHECK(outcome.error_message.find("does not exist") != std::string::npos);

    // Rolled back even after the failure
    CHECK(fx.state->statements().back() == "ROLLBACK");
}

TEST_CASE("QueryExecutor: query_canceled without a cancel request is a timeout", "[executor]") {
    ExecutorFixture fx;
    fx.respond([](size_t) {
        return DbResultSet::failure("canceling statement due to statement timeout", "57014");
    });

    auto exec = fx.executor();
    const auto outcome = exec.execute(kQuery);
    REQUIRE_FALSE(outcome.success);
    CHECK(outcome.error_kind == ExecutionErrorKind::TIMEOUT);
}

TEST_CASE("QueryExecutor: BEGIN failure stops before the statement", "[executor]") {
    ExecutorFixture fx;
    {
        std::lock_guard lock(fx.state->mutex);
        fx.state->responder = [](const std::string& sql, size_t) {
            return sql == "BEGIN TRANSACTION READ ONLY"
                ? DbResultSet::failure("server closed the connection unexpectedly")
                : make_ok();
        };
    }

    auto exec = fx.executor();
    const auto outcome = exec.execute(kQuery);
    REQUIRE_FALSE(outcome.success);
    CHECK(outcome.error_kind == ExecutionErrorKind::DRIVER_ERROR);
    CHECK(fx.state->statements().size() == 1);
}

TEST_CASE("QueryExecutor: no connection available", "[executor]") {
    ExecutorFixture fx;
    auto held = fx.pool->acquire(50ms);
    REQUIRE(held != nullptr);

    auto exec = fx.executor();
    const auto outcome = exec.execute(kQuery);
    REQUIRE_FALSE(outcome.success);
    CHECK(outcome.error_kind == ExecutionErrorKind::POOL_EXHAUSTED);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE("CancellationToken: hook fires once", "[cancel]") {
    CancellationToken token;
    int fired = 0;
    token.register_hook([&fired] { ++fired; return true; });

    token.cancel();
    token.cancel();
    CHECK(token.is_cancelled());
    CHECK(fired == 1);
}

TEST_CASE("CancellationToken: late hook fires immediately", "[cancel]") {
    CancellationToken token;
    token.cancel();

    int fired = 0;
    {
        CancellationToken::ScopedHook hook(&token, [&fired] { ++fired; return true; });
        CHECK(fired == 1);
    }
    token.cancel();
    CHECK(fired == 1);
}

TEST_CASE("QueryExecutor: already-cancelled request never touches the database", "[executor][cancel]") {
    ExecutorFixture fx;
    CancellationToken token;
    token.cancel();

    auto exec = fx.executor();
    const auto outcome = exec.execute(kQuery, &token);
    REQUIRE_FALSE(outcome.success);
    CHECK(outcome.error_kind == ExecutionErrorKind::CANCELLED);
    CHECK(fx.state->statements().empty());
}

TEST_CASE("QueryExecutor: cancelling a running statement", "[executor][cancel]") {
    ExecutorFixture fx;
    auto state = fx.state;
    fx.respond([state](size_t) {
        // Simulated long query: runs until the server-side cancel arrives
        for (int i = 0; i < 400 && state->cancel_requests.load() == 0; ++i) {
            std::this_thread::sleep_for(5ms);
        }
        return DbResultSet::failure("canceling statement due to user request", "57014");
    });

    CancellationToken token;
    auto exec = fx.executor();
    ExecutionOutcome outcome;
    std::thread worker([&] { outcome = exec.execute(kQuery, &token); });

    // Wait for the statement to start
    for (int i = 0; i < 400; ++i) {
        const auto statements = fx.state->statements();
        if (statements.size() >= 2) break;
        std::this_thread::sleep_for(5ms);
    }
    token.cancel();
    worker.join();

    REQUIRE_FALSE(outcome.success);
    CHECK(outcome.error_kind == ExecutionErrorKind::CANCELLED);
    CHECK(fx.state->cancel_requests.load() == 1);
    CHECK(fx.state->statements().back() == "ROLLBACK");
}
