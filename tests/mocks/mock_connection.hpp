#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlguard::testing {

/**
 * @brief State shared by every connection a MockConnectionFactory hands out
 *
 * Outlives the connections, so tests can inspect what ran after the pool
 * has taken the connection back.
 */
struct MockConnectionState {
    using Responder = std::function<DbResultSet(const std::string& sql, size_t max_rows)>;

    // Called for every statement; unset = empty successful result
    Responder responder;

    std::atomic<bool> healthy{true};
    std::atomic<bool> accept_timeout{true};
    std::atomic<uint32_t> last_timeout_ms{0};
    std::atomic<int> cancel_requests{0};
    std::atomic<int> closed{0};

    void record(const std::string& sql) {
        std::lock_guard lock(mutex);
        executed.push_back(sql);
    }

    [[nodiscard]] std::vector<std::string> statements() const {
        std::lock_guard lock(mutex);
        return executed;
    }

    mutable std::mutex mutex;
    std::vector<std::string> executed;
};

inline DbResultSet make_rows(std::vector<std::string> columns, std::vector<Row> rows) {
    DbResultSet r;
    r.success = true;
    r.has_rows = true;
    r.column_names = std::move(columns);
    r.total_rows = rows.size();
    r.rows = std::move(rows);
    return r;
}

inline DbResultSet make_ok() {
    DbResultSet r;
    r.success = true;
    return r;
}

class MockDbConnection : public IDbConnection {
public:
    explicit MockDbConnection(std::shared_ptr<MockConnectionState> state)
        : state_(std::move(state)) {}

    [[nodiscard]] DbResultSet execute(const std::string& sql, size_t max_rows) override {
        state_->record(sql);
        MockConnectionState::Responder responder;
        {
            std::lock_guard lock(state_->mutex);
            responder = state_->responder;
        }
        return responder ? responder(sql, max_rows) : make_ok();
    }

    [[nodiscard]] bool is_healthy(const std::string& /*health_check_query*/) override {
        return state_->healthy.load();
    }

    [[nodiscard]] bool is_connected() const override { return connected_; }

    bool set_query_timeout(uint32_t timeout_ms) override {
        state_->last_timeout_ms.store(timeout_ms);
        return state_->accept_timeout.load();
    }

    [[nodiscard]] std::function<bool()> cancel_handle() override {
        auto state = state_;
        return [state] {
            state->cancel_requests.fetch_add(1);
            return true;
        };
    }

    void close() override {
        if (connected_) state_->closed.fetch_add(1);
        connected_ = false;
    }

    void disconnect() { connected_ = false; }

private:
    std::shared_ptr<MockConnectionState> state_;
    bool connected_ = true;
};

class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(std::shared_ptr<MockConnectionState> state)
        : state_(std::move(state)) {}

    [[nodiscard]] std::unique_ptr<IDbConnection> create(
        const std::string& /*connection_string*/) override {
        if (fail_.load()) return nullptr;
        created_.fetch_add(1);
        return std::make_unique<MockDbConnection>(state_);
    }

    void set_fail(bool fail) { fail_.store(fail); }
    [[nodiscard]] int created() const { return created_.load(); }

private:
    std::shared_ptr<MockConnectionState> state_;
    std::atomic<bool> fail_{false};
    std::atomic<int> created_{0};
};

} // namespace sqlguard::testing
