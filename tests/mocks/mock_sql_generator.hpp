#pragma once

#include "core/sql_generator.hpp"
#include <optional>

namespace sqlguard::testing {

/**
 * @brief Returns a fixed outcome and keeps the last request for inspection
 */
class MockSqlGenerator : public ISqlGenerator {
public:
    explicit MockSqlGenerator(GenerationOutcome outcome)
        : outcome_(std::move(outcome)) {}

    GenerationOutcome generate(const GenerationRequest& request) override {
        last_request_ = request;
        ++calls_;
        return outcome_;
    }

    [[nodiscard]] const std::optional<GenerationRequest>& last_request() const { return last_request_; }
    [[nodiscard]] int calls() const { return calls_; }

private:
    GenerationOutcome outcome_;
    std::optional<GenerationRequest> last_request_;
    int calls_ = 0;
};

} // namespace sqlguard::testing
