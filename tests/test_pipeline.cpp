#include <catch2/catch_test_macros.hpp>
#include "core/json.hpp"
#include "core/pipeline.hpp"
#include "mocks/mock_audit_sink.hpp"
#include "mocks/mock_query_executor.hpp"
#include "mocks/mock_sql_generator.hpp"
#include "mocks/sample_catalog.hpp"
#include <stdexcept>

using namespace sqlguard;
using namespace sqlguard::testing;

namespace {

const Identity kCustomer("customer", "ALFKI", "Maria Anders");
const Identity kEmployee("employee", "8", "Laura Callahan");
const Identity kAdmin("admin", "1", "Andrew Fuller");

struct PipelineFixture {
    std::shared_ptr<MockQueryExecutor> executor = std::make_shared<MockQueryExecutor>();
    std::shared_ptr<MockSqlGenerator> generator;
    std::shared_ptr<CapturedAudit> captured = std::make_shared<CapturedAudit>();
    std::shared_ptr<AuditEmitter> audit;
    std::unique_ptr<Pipeline> pipeline;

    explicit PipelineFixture(GenerationOutcome generated = GenerationOutcome::error("unused"),
                             bool with_generator = true) {
        AuditConfig audit_cfg;
        audit_cfg.batch_flush_interval = std::chrono::milliseconds(20);
        std::vector<std::unique_ptr<IAuditSink>> sinks;
        sinks.push_back(std::make_unique<MockAuditSink>(captured));
        audit = std::make_shared<AuditEmitter>(std::move(sinks), audit_cfg);

        PipelineComponents components;
        components.schema = sample_schema();
        components.policy = sample_policy();
        components.executor = executor;
        components.audit = audit;
        if (with_generator) {
            generator = std::make_shared<MockSqlGenerator>(std::move(generated));
            components.generator = generator;
        }
        pipeline = std::make_unique<Pipeline>(std::move(components));
    }

    // Event names of everything audited so far, in emit order
    std::vector<std::string> audited_events() {
        audit->flush();
        std::vector<std::string> events;
        for (const auto& line : captured->lines()) {
            events.push_back(JsonValue::parse(line).string_or("event"));
        }
        return events;
    }

    JsonValue audited(size_t index) {
        audit->flush();
        return JsonValue::parse(captured->lines().at(index));
    }
};

} // anonymous namespace

// ============================================================================
// Candidate statements
// ============================================================================

TEST_CASE("Pipeline: authorized statement runs with the row filter", "[pipeline]") {
    PipelineFixture fx;

    const auto response = fx.pipeline->process_candidate("SELECT id, total FROM orders", kEmployee);

    REQUIRE(response.status == ResponseStatus::OK);
    CHECK(response.sql == "SELECT id, total FROM orders WHERE orders.employee_id = 8");
    CHECK(fx.executor->last_sql() == response.sql);
    CHECK(response.result.row_count == 2);
    CHECK(response.result.column_names == std::vector<std::string>{"id"});

    CHECK(fx.audited_events() == std::vector<std::string>{"QUERY_EXECUTED"});
    CHECK(fx.audited(0).string_or("sql") == response.sql);
}

TEST_CASE("Pipeline: scalar subqueries run under the row filter", "[pipeline]") {
    PipelineFixture fx;

    const auto response = fx.pipeline->process_candidate(
        "SELECT (SELECT sum(total) FROM orders) AS all_total FROM orders", kEmployee);

    REQUIRE(response.status == ResponseStatus::OK);
    CHECK(fx.executor->last_sql() ==
          "SELECT (SELECT sum(total) FROM orders WHERE orders.employee_id = 8) AS all_total "
          "FROM orders WHERE orders.employee_id = 8");
}

TEST_CASE("Pipeline: aliased tables are filtered through the alias", "[pipeline]") {
    PipelineFixture fx;

    const auto response = fx.pipeline->process_candidate(
        "SELECT o.id, c.company_name FROM orders o JOIN customers c ON o.customer_id = c.customer_id",
        kEmployee);

    REQUIRE(response.status == ResponseStatus::OK);
    CHECK(fx.executor->last_sql() ==
          "SELECT o.id, c.company_name FROM orders o JOIN customers c ON o.customer_id = c.customer_id "
          "WHERE o.employee_id = 8");
}

TEST_CASE("Pipeline: functions that run SQL text are denied", "[pipeline]") {
    PipelineFixture fx;

    const auto response = fx.pipeline->process_candidate(
        "SELECT query_to_xml('select phone from customers', true, true, '') FROM orders", kCustomer);

    REQUIRE(response.status == ResponseStatus::DENIED);
    CHECK(response.reason == DenialReason::FORBIDDEN_QUERY_TYPE);
    CHECK(fx.executor->execute_count() == 0);
}

TEST_CASE("Pipeline: text subject ids are quoted in the filter", "[pipeline]") {
    PipelineFixture fx;

    const auto response = fx.pipeline->process_candidate("SELECT id FROM orders", kCustomer);

    REQUIRE(response.status == ResponseStatus::OK);
    CHECK(fx.executor->last_sql() == "SELECT id FROM orders WHERE orders.customer_id = 'ALFKI'");
}

TEST_CASE("Pipeline: denials never reach the database", "[pipeline]") {
    PipelineFixture fx;

    SECTION("Column outside the role's grants") {
        const auto response = fx.pipeline->process_candidate("SELECT employee_id FROM orders", kCustomer);
        REQUIRE(response.status == ResponseStatus::DENIED);
        CHECK(response.reason == DenialReason::UNAUTHORIZED_COLUMN);
        CHECK(response.message == "Unauthorized access to column: orders.employee_id");
    }

    SECTION("Table outside the role's grants") {
        const auto response = fx.pipeline->process_candidate("SELECT first_name FROM employees", kEmployee);
        REQUIRE(response.status == ResponseStatus::DENIED);
        CHECK(response.reason == DenialReason::UNAUTHORIZED_TABLE);
        CHECK(response.message == "Unauthorized access to table: employees");
    }

    SECTION("Modifying statement") {
        const auto response = fx.pipeline->process_candidate("DELETE FROM orders", kAdmin);
        REQUIRE(response.status == ResponseStatus::DENIED);
        CHECK(response.reason == DenialReason::FORBIDDEN_QUERY_TYPE);
        CHECK(response.message == "Forbidden query type. Only SELECT queries are allowed.");
    }

    SECTION("Stacked statement") {
        const auto response = fx.pipeline->process_candidate(
            "SELECT id FROM orders; DROP TABLE orders", kAdmin);
        REQUIRE(response.status == ResponseStatus::DENIED);
        CHECK(response.reason == DenialReason::INJECTION_SUSPECTED);
    }

    CHECK(fx.executor->execute_count() == 0);
    CHECK(fx.audited_events() == std::vector<std::string>{"SECURITY_VIOLATION"});
    CHECK(fx.pipeline->get_stats().requests_denied == 1);
}

TEST_CASE("Pipeline: execution errors come back with the final SQL", "[pipeline]") {
    PipelineFixture fx;
    fx.executor->set_should_succeed(false);
    fx.executor->set_error_kind(ExecutionErrorKind::TIMEOUT);

    const auto response = fx.pipeline->process_candidate("SELECT id FROM orders", kEmployee);

    REQUIRE(response.status == ResponseStatus::EXECUTION_ERROR);
    CHECK(response.error_kind == ExecutionErrorKind::TIMEOUT);
    CHECK(response.sql == "SELECT id FROM orders WHERE orders.employee_id = 8");
    CHECK(response.message == "Mock failure");

    const auto record = fx.audited(0);
    CHECK(record.string_or("event") == "EXECUTION_FAILED");
    CHECK(record.string_or("error_kind") == "timeout");
}

TEST_CASE("Pipeline: sensitive columns are audited before execution", "[pipeline]") {
    PipelineFixture fx;

    const auto response = fx.pipeline->process_candidate(
        "SELECT company_name, contact_name, phone FROM customers", kAdmin);
    REQUIRE(response.status == ResponseStatus::OK);

    CHECK(fx.audited_events() == std::vector<std::string>{"DATA_ACCESS", "QUERY_EXECUTED"});
    const auto access = fx.audited(0);
    CHECK(access["sensitive_columns"].size() == 2);
    CHECK(access["sensitive_columns"][0].get<std::string>() == "customers.contact_name");
    CHECK(access["sensitive_columns"][1].get<std::string>() == "customers.phone");
    CHECK(access["identity"].string_or("display_name") == "Andrew Fuller");
}

TEST_CASE("Pipeline: stats count each outcome", "[pipeline]") {
    PipelineFixture fx;

    (void)fx.pipeline->process_candidate("SELECT id FROM orders", kEmployee);
    (void)fx.pipeline->process_candidate("SELECT phone FROM customers", kCustomer);
    fx.executor->set_should_succeed(false);
    (void)fx.pipeline->process_candidate("SELECT id FROM orders", kEmployee);

    const auto stats = fx.pipeline->get_stats();
    CHECK(stats.total_requests == 3);
    CHECK(stats.requests_executed == 1);
    CHECK(stats.requests_denied == 1);
    CHECK(stats.execution_failures == 1);
    CHECK(stats.generator_passthroughs == 0);
}

// ============================================================================
// Questions
// ============================================================================

TEST_CASE("Pipeline: generated SQL goes through authorization", "[pipeline][generator]") {
    SECTION("Allowed") {
        PipelineFixture fx(GenerationOutcome::sql("SELECT id, total FROM orders"));

        const auto response = fx.pipeline->process_question("What are my orders?", kCustomer);
        REQUIRE(response.status == ResponseStatus::OK);
        CHECK(response.sql == "SELECT id, total FROM orders WHERE orders.customer_id = 'ALFKI'");
        CHECK(fx.audited(0).string_or("question") == "What are my orders?");
    }

    SECTION("Denied") {
        PipelineFixture fx(GenerationOutcome::sql("SELECT first_name, home_phone FROM employees"));

        const auto response = fx.pipeline->process_question("Who handles my orders?", kCustomer);
        REQUIRE(response.status == ResponseStatus::DENIED);
        CHECK(response.reason == DenialReason::UNAUTHORIZED_TABLE);
        CHECK(fx.executor->execute_count() == 0);
    }
}

TEST_CASE("Pipeline: generator sees only the role's schema", "[pipeline][generator]") {
    PipelineFixture fx(GenerationOutcome::sql("SELECT id FROM orders"));

    (void)fx.pipeline->process_question("How many orders did I place?", kCustomer);

    REQUIRE(fx.generator->last_request().has_value());
    const auto& request = *fx.generator->last_request();
    CHECK(request.question == "How many orders did I place?");
    CHECK(request.identity.subject_id == "ALFKI");
    REQUIRE(request.visible_schema);
    CHECK(request.visible_schema->table_names() == std::vector<std::string>{"orders"});
    CHECK(request.visible_schema->columns("orders") == std::vector<std::string>{"id", "total"});
    CHECK(request.row_filter == std::optional<std::string>("orders.customer_id = 'ALFKI'"));

    SECTION("Roles without a template get no filter") {
        (void)fx.pipeline->process_question("List invoices", kAdmin);
        CHECK_FALSE(fx.generator->last_request()->row_filter.has_value());
        CHECK(fx.generator->last_request()->visible_schema->table_count() == 4);
    }
}

TEST_CASE("Pipeline: non-SQL replies are passed through", "[pipeline][generator]") {
    SECTION("Clarification") {
        PipelineFixture fx(GenerationOutcome::clarification("Which year do you mean?"));
        const auto response = fx.pipeline->process_question("Show sales", kEmployee);
        CHECK(response.status == ResponseStatus::CLARIFICATION);
        CHECK(response.message == "Which year do you mean?");
        CHECK(fx.executor->execute_count() == 0);
        CHECK(fx.pipeline->get_stats().generator_passthroughs == 1);
        CHECK(fx.audited_events() == std::vector<std::string>{"GENERATOR_OUTCOME"});
    }

    SECTION("Refusal") {
        PipelineFixture fx(GenerationOutcome::refusal("Access denied"));
        const auto response = fx.pipeline->process_question("Show all salaries", kCustomer);
        CHECK(response.status == ResponseStatus::REFUSAL);
        CHECK(response.message == "Access denied");
        CHECK(fx.executor->execute_count() == 0);
    }

    SECTION("Generator failure") {
        PipelineFixture fx(GenerationOutcome::error("API error: HTTP 503"));
        const auto response = fx.pipeline->process_question("Show sales", kEmployee);
        CHECK(response.status == ResponseStatus::GENERATOR_ERROR);
        CHECK(response.message == "API error: HTTP 503");
    }
}

TEST_CASE("Pipeline: questions need a generator", "[pipeline][generator]") {
    PipelineFixture fx(GenerationOutcome::error("unused"), false);

    const auto response = fx.pipeline->process_question("Show sales", kEmployee);
    CHECK(response.status == ResponseStatus::GENERATOR_ERROR);
    CHECK(response.message.find("not configured") != std::string::npos);
}

// ============================================================================
// Sensitive columns
// ============================================================================

TEST_CASE("Pipeline: sensitive_columns_accessed", "[pipeline]") {
    const auto schema = sample_schema();
    const auto policy = sample_policy();
    const auto accessed = [&](const std::string& sql) {
        return Pipeline::sensitive_columns_accessed(sql, *schema, *policy);
    };

    CHECK(accessed("SELECT id, total FROM orders").empty());
    CHECK(accessed("SELECT home_phone FROM employees") ==
          std::vector<std::string>{"employees.home_phone"});
    CHECK(accessed("SELECT customers.phone, orders.id FROM customers "
                   "JOIN orders ON orders.customer_id = customers.customer_id") ==
          std::vector<std::string>{"customers.phone"});
    CHECK(accessed("SELECT phone, phone FROM customers") ==
          std::vector<std::string>{"customers.phone"});
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Pipeline: reinitialize_schema swaps the catalog", "[pipeline]") {
    PipelineFixture fx;
    CHECK(fx.pipeline->schema()->table_count() == 4);

    // Wildcards expand against the current catalog
    CHECK(fx.pipeline->process_candidate("SELECT * FROM orders", kCustomer).status ==
          ResponseStatus::DENIED);

    SchemaCatalog::Builder builder("public");
    builder.add_table("orders", {"id", "total"});
    const auto previous = fx.pipeline->schema();
    fx.pipeline->reinitialize_schema(std::make_shared<const SchemaCatalog>(builder.build()));

    CHECK(fx.pipeline->schema()->table_count() == 1);
    CHECK(previous->table_count() == 4);
    CHECK(fx.pipeline->process_candidate("SELECT * FROM orders", kCustomer).status ==
          ResponseStatus::OK);

    SECTION("A missing catalog is ignored") {
        fx.pipeline->reinitialize_schema(nullptr);
        CHECK(fx.pipeline->schema()->table_count() == 1);
    }
}

TEST_CASE("Pipeline: required collaborators", "[pipeline]") {
    PipelineComponents components;
    components.schema = sample_schema();
    components.policy = sample_policy();
    CHECK_THROWS_AS(Pipeline(components), std::invalid_argument);

    components.executor = std::make_shared<MockQueryExecutor>();
    CHECK_NOTHROW(Pipeline(components));
}
