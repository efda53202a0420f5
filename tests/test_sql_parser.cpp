#include <catch2/catch_test_macros.hpp>
#include "parser/sql_parser.hpp"

using namespace sqlguard;

TEST_CASE("SqlParser: single SELECT is read-only", "[parser]") {
    const auto shape = SqlParser::inspect("SELECT id, total FROM orders WHERE total > 10");

    CHECK(shape.parsed);
    CHECK(shape.statement_count == 1);
    CHECK(shape.type == "SelectStmt");
    CHECK(shape.is_single_read_only_select());
}

TEST_CASE("SqlParser: set operations and CTEs are still one SELECT", "[parser]") {
    CHECK(SqlParser::inspect("SELECT id FROM orders UNION SELECT id FROM invoices")
              .is_single_read_only_select());
    CHECK(SqlParser::inspect("WITH big AS (SELECT id FROM orders) SELECT id FROM big")
              .is_single_read_only_select());
}

TEST_CASE("SqlParser: multiple statements are counted", "[parser]") {
    const auto shape = SqlParser::inspect("SELECT 1; SELECT 2");

    CHECK(shape.parsed);
    CHECK(shape.statement_count == 2);
    CHECK_FALSE(shape.is_single_read_only_select());
}

TEST_CASE("SqlParser: data-modifying statements are rejected", "[parser]") {
    SECTION("DELETE") {
        const auto shape = SqlParser::inspect("DELETE FROM orders");
        CHECK(shape.type == "DeleteStmt");
        CHECK_FALSE(shape.is_single_read_only_select());
    }

    SECTION("SELECT INTO creates a table") {
        const auto shape = SqlParser::inspect("SELECT id INTO copy_of_orders FROM orders");
        CHECK(shape.select_into);
        CHECK_FALSE(shape.is_single_read_only_select());
    }

    SECTION("Row locks") {
        const auto shape = SqlParser::inspect("SELECT id FROM orders FOR UPDATE");
        CHECK(shape.locking_clause);
        CHECK_FALSE(shape.is_single_read_only_select());
    }

    SECTION("Writable CTE") {
        const auto shape = SqlParser::inspect(
            "WITH gone AS (DELETE FROM orders RETURNING id) SELECT id FROM gone");
        CHECK(shape.type == "SelectStmt");
        CHECK(shape.data_modifying);
        CHECK_FALSE(shape.is_single_read_only_select());
    }
}

TEST_CASE("SqlParser: syntax errors are reported, not thrown", "[parser]") {
    const auto shape = SqlParser::inspect("SELEC id FROM orders");

    CHECK_FALSE(shape.parsed);
    CHECK_FALSE(shape.error.empty());
    CHECK_FALSE(shape.is_single_read_only_select());
}
