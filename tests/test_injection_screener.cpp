#include <catch2/catch_test_macros.hpp>
#include "security/injection_screener.hpp"
#include "mocks/sample_catalog.hpp"

using namespace sqlguard;
using sqlguard::testing::sample_policy;

TEST_CASE("InjectionScreener: plain SELECTs pass", "[injection]") {
    const InjectionScreener screener(sample_policy());

    CHECK_FALSE(screener.scan("SELECT id, total FROM orders WHERE total > 10"));
    CHECK_FALSE(screener.scan("SELECT id FROM orders;"));
    CHECK_FALSE(screener.scan("SELECT id FROM orders;   \n"));
    CHECK_FALSE(screener.scan("SELECT id FROM orders UNION SELECT id FROM invoices"));
}

TEST_CASE("InjectionScreener: stacked statements", "[injection]") {
    const InjectionScreener screener(sample_policy());

    CHECK(screener.scan("SELECT name FROM customers; DROP TABLE customers;"));
    CHECK(screener.first_match("SELECT 1; SELECT 2") == R"(;(?!\s*$))");
}

TEST_CASE("InjectionScreener: comments", "[injection]") {
    const InjectionScreener screener(sample_policy());

    CHECK(screener.first_match("SELECT id FROM orders -- WHERE customer_id = 1") == "--|#");
    CHECK(screener.scan("SELECT id FROM orders # tail"));
}

TEST_CASE("InjectionScreener: write keywords match case-insensitively", "[injection]") {
    const InjectionScreener screener(sample_policy());

    CHECK(screener.scan("select id from orders where exists (delete from orders)"));
    CHECK(screener.scan("SELECT id FROM orders WHERE 1 = 1 AND UpDaTe"));
    // Word boundaries: column names that merely contain a keyword pass
    CHECK_FALSE(screener.scan("SELECT updated_at, dropped FROM orders"));
}

TEST_CASE("InjectionScreener: tautologies and bare UNION", "[injection]") {
    const InjectionScreener screener(sample_policy());

    CHECK(screener.scan("SELECT id FROM orders WHERE customer_id = 5 OR 1=1"));
    CHECK(screener.scan("SELECT id FROM orders WHERE id = 1 or 1 = 1"));
    CHECK(screener.scan("SELECT id FROM orders UNION ALL SELECT id FROM invoices"));
}

TEST_CASE("InjectionScreener: no patterns configured", "[injection]") {
    PolicyConfig cfg;
    const auto policy = PolicyStore::create(cfg);
    REQUIRE(policy.is_ok());

    const InjectionScreener screener(policy.value());
    CHECK_FALSE(screener.scan("SELECT 1; DROP TABLE orders"));
    CHECK_FALSE(screener.first_match("anything").has_value());
}
