#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_schema_loader.hpp"
#include "mocks/mock_connection.hpp"

using namespace sqlguard;
using namespace sqlguard::testing;

namespace {

struct LoaderFixture {
    std::shared_ptr<MockConnectionState> state = std::make_shared<MockConnectionState>();
    MockDbConnection conn{state};
    DbResultSet columns;
    DbResultSet foreign_keys = make_rows({"table_name", "column_name", "table_name", "column_name"}, {});

    LoaderFixture() {
        columns = make_rows({"table_name", "column_name"}, {
            {std::string("customers"), std::string("customer_id")},
            {std::string("customers"), std::string("company_name")},
            {std::string("orders"), std::string("id")},
            {std::string("orders"), std::string("customer_id")},
            {std::string("orders"), std::string("employee_id")},
        });
    }

    void install() {
        std::lock_guard lock(state->mutex);
        state->responder = [this](const std::string& sql, size_t) {
            if (sql.find("FOREIGN KEY") != std::string::npos) return foreign_keys;
            if (sql.find("information_schema.columns") != std::string::npos) return columns;
            return DbResultSet::failure("unexpected statement");
        };
    }
};

} // anonymous namespace

TEST_CASE("PgSchemaLoader: builds the catalog in server order", "[schema_loader]") {
    LoaderFixture fx;
    fx.foreign_keys = make_rows({"table_name", "column_name", "table_name", "column_name"}, {
        {std::string("orders"), std::string("customer_id"),
         std::string("customers"), std::string("customer_id")},
    });
    fx.install();

    PgSchemaLoader loader;
    auto result = loader.load(fx.conn, "public");
    REQUIRE(result.is_ok());

    const auto& catalog = *result.value();
    CHECK(catalog.schema_name() == "public");
    CHECK(catalog.table_names() == std::vector<std::string>{"customers", "orders"});
    CHECK(catalog.columns("orders") == std::vector<std::string>{"id", "customer_id", "employee_id"});

    REQUIRE(catalog.relationships().size() == 1);
    const auto& fk = catalog.relationships().begin()->second;
    CHECK(fk.child_table == "orders");
    CHECK(fk.child_column == "customer_id");
    CHECK(fk.parent_table == "customers");
    CHECK(fk.parent_column == "customer_id");

    // Columns first, then foreign keys
    const auto statements = fx.state->statements();
    REQUIRE(statements.size() == 2);
    CHECK(statements[0].find("information_schema.columns") != std::string::npos);
    CHECK(statements[1].find("FOREIGN KEY") != std::string::npos);
}

TEST_CASE("PgSchemaLoader: later constraint between the same tables wins", "[schema_loader]") {
    LoaderFixture fx;
    fx.foreign_keys = make_rows({"table_name", "column_name", "table_name", "column_name"}, {
        {std::string("orders"), std::string("customer_id"),
         std::string("customers"), std::string("customer_id")},
        {std::string("orders"), std::string("id"),
         std::string("customers"), std::string("customer_id")},
    });
    fx.install();

    PgSchemaLoader loader;
    auto result = loader.load(fx.conn, "public");
    REQUIRE(result.is_ok());

    const auto& relationships = result.value()->relationships();
    REQUIRE(relationships.size() == 1);
    CHECK(relationships.begin()->second.child_column == "id");
}

TEST_CASE("PgSchemaLoader: empty schema is unavailable", "[schema_loader]") {
    LoaderFixture fx;
    fx.columns = make_rows({"table_name", "column_name"}, {});
    fx.install();

    PgSchemaLoader loader;
    auto result = loader.load(fx.conn, "sales");
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::SCHEMA_UNAVAILABLE);
    CHECK(result.error_message().find("sales") != std::string::npos);
}

TEST_CASE("PgSchemaLoader: introspection failures", "[schema_loader]") {
    LoaderFixture fx;
    PgSchemaLoader loader;

    SECTION("Column query fails") {
        fx.columns = DbResultSet::failure("permission denied for schema information_schema");
        fx.install();
        auto result = loader.load(fx.conn, "public");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::SCHEMA_UNAVAILABLE);
        CHECK(result.error_message().find("permission denied") != std::string::npos);
        CHECK(fx.state->statements().size() == 1);
    }

    SECTION("Foreign key query fails") {
        fx.foreign_keys = DbResultSet::failure("canceling statement due to statement timeout", "57014");
        fx.install();
        auto result = loader.load(fx.conn, "public");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::SCHEMA_UNAVAILABLE);
    }

    SECTION("Connection closed") {
        fx.conn.disconnect();
        auto result = loader.load(fx.conn, "public");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::SCHEMA_UNAVAILABLE);
        CHECK(fx.state->statements().empty());
    }
}

TEST_CASE("PgSchemaLoader: schema name is quoted as a literal", "[schema_loader]") {
    const auto columns = PgSchemaLoader::columns_query("o'neil");
    CHECK(columns.find("table_schema = 'o''neil'") != std::string::npos);

    const auto fks = PgSchemaLoader::foreign_keys_query("o'neil");
    CHECK(fks.find("'o''neil'") != std::string::npos);
    CHECK(fks.find("FOREIGN KEY") != std::string::npos);
}
