#include <catch2/catch_test_macros.hpp>
#include "parser/sql_lexer.hpp"

using namespace sqlguard;

// ============================================================================
// Tokenization
// ============================================================================

TEST_CASE("SqlLexer: keywords are uppercased, identifiers lowercased", "[lexer]") {
    const auto tokens = SqlLexer::tokenize("select Orders.ID from ORDERS");

    REQUIRE(tokens.size() == 6);
    CHECK(tokens[0].is_keyword("SELECT"));
    CHECK(tokens[1].kind == TokenKind::IDENTIFIER);
    CHECK(tokens[1].text == "orders");
    CHECK(tokens[2].is(TokenKind::DOT));
    CHECK(tokens[3].text == "id");
    CHECK(tokens[4].is_keyword("FROM"));
    CHECK(tokens[5].text == "orders");
}

TEST_CASE("SqlLexer: offsets point back into the source", "[lexer]") {
    const std::string sql = "SELECT  total FROM orders";
    const auto tokens = SqlLexer::tokenize(sql);

    REQUIRE(tokens.size() == 4);
    CHECK(sql.substr(tokens[1].offset, tokens[1].length) == "total");
    CHECK(tokens[3].end() == sql.size());
}

TEST_CASE("SqlLexer: comments are dropped", "[lexer]") {
    SECTION("Line comment") {
        const auto tokens = SqlLexer::tokenize("SELECT 1 -- trailing note\n");
        REQUIRE(tokens.size() == 2);
        CHECK(tokens[1].kind == TokenKind::NUMBER);
    }

    SECTION("Nested block comment") {
        const auto tokens = SqlLexer::tokenize("SELECT /* a /* b */ still comment */ id");
        REQUIRE(tokens.size() == 2);
        CHECK(tokens[1].text == "id");
    }
}

TEST_CASE("SqlLexer: string literals keep their raw text", "[lexer]") {
    const auto tokens = SqlLexer::tokenize("SELECT 'it''s; DROP' AS x");

    REQUIRE(tokens.size() == 4);
    CHECK(tokens[1].kind == TokenKind::STRING_LITERAL);
    CHECK(tokens[1].text == "'it''s; DROP'");
    CHECK(tokens[2].is_keyword("AS"));
}

TEST_CASE("SqlLexer: escape and dollar-quoted strings", "[lexer]") {
    SECTION("E-string honours backslash escapes") {
        const auto tokens = SqlLexer::tokenize(R"(SELECT E'a\'b' FROM t)");
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[1].kind == TokenKind::STRING_LITERAL);
        CHECK(tokens[2].is_keyword("FROM"));
    }

    SECTION("Dollar quotes hide semicolons") {
        const auto tokens = SqlLexer::tokenize("SELECT $tag$a; b$tag$");
        REQUIRE(tokens.size() == 2);
        CHECK(tokens[1].kind == TokenKind::STRING_LITERAL);
    }
}

TEST_CASE("SqlLexer: quoted identifiers preserve case", "[lexer]") {
    const auto tokens = SqlLexer::tokenize(R"(SELECT "Order ""Id""" FROM t)");

    REQUIRE(tokens.size() == 4);
    CHECK(tokens[1].kind == TokenKind::QUOTED_IDENTIFIER);
    CHECK(tokens[1].text == R"(Order "Id")");
    CHECK(tokens[1].is_identifier());
}

TEST_CASE("SqlLexer: parameters, numbers and operators", "[lexer]") {
    const auto tokens = SqlLexer::tokenize("WHERE a >= $1 AND b::text <> 1.5e3");

    REQUIRE(tokens.size() == 10);
    CHECK(tokens[2].is_operator(">="));
    CHECK(tokens[3].kind == TokenKind::PARAMETER);
    CHECK(tokens[3].is_literal());
    CHECK(tokens[6].is_operator("::"));
    CHECK(tokens[8].is_operator("<>"));
    CHECK(tokens[9].kind == TokenKind::NUMBER);
    CHECK(tokens[9].text == "1.5e3");
}

TEST_CASE("SqlLexer: unreserved words lex as identifiers", "[lexer]") {
    const auto tokens = SqlLexer::tokenize("SELECT last, rows, filter FROM t ORDER BY x NULLS FIRST");

    REQUIRE(tokens.size() == 13);
    CHECK(tokens[1].kind == TokenKind::IDENTIFIER);
    CHECK(tokens[1].text == "last");
    CHECK(tokens[3].kind == TokenKind::IDENTIFIER);
    CHECK(tokens[5].kind == TokenKind::IDENTIFIER);
    CHECK(tokens[8].is_keyword("ORDER"));
    CHECK(tokens[9].is_keyword("BY"));
    CHECK(tokens[12].text == "first");

    CHECK(SqlLexer::is_reserved("FROM"));
    CHECK_FALSE(SqlLexer::is_reserved("BY"));
    CHECK_FALSE(SqlLexer::is_keyword("LAST"));
}

TEST_CASE("SqlLexer: star is its own token", "[lexer]") {
    const auto tokens = SqlLexer::tokenize("SELECT * FROM t");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[1].is(TokenKind::STAR));
}

TEST_CASE("SqlLexer: unterminated input never throws", "[lexer]") {
    const auto str = SqlLexer::tokenize("SELECT 'open");
    REQUIRE(str.size() == 2);
    CHECK(str[1].kind == TokenKind::STRING_LITERAL);

    const auto comment = SqlLexer::tokenize("SELECT 1 /* never closed");
    CHECK(comment.size() == 2);

    CHECK(SqlLexer::tokenize("").empty());
}

// ============================================================================
// Fingerprinting
// ============================================================================

TEST_CASE("SqlLexer: fingerprint ignores literals, case and spacing", "[lexer][fingerprint]") {
    const auto a = SqlLexer::fingerprint("SELECT id FROM orders WHERE id = 5");
    const auto b = SqlLexer::fingerprint("select   id\nfrom orders where id = 42");

    CHECK(a.normalized == "select id from orders where id = ?");
    CHECK(a.hash == b.hash);
    CHECK(a.normalized == b.normalized);
}

TEST_CASE("SqlLexer: fingerprint distinguishes query shapes", "[lexer][fingerprint]") {
    const auto a = SqlLexer::fingerprint("SELECT id FROM orders");
    const auto b = SqlLexer::fingerprint("SELECT id FROM customers");

    CHECK(a.hash != b.hash);
}

TEST_CASE("SqlLexer: fingerprint collapses string literals", "[lexer][fingerprint]") {
    const auto fp = SqlLexer::fingerprint("SELECT name FROM customers WHERE city IN ('Berlin', 'Paris')");
    CHECK(fp.normalized == "select name from customers where city in (?, ?)");
}
