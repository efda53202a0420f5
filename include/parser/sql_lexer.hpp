#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sqlguard {

enum class TokenKind : uint8_t {
    KEYWORD,            // text uppercased
    IDENTIFIER,         // text lowercased
    QUOTED_IDENTIFIER,  // text unquoted, case preserved
    STRING_LITERAL,     // text is the raw source including quotes
    NUMBER,
    OPERATOR,
    DOT,
    COMMA,
    LPAREN,
    RPAREN,
    SEMICOLON,
    STAR,
    PARAMETER           // $1, $2, ...
};

struct Token {
    TokenKind kind;
    std::string text;
    size_t offset;      // Byte offset in the source statement
    size_t length;      // Byte length in the source statement

    size_t end() const { return offset + length; }

    bool is(TokenKind k) const { return kind == k; }
    bool is_keyword(std::string_view kw) const { return kind == TokenKind::KEYWORD && text == kw; }
    bool is_identifier() const {
        return kind == TokenKind::IDENTIFIER || kind == TokenKind::QUOTED_IDENTIFIER;
    }
    bool is_operator(std::string_view op) const { return kind == TokenKind::OPERATOR && text == op; }
    bool is_literal() const {
        return kind == TokenKind::STRING_LITERAL || kind == TokenKind::NUMBER ||
               kind == TokenKind::PARAMETER;
    }
};

/**
 * @brief Single-pass SQL tokenizer (PostgreSQL lexical rules)
 *
 * Drops whitespace and comments (line, nested block). Recognises
 * standard, escape (E'...') and dollar-quoted strings, quoted identifiers,
 * numerics, positional parameters and multi-character operators.
 *
 * Never fails: unterminated literals and comments extend to end of input.
 *
 * Example:
 *   Input:  SELECT Orders.id FROM orders WHERE total > 10 -- note
 *   Tokens: KEYWORD(SELECT) IDENTIFIER(orders) DOT IDENTIFIER(id) KEYWORD(FROM)
 *           IDENTIFIER(orders) KEYWORD(WHERE) IDENTIFIER(total) OPERATOR(>) NUMBER(10)
 */
class SqlLexer {
public:
    [[nodiscard]] static std::vector<Token> tokenize(std::string_view sql);

    /**
     * @brief Normalized query shape plus its xxHash64
     *
     * Literals and parameters become '?', keywords are lowercased and
     * whitespace is collapsed, so queries differing only in constants share
     * a fingerprint.
     */
    [[nodiscard]] static QueryFingerprint fingerprint(std::string_view sql);

    // word must already be uppercased
    [[nodiscard]] static bool is_keyword(std::string_view upper_word);

    // Keyword that can never name a column
    [[nodiscard]] static bool is_reserved(std::string_view upper_word);
};

} // namespace sqlguard
