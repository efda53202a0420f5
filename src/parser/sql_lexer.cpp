#include "parser/sql_lexer.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <string>
#include <unordered_set>

namespace sqlguard {

// ============================================================================
// Lookup table for character classification. One 256-byte table gives
// locale-independent classification and case folding in a single load.
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER   = 0,
    CC_SPACE   = 1,
    CC_DIGIT   = 2,
    CC_ALPHA   = 4,
    CC_IDENT   = 8,   // _ and $ (and high-bit bytes)
    CC_OP      = 16,  // PostgreSQL operator characters
};

struct CharTable {
    uint8_t cls[256];
    char    lower[256];
    char    upper[256];

    constexpr CharTable() : cls{}, lower{}, upper{} {
        for (int i = 0; i < 256; ++i) {
            lower[i] = static_cast<char>(i);
            upper[i] = static_cast<char>(i);
            cls[i] = i >= 0x80 ? CC_ALPHA : CC_OTHER;
        }
        cls[' '] = CC_SPACE; cls['\t'] = CC_SPACE;
        cls['\n'] = CC_SPACE; cls['\r'] = CC_SPACE; cls['\f'] = CC_SPACE; cls['\v'] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) {
            cls[i] = CC_ALPHA;
            upper[i] = static_cast<char>(i - 32);
        }
        for (int i = 'A'; i <= 'Z'; ++i) {
            cls[i] = CC_ALPHA;
            lower[i] = static_cast<char>(i + 32);
        }
        cls['_'] = CC_IDENT;
        cls['$'] = CC_IDENT;
        for (const char c : {'+', '-', '*', '/', '<', '>', '=', '~', '!', '@',
                             '#', '%', '^', '&', '|', '`', '?'}) {
            cls[static_cast<unsigned char>(c)] = CC_OP;
        }
    }
};

static constexpr CharTable CT{};

inline bool ct_space(unsigned char c)       { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c)       { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) { return CT.cls[c] == CC_ALPHA || c == '_'; }
inline bool ct_ident_cont(unsigned char c)  { auto v = CT.cls[c]; return v == CC_ALPHA || v == CC_DIGIT || v == CC_IDENT; }
inline bool ct_op(unsigned char c)          { return CT.cls[c] == CC_OP; }
inline char ct_lower(unsigned char c)       { return CT.lower[c]; }
inline char ct_upper(unsigned char c)       { return CT.upper[c]; }

// Transparent hash for heterogeneous lookup (no temporary std::string)
struct StringViewHash {
    using is_transparent = void;
    size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};
struct StringViewEqual {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

// PostgreSQL reserved words, plus BETWEEN and BY which structure
// conditions and clauses. Unreserved words (LAST, ROWS, FILTER, ...) and
// function-like words (SUBSTRING, EXTRACT, COALESCE, ...) are valid column
// and table names, so they lex as identifiers.
const std::unordered_set<std::string, StringViewHash, StringViewEqual> SQL_KEYWORDS = {
    "ALL", "AND", "ANY", "AS", "ASC", "BETWEEN", "BY", "CASE", "CAST", "CREATE",
    "CROSS", "DESC", "DISTINCT", "ELSE", "END", "EXCEPT", "FALSE", "FETCH", "FOR",
    "FROM", "FULL", "GRANT", "GROUP", "HAVING", "ILIKE", "IN", "INNER", "INTERSECT",
    "INTO", "IS", "JOIN", "LATERAL", "LEFT", "LIKE", "LIMIT", "NATURAL", "NOT",
    "NULL", "OFFSET", "ON", "ONLY", "OR", "ORDER", "OUTER", "RETURNING", "RIGHT",
    "SELECT", "SIMILAR", "SOME", "TABLE", "THEN", "TRUE", "UNION", "USING",
    "WHEN", "WHERE", "WINDOW", "WITH"
};

// Keywords PostgreSQL still accepts as a column name
const std::unordered_set<std::string, StringViewHash, StringViewEqual> UNRESERVED_KEYWORDS = {
    "BETWEEN", "BY"
};

// Length of a dollar-quote delimiter ($$ or $tag$) starting at i, or 0
size_t dollar_tag_length(std::string_view sql, size_t i) {
    if (sql[i] != '$') return 0;
    size_t j = i + 1;
    if (j < sql.size() && ct_digit(static_cast<unsigned char>(sql[j]))) return 0;  // $1 parameter
    while (j < sql.size() && sql[j] != '$') {
        const auto c = static_cast<unsigned char>(sql[j]);
        if (!ct_ident_cont(c) || c == '$') return 0;
        ++j;
    }
    if (j >= sql.size()) return 0;
    return j - i + 1;
}

} // anonymous namespace

bool SqlLexer::is_keyword(std::string_view upper_word) {
    return SQL_KEYWORDS.contains(upper_word);
}

bool SqlLexer::is_reserved(std::string_view upper_word) {
    return SQL_KEYWORDS.contains(upper_word) && !UNRESERVED_KEYWORDS.contains(upper_word);
}

std::vector<Token> SqlLexer::tokenize(std::string_view sql) {
    std::vector<Token> tokens;
    tokens.reserve(sql.size() / 4 + 1);

    const size_t len = sql.size();
    size_t i = 0;

    auto emit = [&](TokenKind kind, std::string text, size_t start, size_t end) {
        tokens.push_back(Token{kind, std::move(text), start, end - start});
    };

    // Scan a single-quoted body starting after the opening quote.
    // backslash_escapes: E'...' strings honour \' escapes.
    auto scan_quoted = [&](size_t pos, bool backslash_escapes) {
        while (pos < len) {
            const char c = sql[pos];
            if (backslash_escapes && c == '\\' && pos + 1 < len) {
                pos += 2;
                continue;
            }
            if (c == '\'') {
                if (pos + 1 < len && sql[pos + 1] == '\'') {
                    pos += 2;
                    continue;
                }
                return pos + 1;
            }
            ++pos;
        }
        return len;
    };

    while (i < len) {
        const auto c = static_cast<unsigned char>(sql[i]);
        const auto next_c = (i + 1 < len) ? static_cast<unsigned char>(sql[i + 1]) : static_cast<unsigned char>('\0');

        if (ct_space(c)) {
            ++i;
            continue;
        }

        // Line comment
        if (c == '-' && next_c == '-') {
            while (i < len && sql[i] != '\n' && sql[i] != '\r') ++i;
            continue;
        }

        // Block comment (PostgreSQL nests them)
        if (c == '/' && next_c == '*') {
            int depth = 1;
            i += 2;
            while (i < len && depth > 0) {
                if (sql[i] == '/' && i + 1 < len && sql[i + 1] == '*') {
                    ++depth;
                    i += 2;
                } else if (sql[i] == '*' && i + 1 < len && sql[i + 1] == '/') {
                    --depth;
                    i += 2;
                } else {
                    ++i;
                }
            }
            continue;
        }

        const size_t start = i;

        // Standard string literal
        if (c == '\'') {
            i = scan_quoted(i + 1, false);
            emit(TokenKind::STRING_LITERAL, std::string(sql.substr(start, i - start)), start, i);
            continue;
        }

        // Prefixed string literal: E'..', B'..', X'..', N'..'
        if ((c == 'e' || c == 'E' || c == 'b' || c == 'B' || c == 'x' || c == 'X' ||
             c == 'n' || c == 'N') && next_c == '\'') {
            i = scan_quoted(i + 2, c == 'e' || c == 'E');
            emit(TokenKind::STRING_LITERAL, std::string(sql.substr(start, i - start)), start, i);
            continue;
        }

        // Quoted identifier ("" is an embedded quote)
        if (c == '"') {
            std::string text;
            ++i;
            while (i < len) {
                if (sql[i] == '"') {
                    if (i + 1 < len && sql[i + 1] == '"') {
                        text += '"';
                        i += 2;
                        continue;
                    }
                    ++i;
                    break;
                }
                text += sql[i++];
            }
            emit(TokenKind::QUOTED_IDENTIFIER, std::move(text), start, i);
            continue;
        }

        // Dollar-quoted string or positional parameter
        if (c == '$') {
            if (ct_digit(next_c)) {
                ++i;
                while (i < len && ct_digit(static_cast<unsigned char>(sql[i]))) ++i;
                emit(TokenKind::PARAMETER, std::string(sql.substr(start, i - start)), start, i);
                continue;
            }
            const size_t tag_len = dollar_tag_length(sql, i);
            if (tag_len > 0) {
                const std::string_view tag = sql.substr(i, tag_len);
                const size_t close = sql.find(tag, i + tag_len);
                i = (close == std::string_view::npos) ? len : close + tag_len;
                emit(TokenKind::STRING_LITERAL, std::string(sql.substr(start, i - start)), start, i);
                continue;
            }
            ++i;
            emit(TokenKind::OPERATOR, "$", start, i);
            continue;
        }

        // Numeric literal
        if (ct_digit(c) || (c == '.' && ct_digit(next_c))) {
            while (i < len && ct_digit(static_cast<unsigned char>(sql[i]))) ++i;
            if (i < len && sql[i] == '.' && !(i + 1 < len && sql[i + 1] == '.')) {
                ++i;
                while (i < len && ct_digit(static_cast<unsigned char>(sql[i]))) ++i;
            }
            if (i < len && (sql[i] == 'e' || sql[i] == 'E')) {
                size_t j = i + 1;
                if (j < len && (sql[j] == '+' || sql[j] == '-')) ++j;
                if (j < len && ct_digit(static_cast<unsigned char>(sql[j]))) {
                    i = j;
                    while (i < len && ct_digit(static_cast<unsigned char>(sql[i]))) ++i;
                }
            }
            emit(TokenKind::NUMBER, std::string(sql.substr(start, i - start)), start, i);
            continue;
        }

        // Identifier or keyword
        if (ct_ident_start(c)) {
            std::string lower;
            std::string upper;
            while (i < len && ct_ident_cont(static_cast<unsigned char>(sql[i]))) {
                lower += ct_lower(static_cast<unsigned char>(sql[i]));
                upper += ct_upper(static_cast<unsigned char>(sql[i]));
                ++i;
            }
            if (is_keyword(upper)) {
                emit(TokenKind::KEYWORD, std::move(upper), start, i);
            } else {
                emit(TokenKind::IDENTIFIER, std::move(lower), start, i);
            }
            continue;
        }

        switch (c) {
            case '.': ++i; emit(TokenKind::DOT, ".", start, i); continue;
            case ',': ++i; emit(TokenKind::COMMA, ",", start, i); continue;
            case '(': ++i; emit(TokenKind::LPAREN, "(", start, i); continue;
            case ')': ++i; emit(TokenKind::RPAREN, ")", start, i); continue;
            case ';': ++i; emit(TokenKind::SEMICOLON, ";", start, i); continue;
            case ':':
                i += (next_c == ':') ? 2 : 1;
                emit(TokenKind::OPERATOR, std::string(sql.substr(start, i - start)), start, i);
                continue;
            default:
                break;
        }

        // Operator run; stops where a comment begins
        if (ct_op(c)) {
            while (i < len && ct_op(static_cast<unsigned char>(sql[i]))) {
                if (i > start && ((sql[i] == '-' && i + 1 < len && sql[i + 1] == '-') ||
                                  (sql[i] == '/' && i + 1 < len && sql[i + 1] == '*'))) {
                    break;
                }
                ++i;
            }
            // PostgreSQL rule: a multi-char operator cannot end in + or -
            // unless it contains one of ~ ! @ # % ^ & | ` ?
            std::string_view op = sql.substr(start, i - start);
            if (op.size() > 1 && op.find_first_of("~!@#%^&|`?") == std::string_view::npos) {
                while (op.size() > 1 && (op.back() == '+' || op.back() == '-')) {
                    op.remove_suffix(1);
                }
                i = start + op.size();
            }
            if (op == "*") {
                emit(TokenKind::STAR, "*", start, i);
            } else {
                emit(TokenKind::OPERATOR, std::string(op), start, i);
            }
            continue;
        }

        // Anything else (e.g. '[', ']') is kept as a one-byte operator
        ++i;
        emit(TokenKind::OPERATOR, std::string(1, static_cast<char>(c)), start, i);
    }

    return tokens;
}

QueryFingerprint SqlLexer::fingerprint(std::string_view sql) {
    const auto tokens = tokenize(sql);

    std::string normalized;
    normalized.reserve(sql.size());

    bool suppress_space = true;
    for (const auto& tok : tokens) {
        const bool tight = tok.is(TokenKind::COMMA) || tok.is(TokenKind::RPAREN) ||
                           tok.is(TokenKind::DOT) || tok.is(TokenKind::SEMICOLON);
        if (!suppress_space && !tight) {
            normalized += ' ';
        }

        switch (tok.kind) {
            case TokenKind::STRING_LITERAL:
            case TokenKind::NUMBER:
            case TokenKind::PARAMETER:
                normalized += '?';
                break;
            case TokenKind::KEYWORD:
                for (const char ch : tok.text) normalized += ct_lower(static_cast<unsigned char>(ch));
                break;
            case TokenKind::QUOTED_IDENTIFIER:
                normalized += '"';
                normalized += tok.text;
                normalized += '"';
                break;
            default:
                normalized += tok.text;
                break;
        }

        suppress_space = tok.is(TokenKind::LPAREN) || tok.is(TokenKind::DOT);
    }

    const uint64_t hash = XXH64(normalized.data(), normalized.size(), 0);
    return QueryFingerprint(hash, std::move(normalized));
}

} // namespace sqlguard
