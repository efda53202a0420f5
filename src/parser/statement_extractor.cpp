#include "parser/statement_extractor.hpp"
#include "core/utils.hpp"

#include <map>
#include <set>
#include <string>

namespace sqlguard {

namespace {

using Clause = StatementExtractor::Clause;
using FromState = StatementExtractor::FromState;

enum class ParenKind {
    FUNCTION,   // call arguments
    GROUP       // subquery, expression grouping, IN-list, window spec
};

struct Frame {
    Clause clause = Clause::NONE;
    FromState from_state = FromState::EXPECT_TABLE;
    ParenKind kind = ParenKind::GROUP;
    std::string last_table;
};

struct RawColumn {
    std::string qualifier;  // Empty = unqualified
    std::string name;       // Empty for wildcards
    bool star = false;
};

struct DottedName {
    std::vector<std::string> parts;
    bool star = false;      // parts.* form
    size_t next = 0;        // Index of the first token after the name
};

constexpr const char* kDerived = "";  // alias target for subqueries / table functions

bool is_join_word(const Token& t) {
    return t.is_keyword("JOIN") || t.is_keyword("INNER") || t.is_keyword("LEFT") ||
           t.is_keyword("RIGHT") || t.is_keyword("FULL") || t.is_keyword("OUTER") ||
           t.is_keyword("CROSS") || t.is_keyword("NATURAL") || t.is_keyword("LATERAL") ||
           t.is_keyword("ONLY");
}

bool ends_operand(const Token& t) {
    switch (t.kind) {
        case TokenKind::IDENTIFIER:
        case TokenKind::QUOTED_IDENTIFIER:
        case TokenKind::NUMBER:
        case TokenKind::STRING_LITERAL:
        case TokenKind::PARAMETER:
        case TokenKind::RPAREN:
            return true;
        case TokenKind::KEYWORD:
            return t.text == "END" || t.text == "NULL" || t.text == "TRUE" || t.text == "FALSE";
        default:
            return false;
    }
}

// Name text of an identifier, or of a keyword used as one (t.by, WHERE by = 1)
std::string name_text(const Token& t) {
    return t.is(TokenKind::KEYWORD) ? utils::to_lower(t.text) : t.text;
}

// BETWEEN and BY name a column where an operand is expected
bool keyword_names_column(const Token& tok, const Token* prev) {
    if (SqlLexer::is_reserved(tok.text)) return false;
    if (!prev) return true;
    return !ends_operand(*prev) && !prev->is_keyword("NOT") &&
           !prev->is_keyword("GROUP") && !prev->is_keyword("ORDER");
}

DottedName read_dotted_name(const std::vector<Token>& tokens, size_t i) {
    DottedName name;
    name.parts.push_back(name_text(tokens[i]));
    size_t j = i + 1;
    while (j + 1 < tokens.size() && tokens[j].is(TokenKind::DOT)) {
        const Token& part = tokens[j + 1];
        // Any keyword may follow a dot: t.last, t.order
        if (part.is_identifier() || part.is(TokenKind::KEYWORD)) {
            name.parts.push_back(name_text(part));
            j += 2;
        } else if (part.is(TokenKind::STAR)) {
            name.star = true;
            j += 2;
            break;
        } else {
            break;
        }
    }
    name.next = j;
    return name;
}

std::string table_name_of(const std::vector<std::string>& parts, const SchemaCatalog& schema) {
    if (parts.size() == 1) return parts[0];
    if (parts.size() == 2 && parts[0] == schema.schema_name()) return parts[1];
    std::string joined;
    for (size_t k = 0; k < parts.size(); ++k) {
        if (k > 0) joined += '.';
        joined += parts[k];
    }
    return joined;
}

/**
 * Classification pass: collects table references, aliases and raw column
 * references without consulting column metadata.
 */
class Classifier {
public:
    Classifier(const std::vector<Token>& tokens, const SchemaCatalog& schema)
        : tokens_(tokens), schema_(schema) {
        frames_.emplace_back();
    }

    void run(ExtractedReferences& refs) {
        for (size_t i = 0; i < tokens_.size(); ++i) {
            const Token& tok = tokens_[i];
            const Token* prev = i > 0 ? &tokens_[i - 1] : nullptr;

            switch (tok.kind) {
                case TokenKind::KEYWORD:
                    if (keyword_names_column(tok, prev)) {
                        i = on_identifier(i, prev, refs);
                    } else {
                        on_keyword(tok);
                    }
                    break;
                case TokenKind::LPAREN:
                    on_lparen(prev);
                    break;
                case TokenKind::RPAREN:
                    if (frames_.size() > 1) frames_.pop_back();
                    alias_pending_ = false;
                    break;
                case TokenKind::COMMA:
                    if (frame().clause == Clause::FROM_LIST) {
                        frame().from_state = FromState::EXPECT_TABLE;
                    }
                    alias_pending_ = false;
                    break;
                case TokenKind::SEMICOLON:
                    frames_.resize(1);
                    frames_.front() = Frame{};
                    alias_pending_ = false;
                    break;
                case TokenKind::STAR:
                    on_star(prev);
                    break;
                case TokenKind::IDENTIFIER:
                case TokenKind::QUOTED_IDENTIFIER:
                    i = on_identifier(i, prev, refs);
                    break;
                default:
                    alias_pending_ = false;
                    break;
            }
        }
    }

    const std::vector<RawColumn>& raw_columns() const { return raw_columns_; }
    const std::map<std::string, std::set<std::string>>& aliases() const { return aliases_; }

private:
    Frame& frame() { return frames_.back(); }

    void on_keyword(const Token& tok) {
        Frame& f = frame();
        alias_pending_ = false;

        if (tok.text == "SELECT") {
            // EXISTS (SELECT ...), ARRAY(SELECT ...): a subquery, not call arguments
            f.kind = ParenKind::GROUP;
            f.clause = Clause::SELECT_LIST;
            return;
        }
        if (tok.text == "FROM") {
            // EXTRACT(YEAR FROM d), SUBSTRING(s FROM 2), TRIM(BOTH FROM s)
            if (f.kind == ParenKind::FUNCTION) return;
            f.clause = Clause::FROM_LIST;
            f.from_state = FromState::EXPECT_TABLE;
            return;
        }
        // TABLE t is SELECT * FROM t
        if (tok.text == "JOIN" || tok.text == "TABLE") {
            f.clause = Clause::FROM_LIST;
            f.from_state = FromState::EXPECT_TABLE;
            return;
        }
        if (tok.text == "UNION" || tok.text == "INTERSECT" || tok.text == "EXCEPT") {
            f.clause = Clause::NONE;
            return;
        }
        if (tok.text == "AS") {
            if (f.clause == Clause::FROM_LIST) {
                if (f.from_state == FromState::AFTER_TABLE || f.from_state == FromState::AFTER_DERIVED) {
                    f.from_state = FromState::EXPECT_ALIAS;
                }
            } else {
                // Output alias or CAST target type follows
                alias_pending_ = true;
            }
            return;
        }
        if (f.clause == Clause::FROM_LIST) {
            if (is_join_word(tok)) return;
            f.clause = Clause::EXPRESSION;
        }
    }

    void on_lparen(const Token* prev) {
        Frame& outer = frame();
        alias_pending_ = false;

        Frame inner;
        const bool call = prev && (prev->is_identifier() || prev->is_keyword("CAST"));
        inner.kind = call ? ParenKind::FUNCTION : ParenKind::GROUP;

        if (!call && outer.clause == Clause::FROM_LIST &&
            outer.from_state == FromState::EXPECT_TABLE) {
            // Derived table or parenthesised join
            outer.from_state = FromState::AFTER_DERIVED;
            inner.clause = Clause::FROM_LIST;
            inner.from_state = FromState::EXPECT_TABLE;
        } else {
            inner.clause = Clause::EXPRESSION;
        }
        frames_.push_back(std::move(inner));
    }

    void on_star(const Token* prev) {
        alias_pending_ = false;
        if (!prev) return;
        const bool select_wildcard =
            prev->is_keyword("SELECT") || prev->is_keyword("DISTINCT") || prev->is_keyword("ALL") ||
            (prev->is(TokenKind::COMMA) && frame().clause == Clause::SELECT_LIST);
        if (select_wildcard) {
            raw_columns_.push_back(RawColumn{"", "", true});
        }
        // Otherwise: multiplication or COUNT(*)
    }

    size_t on_identifier(size_t i, const Token* prev, ExtractedReferences& refs) {
        Frame& f = frame();
        DottedName name = read_dotted_name(tokens_, i);
        const size_t last = name.next - 1;
        const bool followed_by_paren =
            name.next < tokens_.size() && tokens_[name.next].is(TokenKind::LPAREN);

        // Function name: recorded but not a column, the arguments are still scanned
        if (followed_by_paren && !name.star) {
            refs.add_function(name.parts.back());
            if (f.clause == Clause::FROM_LIST && f.from_state == FromState::EXPECT_TABLE) {
                f.from_state = FromState::AFTER_DERIVED;
            }
            alias_pending_ = false;
            return last;
        }

        if (f.clause == Clause::FROM_LIST) {
            switch (f.from_state) {
                case FromState::EXPECT_TABLE: {
                    std::string table = table_name_of(name.parts, schema_);
                    refs.add_table(table);
                    f.last_table = std::move(table);
                    f.from_state = FromState::AFTER_TABLE;
                    break;
                }
                case FromState::AFTER_TABLE:
                case FromState::EXPECT_ALIAS:
                    aliases_[name.parts.back()].insert(f.last_table);
                    f.from_state = FromState::AFTER_ALIAS;
                    break;
                case FromState::AFTER_DERIVED:
                    aliases_[name.parts.back()].insert(kDerived);
                    f.from_state = FromState::AFTER_ALIAS;
                    break;
                case FromState::AFTER_ALIAS:
                    break;
            }
            return last;
        }

        // Output alias (explicit AS, or implicit after a complete operand)
        if (alias_pending_) {
            alias_pending_ = false;
            return last;
        }
        if (f.clause == Clause::SELECT_LIST && prev && ends_operand(*prev) && name.parts.size() == 1) {
            return last;
        }
        // Type name after ::, typed literal (DATE '2024-01-01')
        if (prev && prev->is_operator("::")) return last;
        if (name.parts.size() == 1 && name.next < tokens_.size() &&
            tokens_[name.next].is(TokenKind::STRING_LITERAL)) {
            return last;
        }

        RawColumn raw;
        raw.star = name.star;
        if (name.star) {
            raw.qualifier = name.parts.back();
        } else if (name.parts.size() == 1) {
            raw.name = name.parts[0];
        } else {
            raw.qualifier = name.parts[name.parts.size() - 2];
            raw.name = name.parts.back();
        }
        raw_columns_.push_back(std::move(raw));
        return last;
    }

    const std::vector<Token>& tokens_;
    const SchemaCatalog& schema_;
    std::vector<Frame> frames_;
    bool alias_pending_ = false;
    std::vector<RawColumn> raw_columns_;
    std::map<std::string, std::set<std::string>> aliases_;
};

void add_unqualified(const std::string& column, const SchemaCatalog& schema,
                     ExtractedReferences& refs) {
    if (schema.column_exists_anywhere(column)) {
        refs.add_column(ColumnRef("", column));
    }
}

void expand_table(const std::string& table, const SchemaCatalog& schema,
                  ExtractedReferences& refs) {
    for (const auto& col : schema.columns(table)) {
        refs.add_column(ColumnRef(table, col));
    }
}

} // anonymous namespace

ExtractedReferences StatementExtractor::extract(std::string_view sql, const SchemaCatalog& schema) {
    return extract(SqlLexer::tokenize(sql), schema);
}

ExtractedReferences StatementExtractor::extract(const std::vector<Token>& tokens,
                                                const SchemaCatalog& schema) {
    ExtractedReferences refs;
    Classifier classifier(tokens, schema);
    classifier.run(refs);

    const auto& aliases = classifier.aliases();
    const std::vector<std::string> scope_tables = refs.tables;

    // Tables a qualifier may denote; kDerived marks a subquery alias
    auto targets_of = [&](const std::string& qualifier) {
        std::set<std::string> targets;
        const auto it = aliases.find(qualifier);
        if (it != aliases.end()) {
            targets = it->second;
        }
        if (refs.has_table(qualifier) || schema.has_table(qualifier)) {
            targets.insert(qualifier);
        }
        return targets;
    };

    for (const auto& raw : classifier.raw_columns()) {
        if (raw.star) {
            if (raw.qualifier.empty()) {
                for (const auto& table : scope_tables) expand_table(table, schema, refs);
                continue;
            }
            const auto targets = targets_of(raw.qualifier);
            if (targets.empty() || targets.contains(kDerived)) {
                for (const auto& table : scope_tables) expand_table(table, schema, refs);
            }
            for (const auto& table : targets) {
                if (table != kDerived) expand_table(table, schema, refs);
            }
            continue;
        }

        if (raw.qualifier.empty()) {
            if (schema.column_exists_anywhere(raw.name)) {
                refs.add_column(ColumnRef("", raw.name));
                continue;
            }
            // Whole-row reference: SELECT o FROM orders o, row_to_json(orders)
            const auto targets = targets_of(raw.name);
            if (targets.contains(kDerived)) {
                for (const auto& table : scope_tables) expand_table(table, schema, refs);
            }
            for (const auto& table : targets) {
                if (table != kDerived) expand_table(table, schema, refs);
            }
            continue;
        }

        const auto targets = targets_of(raw.qualifier);
        if (targets.empty()) {
            add_unqualified(raw.name, schema, refs);
            continue;
        }
        for (const auto& table : targets) {
            if (table == kDerived) {
                add_unqualified(raw.name, schema, refs);
            } else {
                refs.add_column(ColumnRef(table, raw.name));
            }
        }
    }

    return refs;
}

} // namespace sqlguard
