#include "core/query_rewriter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <set>
#include <vector>

namespace sqlguard {

namespace {

struct Edit {
    size_t offset;
    std::string text;
    size_t erase = 0;   // Source bytes replaced at offset
};

bool is_set_operator(const Token& t) {
    return t.is_keyword("UNION") || t.is_keyword("INTERSECT") || t.is_keyword("EXCEPT");
}

// Keywords that end a WHERE condition (or the FROM list when there is none)
bool ends_condition(const Token& t) {
    if (t.is(TokenKind::SEMICOLON)) return true;
    if (t.kind != TokenKind::KEYWORD) return false;
    return t.text == "GROUP" || t.text == "HAVING" || t.text == "WINDOW" ||
           t.text == "ORDER" || t.text == "LIMIT" || t.text == "OFFSET" ||
           t.text == "FETCH" || t.text == "FOR" || is_set_operator(t);
}

// First token of a parenthesised query body
bool starts_query(const Token& t) {
    return t.is_keyword("SELECT") || t.is_keyword("WITH") || t.is_keyword("TABLE");
}

// Index of the parenthesis closing tokens[open], or end when unbalanced
size_t matching_paren(const std::vector<Token>& tokens, size_t open, size_t end) {
    int depth = 0;
    for (size_t i = open; i < end; ++i) {
        if (tokens[i].is(TokenKind::LPAREN)) ++depth;
        else if (tokens[i].is(TokenKind::RPAREN) && --depth == 0) return i;
    }
    return end;
}

// Drop parentheses that wrap the whole range: ((a = 1)) -> a = 1
void strip_enclosing_parens(const std::vector<Token>& tokens, size_t& begin, size_t& end) {
    while (end - begin >= 2 && tokens[begin].is(TokenKind::LPAREN) &&
           matching_paren(tokens, begin, end) == end - 1) {
        ++begin;
        --end;
    }
}

std::string concat_text(const std::vector<Token>& tokens, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) out += tokens[i].text;
    return out;
}

// Identifier as it must be written back into SQL
std::string sql_name(const Token& t) {
    if (t.kind != TokenKind::QUOTED_IDENTIFIER) return t.text;
    std::string quoted = "\"";
    for (const char c : t.text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

/**
 * One rewrite over a token stream. A block is a single SELECT body; blocks
 * nest through parenthesised subqueries and each is filtered on its own.
 */
class RowFilterPass {
public:
    RowFilterPass(const std::vector<Token>& tokens, const RowFilterRule& rule, const std::string& value)
        : tokens_(tokens), rule_(rule), value_(value) {}

    // force: top-level blocks get the table-qualified predicate even when
    // their FROM list does not name the table
    void rewrite_query(size_t begin, size_t end, bool force) {
        size_t branch_begin = begin;
        int depth = 0;
        for (size_t i = begin; i <= end; ++i) {
            if (i < end) {
                if (tokens_[i].is(TokenKind::LPAREN)) ++depth;
                else if (tokens_[i].is(TokenKind::RPAREN)) --depth;
                if (depth != 0 || !is_set_operator(tokens_[i])) continue;
            }
            if (i > branch_begin) {
                rewrite_branch(branch_begin, i, force);
            }
            // Skip ALL / DISTINCT after UNION
            branch_begin = i + 1;
            if (branch_begin < end &&
                (tokens_[branch_begin].is_keyword("ALL") || tokens_[branch_begin].is_keyword("DISTINCT"))) {
                ++branch_begin;
            }
        }
    }

    // Table name used outside every FROM list that was understood
    bool has_unbound_reference(size_t end) const {
        for (size_t i = 0; i < end; ++i) {
            const Token& t = tokens_[i];
            if (!t.is_identifier() || t.text != rule_.table || table_tokens_.contains(i)) continue;
            // Column qualifier (orders.id) or output alias (AS orders)
            if (i + 1 < end && tokens_[i + 1].is(TokenKind::DOT)) continue;
            if (i > 0 && tokens_[i - 1].is_keyword("AS")) continue;
            return true;
        }
        return false;
    }

    std::vector<Edit>& edits() { return edits_; }

private:
    void rewrite_branch(size_t begin, size_t end, bool force) {
        // (SELECT ...) UNION (SELECT ...): descend into the parenthesised branch
        if (tokens_[begin].is(TokenKind::LPAREN)) {
            const size_t close = matching_paren(tokens_, begin, end);
            if (close < end) {
                const size_t trailing = close + 1;
                if (trailing == end || ends_condition(tokens_[trailing])) {
                    rewrite_query(begin + 1, close, force);
                    return;
                }
            }
        }

        // Subqueries anywhere in the block are blocks of their own
        for (size_t i = begin; i + 1 < end; ++i) {
            if (tokens_[i].is(TokenKind::LPAREN) && starts_query(tokens_[i + 1])) {
                const size_t close = matching_paren(tokens_, i, end);
                rewrite_query(i + 1, close, false);
                i = close;
            }
        }

        rewrite_block(begin, end, force);
    }

    void rewrite_block(size_t begin, size_t end, bool force) {
        // Main SELECT, after any WITH list, or the TABLE t shorthand
        size_t head = end;
        int depth = 0;
        for (size_t i = begin; i < end; ++i) {
            const Token& t = tokens_[i];
            if (t.is(TokenKind::LPAREN)) { ++depth; continue; }
            if (t.is(TokenKind::RPAREN)) { --depth; continue; }
            if (depth == 0 && (t.is_keyword("SELECT") || t.is_keyword("TABLE"))) {
                head = i;
                break;
            }
        }
        if (head == end) return;

        const bool table_form = tokens_[head].is_keyword("TABLE");
        size_t from = table_form ? head : end;
        depth = 0;
        for (size_t i = head + 1; from == end && i < end; ++i) {
            const Token& t = tokens_[i];
            if (t.is(TokenKind::LPAREN)) ++depth;
            else if (t.is(TokenKind::RPAREN)) --depth;
            else if (depth == 0 && t.is_keyword("FROM")) from = i;
        }

        // Scanning from FROM keeps WITHIN GROUP (...) in the select list out
        const size_t scan = from != end ? from : head;
        size_t where = end;
        size_t cond_end = end;
        depth = 0;
        for (size_t i = scan; i < end; ++i) {
            const Token& t = tokens_[i];
            if (t.is(TokenKind::LPAREN)) { ++depth; continue; }
            if (t.is(TokenKind::RPAREN)) { --depth; continue; }
            if (depth != 0) continue;
            if (where == end && t.is_keyword("WHERE")) {
                where = i;
            } else if (ends_condition(t)) {
                cond_end = i;
                break;
            }
        }

        std::vector<std::string> bindings;
        if (from != end) {
            collect_bindings(from + 1, where != end ? where : cond_end, bindings);
        }
        if (bindings.empty()) {
            if (!force) return;
            bindings.push_back(rule_.table);
        }

        if (table_form) {
            edits_.push_back(Edit{tokens_[head].offset, "SELECT * FROM", tokens_[head].length});
        }

        if (where == end) {
            // No WHERE: insert after the last token of the FROM list
            const size_t last = cond_end > scan ? cond_end - 1 : scan;
            edits_.push_back(Edit{tokens_[last].end(), " WHERE " + predicate(bindings)});
            return;
        }

        const size_t cond_begin = where + 1;
        if (cond_begin >= cond_end) {
            edits_.push_back(Edit{tokens_[where].end(), " " + predicate(bindings)});
            return;
        }

        // Split into top-level conjuncts; BETWEEN x AND y is not a separator
        const bool bare_ok = bindings.size() == 1;
        std::set<std::string> present;
        bool has_or = false;
        bool between_pending = false;
        size_t conjunct_begin = cond_begin;
        depth = 0;
        for (size_t i = cond_begin; i <= cond_end; ++i) {
            if (i < cond_end) {
                const Token& t = tokens_[i];
                if (t.is(TokenKind::LPAREN)) { ++depth; continue; }
                if (t.is(TokenKind::RPAREN)) { --depth; continue; }
                if (depth != 0) continue;
                if (t.is_keyword("OR")) { has_or = true; continue; }
                if (t.is_keyword("BETWEEN")) { between_pending = true; continue; }
                if (!t.is_keyword("AND")) continue;
                if (between_pending) { between_pending = false; continue; }
            }
            if (i > conjunct_begin) {
                for (const auto& binding : bindings) {
                    if (is_filter_conjunct(conjunct_begin, i, binding, bare_ok)) present.insert(binding);
                }
            }
            conjunct_begin = i + 1;
        }

        std::vector<std::string> missing;
        for (const auto& binding : bindings) {
            if (has_or || !present.contains(binding)) missing.push_back(binding);
        }
        if (missing.empty()) {
            return;
        }

        const size_t cond_last_end = tokens_[cond_end - 1].end();
        if (has_or) {
            edits_.push_back(Edit{tokens_[cond_begin].offset, "("});
            edits_.push_back(Edit{cond_last_end, ") AND " + predicate(missing)});
        } else {
            edits_.push_back(Edit{cond_last_end, " AND " + predicate(missing)});
        }
    }

    // Names the FROM list binds the filtered table to: its alias, or the
    // table name itself
    void collect_bindings(size_t begin, size_t end, std::vector<std::string>& bindings) {
        enum class Slot { TABLE, ALIAS, NONE };
        Slot slot = Slot::TABLE;
        std::optional<std::string> pending;

        auto commit = [&] {
            if (pending && std::ranges::find(bindings, *pending) == bindings.end()) {
                bindings.push_back(*pending);
            }
            pending.reset();
        };

        for (size_t i = begin; i < end; ++i) {
            const Token& t = tokens_[i];
            if (t.is(TokenKind::LPAREN)) {
                const size_t close = matching_paren(tokens_, i, end);
                // Parenthesised join: FROM (orders o JOIN customers c ON ...)
                if (slot == Slot::TABLE && i + 1 < end && !starts_query(tokens_[i + 1])) {
                    collect_bindings(i + 1, close, bindings);
                }
                if (slot == Slot::TABLE) slot = Slot::ALIAS;
                i = close;
                continue;
            }
            if (t.is(TokenKind::COMMA) || t.is_keyword("JOIN")) {
                commit();
                slot = Slot::TABLE;
                continue;
            }
            if (t.is_keyword("ON") || t.is_keyword("USING")) {
                commit();
                slot = Slot::NONE;
                continue;
            }
            // AS, LATERAL, ONLY and the join words
            if (!t.is_identifier()) continue;

            if (slot == Slot::TABLE) {
                size_t last = i;
                while (last + 2 < end && tokens_[last + 1].is(TokenKind::DOT) &&
                       tokens_[last + 2].is_identifier()) {
                    last += 2;
                }
                if (last + 1 < end && tokens_[last + 1].is(TokenKind::LPAREN)) {
                    // Table function
                    i = matching_paren(tokens_, last + 1, end);
                    slot = Slot::ALIAS;
                    continue;
                }
                if (tokens_[last].text == rule_.table) {
                    pending = sql_name(tokens_[last]);
                    table_tokens_.insert(last);
                }
                slot = Slot::ALIAS;
                i = last;
            } else if (slot == Slot::ALIAS) {
                if (pending) pending = sql_name(t);
                slot = Slot::NONE;
            }
        }
        commit();
    }

    std::string predicate(const std::vector<std::string>& bindings) const {
        std::string out;
        for (const auto& binding : bindings) {
            if (!out.empty()) out += " AND ";
            out += std::format("{}.{} = {}", binding, rule_.column, value_);
        }
        return out;
    }

    bool is_column_side(size_t begin, size_t end, const std::string& binding, bool bare_ok) const {
        if (end - begin == 1) {
            return bare_ok && tokens_[begin].is_identifier() && tokens_[begin].text == rule_.column;
        }
        if (end - begin == 3) {
            return tokens_[begin].is_identifier() && sql_name(tokens_[begin]) == binding &&
                   tokens_[begin + 1].is(TokenKind::DOT) &&
                   tokens_[begin + 2].is_identifier() && tokens_[begin + 2].text == rule_.column;
        }
        return false;
    }

    // `[binding.]column = value` or `value = [binding.]column`
    bool is_filter_conjunct(size_t begin, size_t end, const std::string& binding, bool bare_ok) const {
        strip_enclosing_parens(tokens_, begin, end);

        size_t eq = end;
        for (size_t i = begin; i < end; ++i) {
            if (tokens_[i].is_operator("=")) {
                eq = i;
                break;
            }
        }
        if (eq == end || eq == begin) return false;

        return (is_column_side(begin, eq, binding, bare_ok) &&
                concat_text(tokens_, eq + 1, end) == value_) ||
               (is_column_side(eq + 1, end, binding, bare_ok) &&
                concat_text(tokens_, begin, eq) == value_);
    }

    const std::vector<Token>& tokens_;
    const RowFilterRule& rule_;
    const std::string& value_;
    std::set<size_t> table_tokens_;   // Tokens naming the table inside a FROM list
    std::vector<Edit> edits_;
};

} // anonymous namespace

std::string QueryRewriter::apply_row_filter(std::string_view sql, const Identity& identity,
                                            const PolicyStore& policy) {
    const RowFilterRule* rule = policy.row_filter(identity.role);
    if (!rule) {
        return std::string(sql);
    }
    return apply_predicate(sql, *rule, identity.subject_id);
}

std::string QueryRewriter::apply_predicate(std::string_view sql, const RowFilterRule& rule,
                                           const std::string& subject_id) {
    const auto tokens = SqlLexer::tokenize(sql);
    const std::string value = RowFilterRule::format_value(subject_id);

    // Statement body ends at the first top-level semicolon
    size_t body_end = tokens.size();
    int depth = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].is(TokenKind::LPAREN)) ++depth;
        else if (tokens[i].is(TokenKind::RPAREN)) --depth;
        else if (depth == 0 && tokens[i].is(TokenKind::SEMICOLON)) {
            body_end = i;
            break;
        }
    }

    RowFilterPass pass(tokens, rule, value);
    pass.rewrite_query(0, body_end, false);

    std::vector<Edit> edits = std::move(pass.edits());
    if (pass.has_unbound_reference(body_end)) {
        utils::log::warn(std::format("Row filter table {} referenced outside a FROM list; "
                                     "qualifying every top-level block", rule.table));
        RowFilterPass forced(tokens, rule, value);
        forced.rewrite_query(0, body_end, true);
        edits = std::move(forced.edits());
    }

    if (edits.empty()) {
        return std::string(sql);
    }

    std::ranges::stable_sort(edits, [](const Edit& a, const Edit& b) { return a.offset > b.offset; });
    std::string out(sql);
    for (const auto& edit : edits) {
        out.replace(edit.offset, edit.erase, edit.text);
    }

    utils::log::debug(std::format("Row filter {}.{} = {} applied: {}", rule.table, rule.column, value, out));
    return out;
}

} // namespace sqlguard
