#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sqlguard {

/**
 * @brief Parsed row-filter template of the form `table.column = {user_id}`
 */
struct RowFilterRule {
    std::string table;
    std::string column;

    /**
     * @brief Concrete predicate for one subject
     *
     * Integer subject ids are inlined bare; anything else becomes a string
     * literal with embedded quotes doubled.
     */
    [[nodiscard]] std::string render(const std::string& subject_id) const;

    // Right-hand side only: `8`, `'ALFKI'`
    [[nodiscard]] static std::string format_value(const std::string& subject_id);
};

struct InjectionPattern {
    std::string source;
    std::regex regex;
};

/**
 * @brief RBAC allow-lists, row-filter templates, sensitive columns,
 * injection patterns and forbidden functions
 *
 * Built once from configuration and shared read-only as
 * shared_ptr<const PolicyStore>; all accessors are const and safe for
 * unsynchronized concurrent reads.
 */
class PolicyStore {
public:
    using SensitiveColumnSet = std::unordered_map<std::string, std::unordered_set<std::string>>;

    /**
     * @brief Validate and compile a policy configuration
     * @return CONFIG_ERROR naming the offending entry when a template is
     *         malformed or a pattern does not compile
     */
    [[nodiscard]] static Result<std::shared_ptr<const PolicyStore>> create(const PolicyConfig& config);

    /**
     * @brief Parse `table.column = {user_id}`
     */
    [[nodiscard]] static std::optional<RowFilterRule> parse_row_filter(const std::string& text);

    // Allowed tables for a role; empty for unknown roles
    [[nodiscard]] const TableGrants& allowed_tables(const std::string& role) const;
    [[nodiscard]] bool has_role(const std::string& role) const { return rbac_.contains(role); }
    [[nodiscard]] std::vector<std::string> roles() const;

    [[nodiscard]] const RowFilterRule* row_filter(const std::string& role) const;

    // Concrete predicate for the identity, or nullopt when its role has no template
    [[nodiscard]] std::optional<std::string> row_filter_predicate(const Identity& identity) const;

    [[nodiscard]] bool is_sensitive(const std::string& table, const std::string& column) const;
    [[nodiscard]] const SensitiveColumnSet& sensitive_columns() const { return sensitive_; }

    [[nodiscard]] const std::vector<InjectionPattern>& injection_patterns() const { return patterns_; }

    // name is unqualified and lowercase, as the lexer reports it
    [[nodiscard]] bool is_forbidden_function(const std::string& name) const {
        return forbidden_functions_.contains(name);
    }

private:
    // Only create() can name the key
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    explicit PolicyStore(ConstructionKey) {}

private:
    std::map<std::string, TableGrants> rbac_;
    std::map<std::string, RowFilterRule> rls_;
    SensitiveColumnSet sensitive_;
    std::vector<InjectionPattern> patterns_;
    std::unordered_set<std::string> forbidden_functions_;
};

} // namespace sqlguard
