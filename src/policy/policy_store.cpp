#include "policy/policy_store.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlguard {

namespace {

const std::regex& row_filter_syntax() {
    static const std::regex kSyntax(
        R"(^\s*([A-Za-z_][A-Za-z0-9_]*)\.([A-Za-z_][A-Za-z0-9_]*)\s*=\s*\{user_id\}\s*$)");
    return kSyntax;
}

} // anonymous namespace

// ============================================================================
// RowFilterRule
// ============================================================================

std::string RowFilterRule::format_value(const std::string& subject_id) {
    if (utils::is_integer_literal(subject_id)) {
        return subject_id;
    }
    std::string quoted;
    quoted.reserve(subject_id.size() + 2);
    quoted += '\'';
    for (char c : subject_id) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string RowFilterRule::render(const std::string& subject_id) const {
    return std::format("{}.{} = {}", table, column, format_value(subject_id));
}

// ============================================================================
// PolicyStore
// ============================================================================

std::optional<RowFilterRule> PolicyStore::parse_row_filter(const std::string& text) {
    std::smatch match;
    if (!std::regex_match(text, match, row_filter_syntax())) {
        return std::nullopt;
    }
    return RowFilterRule{utils::to_lower(match[1].str()), utils::to_lower(match[2].str())};
}

Result<std::shared_ptr<const PolicyStore>> PolicyStore::create(const PolicyConfig& config) {
    using R = Result<std::shared_ptr<const PolicyStore>>;

    auto store = std::make_shared<PolicyStore>(ConstructionKey{});
    store->rbac_ = config.rbac;

    for (const auto& [role, text] : config.rls) {
        auto rule = parse_row_filter(text);
        if (!rule) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("rls.{}: expected 'table.column = {{user_id}}', got '{}'", role, text));
        }
        store->rls_.emplace(role, std::move(*rule));
    }

    for (const auto& [table, columns] : config.sensitive_columns) {
        auto& set = store->sensitive_[table];
        set.insert(columns.begin(), columns.end());
    }

    store->patterns_.reserve(config.injection_patterns.size());
    for (size_t i = 0; i < config.injection_patterns.size(); ++i) {
        const auto& source = config.injection_patterns[i];
        try {
            store->patterns_.push_back(InjectionPattern{
                source,
                std::regex(source, std::regex::ECMAScript | std::regex::icase)});
        } catch (const std::regex_error& e) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("injection.patterns[{}]: '{}' does not compile: {}", i, source, e.what()));
        }
    }

    for (const auto& name : config.forbidden_functions) {
        store->forbidden_functions_.insert(utils::to_lower(name));
    }

    utils::log::debug(std::format(
        "Policy store: {} roles, {} row filters, {} injection patterns, {} forbidden functions",
        store->rbac_.size(), store->rls_.size(), store->patterns_.size(),
        store->forbidden_functions_.size()));

    return R::ok(std::move(store));
}

const TableGrants& PolicyStore::allowed_tables(const std::string& role) const {
    static const TableGrants kNoAccess;
    const auto it = rbac_.find(role);
    return it != rbac_.end() ? it->second : kNoAccess;
}

std::vector<std::string> PolicyStore::roles() const {
    std::vector<std::string> names;
    names.reserve(rbac_.size());
    for (const auto& [role, grants] : rbac_) {
        names.push_back(role);
    }
    return names;
}

const RowFilterRule* PolicyStore::row_filter(const std::string& role) const {
    const auto it = rls_.find(role);
    return it != rls_.end() ? &it->second : nullptr;
}

std::optional<std::string> PolicyStore::row_filter_predicate(const Identity& identity) const {
    const RowFilterRule* rule = row_filter(identity.role);
    if (!rule) return std::nullopt;
    return rule->render(identity.subject_id);
}

bool PolicyStore::is_sensitive(const std::string& table, const std::string& column) const {
    const auto it = sensitive_.find(table);
    return it != sensitive_.end() && it->second.contains(column);
}

} // namespace sqlguard
