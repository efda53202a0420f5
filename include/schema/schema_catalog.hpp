#pragma once

#include "core/types.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sqlguard {

struct ForeignKey {
    std::string child_table;
    std::string child_column;
    std::string parent_table;
    std::string parent_column;
};

/**
 * @brief Immutable snapshot of the target database's tables, columns and
 * foreign keys.
 *
 * Built once (via Builder) and shared as shared_ptr<const SchemaCatalog>;
 * all lookups are const and safe for unsynchronized concurrent reads.
 * Reinitialization produces a new instance rather than mutating this one.
 */
class SchemaCatalog {
public:
    using ColumnList = std::vector<std::string>;
    // (child table, parent table) -> foreign key; one pair per table pair
    using RelationshipMap = std::map<std::pair<std::string, std::string>, ForeignKey>;

    class Builder {
    public:
        explicit Builder(std::string schema_name = "public")
            : schema_name_(std::move(schema_name)) {}

        // Columns keep insertion order; duplicates are ignored
        Builder& add_column(const std::string& table, const std::string& column);
        Builder& add_table(const std::string& table, const ColumnList& columns);
        Builder& add_foreign_key(ForeignKey fk);

        [[nodiscard]] SchemaCatalog build();

    private:
        std::string schema_name_;
        std::vector<std::string> table_order_;
        std::unordered_map<std::string, ColumnList> columns_;
        RelationshipMap relationships_;
    };

    SchemaCatalog() = default;

    [[nodiscard]] const std::string& schema_name() const { return schema_name_; }
    [[nodiscard]] bool empty() const { return table_order_.empty(); }
    [[nodiscard]] size_t table_count() const { return table_order_.size(); }

    // Table names in load order
    [[nodiscard]] const std::vector<std::string>& table_names() const { return table_order_; }

    [[nodiscard]] bool has_table(const std::string& table) const;
    [[nodiscard]] bool has_column(const std::string& table, const std::string& column) const;

    // Ordered columns of a table; empty if the table is unknown
    [[nodiscard]] const ColumnList& columns(const std::string& table) const;

    // Every table that defines a column with this name, in load order
    [[nodiscard]] std::vector<std::string> tables_with_column(const std::string& column) const;

    [[nodiscard]] bool column_exists_anywhere(const std::string& column) const {
        return column_index_.contains(column);
    }

    [[nodiscard]] const RelationshipMap& relationships() const { return relationships_; }

    /**
     * @brief Role-visible subset of this catalog
     *
     * Keeps only granted tables, only granted columns (in catalog order),
     * and only relationships whose both ends remain visible.
     */
    [[nodiscard]] SchemaCatalog filtered(const TableGrants& grants) const;

private:
    std::string schema_name_;
    std::vector<std::string> table_order_;
    std::unordered_map<std::string, ColumnList> columns_;
    std::unordered_map<std::string, std::unordered_set<std::string>> column_sets_;
    std::unordered_map<std::string, std::vector<std::string>> column_index_;  // column -> tables
    RelationshipMap relationships_;
};

} // namespace sqlguard
