#include "schema/schema_catalog.hpp"

#include <algorithm>

namespace sqlguard {

// ============================================================================
// Builder
// ============================================================================

SchemaCatalog::Builder& SchemaCatalog::Builder::add_column(
    const std::string& table, const std::string& column) {

    auto [it, inserted] = columns_.try_emplace(table);
    if (inserted) {
        table_order_.push_back(table);
    }
    if (std::ranges::find(it->second, column) == it->second.end()) {
        it->second.push_back(column);
    }
    return *this;
}

SchemaCatalog::Builder& SchemaCatalog::Builder::add_table(
    const std::string& table, const ColumnList& columns) {

    auto [it, inserted] = columns_.try_emplace(table);
    if (inserted) {
        table_order_.push_back(table);
    }
    for (const auto& column : columns) {
        add_column(table, column);
    }
    return *this;
}

SchemaCatalog::Builder& SchemaCatalog::Builder::add_foreign_key(ForeignKey fk) {
    auto key = std::make_pair(fk.child_table, fk.parent_table);
    relationships_.insert_or_assign(std::move(key), std::move(fk));
    return *this;
}

SchemaCatalog SchemaCatalog::Builder::build() {
    SchemaCatalog catalog;
    catalog.schema_name_ = std::move(schema_name_);
    catalog.table_order_ = std::move(table_order_);
    catalog.columns_ = std::move(columns_);
    catalog.relationships_ = std::move(relationships_);

    for (const auto& table : catalog.table_order_) {
        const auto& cols = catalog.columns_[table];
        auto& set = catalog.column_sets_[table];
        set.reserve(cols.size());
        for (const auto& col : cols) {
            set.insert(col);
            catalog.column_index_[col].push_back(table);
        }
    }
    return catalog;
}

// ============================================================================
// Lookups
// ============================================================================

bool SchemaCatalog::has_table(const std::string& table) const {
    return columns_.contains(table);
}

bool SchemaCatalog::has_column(const std::string& table, const std::string& column) const {
    const auto it = column_sets_.find(table);
    return it != column_sets_.end() && it->second.contains(column);
}

const SchemaCatalog::ColumnList& SchemaCatalog::columns(const std::string& table) const {
    static const ColumnList kEmpty;
    const auto it = columns_.find(table);
    return it != columns_.end() ? it->second : kEmpty;
}

std::vector<std::string> SchemaCatalog::tables_with_column(const std::string& column) const {
    const auto it = column_index_.find(column);
    if (it == column_index_.end()) return {};
    return it->second;
}

SchemaCatalog SchemaCatalog::filtered(const TableGrants& grants) const {
    Builder builder(schema_name_);

    for (const auto& table : table_order_) {
        const auto grant = grants.find(table);
        if (grant == grants.end()) continue;

        ColumnList visible;
        for (const auto& col : columns(table)) {
            if (grant->second.contains(col)) {
                visible.push_back(col);
            }
        }
        builder.add_table(table, visible);
    }

    for (const auto& [key, fk] : relationships_) {
        if (grants.contains(fk.child_table) && grants.contains(fk.parent_table) &&
            has_table(fk.child_table) && has_table(fk.parent_table)) {
            builder.add_foreign_key(fk);
        }
    }

    return builder.build();
}

} // namespace sqlguard
