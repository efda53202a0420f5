#pragma once

#include "core/types.hpp"
#include "schema/schema_catalog.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sqlguard {

/**
 * @brief Everything the generator may see for one question
 *
 * visible_schema is already filtered to the role's grants.
 */
struct GenerationRequest {
    std::string question;
    Identity identity;
    std::shared_ptr<const SchemaCatalog> visible_schema;
    std::optional<std::string> row_filter;     // Concrete predicate, e.g. orders.customer_id = 'ALFKI'
};

enum class GenerationKind : uint8_t {
    SQL,
    CLARIFICATION,
    REFUSAL,
    ERROR
};

[[nodiscard]] inline const char* generation_kind_to_string(GenerationKind kind) {
    switch (kind) {
        case GenerationKind::SQL:           return "sql";
        case GenerationKind::CLARIFICATION: return "clarification";
        case GenerationKind::REFUSAL:       return "refusal";
        case GenerationKind::ERROR:         return "error";
        default:                            return "unknown";
    }
}

/**
 * @brief SQL(text) | CLARIFICATION(question) | REFUSAL(message) | ERROR(message)
 */
struct GenerationOutcome {
    GenerationKind kind = GenerationKind::ERROR;
    std::string text;

    static GenerationOutcome sql(std::string statement) {
        return {GenerationKind::SQL, std::move(statement)};
    }
    static GenerationOutcome clarification(std::string question) {
        return {GenerationKind::CLARIFICATION, std::move(question)};
    }
    static GenerationOutcome refusal(std::string message) {
        return {GenerationKind::REFUSAL, std::move(message)};
    }
    static GenerationOutcome error(std::string message) {
        return {GenerationKind::ERROR, std::move(message)};
    }

    [[nodiscard]] bool is_sql() const { return kind == GenerationKind::SQL; }
};

/**
 * @brief Natural-language to SQL collaborator
 *
 * Its output is untrusted: SQL replies go through the full authorization
 * pipeline like any other candidate statement.
 */
class ISqlGenerator {
public:
    virtual ~ISqlGenerator() = default;

    [[nodiscard]] virtual GenerationOutcome generate(const GenerationRequest& request) = 0;
};

} // namespace sqlguard
