#include "core/prompt_builder.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlguard {

std::string PromptBuilder::system_prompt() {
    return "You are a SQL query generator for a PostgreSQL database. "
           "Follow these rules strictly:\n"
           "- ONLY generate a single SELECT query. Never modify data or the database "
           "(no INSERT, UPDATE, DELETE, DROP, ALTER or similar).\n"
           "- Users can only access the tables and columns listed in the schema. "
           "If a request requires anything else, reply \"Access Denied.\"\n"
           "- Do not use column names that are not in the schema.\n"
           "- Always join tables using the provided foreign key relationships. "
           "Do not invent new join conditions.\n"
           "- Do not use table aliases; always reference tables by their full names.\n"
           "- Always list field names in the SELECT clause; do not use SELECT *.\n"
           "- Apply the given row filter as a WHERE condition when it is provided.\n"
           "- If the question is not related to the database, reply \"I don't know.\"\n"
           "- You may order the results by a relevant column.\n"
           "- If the request is vague or ambiguous, do not guess. Reply with CLARIFY: "
           "followed by a short clarifying question.\n"
           "  Example: User: \"Show orders\" AI: \"CLARIFY: Do you want all orders, or just "
           "recent ones? Should I include the order total?\"\n"
           "- Your reply must contain only the SQL query, with no additional text.";
}

std::string PromptBuilder::describe_schema(const SchemaCatalog& schema) {
    std::string out;
    for (const auto& table : schema.table_names()) {
        out += std::format("Table '{}': {}\n", table, utils::join(schema.columns(table), ", "));
    }
    return out;
}

std::string PromptBuilder::describe_relationships(const SchemaCatalog& schema) {
    std::string out;
    for (const auto& [tables, fk] : schema.relationships()) {
        out += std::format("- {}.{} -> {}.{}\n",
            fk.child_table, fk.child_column, fk.parent_table, fk.parent_column);
    }
    return out;
}

std::string PromptBuilder::user_prompt(const GenerationRequest& request) {
    std::string out = std::format("Database schema for the '{}' role:\n", request.identity.role);
    if (request.visible_schema && !request.visible_schema->empty()) {
        out += describe_schema(*request.visible_schema);
        const auto relationships = describe_relationships(*request.visible_schema);
        if (!relationships.empty()) {
            out += "\nForeign key relationships:\n";
            out += relationships;
        }
    } else {
        out += "(no accessible tables)\n";
    }

    out += std::format("\nThe user is identified by user_id = {}.\n", request.identity.subject_id);
    if (request.row_filter) {
        out += std::format("Row filter to apply: {}\n", *request.row_filter);
    }

    out += std::format("\nUser: \"{}\"\nAI:", request.question);
    return out;
}

} // namespace sqlguard
