#pragma once

#include "core/sql_generator.hpp"
#include <string>

namespace sqlguard {

/**
 * @brief Renders the generator prompt for one request
 *
 * The system prompt carries the fixed generation rules; the user prompt
 * carries the role-visible schema, its foreign keys, the caller's row
 * filter and the question.
 */
class PromptBuilder {
public:
    [[nodiscard]] static std::string system_prompt();
    [[nodiscard]] static std::string user_prompt(const GenerationRequest& request);

    // "Table 'orders': order_id, customer_id, ..." one line per table
    [[nodiscard]] static std::string describe_schema(const SchemaCatalog& schema);

    // "- orders.customer_id -> customers.customer_id" one line per key
    [[nodiscard]] static std::string describe_relationships(const SchemaCatalog& schema);
};

} // namespace sqlguard
