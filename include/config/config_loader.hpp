#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace sqlguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads sql-guard.toml into an immutable ServiceConfig
 *
 * String values may reference environment variables as ${NAME}. A
 * top-level `include = ["other.toml"]` merges sibling files underneath
 * the including file (the including file wins on conflicts).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ServiceConfig config;

        static LoadResult ok(ServiceConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sql-guard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (includes are not resolved)
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config
     * @return One message per problem, naming the offending key; empty if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ServiceConfig& config);

private:
    static ServiceConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(ServiceConfig config);

    static DatabaseConfig extract_database(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static LlmConfig extract_llm(const toml::table& root);
    static PolicyConfig extract_policy(const toml::table& root);
};

} // namespace sqlguard
