#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "policy/policy_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlguard {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars and arrays.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::node* node) {
    std::vector<std::string> result;
    if (const auto* arr = node ? node->as_array() : nullptr) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Identifiers are matched lowercased, as the lexer emits them
std::vector<std::string> toml_identifier_array(const toml::node* node) {
    auto names = toml_string_array(node);
    for (auto& name : names) {
        name = utils::to_lower(name);
    }
    return names;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& db = *database;

    cfg.connection_string = db["connection_string"].value_or(""s);
    cfg.schema = db["schema"].value_or(cfg.schema);
    cfg.min_connections = static_cast<size_t>(db["min_connections"].value_or(int64_t{1}));
    cfg.max_connections = static_cast<size_t>(db["max_connections"].value_or(int64_t{8}));
    cfg.connection_timeout = std::chrono::milliseconds(db["connection_timeout_ms"].value_or(int64_t{5000}));
    cfg.query_timeout = std::chrono::milliseconds(db["query_timeout_ms"].value_or(int64_t{30000}));
    cfg.health_check_query = db["health_check_query"].value_or(cfg.health_check_query);
    cfg.idle_timeout_seconds = db["idle_timeout_seconds"].value_or(cfg.idle_timeout_seconds);
    cfg.pool_acquire_timeout_ms = db["pool_acquire_timeout_ms"].value_or(cfg.pool_acquire_timeout_ms);
    cfg.max_result_rows = static_cast<size_t>(db["max_result_rows"].value_or(int64_t{10000}));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.enabled = a["enabled"].value_or(cfg.enabled);
    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.ring_buffer_size = static_cast<size_t>(a["ring_buffer_size"].value_or(int64_t{4096}));
    cfg.batch_flush_interval = std::chrono::milliseconds(a["batch_flush_interval_ms"].value_or(int64_t{1000}));
    cfg.max_batch_size = static_cast<size_t>(a["max_batch_size"].value_or(int64_t{256}));
    cfg.integrity_enabled = a["integrity_enabled"].value_or(cfg.integrity_enabled);
    cfg.rotation_max_file_size_mb = static_cast<size_t>(a["rotation_max_file_size_mb"].value_or(int64_t{100}));
    cfg.rotation_max_files = a["rotation_max_files"].value_or(cfg.rotation_max_files);
    return cfg;
}

LlmConfig ConfigLoader::extract_llm(const toml::table& root) {
    LlmConfig cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.enabled = l["enabled"].value_or(cfg.enabled);
    cfg.provider = utils::to_lower(l["provider"].value_or(cfg.provider));
    cfg.endpoint = l["endpoint"].value_or(cfg.endpoint);
    cfg.api_key = l["api_key"].value_or(""s);
    cfg.model = l["model"].value_or(cfg.model);
    cfg.timeout_ms = l["timeout_ms"].value_or(cfg.timeout_ms);
    cfg.max_retries = l["max_retries"].value_or(cfg.max_retries);
    cfg.max_tokens = l["max_tokens"].value_or(cfg.max_tokens);
    return cfg;
}

PolicyConfig ConfigLoader::extract_policy(const toml::table& root) {
    PolicyConfig cfg;

    // [rbac.<role>] <table> = ["col", ...]
    if (const auto* rbac = root["rbac"].as_table()) {
        for (const auto& [role_key, role_node] : *rbac) {
            const auto* tables = role_node.as_table();
            if (!tables) continue;
            auto& grants = cfg.rbac[std::string(role_key.str())];
            for (const auto& [table_key, columns_node] : *tables) {
                auto& allowed = grants[utils::to_lower(table_key.str())];
                for (auto& column : toml_identifier_array(&columns_node)) {
                    allowed.insert(std::move(column));
                }
            }
        }
    }

    // [rls] <role> = "table.column = {user_id}"
    if (const auto* rls = root["rls"].as_table()) {
        for (const auto& [role_key, template_node] : *rls) {
            if (const auto* text = template_node.as_string()) {
                cfg.rls.emplace(std::string(role_key.str()), text->get());
            }
        }
    }

    // [sensitive_columns] <table> = ["col", ...]
    if (const auto* sensitive = root["sensitive_columns"].as_table()) {
        for (const auto& [table_key, columns_node] : *sensitive) {
            cfg.sensitive_columns[utils::to_lower(table_key.str())] =
                toml_identifier_array(&columns_node);
        }
    }

    // [injection] patterns = ["regex", ...]
    if (const auto* injection = root["injection"].as_table()) {
        cfg.injection_patterns = toml_string_array(injection->get("patterns"));
        if (const auto* functions = injection->get("forbidden_functions")) {
            cfg.forbidden_functions = toml_identifier_array(functions);
        }
    }

    return cfg;
}

ServiceConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    ServiceConfig config;
    config.database = extract_database(root);
    config.logging = extract_logging(root);
    config.audit = extract_audit(root);
    config.llm = extract_llm(root);
    config.policy = extract_policy(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ServiceConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config {}: {} (line {})",
            config_path, e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {} (line {})",
            e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ServiceConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (db.connection_string.empty()) {
        errors.emplace_back("database.connection_string must not be empty");
    }
    if (db.max_connections == 0) {
        errors.emplace_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format(
            "database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.connection_timeout.count() <= 0) {
        errors.emplace_back("database.connection_timeout_ms must be > 0");
    }
    if (db.query_timeout.count() <= 0) {
        errors.emplace_back("database.query_timeout_ms must be > 0");
    }
    if (db.pool_acquire_timeout_ms <= 0) {
        errors.emplace_back("database.pool_acquire_timeout_ms must be > 0");
    }
    if (db.schema.empty()) {
        errors.emplace_back("database.schema must not be empty");
    }

    if (!utils::log::is_level_name(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    if (config.audit.enabled) {
        if (config.audit.output_file.empty()) {
            errors.emplace_back("audit.output_file required when audit is enabled");
        }
        if (config.audit.batch_flush_interval.count() <= 0) {
            errors.emplace_back("audit.batch_flush_interval_ms must be > 0");
        }
        if (config.audit.ring_buffer_size == 0) {
            errors.emplace_back("audit.ring_buffer_size must be > 0");
        }
    }

    if (config.llm.enabled) {
        if (config.llm.provider != "openai" && config.llm.provider != "anthropic") {
            errors.push_back(std::format("llm.provider '{}' must be openai or anthropic",
                config.llm.provider));
        }
        if (config.llm.endpoint.empty()) {
            errors.emplace_back("llm.endpoint required when llm is enabled");
        }
        if (config.llm.timeout_ms == 0) {
            errors.emplace_back("llm.timeout_ms must be > 0");
        }
    }

    for (const auto& [role, text] : config.policy.rls) {
        if (!text.contains("{user_id}")) {
            errors.push_back(std::format("rls.{} must contain {{user_id}}", role));
        } else if (!PolicyStore::parse_row_filter(text)) {
            errors.push_back(std::format("rls.{} must have the form 'table.column = {{user_id}}'", role));
        }
    }

    const auto& patterns = config.policy.injection_patterns;
    for (size_t i = 0; i < patterns.size(); ++i) {
        try {
            const std::regex compiled(patterns[i], std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            errors.push_back(std::format("injection.patterns[{}] does not compile: {}", i, e.what()));
        }
    }

    return errors;
}

} // namespace sqlguard
