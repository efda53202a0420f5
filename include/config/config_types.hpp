#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sqlguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;
    std::string schema;                   // Schema introspected at startup
    size_t min_connections;
    size_t max_connections;
    std::chrono::milliseconds connection_timeout;
    std::chrono::milliseconds query_timeout;
    std::string health_check_query;
    int idle_timeout_seconds;
    int pool_acquire_timeout_ms;
    size_t max_result_rows;

    DatabaseConfig()
        : schema("public"),
          min_connections(1),
          max_connections(8),
          connection_timeout(5000),
          query_timeout(30000),
          health_check_query("SELECT 1"),
          idle_timeout_seconds(300),
          pool_acquire_timeout_ms(5000),
          max_result_rows(10000) {}
};

struct LoggingConfig {
    std::string level = "info";
};

struct AuditConfig {
    bool enabled;
    std::string output_file;
    size_t ring_buffer_size;
    std::chrono::milliseconds batch_flush_interval;
    size_t max_batch_size;

    // File rotation
    size_t rotation_max_file_size_mb = 100;
    int rotation_max_files = 10;

    // Integrity (hash chain)
    bool integrity_enabled = true;

    AuditConfig()
        : enabled(true),
          output_file("audit.jsonl"),
          ring_buffer_size(4096),
          batch_flush_interval(1000),
          max_batch_size(256) {}
};

struct LlmConfig {
    bool enabled = false;
    std::string provider = "openai";      // openai | anthropic
    std::string endpoint = "https://api.openai.com";
    std::string api_key;
    std::string model = "gpt-4o-mini";
    uint32_t timeout_ms = 30000;
    uint32_t max_retries = 2;
    int max_tokens = 512;
};

// ============================================================================
// Authorization Policy
// ============================================================================

struct PolicyConfig {
    // role -> table -> allowed columns
    std::map<std::string, TableGrants> rbac;
    // role -> row-filter template, e.g. "orders.customer_id = {user_id}"
    std::map<std::string, std::string> rls;
    // table -> columns whose access is audited
    std::map<std::string, std::vector<std::string>> sensitive_columns;
    // Ordered, matched case-insensitively against the raw statement
    std::vector<std::string> injection_patterns;
    // Functions that run SQL text or reach server files and settings
    std::vector<std::string> forbidden_functions = {
        "query_to_xml", "query_to_xmlschema", "query_to_xml_and_xmlschema",
        "cursor_to_xml", "cursor_to_xmlschema",
        "table_to_xml", "table_to_xmlschema", "table_to_xml_and_xmlschema",
        "schema_to_xml", "schema_to_xmlschema", "schema_to_xml_and_xmlschema",
        "database_to_xml", "database_to_xmlschema", "database_to_xml_and_xmlschema",
        "dblink", "dblink_exec", "dblink_open", "dblink_fetch", "dblink_send_query",
        "pg_read_file", "pg_read_binary_file", "pg_ls_dir", "pg_stat_file",
        "lo_import", "lo_export", "lo_get", "lo_open", "loread",
        "current_setting", "set_config",
        "pg_sleep", "pg_terminate_backend", "pg_cancel_backend", "pg_reload_conf"
    };
};

// ============================================================================
// Service Configuration (top level)
// ============================================================================

struct ServiceConfig {
    DatabaseConfig database;
    LoggingConfig logging;
    AuditConfig audit;
    LlmConfig llm;
    PolicyConfig policy;
};

} // namespace sqlguard
