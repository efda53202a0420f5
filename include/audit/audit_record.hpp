#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlguard {

// ============================================================================
// Audit Record
// ============================================================================

enum class AuditEventKind : uint8_t {
    SECURITY_VIOLATION,     // Denied candidate statement
    QUERY_EXECUTED,
    EXECUTION_FAILED,
    DATA_ACCESS,            // Sensitive columns touched
    GENERATOR_OUTCOME       // Clarification / refusal / generator error
};

[[nodiscard]] inline const char* audit_event_kind_to_string(AuditEventKind kind) {
    switch (kind) {
        case AuditEventKind::SECURITY_VIOLATION: return "SECURITY_VIOLATION";
        case AuditEventKind::QUERY_EXECUTED:     return "QUERY_EXECUTED";
        case AuditEventKind::EXECUTION_FAILED:   return "EXECUTION_FAILED";
        case AuditEventKind::DATA_ACCESS:        return "DATA_ACCESS";
        case AuditEventKind::GENERATOR_OUTCOME:  return "GENERATOR_OUTCOME";
        default:                                 return "UNKNOWN";
    }
}

struct AuditRecord {
    std::string audit_id;               // UUID
    uint64_t sequence_num;              // Monotonic counter for gap detection
    std::chrono::system_clock::time_point timestamp;
    AuditEventKind kind;

    // Identity
    std::string role;
    std::string subject_id;
    std::string display_name;

    // Request
    std::string question;               // Natural-language question, when one exists
    std::string sql;
    uint64_t fingerprint_hash;

    // Verdict
    std::optional<DenialReason> denial_reason;
    std::string detail;

    // Execution
    std::optional<ExecutionErrorKind> error_kind;
    std::string error_message;
    uint64_t rows_returned;
    double elapsed_ms;

    // Sensitive-column access (table.column)
    std::vector<std::string> sensitive_columns;

    // Integrity (hash chain)
    std::string record_hash;
    std::string previous_hash;

    AuditRecord()
        : audit_id(utils::generate_uuid()),
          sequence_num(0),
          timestamp(utils::now()),
          kind(AuditEventKind::QUERY_EXECUTED),
          fingerprint_hash(0),
          rows_returned(0),
          elapsed_ms(0.0) {}

    AuditRecord(AuditEventKind k, const Identity& identity, std::string statement)
        : AuditRecord() {
        kind = k;
        role = identity.role;
        subject_id = identity.subject_id;
        display_name = identity.display_name;
        sql = std::move(statement);
    }
};

} // namespace sqlguard
