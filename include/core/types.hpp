#pragma once

#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sqlguard {

// table -> allowed column names, for one role
using TableGrants = std::unordered_map<std::string, std::unordered_set<std::string>>;

// ============================================================================
// Identity
// ============================================================================

/**
 * @brief Caller identity supplied per request by the authentication layer.
 * Never persisted by the core.
 */
struct Identity {
    std::string role;
    std::string subject_id;     // customer_id, employee_id, ... (text or integer)
    std::string display_name;

    Identity() = default;
    Identity(std::string r, std::string id, std::string name = {})
        : role(std::move(r)), subject_id(std::move(id)), display_name(std::move(name)) {}

    // "Maggie (role=admin, id=4)" for log lines
    std::string describe() const {
        return std::format("{} (role={}, id={})",
            display_name.empty() ? "<anonymous>" : display_name, role, subject_id);
    }
};

// ============================================================================
// Query Fingerprint
// ============================================================================

struct QueryFingerprint {
    uint64_t hash;              // xxHash64 of normalized query
    std::string normalized;     // Normalized query text (literals replaced)

    QueryFingerprint() : hash(0) {}
    QueryFingerprint(uint64_t h, std::string n) : hash(h), normalized(std::move(n)) {}
};

// ============================================================================
// Extracted References
// ============================================================================

struct ColumnRef {
    std::string table;          // Empty = unqualified reference
    std::string column;

    ColumnRef() = default;
    ColumnRef(std::string t, std::string c) : table(std::move(t)), column(std::move(c)) {}

    bool is_qualified() const { return !table.empty(); }

    std::string full_name() const {
        return table.empty() ? column : (table + "." + column);
    }

    bool operator==(const ColumnRef&) const = default;
};

/**
 * @brief Tables and columns a statement touches, in first-occurrence order
 */
struct ExtractedReferences {
    std::vector<std::string> tables;
    std::vector<ColumnRef> columns;
    std::vector<std::string> functions;     // Called function names, unqualified

    void add_table(std::string table) {
        if (std::ranges::find(tables, table) == tables.end()) {
            tables.emplace_back(std::move(table));
        }
    }

    void add_column(ColumnRef ref) {
        if (std::ranges::find(columns, ref) == columns.end()) {
            columns.emplace_back(std::move(ref));
        }
    }

    void add_function(std::string name) {
        if (std::ranges::find(functions, name) == functions.end()) {
            functions.emplace_back(std::move(name));
        }
    }

    bool has_table(const std::string& table) const {
        return std::ranges::find(tables, table) != tables.end();
    }

    bool has_column(const ColumnRef& ref) const {
        return std::ranges::find(columns, ref) != columns.end();
    }
};

// ============================================================================
// Authorization Verdict
// ============================================================================

enum class DenialReason {
    FORBIDDEN_QUERY_TYPE,
    INJECTION_SUSPECTED,
    UNAUTHORIZED_TABLE,
    UNAUTHORIZED_COLUMN
};

[[nodiscard]] inline const char* denial_reason_to_string(DenialReason reason) {
    switch (reason) {
        case DenialReason::FORBIDDEN_QUERY_TYPE: return "ForbiddenQueryType";
        case DenialReason::INJECTION_SUSPECTED:  return "InjectionSuspected";
        case DenialReason::UNAUTHORIZED_TABLE:   return "UnauthorizedTable";
        case DenialReason::UNAUTHORIZED_COLUMN:  return "UnauthorizedColumn";
        default:                                 return "Unknown";
    }
}

/**
 * @brief Authorized | Denied(reason, detail)
 *
 * Only constructible through the two factories, so a verdict is never both.
 */
class AuthorizationVerdict {
public:
    static AuthorizationVerdict authorized() {
        return AuthorizationVerdict(true, DenialReason::FORBIDDEN_QUERY_TYPE, {});
    }

    static AuthorizationVerdict denied(DenialReason reason, std::string detail = {}) {
        return AuthorizationVerdict(false, reason, std::move(detail));
    }

    [[nodiscard]] bool is_authorized() const { return authorized_; }
    [[nodiscard]] bool is_denied() const { return !authorized_; }

    // Meaningful only when denied
    [[nodiscard]] DenialReason reason() const { return reason_; }
    [[nodiscard]] const std::string& detail() const { return detail_; }

    // Stable user-facing text for the boundary layer
    [[nodiscard]] std::string message() const {
        if (authorized_) return "Authorized";
        switch (reason_) {
            case DenialReason::FORBIDDEN_QUERY_TYPE:
                return "Forbidden query type. Only SELECT queries are allowed.";
            case DenialReason::INJECTION_SUSPECTED:
                return "Potential SQL injection detected.";
            case DenialReason::UNAUTHORIZED_TABLE:
                return std::format("Unauthorized access to table: {}", detail_);
            case DenialReason::UNAUTHORIZED_COLUMN:
                return std::format("Unauthorized access to column: {}", detail_);
        }
        return "Denied";
    }

private:
    AuthorizationVerdict(bool authorized, DenialReason reason, std::string detail)
        : authorized_(authorized), reason_(reason), detail_(std::move(detail)) {}

    bool authorized_;
    DenialReason reason_;
    std::string detail_;
};

// ============================================================================
// Execution
// ============================================================================

enum class ExecutionErrorKind {
    DRIVER_ERROR,
    TIMEOUT,
    CANCELLED,
    POOL_EXHAUSTED,
    RESULT_TOO_LARGE
};

[[nodiscard]] inline const char* execution_error_kind_to_string(ExecutionErrorKind kind) {
    switch (kind) {
        case ExecutionErrorKind::DRIVER_ERROR:     return "driver_error";
        case ExecutionErrorKind::TIMEOUT:          return "timeout";
        case ExecutionErrorKind::CANCELLED:        return "cancelled";
        case ExecutionErrorKind::POOL_EXHAUSTED:   return "pool_exhausted";
        case ExecutionErrorKind::RESULT_TOO_LARGE: return "result_too_large";
        default:                                   return "unknown";
    }
}

using Row = std::vector<std::optional<std::string>>;  // nullopt = SQL NULL

struct ExecutionResult {
    std::vector<std::string> column_names;
    std::vector<Row> rows;
    uint64_t row_count = 0;
    double elapsed_ms = 0.0;
};

/**
 * @brief Ok{rows} | Err{kind, message}
 */
struct ExecutionOutcome {
    bool success = false;
    ExecutionResult result;
    ExecutionErrorKind error_kind = ExecutionErrorKind::DRIVER_ERROR;
    std::string error_message;

    static ExecutionOutcome ok(ExecutionResult result) {
        ExecutionOutcome outcome;
        outcome.success = true;
        outcome.result = std::move(result);
        return outcome;
    }

    static ExecutionOutcome failure(ExecutionErrorKind kind, std::string message,
                                    double elapsed_ms = 0.0) {
        ExecutionOutcome outcome;
        outcome.success = false;
        outcome.error_kind = kind;
        outcome.error_message = std::move(message);
        outcome.result.elapsed_ms = elapsed_ms;
        return outcome;
    }
};

// ============================================================================
// Pipeline Response
// ============================================================================

enum class ResponseStatus {
    OK,
    DENIED,
    EXECUTION_ERROR,
    CLARIFICATION,
    REFUSAL,
    GENERATOR_ERROR
};

[[nodiscard]] inline const char* response_status_to_string(ResponseStatus status) {
    switch (status) {
        case ResponseStatus::OK:              return "ok";
        case ResponseStatus::DENIED:          return "denied";
        case ResponseStatus::EXECUTION_ERROR: return "error";
        case ResponseStatus::CLARIFICATION:   return "clarification";
        case ResponseStatus::REFUSAL:         return "refusal";
        case ResponseStatus::GENERATOR_ERROR: return "generator_error";
        default:                              return "unknown";
    }
}

/**
 * @brief Structured outcome handed back to the boundary layer
 */
struct GuardResponse {
    ResponseStatus status = ResponseStatus::GENERATOR_ERROR;
    std::string sql;                        // Final (rewritten) statement, when one exists
    ExecutionResult result;                 // OK only
    std::optional<DenialReason> reason;     // DENIED only
    std::optional<ExecutionErrorKind> error_kind;  // EXECUTION_ERROR only
    std::string message;

    static GuardResponse ok(std::string sql, ExecutionResult result) {
        GuardResponse r;
        r.status = ResponseStatus::OK;
        r.sql = std::move(sql);
        r.result = std::move(result);
        return r;
    }

    static GuardResponse denied(const AuthorizationVerdict& verdict) {
        GuardResponse r;
        r.status = ResponseStatus::DENIED;
        r.reason = verdict.reason();
        r.message = verdict.message();
        return r;
    }

    static GuardResponse execution_error(std::string sql, ExecutionErrorKind kind,
                                         std::string message) {
        GuardResponse r;
        r.status = ResponseStatus::EXECUTION_ERROR;
        r.sql = std::move(sql);
        r.error_kind = kind;
        r.message = std::move(message);
        return r;
    }

    static GuardResponse passthrough(ResponseStatus status, std::string message) {
        GuardResponse r;
        r.status = status;
        r.message = std::move(message);
        return r;
    }
};

} // namespace sqlguard
