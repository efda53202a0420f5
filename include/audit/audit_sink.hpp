#pragma once

#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Destination for serialized audit lines
 *
 * Only ever called from the AuditEmitter writer thread.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    // One or more newline-terminated JSON records. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view lines) = 0;

    virtual void flush() = 0;
    virtual void shutdown() = 0;

    // e.g. "file:/var/log/sql-guard/audit.jsonl"
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace sqlguard
