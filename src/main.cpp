#include "audit/audit_emitter.hpp"
#include "config/config_loader.hpp"
#include "core/cancellation.hpp"
#include "core/json.hpp"
#include "core/llm_client.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/generic_query_executor.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_loader.hpp"
#include "policy/policy_store.hpp"

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace sqlguard;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string config_file = "config/sql-guard.toml";
    std::optional<std::string> sql;
    std::optional<std::string> question;
    Identity identity;
};

void print_usage(std::ostream& out) {
    out << "Usage: sql-guard [--config path] (--sql \"<statement>\" | --question \"<text>\")\n"
           "                 [--role role] [--user-id id] [--name display-name]\n"
           "Identity defaults come from USER_ROLE, USER_ID and USERNAME.\n";
}

std::string env_or(const char* name, std::string fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::move(fallback);
}

// nullopt on a usage error (already reported)
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    opts.identity.role = env_or("USER_ROLE", "customer");
    opts.identity.subject_id = env_or("USER_ID", "");
    opts.identity.display_name = env_or("USERNAME", "");

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            std::exit(0);
        }
        if (i + 1 >= argc) {
            std::cerr << std::format("Missing value for {}\n", arg);
            return std::nullopt;
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            opts.config_file = value;
        } else if (arg == "--sql") {
            opts.sql = value;
        } else if (arg == "--question") {
            opts.question = value;
        } else if (arg == "--role") {
            opts.identity.role = value;
        } else if (arg == "--user-id") {
            opts.identity.subject_id = value;
        } else if (arg == "--name") {
            opts.identity.display_name = value;
        } else {
            std::cerr << std::format("Unknown option {}\n", arg);
            return std::nullopt;
        }
    }

    if (opts.sql.has_value() == opts.question.has_value()) {
        std::cerr << "Exactly one of --sql or --question is required\n";
        return std::nullopt;
    }
    return opts;
}

// ============================================================================
// Response rendering (JSON on stdout)
// ============================================================================

glz::json_t render_rows(const ExecutionResult& result) {
    glz::json_t::array_t rows;
    rows.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        glz::json_t::object_t record;
        for (size_t i = 0; i < result.column_names.size() && i < row.size(); ++i) {
            if (row[i]) {
                record[result.column_names[i]] = *row[i];
            } else {
                record[result.column_names[i]] = nullptr;
            }
        }
        rows.emplace_back(std::move(record));
    }
    return rows;
}

glz::json_t render_response(const GuardResponse& response) {
    glz::json_t::object_t doc;
    doc["status"] = response_status_to_string(response.status);

    switch (response.status) {
        case ResponseStatus::OK: {
            glz::json_t::array_t columns;
            for (const auto& name : response.result.column_names) {
                columns.emplace_back(name);
            }
            doc["columns"] = std::move(columns);
            doc["rows"] = render_rows(response.result);
            doc["rowCount"] = static_cast<double>(response.result.row_count);
            doc["elapsedMillis"] = response.result.elapsed_ms;
            doc["sql"] = response.sql;
            break;
        }
        case ResponseStatus::DENIED:
            doc["reason"] = response.reason ? denial_reason_to_string(*response.reason) : "";
            doc["message"] = response.message;
            break;
        case ResponseStatus::EXECUTION_ERROR:
            doc["kind"] = response.error_kind ? execution_error_kind_to_string(*response.error_kind) : "";
            doc["message"] = response.message;
            doc["sql"] = response.sql;
            break;
        default:
            doc["message"] = response.message;
            break;
    }
    return doc;
}

// ============================================================================
// Signals: SIGINT/SIGTERM cancel the in-flight request
// ============================================================================

/**
 * @brief Waits for SIGINT/SIGTERM on a dedicated thread
 *
 * Must be constructed before any other thread starts so the block mask
 * is inherited everywhere.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& token) : token_(token) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        thread_ = std::thread([this] { run(); });
    }

    ~SignalWatcher() {
        stop_.store(true, std::memory_order_release);
        if (thread_.joinable()) thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run() {
        const timespec poll_interval{0, 200'000'000};
        while (!stop_.load(std::memory_order_acquire)) {
            const int sig = sigtimedwait(&signals_, nullptr, &poll_interval);
            if (sig > 0) {
                utils::log::warn(std::format("Received signal {}, cancelling request", sig));
                token_.cancel();
            }
        }
    }

    CancellationToken& token_;
    sigset_t signals_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    // Identity comes from the caller; without a subject the core is never invoked
    if (opts->identity.subject_id.empty()) {
        std::cerr << "No subject identifier: pass --user-id or set USER_ID\n";
        return kExitUsage;
    }

    CancellationToken cancel;
    SignalWatcher signal_watcher(cancel);

    try {
        // =====================================================================
        // [1/5] Configuration
        // =====================================================================
        auto config_result = ConfigLoader::load_from_file(opts->config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitFailure;
        }
        const ServiceConfig& config = config_result.config;
        utils::log::set_level(config.logging.level);
        utils::log::info(std::format("[1/5] Configuration loaded from {}", opts->config_file));

        auto policy = PolicyStore::create(config.policy);
        if (policy.is_error()) {
            utils::log::error(policy.error_message());
            return kExitFailure;
        }

        // =====================================================================
        // [2/5] Audit trail
        // =====================================================================
        std::shared_ptr<AuditEmitter> audit;
        if (config.audit.enabled) {
            auto emitter = AuditEmitter::create(config.audit);
            if (emitter.is_error()) {
                utils::log::error(emitter.error_message());
                return kExitFailure;
            }
            audit = std::move(emitter.value());
            utils::log::info(std::format("[2/5] Audit trail: {}", config.audit.output_file));
        } else {
            utils::log::info("[2/5] Audit trail: disabled");
        }

        // =====================================================================
        // [3/5] Connection pool
        // =====================================================================
        PoolConfig pool_config;
        pool_config.connection_string = config.database.connection_string;
        pool_config.min_connections = config.database.min_connections;
        pool_config.max_connections = config.database.max_connections;
        pool_config.idle_timeout = std::chrono::seconds(config.database.idle_timeout_seconds);
        pool_config.health_check_query = config.database.health_check_query;

        auto pool = std::make_shared<GenericConnectionPool>(
            pool_config, std::make_shared<PgConnectionFactory>(config.database.connection_timeout));
        utils::log::info(std::format("[3/5] Connection pool: max {} connections",
            pool_config.max_connections));

        // =====================================================================
        // [4/5] Schema catalog (fatal when unavailable)
        // =====================================================================
        const auto acquire_timeout = std::chrono::milliseconds(config.database.pool_acquire_timeout_ms);
        std::shared_ptr<const SchemaCatalog> schema;
        {
            auto conn = pool->acquire(acquire_timeout);
            if (!conn || !conn->is_valid()) {
                utils::log::error("SchemaUnavailable: cannot connect to the database");
                return kExitFailure;
            }
            PgSchemaLoader loader;
            auto loaded = loader.load(*conn->get(), config.database.schema);
            if (loaded.is_error()) {
                utils::log::error(std::format("{}: {}",
                    error_category_to_string(loaded.error_category()), loaded.error_message()));
                return kExitFailure;
            }
            schema = std::move(loaded.value());
        }
        utils::log::info(std::format("[4/5] Schema '{}': {} tables",
            schema->schema_name(), schema->table_count()));

        // =====================================================================
        // [5/5] Pipeline
        // =====================================================================
        GenericQueryExecutor::Config exec_config;
        exec_config.query_timeout_ms = static_cast<uint32_t>(config.database.query_timeout.count());
        exec_config.max_result_rows = static_cast<uint32_t>(config.database.max_result_rows);
        exec_config.acquire_timeout = acquire_timeout;

        PipelineComponents components;
        components.schema = schema;
        components.policy = policy.value();
        components.executor = std::make_shared<GenericQueryExecutor>(pool, exec_config);
        components.audit = audit;
        if (config.llm.enabled) {
            components.generator = std::make_shared<LlmSqlGenerator>(config.llm);
        }
        Pipeline pipeline(std::move(components));
        utils::log::info(std::format("[5/5] Pipeline ready (generator: {})",
            config.llm.enabled ? config.llm.provider : "disabled"));

        const GuardResponse response = opts->sql
            ? pipeline.process_candidate(*opts->sql, opts->identity, &cancel)
            : pipeline.process_question(*opts->question, opts->identity, &cancel);

        std::cout << JsonValue::dump(render_response(response)) << '\n';

        if (audit) {
            audit->shutdown();
        }
        pool->drain();

        return 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }
}
