#pragma once

#include "config/config_types.hpp"
#include "core/sql_generator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sqlguard {

/**
 * @brief ISqlGenerator backed by a hosted chat-completion API.
 *
 * Uses the OpenAI (/v1/chat/completions) or Anthropic (/v1/messages)
 * request format via httplib::Client. Connection failures and HTTP 429
 * are retried up to max_retries with a linear backoff; any other HTTP
 * error is returned immediately as GenerationKind::ERROR.
 */
class LlmSqlGenerator : public ISqlGenerator {
public:
    explicit LlmSqlGenerator(LlmConfig config);

    [[nodiscard]] GenerationOutcome generate(const GenerationRequest& request) override;

    /**
     * @brief Classify a raw model reply
     *
     * Drops <think> sections and markdown fences, then:
     * CLARIFY: prefix -> clarification; "access denied", "i don't know",
     * "not authorized" -> refusal; empty -> error; anything else -> SQL.
     */
    [[nodiscard]] static GenerationOutcome classify_reply(const std::string& reply);

    // Remove ```sql ... ``` fences and <think>...</think> blocks
    [[nodiscard]] static std::string strip_markup(const std::string& reply);

    [[nodiscard]] static std::string build_request_body(const LlmConfig& config,
                                                        const std::string& system_prompt,
                                                        const std::string& user_prompt);

    // Assistant text from a provider response body; nullopt if absent
    [[nodiscard]] static std::optional<std::string> extract_content(const std::string& body,
                                                                    const std::string& provider);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t retries = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    // Raw assistant text, or the error message in the error slot
    struct ApiReply {
        bool success = false;
        std::string content;
        std::string error;
        std::chrono::milliseconds latency{0};
    };

    [[nodiscard]] ApiReply call_api(const std::string& system_prompt,
                                    const std::string& user_prompt);

    LlmConfig config_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> retries_{0};
};

} // namespace sqlguard
