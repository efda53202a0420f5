#include "core/llm_client.hpp"
#include "core/json.hpp"
#include "core/prompt_builder.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <array>
#include <format>
#include <regex>
#include <string_view>
#include <thread>

namespace sqlguard {

namespace {

constexpr std::string_view kClarifyPrefix = "clarify:";

constexpr std::array<std::string_view, 3> kRefusalPhrases = {
    "access denied", "i don't know", "not authorized"
};

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

LlmSqlGenerator::LlmSqlGenerator(LlmConfig config)
    : config_(std::move(config)) {}

// ============================================================================
// Reply Classification
// ============================================================================

std::string LlmSqlGenerator::strip_markup(const std::string& reply) {
    static const std::regex kThink(R"(<think>[\s\S]*?</think>)", std::regex::icase);
    static const std::regex kFence(R"(```[A-Za-z]*\s*([\s\S]*?)```)");

    const std::string without_think = std::regex_replace(reply, kThink, "");

    std::smatch match;
    if (std::regex_search(without_think, match, kFence)) {
        return utils::trim(match[1].str());
    }
    return utils::trim(without_think);
}

GenerationOutcome LlmSqlGenerator::classify_reply(const std::string& reply) {
    const std::string text = strip_markup(reply);
    const std::string lower = utils::to_lower(text);

    if (const auto pos = lower.find(kClarifyPrefix); pos != std::string::npos) {
        return GenerationOutcome::clarification(utils::trim(text.substr(pos + kClarifyPrefix.size())));
    }

    for (const auto phrase : kRefusalPhrases) {
        if (lower.contains(phrase)) {
            return GenerationOutcome::refusal(text);
        }
    }

    if (text.empty()) {
        return GenerationOutcome::error("Generator returned an empty reply");
    }
    return GenerationOutcome::sql(text);
}

// ============================================================================
// Wire Format
// ============================================================================

std::string LlmSqlGenerator::build_request_body(const LlmConfig& config,
                                                const std::string& system_prompt,
                                                const std::string& user_prompt) {
    if (config.provider == "anthropic") {
        const glz::json_t body = {
            {"model", config.model},
            {"max_tokens", static_cast<double>(config.max_tokens)},
            {"system", system_prompt},
            {"messages", glz::json_t::array_t{
                glz::json_t{{"role", "user"}, {"content", user_prompt}}}}
        };
        return JsonValue::dump(body);
    }

    const glz::json_t body = {
        {"model", config.model},
        {"temperature", 0.0},
        {"max_tokens", static_cast<double>(config.max_tokens)},
        {"messages", glz::json_t::array_t{
            glz::json_t{{"role", "system"}, {"content", system_prompt}},
            glz::json_t{{"role", "user"}, {"content", user_prompt}}}}
    };
    return JsonValue::dump(body);
}

std::optional<std::string> LlmSqlGenerator::extract_content(const std::string& body,
                                                            const std::string& provider) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error& e) {
        utils::log::warn(std::format("Unparseable LLM response: {}", e.what()));
        return std::nullopt;
    }

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        std::optional<std::string> text;
        doc["content"].for_each_child([&](std::string_view, const JsonValue& block) {
            if (!text && block.string_or("type") == "text" && block["text"].is_string()) {
                text = block["text"].get<std::string>();
            }
        });
        return text;
    }

    // {"choices":[{"message":{"content":"..."}}]}
    const JsonValue content = doc["choices"][0]["message"]["content"];
    if (!content.is_string()) {
        return std::nullopt;
    }
    return content.get<std::string>();
}

// ============================================================================
// Core API
// ============================================================================

GenerationOutcome LlmSqlGenerator::generate(const GenerationRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled) {
        return GenerationOutcome::error("SQL generator is disabled");
    }

    const auto user_prompt = PromptBuilder::user_prompt(request);
    utils::log::debug(std::format("Generator prompt for {}:\n{}", request.identity.describe(), user_prompt));

    const auto reply = call_api(PromptBuilder::system_prompt(), user_prompt);
    if (!reply.success) {
        utils::log::error(std::format("Generator call failed after {} ms: {}",
            reply.latency.count(), reply.error));
        return GenerationOutcome::error(reply.error);
    }

    auto outcome = classify_reply(reply.content);
    utils::log::info(std::format("Generator replied with {} in {} ms",
        generation_kind_to_string(outcome.kind), reply.latency.count()));
    return outcome;
}

LlmSqlGenerator::ApiReply LlmSqlGenerator::call_api(const std::string& system_prompt,
                                                    const std::string& user_prompt) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const auto start = std::chrono::steady_clock::now();
    const auto since_start = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };
    const auto failed = [&](std::string message) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return ApiReply{false, "", std::move(message), since_start()};
    };

    if (config_.api_key.empty()) {
        return failed("No API key configured");
    }
    if (config_.endpoint.empty()) {
        return failed("No endpoint configured");
    }

    std::string json_body;
    try {
        json_body = build_request_body(config_, system_prompt, user_prompt);
    } catch (const JsonValue::parse_error& e) {
        return failed(std::format("Could not encode request: {}", e.what()));
    }

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {"Authorization", "Bearer " + config_.api_key}
        };
        path = "/v1/chat/completions";
    }

    // Retry loop
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            retries_.fetch_add(1, std::memory_order_relaxed);
            std::this_thread::sleep_for(std::chrono::milliseconds(1000 * attempt));
        }

        const auto res = cli.Post(path, headers, json_body, "application/json");

        if (!res) {
            utils::log::warn(std::format("LLM request attempt {} failed: {}",
                attempt + 1, httplib::to_string(res.error())));
            continue;
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429) {
            utils::log::warn(std::format("LLM request attempt {} rate limited", attempt + 1));
            continue;
        }

        if (res->status != httplib::StatusCode::OK_200) {
            return failed(std::format("API error: HTTP {} - {}", res->status,
                res->body.substr(0, 200)));
        }

        auto content = extract_content(res->body, config_.provider);
        if (!content) {
            return failed("API response carried no message content");
        }
        return ApiReply{true, std::move(*content), "", since_start()};
    }

    return failed(std::format("No usable response after {} attempts", config_.max_retries + 1));
}

// ============================================================================
// Stats
// ============================================================================

LlmSqlGenerator::Stats LlmSqlGenerator::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        retries_.load(std::memory_order_relaxed)
    };
}

} // namespace sqlguard
