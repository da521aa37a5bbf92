/*
 * OpenAI client - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/ai/llm.hpp>
#include <glsfs/core/json_text.hpp>
#include <sstream>

namespace glsfs::ai {

std::optional<LLMCompletion> OpenAILLMClient::complete(const std::string& system, const std::string& prompt) {
    std::string key = detail::resolve_api_key(m_cfg);
    if (key.empty()) {
        std::string reason = m_cfg.api_key_env.empty() ? "(no-key-direct)" : "(env-missing:" + m_cfg.api_key_env + ")";
        return LLMCompletion{reason, "error"};
    }
    std::string endpoint = m_cfg.endpoint.empty() ? "https://api.openai.com/v1/chat/completions" : m_cfg.endpoint;
    std::ostringstream body;
    body << "{\"model\":" << json_quote(m_cfg.model.empty() ? "gpt-4o-mini" : m_cfg.model) << ","
         << "\"messages\":[{\"role\":\"system\",\"content\":" << json_quote(system) << "},"
         << "{\"role\":\"user\",\"content\":" << json_quote(prompt) << "}],"
         << "\"temperature\":" << m_cfg.temperature << ",\"max_tokens\":" << m_cfg.max_tokens << "}";
    auto resp = detail::http_post_json(endpoint, {"Authorization: Bearer " + key}, body.str(), m_cfg.timeout_seconds);
    if (!resp.ok()) {
        auto msg = detail::json_string_field(resp.body, "message");
        std::string combined = "(openai error code=" + std::to_string(resp.status)
            + (resp.error.empty() ? "" : " curl=" + resp.error)
            + (msg ? " msg=" + *msg : "") + ")";
        return LLMCompletion{combined, "error"};
    }
    // choices[0].message.content
    auto choices = resp.body.find("\"choices\"");
    auto message = resp.body.find("\"message\"", choices==std::string::npos ? 0 : choices);
    auto content = detail::json_string_field(resp.body, "content", message==std::string::npos ? 0 : message);
    if (!content || content->empty())
        return LLMCompletion{"(parse-empty) RAW:" + resp.body.substr(0, 2048), "error"};
    return LLMCompletion{*content, "openai",
                         detail::json_int_field(resp.body, "prompt_tokens"),
                         detail::json_int_field(resp.body, "completion_tokens")};
}

} // namespace glsfs::ai
