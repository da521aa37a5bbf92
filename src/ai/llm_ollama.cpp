/*
 * Ollama client - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/ai/llm.hpp>
#include <glsfs/core/json_text.hpp>
#include <sstream>

namespace glsfs::ai {

std::optional<LLMCompletion> OllamaLLMClient::complete(const std::string& system, const std::string& prompt) {
    std::string endpoint = m_cfg.endpoint.empty() ? "http://localhost:11434/api/generate" : m_cfg.endpoint;
    // Body per API generate: {"model":"<model>","system":"...","prompt":"...","stream":false}
    std::ostringstream body;
    body << "{\"model\":" << json_quote(m_cfg.model.empty() ? "granite3.1-dense" : m_cfg.model)
         << ",\"system\":" << json_quote(system)
         << ",\"prompt\":" << json_quote(prompt)
         << ",\"stream\":false"
         << ",\"options\":{\"temperature\":" << m_cfg.temperature << ",\"num_predict\":" << m_cfg.max_tokens << "}}";
    auto resp = detail::http_post_json(endpoint, {}, body.str(), m_cfg.timeout_seconds);
    if (!resp.ok()) {
        return LLMCompletion{"(ollama error code=" + std::to_string(resp.status)
                             + (resp.error.empty() ? "" : " curl=" + resp.error) + ")", "error"};
    }
    auto text = detail::json_string_field(resp.body, "response");
    if (!text || text->empty()) return LLMCompletion{"(parse-empty)", "error"};
    return LLMCompletion{*text, "ollama",
                         detail::json_int_field(resp.body, "prompt_eval_count"),
                         detail::json_int_field(resp.body, "eval_count")};
}

} // namespace glsfs::ai
