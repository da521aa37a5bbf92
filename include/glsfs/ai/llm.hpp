/*
 * LLM clients - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Text-generation providers behind one interface. Remote providers speak
 *   HTTP through libcurl; the stub returns a canned file or echoes the prompt
 *   so the whole pipeline works offline.
 *   A completion with source "error" carries the failure text.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace glsfs::ai {

struct LLMConfig {
    std::string provider = "stub";  // openai, ollama, stub
    std::string model;
    std::string endpoint;           // empty: provider default
    std::string api_key_env;        // env var containing key
    std::string api_key;            // direct key (prefer env)
    std::string stub_file;          // canned response for the stub provider
    int max_tokens = 256;
    double temperature = 0.3;
    int timeout_seconds = 60;
};

struct LLMCompletion {
    std::string text;
    std::string source;             // stub_file|stub_plain|openai|ollama|error
    int prompt_tokens = -1;
    int completion_tokens = -1;

    bool failed() const { return source=="error"; }
};

class LLMClient {
public:
    virtual ~LLMClient() = default;
    virtual std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) = 0;
};

// stub_file set and readable: its contents. Otherwise the prompt itself,
// so a typed shell command goes straight to validation.
class StubLLMClient : public LLMClient {
public:
    explicit StubLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// OpenAI Chat Completions (non streaming).
class OpenAILLMClient : public LLMClient {
public:
    explicit OpenAILLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// Ollama /api/generate (non streaming).
class OllamaLLMClient : public LLMClient {
public:
    explicit OllamaLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// Unknown providers get the stub.
std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg);

namespace detail {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;     // curl error text, empty on transport success

    bool ok() const { return error.empty() && status/100==2; }
};

HttpResponse http_post_json(const std::string& url, const std::vector<std::string>& headers,
                            const std::string& body, int timeout_seconds);

// Value of the first "key":"..." string at or after from (JSON escapes decoded).
std::optional<std::string> json_string_field(const std::string& doc, const std::string& key, std::size_t from = 0);

// Value of the first "key":<int>; -1 when missing or out of int range.
int json_int_field(const std::string& doc, const std::string& key);

// API key from api_key_env, falling back to api_key.
std::string resolve_api_key(const LLMConfig& cfg);

} // namespace detail

} // namespace glsfs::ai
