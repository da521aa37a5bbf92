/*
 * LLM clients - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/ai/llm.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace glsfs::ai {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::optional<LLMCompletion> StubLLMClient::complete(const std::string&, const std::string& prompt) {
    if (!m_cfg.stub_file.empty()) {
        std::ifstream in(m_cfg.stub_file);
        if (in) {
            std::ostringstream oss; oss << in.rdbuf();
            std::string data = oss.str();
            if (!data.empty()) return LLMCompletion{data, "stub_file"};
        } else {
            spdlog::warn("llm: stub file {} not readable, echoing prompt", m_cfg.stub_file);
        }
    }
    return LLMCompletion{prompt, "stub_plain"};
}

std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg) {
    if (cfg.provider=="openai") return std::make_unique<OpenAILLMClient>(cfg);
    if (cfg.provider=="ollama") return std::make_unique<OllamaLLMClient>(cfg);
    if (cfg.provider!="stub") spdlog::warn("llm: unknown provider '{}', using stub", cfg.provider);
    return std::make_unique<StubLLMClient>(cfg);
}

namespace detail {

HttpResponse http_post_json(const std::string& url, const std::vector<std::string>& headers,
                            const std::string& body, int timeout_seconds) {
    HttpResponse out;
    CURL* curl = curl_easy_init();
    if (!curl) { out.error = "curl-init-fail"; return out; }
    struct curl_slist* hdrs = nullptr;
    hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
    for (auto &h : headers) hdrs = curl_slist_append(hdrs, h.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    auto res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    if (res!=CURLE_OK) out.error = curl_easy_strerror(res);
    curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);
    return out;
}

std::optional<std::string> json_string_field(const std::string& doc, const std::string& key, std::size_t from) {
    std::string marker = "\"" + key + "\"";
    size_t pos = doc.find(marker, from);
    if (pos==std::string::npos) return std::nullopt;
    pos = doc.find(':', pos + marker.size());
    if (pos==std::string::npos) return std::nullopt;
    ++pos;
    while (pos<doc.size() && std::isspace(static_cast<unsigned char>(doc[pos]))) ++pos;
    if (pos>=doc.size() || doc[pos]!='"') return std::nullopt;
    std::string text;
    bool esc = false;
    for (size_t i=pos+1;i<doc.size();++i) {
        char c = doc[i];
        if (esc) {
            switch (c) {
                case 'n': text.push_back('\n'); break;
                case 'r': text.push_back('\r'); break;
                case 't': text.push_back('\t'); break;
                case 'u':
                    // \u00XX only; wider code points are rare in shell commands
                    if (i+4<doc.size()) {
                        unsigned v = std::strtoul(doc.substr(i+1, 4).c_str(), nullptr, 16);
                        if (v<0x80) text.push_back(static_cast<char>(v)); else text.push_back('?');
                        i += 4;
                    }
                    break;
                default: text.push_back(c);
            }
            esc = false;
            continue;
        }
        if (c=='\\') { esc = true; continue; }
        if (c=='"') return text;
        text.push_back(c);
    }
    return std::nullopt;
}

int json_int_field(const std::string& doc, const std::string& key) {
    size_t pos = doc.find("\"" + key + "\"");
    if (pos==std::string::npos) return -1;
    pos = doc.find(':', pos);
    if (pos==std::string::npos) return -1;
    ++pos;
    while (pos<doc.size() && std::isspace(static_cast<unsigned char>(doc[pos]))) ++pos;
    size_t end = pos;
    while (end<doc.size() && std::isdigit(static_cast<unsigned char>(doc[end]))) ++end;
    if (end==pos) return -1;
    errno = 0;
    long v = std::strtol(doc.c_str() + pos, nullptr, 10);
    if (errno==ERANGE || v>INT_MAX) return -1;
    return static_cast<int>(v);
}

std::string resolve_api_key(const LLMConfig& cfg) {
    const char* env_key = nullptr;
    if (!cfg.api_key_env.empty()) env_key = std::getenv(cfg.api_key_env.c_str());
    return (env_key && *env_key) ? std::string(env_key) : cfg.api_key;
}

} // namespace detail

} // namespace glsfs::ai
