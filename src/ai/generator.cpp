/*
 * Command generator - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/ai/generator.hpp>
#include <glsfs/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <sstream>

namespace glsfs::ai {

namespace {

std::string trim(const std::string& s) {
    size_t a=0; while (a<s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b=s.size(); while (b>a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b-a);
}

void append_joined(std::string& into, const std::string& piece) {
    if (piece.empty()) return;
    if (!into.empty()) into.push_back(' ');
    into += piece;
}

// "Assistant:" echo from prompt-completion models
std::string strip_role_prefix(const std::string& text) {
    auto pos = text.rfind("Assistant:");
    return pos==std::string::npos ? text : text.substr(pos + 10);
}

} // namespace

LLMCommandGenerator::LLMCommandGenerator(std::unique_ptr<LLMClient> client) : m_client(std::move(client)) {
    if (!m_client) throw GenerationError("no LLM client configured");
}

const std::string& LLMCommandGenerator::system_prompt() {
    static const std::string prompt =
        "You are an expert Linux filesystem assistant. When users ask about file operations, "
        "reply with a single bash command on the first line, then a blank line, then a short "
        "explanation. The user's files live in /home/user/Desktop, /home/user/Documents and "
        "/home/user/Downloads (read-only) and /home/user/workspace (writable). "
        "For dangerous operations, include warnings.";
    return prompt;
}

GeneratedCommand LLMCommandGenerator::generate(const std::string& query) {
    if (trim(query).empty()) throw GenerationError("empty query");
    auto completion = m_client->complete(system_prompt(), query);
    if (!completion) throw GenerationError("LLM returned no response");
    if (completion->failed()) throw GenerationError("LLM provider error: " + completion->text);
    spdlog::debug("generator: [{}] {}", completion->source, completion->text);
    auto out = parse_response(completion->text);
    if (out.command.empty()) throw GenerationError("could not extract a command from the response");
    return out;
}

GeneratedCommand parse_response(const std::string& text) {
    GeneratedCommand out;
    out.raw_response = text;
    std::istringstream in(trim(strip_role_prefix(text)));
    std::string line;
    bool in_explanation = false;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.rfind("```", 0)==0) { if (!out.command.empty()) in_explanation = true; continue; }
        if (!in_explanation) {
            if (t.empty()) { in_explanation = !out.command.empty(); continue; }
            if (t[0]=='#' || t.rfind("This", 0)==0) { in_explanation = true; append_joined(out.explanation, t); continue; }
            if (t[0]=='$' && t.size()>1 && t[1]==' ') t = trim(t.substr(1)); // "$ ls" prompt marker
            append_joined(out.command, t);
            continue;
        }
        append_joined(out.explanation, t);
    }
    std::string::size_type p = 0;
    while ((p = out.command.find("find.", p))!=std::string::npos) {
        bool start = p==0 || !std::isalnum(static_cast<unsigned char>(out.command[p-1]));
        char next = p+5<out.command.size() ? out.command[p+5] : ' ';
        if (start && (next==' ' || next=='/' || next=='.')) out.command.replace(p, 5, "find .");
        p += 5;
    }
    return out;
}

LLMConfig llm_config_from(const Config& cfg) {
    LLMConfig l;
    l.provider = cfg.llm_provider;
    l.model = cfg.llm_model;
    l.endpoint = cfg.llm_endpoint;
    l.api_key_env = cfg.llm_api_key_env;
    l.api_key = cfg.llm_api_key;
    l.stub_file = cfg.llm_stub_file;
    l.max_tokens = cfg.llm_max_tokens;
    l.temperature = cfg.llm_temperature;
    l.timeout_seconds = cfg.llm_timeout;
    return l;
}

} // namespace glsfs::ai
