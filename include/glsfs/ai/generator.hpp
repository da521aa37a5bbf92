/*
 * Command generator - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Natural-language request -> one shell command plus an optional
 *   explanation. Output is untrusted; it only ever reaches the validator.
 */
#pragma once
#include <memory>
#include <string>
#include <glsfs/ai/llm.hpp>
#include <glsfs/core/config.hpp>

namespace glsfs::ai {

struct GeneratedCommand {
    std::string command;
    std::string explanation;
    std::string raw_response;
};

class CommandGenerator {
public:
    virtual ~CommandGenerator() = default;
    // Throws GenerationError.
    virtual GeneratedCommand generate(const std::string& query) = 0;
};

class LLMCommandGenerator : public CommandGenerator {
public:
    explicit LLMCommandGenerator(std::unique_ptr<LLMClient> client);
    GeneratedCommand generate(const std::string& query) override;

    static const std::string& system_prompt();
private:
    std::unique_ptr<LLMClient> m_client;
};

// Split a model reply into command and explanation:
//  - code fences are dropped; a closing fence ends the command
//  - leading lines form the command until a blank line or a line starting
//    with '#' or "This"; everything from there on is the explanation
//  - a glued "find." becomes "find ."
GeneratedCommand parse_response(const std::string& text);

LLMConfig llm_config_from(const Config& cfg);

} // namespace glsfs::ai
