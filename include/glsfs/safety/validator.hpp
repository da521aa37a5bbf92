/*
 * Safety Validator - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Decides whether a generated command may run. Checks run in a fixed order
 *   and the first failure wins:
 *     1. empty input
 *     2. forbidden pattern blocklist (on the raw command)
 *     3. path normalization (all later checks use the normalized copy)
 *     4-5. write targets vs read-only mounts and the safe roots
 *     6. injection patterns (high confidence blocks, low confidence warns)
 *     7. dangerous system paths and excessive ".." traversal
 *   A safe result always carries the normalized command as sanitized_command.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <regex>
#include <glsfs/path/normalizer.hpp>
#include <glsfs/safety/command_table.hpp>

namespace glsfs {

enum class Verdict { Forbidden, BlockedByBoundary, BlockedByInjection, Safe, SafeWithWarnings };

const char* to_string(Verdict v);

struct ValidationResult {
    bool is_safe = false;
    Verdict verdict = Verdict::Forbidden;
    std::vector<std::string> warnings;
    std::optional<std::string> sanitized_command;
    std::string reason;               // empty when safe
    std::string base_command;
    CommandClass command_class = CommandClass::Unknown;
};

struct ValidatorPolicy {
    std::string sandbox_home = kDefaultSandboxHome;
    std::vector<std::string> safe_roots;      // empty: home, its folders, /workspace, /tmp
    std::vector<std::string> readonly_mounts; // empty: home/{Desktop,Documents,Downloads}
    int max_traversal = 3;                    // more ".." segments than this are rejected
};

class SafetyValidator {
public:
    explicit SafetyValidator(ValidatorPolicy policy = {});

    ValidationResult validate(const std::string& command) const;

    // Absolute, lexically normal sandbox path for a word (quotes removed,
    // home and folder names rewritten, relative paths anchored at base, or at
    // home when base is empty).
    std::string resolve(const std::string& word, const std::string& base = "") const;

    bool is_readonly_path(const std::string& resolved) const;
    bool is_inside_safe_roots(const std::string& resolved) const;

    const ValidatorPolicy& policy() const { return m_policy; }
private:
    struct Pattern { std::regex re; std::string description; };

    std::optional<std::string> check_forbidden(const std::string& raw) const;
    std::optional<std::string> check_targets(const TokenList& tokens, ValidationResult& res) const;
    std::optional<std::string> check_injection(const std::string& cmd, ValidationResult& res) const;
    std::optional<std::string> check_paths(const TokenList& tokens) const;
    // Working directory after the segment ran (cd tracking, starts at home).
    std::string follow_cd(const TokenList& segment, const std::string& cwd) const;

    ValidatorPolicy m_policy;
    PathNormalizer m_normalizer;
    std::vector<Pattern> m_forbidden;
    std::vector<Pattern> m_injection;
    std::vector<Pattern> m_suspicious;
};

// Output redirection targets (>, >>, 1>, 2>, &>, glued or separate) of tokens.
TokenList redirection_targets(const TokenList& tokens);

} // namespace glsfs
