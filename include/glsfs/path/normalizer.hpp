/*
 * Path Normalizer - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Rewrites path references in a generated command into the canonical
 *   sandbox layout: ~, $HOME and ${HOME} become the sandbox home, known folder
 *   names (desktop, documents, downloads, workspace) get their canonical case
 *   and an absolute sandbox prefix, and glued artifacts such as "find." are
 *   split. Flags, operators, redirections, fully quoted words and pattern
 *   operands (find -name X, grep X) are never rewritten.
 *
 *   normalize(normalize(c)) == normalize(c) for every command c.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <glsfs/lex/tokenizer.hpp>

namespace glsfs {

inline constexpr const char* kDefaultSandboxHome = "/home/user";

// Canonical spelling for a known sandbox folder name matched case-insensitively.
std::optional<std::string> canonical_folder_name(const std::string& name);

// The folder names as they appear under the sandbox home.
const std::vector<std::string>& known_folder_names();

class PathNormalizer {
public:
    explicit PathNormalizer(std::string sandbox_home = kDefaultSandboxHome);

    std::string normalize(const std::string& command) const;

    // Single-word rewrite (home expansion + folder canonicalization).
    std::string rewrite_path(const std::string& word) const;

    const std::string& sandbox_home() const { return m_home; }
private:
    std::string expand_home(const std::string& word) const;
    std::string canonicalize_folders(const std::string& word) const;
    std::optional<TokenList> split_glued_command(const std::string& word) const;

    std::string m_home;
};

} // namespace glsfs
