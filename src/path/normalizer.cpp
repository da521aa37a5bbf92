/*
 * Path Normalizer - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/path/normalizer.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace glsfs {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

// Options whose argument is a name/search pattern, not a path.
const std::unordered_set<std::string>& pattern_options() {
    static const std::unordered_set<std::string> opts = {
        "-name", "-iname", "-path", "-ipath", "-wholename", "-iwholename",
        "-regex", "-iregex", "-lname", "-ilname", "-e", "--regexp",
        "--include", "--exclude", "--exclude-dir", "-g", "--glob"
    };
    return opts;
}

// Commands whose first operand is a pattern or a script.
const std::unordered_set<std::string>& pattern_first_commands() {
    static const std::unordered_set<std::string> cmds = {
        "grep", "egrep", "fgrep", "rg", "ag", "sed", "awk", "gawk"
    };
    return cmds;
}

// Commands the generator tends to glue to their first path ("find.").
const char* const kGlueCommands[] = {"find", "ls", "du", "tree", "cd"};

bool is_assignment(const std::string& w) {
    auto eq = w.find('=');
    if (eq==std::string::npos || eq==0) return false;
    if (!(std::isalpha(static_cast<unsigned char>(w[0])) || w[0]=='_')) return false;
    for (std::size_t i=1;i<eq;++i) if (!(std::isalnum(static_cast<unsigned char>(w[i])) || w[i]=='_')) return false;
    return true;
}

std::string base_name(const std::string& cmd) {
    auto slash = cmd.find_last_of('/');
    return slash==std::string::npos ? cmd : cmd.substr(slash+1);
}

} // namespace

const std::vector<std::string>& known_folder_names() {
    static const std::vector<std::string> names = {"Desktop", "Documents", "Downloads", "workspace"};
    return names;
}

std::optional<std::string> canonical_folder_name(const std::string& name) {
    auto l = lower(name);
    for (auto &n : known_folder_names()) if (lower(n)==l) return n;
    return std::nullopt;
}

PathNormalizer::PathNormalizer(std::string sandbox_home) : m_home(std::move(sandbox_home)) {
    while (m_home.size()>1 && m_home.back()=='/') m_home.pop_back();
}

std::string PathNormalizer::expand_home(const std::string& w) const {
    static const char* forms[] = {"${HOME}", "$HOME", "~"};
    for (auto f : forms) {
        std::string form(f);
        if (w.compare(0, form.size(), form)!=0) continue;
        if (w.size()==form.size()) return m_home;
        if (w[form.size()]=='/') return m_home + w.substr(form.size());
        // ~user or $HOMEDIR: not ours
        return w;
    }
    return w;
}

std::string PathNormalizer::canonicalize_folders(const std::string& w) const {
    std::string prefix = m_home + "/";
    std::size_t start;
    bool absolute;
    if (w.compare(0, prefix.size(), prefix)==0) { start = prefix.size(); absolute = true; }
    else if (!w.empty() && w[0]!='/' && w[0]!='.' && w[0]!='~' && w[0]!='$' && w[0]!='\'' && w[0]!='"') { start = 0; absolute = false; }
    else return w;
    auto slash = w.find('/', start);
    std::string seg = w.substr(start, slash==std::string::npos ? std::string::npos : slash-start);
    auto canon = canonical_folder_name(seg);
    if (!canon) return w;
    std::string rest = slash==std::string::npos ? std::string() : w.substr(slash);
    if (absolute) return prefix + *canon + rest;
    return m_home + "/" + *canon + rest;
}

std::string PathNormalizer::rewrite_path(const std::string& word) const {
    return canonicalize_folders(expand_home(word));
}

std::optional<TokenList> PathNormalizer::split_glued_command(const std::string& w) const {
    for (auto c : kGlueCommands) {
        std::string cmd(c);
        if (w.size()<=cmd.size() || w.compare(0, cmd.size(), cmd)!=0) continue;
        std::string rest = w.substr(cmd.size());
        if (rest=="." || rest==".." || rest.rfind("./",0)==0 || rest.rfind("../",0)==0 || rest[0]=='/' || rest[0]=='~')
            return TokenList{cmd, rest};
    }
    return std::nullopt;
}

std::string PathNormalizer::normalize(const std::string& command) const {
    TokenList in = split_chain_operators(tokenize(command)), out;
    out.reserve(in.size()+1);
    bool command_pos = true;      // next word names a command
    bool skip_next = false;       // next word is an option argument pattern
    bool pattern_pending = false; // first operand of grep/sed/awk still to come
    for (auto &tok : in) {
        if (is_chain_operator(tok)) { out.push_back(tok); command_pos = true; skip_next = false; pattern_pending = false; continue; }
        if (command_pos) {
            if (is_assignment(tok)) { out.push_back(tok); continue; }
            auto glued = split_glued_command(tok);
            if (glued) {
                out.push_back((*glued)[0]);
                out.push_back(rewrite_path((*glued)[1]));
                command_pos = false;
                continue;
            }
            out.push_back(tok);
            if (tok!="sudo") {
                command_pos = false;
                pattern_pending = pattern_first_commands().count(base_name(tok))>0;
            }
            continue;
        }
        if (skip_next) { out.push_back(tok); skip_next = false; continue; }
        if (is_redirection(tok)) { out.push_back(tok); continue; }
        if (is_flag(tok)) {
            out.push_back(tok);
            if (pattern_options().count(tok)) { skip_next = true; if (tok=="-e" || tok=="--regexp") pattern_pending = false; }
            continue;
        }
        if (pattern_pending) { out.push_back(tok); pattern_pending = false; continue; }
        if (is_fully_quoted(tok)) { out.push_back(tok); continue; }
        out.push_back(rewrite_path(tok));
    }
    return join_tokens(out);
}

} // namespace glsfs
