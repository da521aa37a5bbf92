/*
 * Command classification table - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/safety/command_table.hpp>
#include <cctype>
#include <unordered_map>

namespace glsfs {

namespace {

using Table = std::unordered_map<std::string, CommandInfo>;

Table build_table() {
    Table t;
    const CommandInfo ro{CommandClass::ReadOnly, TargetStrategy::None, false};
    for (auto name : {"ls", "cat", "head", "tail", "less", "more", "find", "grep", "egrep", "fgrep",
                      "wc", "file", "stat", "du", "df", "tree", "pwd", "echo", "printf",
                      "sort", "uniq", "cut", "awk", "sed", "diff", "comm", "cmp",
                      "basename", "dirname", "realpath", "readlink", "md5sum", "sha256sum",
                      "strings", "od", "hexdump", "xxd", "nl", "tac", "rev", "column",
                      "date", "cal", "env", "printenv", "id", "whoami", "hostname",
                      "true", "false", "test", "[", "expr", "cd"})
        t.emplace(name, ro);
    for (auto name : {"rm", "rmdir", "shred", "truncate"})
        t.emplace(name, CommandInfo{CommandClass::Write, TargetStrategy::AllOperands, true});
    for (auto name : {"touch", "mkdir", "tee"})
        t.emplace(name, CommandInfo{CommandClass::Write, TargetStrategy::AllOperands, false});
    for (auto name : {"mv", "cp", "ln"})
        t.emplace(name, CommandInfo{CommandClass::Write, TargetStrategy::LastOperand, false});
    for (auto name : {"chmod", "chown", "chgrp"})
        t.emplace(name, CommandInfo{CommandClass::Write, TargetStrategy::OperandsAfterFirst, false});
    return t;
}

bool is_assignment(const std::string& w) {
    auto eq = w.find('=');
    if (eq==std::string::npos || eq==0) return false;
    for (std::size_t i=0;i<eq;++i) {
        unsigned char c = static_cast<unsigned char>(w[i]);
        if (!(std::isalnum(c) || c=='_') || (i==0 && std::isdigit(c))) return false;
    }
    return true;
}

// Index of the command word inside the first segment, or tokens.size().
std::size_t command_index(const TokenList& tokens) {
    std::size_t i = 0;
    while (i<tokens.size() && is_assignment(tokens[i])) ++i;
    if (i<tokens.size() && tokens[i]=="sudo") {
        ++i;
        while (i<tokens.size() && is_flag(tokens[i])) ++i;
    }
    if (i<tokens.size() && is_chain_operator(tokens[i])) return tokens.size();
    return i;
}

bool find_action(const std::string& w) {
    return w=="-delete" || w=="-exec" || w=="-execdir" || w=="-ok" || w=="-okdir";
}

bool sed_in_place(const std::string& w) {
    if (w.rfind("--in-place", 0)==0) return true;
    return w.size()>1 && w[0]=='-' && w[1]!='-' && w.find('i', 1)!=std::string::npos;
}

bool recursive_flag(const std::string& w) {
    if (w=="--recursive") return true;
    return w.size()>1 && w[0]=='-' && w[1]!='-' && w.find_first_of("rR", 1)!=std::string::npos;
}

// find's expression starts at the first option, '(' or '!'
bool find_expression(const std::string& w) {
    auto u = unquote(w);
    return u.empty() || u[0]=='-' || u[0]=='(' || u[0]=='!' || u[0]==')';
}

} // namespace

const CommandInfo& lookup_command(const std::string& name) {
    static const Table table = build_table();
    static const CommandInfo unknown{};
    auto it = table.find(name);
    return it==table.end() ? unknown : it->second;
}

std::string base_command(const TokenList& words) {
    auto tokens = split_chain_operators(words);
    auto i = command_index(tokens);
    if (i>=tokens.size()) return "";
    std::string cmd = unquote(tokens[i]);
    auto slash = cmd.find_last_of('/');
    if (slash!=std::string::npos) cmd = cmd.substr(slash+1);
    return cmd;
}

TokenList command_words(const TokenList& words) {
    TokenList out;
    auto tokens = split_chain_operators(words);
    auto i = command_index(tokens);
    if (i>=tokens.size()) return out;
    bool redirect_target = false;
    for (++i; i<tokens.size(); ++i) {
        auto &t = tokens[i];
        if (is_chain_operator(t)) break;
        if (redirect_target) { redirect_target = false; continue; }
        if (is_redirection(t)) {
            redirect_target = redirection_prefix_length(t)==t.size() && t.find(">&")==std::string::npos;
            continue;
        }
        out.push_back(t);
    }
    return out;
}

TokenList command_operands(const TokenList& words) {
    TokenList ops;
    for (auto &t : command_words(words)) if (!is_flag(t)) ops.push_back(t);
    return ops;
}

TokenList extract_targets(const TokenList& operands, TargetStrategy strategy) {
    switch (strategy) {
        case TargetStrategy::LeadingOperands: {
            TokenList starts;
            for (auto &w : operands) { if (find_expression(w)) break; starts.push_back(w); }
            if (starts.empty()) starts.push_back(".");
            return starts;
        }
        case TargetStrategy::AllOperands: return operands;
        case TargetStrategy::LastOperand:
            if (operands.empty()) return {};
            return {operands.back()};
        case TargetStrategy::OperandsAfterFirst:
            if (operands.size()<2) return {};
            return TokenList(operands.begin()+1, operands.end());
        case TargetStrategy::None: break;
    }
    return {};
}

CommandInfo classify_segment(const TokenList& segment) {
    auto name = base_command(segment);
    CommandInfo info = lookup_command(name);
    auto words = command_words(segment);
    if (name=="find") {
        for (auto &w : words) {
            auto u = unquote(w);
            if (!find_action(u)) continue;
            info.cls = CommandClass::Write;
            info.targets = TargetStrategy::LeadingOperands;
            info.recursive = true;
            if (u=="-delete") info.destructive = true;
        }
    } else if (name=="sed") {
        for (auto &w : words) {
            if (!sed_in_place(unquote(w))) continue;
            info.cls = CommandClass::Write;
            info.targets = TargetStrategy::OperandsAfterFirst;
        }
    } else if (name=="rm" || name=="chmod" || name=="chown" || name=="chgrp") {
        for (auto &w : words) if (recursive_flag(unquote(w))) info.recursive = true;
    }
    return info;
}

TokenList segment_targets(const TokenList& segment) {
    auto info = classify_segment(segment);
    if (info.cls!=CommandClass::Write) return {};
    if (info.targets==TargetStrategy::LeadingOperands) return extract_targets(command_words(segment), info.targets);
    return extract_targets(command_operands(segment), info.targets);
}

const char* to_string(CommandClass c) {
    switch (c) {
        case CommandClass::ReadOnly: return "read-only";
        case CommandClass::Write: return "write";
        case CommandClass::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace glsfs
