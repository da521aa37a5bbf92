/*
 * Safety Validator - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/safety/validator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace glsfs {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b==std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e-b+1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{}/)";
    std::string out;
    for (char c : s) { if (special.find(c)!=std::string::npos) out.push_back('\\'); out.push_back(c); }
    return out;
}

// root itself or anything below it (boundary at a path separator)
bool under(const std::string& path, const std::string& root) {
    if (root=="/") return !path.empty() && path[0]=='/';
    if (path.size()<root.size() || path.compare(0, root.size(), root)!=0) return false;
    return path.size()==root.size() || path[root.size()]=='/';
}

const char* const kDangerousDirs[] = {"/etc", "/root", "/sys", "/proc", "/boot"};
const char* const kBlockDevices[] = {"/dev/sd", "/dev/hd", "/dev/vd", "/dev/xvd", "/dev/nvme", "/dev/mmcblk"};
const char* const kHarmlessSinks[] = {"/dev/null", "/dev/stdout", "/dev/stderr"};

const auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

} // namespace

const char* to_string(Verdict v) {
    switch (v) {
        case Verdict::Forbidden: return "forbidden";
        case Verdict::BlockedByBoundary: return "blocked-by-boundary";
        case Verdict::BlockedByInjection: return "blocked-by-injection";
        case Verdict::Safe: return "safe";
        case Verdict::SafeWithWarnings: return "safe-with-warnings";
    }
    return "forbidden";
}

TokenList redirection_targets(const TokenList& tokens) {
    TokenList out;
    auto words = split_chain_operators(tokens);
    for (std::size_t i=0;i<words.size();++i) {
        auto &t = words[i];
        auto len = redirection_prefix_length(t);
        if (len==0) continue;
        std::string op = t.substr(0, len);
        if (op.find('<')!=std::string::npos) { if (len==t.size()) ++i; continue; }
        if (op.find(">&")!=std::string::npos) continue;
        std::string target = len==t.size() ? (i+1<words.size() ? words[++i] : std::string()) : t.substr(len);
        if (target.empty() || target[0]=='&') continue; // >&2 style duplication
        out.push_back(target);
    }
    return out;
}

SafetyValidator::SafetyValidator(ValidatorPolicy policy)
    : m_policy(std::move(policy)), m_normalizer(m_policy.sandbox_home) {
    const std::string home = m_normalizer.sandbox_home();
    if (m_policy.safe_roots.empty()) {
        m_policy.safe_roots.push_back(home);
        for (auto &f : known_folder_names()) m_policy.safe_roots.push_back(home + "/" + f);
        m_policy.safe_roots.push_back("/workspace");
        m_policy.safe_roots.push_back("/tmp");
    }
    if (m_policy.readonly_mounts.empty())
        for (auto f : {"Desktop", "Documents", "Downloads"}) m_policy.readonly_mounts.push_back(home + "/" + f);

    const std::string home_re = regex_escape(home);
    auto add = [](std::vector<Pattern>& v, const std::string& re, const char* what) {
        v.push_back(Pattern{std::regex(re, kFlags), what});
    };
    // Checked on the raw command, before any rewriting.
    add(m_forbidden, R"((^|[\s;&|])(sudo\s+)?rm\s+(-\S+\s+)*["']?(/|~|\$\{?HOME\}?|/home|)" + home_re + R"()/?\*?["']?(\s|[;&|]|$))",
        "deletion of root or home directory");
    add(m_forbidden, R"((^|[\s;&|])(sudo\s+)?rm\s+(-\S+\s+)*/(etc|usr|var|bin|sbin|lib|lib64|boot|opt|srv)(/\S*)?(\s|[;&|]|$))",
        "deletion of system directories");
    add(m_forbidden, R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)", "fork bomb");
    add(m_forbidden, R"(([A-Za-z_]\w*)\s*\(\s*\)\s*\{[^}]*\1\s*\|\s*\1\s*&)", "fork bomb");
    add(m_forbidden, R"(\bdd\s+.*\bof=/dev/(sd|hd|vd|xvd|nvme|mmcblk|disk))", "raw block device write");
    add(m_forbidden, R"(>\s*/dev/(sd|hd|vd|xvd|nvme|mmcblk))", "raw block device write");
    add(m_forbidden, R"(/dev/sd[a-z])", "direct disk access");
    add(m_forbidden, R"(\b(mkfs(\.\w+)?|mke2fs|mkswap|wipefs)\b)", "filesystem formatting");
    add(m_forbidden, R"(\b(chmod|chown|chgrp)\s+(.*\s)?(-[a-z]*r[a-z]*|--recursive)\s+(.*\s)?["']?/\*?["']?(\s|[;&|]|$))",
        "recursive permission change on root");
    add(m_forbidden, R"(\b(curl|wget)\b.*\|\s*(sudo\s+)?(\S*/)?(sh|bash|zsh|dash|ksh|python\d?|perl)\b)",
        "download and execute");
    add(m_forbidden, R"(>\s*["']?/etc/)", "write to /etc");
    add(m_forbidden, R"(\btee\s+(-\S+\s+)*["']?/etc/)", "write to /etc");

    add(m_injection, R"([;\n]\s*(sudo\s+)?(rm\s+-|shred\s|dd\s))", "chained destructive command");
    add(m_injection, R"(\$\([^)]*\b(rm|shred|dd|mkfs)\b[^)]*\))", "command substitution with destructive command");
    add(m_injection, R"(`[^`]*\b(rm|shred|dd|mkfs)\b[^`]*`)", "backticks with destructive command");
    add(m_injection, R"(\|\s*(sudo\s+)?(\S*/)?(sh|bash|zsh|dash|ksh|fish)(\s|$))", "piping to shell");
    add(m_injection, R"((^|[\s;&|])eval\s)", "use of eval");
    add(m_injection, R"(2>&1.*\|\s*(nc|ncat|netcat)\b)", "output piped to netcat");
    add(m_injection, R"(\b(nc|ncat|netcat)\b.*\s-[a-z]*[ec]\b)", "netcat with command execution");
    add(m_injection, R"(/dev/(tcp|udp)/)", "network redirection");
    add(m_injection, R"((>\s*/dev/null\s*2>&1|&>\s*/dev/null)\s*&(\s|$))", "redirect and background");

    add(m_suspicious, R"(\$\([^)]*\))", "command substitution");
    add(m_suspicious, R"(`[^`]*`)", "backtick substitution");
}

std::string SafetyValidator::resolve(const std::string& word, const std::string& base) const {
    std::string w = m_normalizer.rewrite_path(unquote(word));
    if (w.empty() || w[0]!='/') {
        std::string dir = base.empty() ? m_normalizer.sandbox_home() : base;
        if (dir.back()!='/') dir.push_back('/');
        w = dir + w;
    }
    std::string out = fs::path(w).lexically_normal().generic_string();
    while (out.size()>1 && out.back()=='/') out.pop_back();
    return out;
}

bool SafetyValidator::is_readonly_path(const std::string& resolved) const {
    // case-insensitive: "desktop/x" must not slip past "Desktop"
    auto l = lower(resolved);
    for (auto &m : m_policy.readonly_mounts) if (under(l, lower(m))) return true;
    return false;
}

bool SafetyValidator::is_inside_safe_roots(const std::string& resolved) const {
    for (auto &r : m_policy.safe_roots) if (under(resolved, r)) return true;
    return false;
}

std::optional<std::string> SafetyValidator::check_forbidden(const std::string& raw) const {
    for (auto &p : m_forbidden)
        if (std::regex_search(raw, p.re)) return "FORBIDDEN: Dangerous operation detected (" + p.description + ")";
    return std::nullopt;
}

std::string SafetyValidator::follow_cd(const TokenList& segment, const std::string& cwd) const {
    if (base_command(segment)!="cd") return cwd;
    auto ops = command_operands(segment);
    if (ops.empty()) return m_normalizer.sandbox_home();
    if (unquote(ops.front())=="-") return cwd;
    return resolve(ops.front(), cwd);
}

std::optional<std::string> SafetyValidator::check_targets(const TokenList& tokens, ValidationResult& res) const {
    std::vector<std::string> destructive;
    std::string cwd = m_normalizer.sandbox_home();
    for (auto &seg : split_segments(tokens)) {
        auto info = classify_segment(seg);
        TokenList targets = segment_targets(seg);
        if (info.cls==CommandClass::Write && info.destructive) destructive.push_back(base_command(seg));
        for (auto &t : redirection_targets(seg)) {
            auto plain = unquote(t);
            if (std::find(std::begin(kHarmlessSinks), std::end(kHarmlessSinks), plain)!=std::end(kHarmlessSinks)) continue;
            targets.push_back(t);
        }
        for (auto &t : targets) {
            auto r = resolve(t, cwd);
            if (is_readonly_path(r)) return "BLOCKED: Cannot write to read-only path: " + r;
            if (!is_inside_safe_roots(r)) return "BLOCKED: Path outside sandbox: " + r;
            if (!info.recursive) continue;
            // rm -r ~ style: a read-only folder below the target
            for (auto &m : m_policy.readonly_mounts)
                if (under(lower(m), lower(r))) return "BLOCKED: Cannot write to read-only path: " + m;
        }
        cwd = follow_cd(seg, cwd);
    }
    for (auto &d : destructive)
        res.warnings.push_back("Destructive command '" + d + "' will permanently remove or modify data");
    return std::nullopt;
}

std::optional<std::string> SafetyValidator::check_injection(const std::string& cmd, ValidationResult& res) const {
    for (auto &p : m_injection)
        if (std::regex_search(cmd, p.re)) return "Security risk: Command injection detected (" + p.description + ")";
    for (auto &p : m_suspicious)
        if (std::regex_search(cmd, p.re)) res.warnings.push_back("Suspicious pattern: " + p.description);
    return std::nullopt;
}

std::optional<std::string> SafetyValidator::check_paths(const TokenList& tokens) const {
    int traversal = 0;
    std::string cwd = m_normalizer.sandbox_home();
    for (auto &seg : split_segments(tokens)) {
        for (auto &tok : seg) {
            std::string word = tok;
            auto rlen = redirection_prefix_length(word);
            if (rlen>0) word = word.substr(rlen);
            std::vector<std::string> candidates;
            if (!is_flag(word)) candidates.push_back(unquote(word));
            auto eq = word.find('=');
            if (eq!=std::string::npos) candidates.push_back(unquote(word.substr(eq+1)));
            for (auto &c : candidates) {
                if (c.empty()) continue;
                std::size_t pos = 0;
                while (pos<=c.size()) {
                    auto next = c.find('/', pos);
                    if (c.compare(pos, (next==std::string::npos ? c.size() : next)-pos, "..")==0) ++traversal;
                    if (next==std::string::npos) break;
                    pos = next+1;
                }
                for (auto d : kBlockDevices)
                    if (c.rfind(d, 0)==0) return std::string("Access to raw block device ") + c + " is forbidden";
                auto r = resolve(c, cwd);
                for (auto d : kDangerousDirs)
                    if (under(r, d)) return std::string("Access to ") + d + " is forbidden";
            }
        }
        cwd = follow_cd(seg, cwd);
    }
    if (traversal>m_policy.max_traversal)
        return "Excessive directory traversal detected (" + std::to_string(traversal) + " '..' segments)";
    return std::nullopt;
}

ValidationResult SafetyValidator::validate(const std::string& command) const {
    ValidationResult res;
    auto reject = [&](Verdict v, std::string reason) {
        spdlog::debug("validator: {} ({})", to_string(v), reason);
        res.is_safe = false;
        res.verdict = v;
        res.sanitized_command.reset();
        res.warnings.push_back(reason);
        res.reason = std::move(reason);
        return res;
    };
    std::string raw = trim(command);
    if (raw.empty()) return reject(Verdict::Forbidden, "empty command");
    if (auto r = check_forbidden(raw)) return reject(Verdict::Forbidden, *r);

    std::string normalized = m_normalizer.normalize(raw);
    if (normalized!=raw) spdlog::debug("validator: normalized '{}' -> '{}'", raw, normalized);
    TokenList tokens = tokenize(normalized);
    res.base_command = base_command(tokens);
    res.command_class = classify_segment(tokens).cls;

    if (auto r = check_targets(tokens, res)) return reject(Verdict::BlockedByBoundary, *r);
    if (auto r = check_injection(normalized, res)) return reject(Verdict::BlockedByInjection, *r);
    if (auto r = check_paths(tokens)) return reject(Verdict::BlockedByBoundary, *r);

    res.is_safe = true;
    res.verdict = res.warnings.empty() ? Verdict::Safe : Verdict::SafeWithWarnings;
    res.sanitized_command = normalized;
    return res;
}

} // namespace glsfs
