/*
 * Configuration - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/core/config.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <sstream>

namespace glsfs {

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static bool as_bool(const std::string& v) { return v=="1"||v=="true"||v=="on"||v=="yes"; }

template <typename T, typename Conv>
static void parse_number(const std::string& key, const std::string& val, T& out, Conv conv) {
    try { out = static_cast<T>(conv(val)); }
    catch (const std::exception&) { spdlog::warn("config: ignoring malformed value for {}: '{}'", key, val); }
}

void apply_config_text(Config& cfg, const std::string& text) {
    std::istringstream in(text); std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('='); if (eq==std::string::npos) continue;
        auto key = trim(line.substr(0,eq)); auto val = trim(line.substr(eq+1));
        auto to_i = [](const std::string& s){ return std::stoi(s); };
        auto to_l = [](const std::string& s){ return std::stol(s); };
        if (key=="log_level") cfg.log_level=val;
        else if (key=="use_sandbox") cfg.use_sandbox=as_bool(val);
        else if (key=="sandbox_required") cfg.sandbox_required=as_bool(val);
        else if (key=="sandbox_image") cfg.sandbox_image=val;
        else if (key=="container_name") cfg.container_name=val;
        else if (key=="memory_limit") cfg.memory_limit=val;
        else if (key=="cpu_quota") parse_number(key, val, cfg.cpu_quota, to_l);
        else if (key=="runtime_binary") cfg.runtime_binary=val;
        else if (key=="sandbox_home") cfg.sandbox_home=val;
        else if (key=="host_home") cfg.host_home=val;
        else if (key=="workspace_dir") cfg.workspace_dir=val;
        else if (key=="exec_timeout") parse_number(key, val, cfg.exec_timeout, to_i);
        else if (key=="ready_retries") parse_number(key, val, cfg.ready_retries, to_i);
        else if (key=="ready_interval_ms") parse_number(key, val, cfg.ready_interval_ms, to_i);
        else if (key=="local_path") cfg.local_path=val;
        else if (key=="log_file") cfg.log_file=val;
        else if (key=="log_capacity") parse_number(key, val, cfg.log_capacity, [](const std::string& s){ return std::stoul(s); });
        else if (key=="auto_execute") cfg.auto_execute=as_bool(val);
        else if (key=="llm_provider") cfg.llm_provider=val;
        else if (key=="llm_model") cfg.llm_model=val;
        else if (key=="llm_endpoint") cfg.llm_endpoint=val;
        else if (key=="llm_api_key_env") cfg.llm_api_key_env=val;
        else if (key=="llm_api_key") cfg.llm_api_key=val;
        else if (key=="llm_stub_file") cfg.llm_stub_file=val;
        else if (key=="llm_timeout") parse_number(key, val, cfg.llm_timeout, to_i);
        else if (key=="llm_max_tokens") parse_number(key, val, cfg.llm_max_tokens, to_i);
        else if (key=="llm_temperature") parse_number(key, val, cfg.llm_temperature, [](const std::string& s){ return std::stod(s); });
    }
}

std::string default_config_path() {
    std::string home = getenv_or("HOME");
    return home.empty() ? std::string(".glsfsrc") : home + "/.glsfsrc";
}

void resolve_config_paths(Config& cfg) {
    if (cfg.host_home.empty()) cfg.host_home = getenv_or("HOME", "/tmp");
    if (cfg.workspace_dir.empty()) cfg.workspace_dir = cfg.host_home + "/glsfs/data/workspace";
    if (cfg.log_file.empty()) cfg.log_file = cfg.host_home + "/glsfs/logs/operations.jsonl";
    if (cfg.workspace_dir.rfind("~/",0)==0) cfg.workspace_dir = cfg.host_home + cfg.workspace_dir.substr(1);
    if (cfg.log_file.rfind("~/",0)==0) cfg.log_file = cfg.host_home + cfg.log_file.substr(1);
}

Config load_config(const std::string& path) {
    Config cfg;
    std::ifstream in(path);
    if (in) {
        std::ostringstream oss; oss << in.rdbuf();
        apply_config_text(cfg, oss.str());
    }
    resolve_config_paths(cfg);
    return cfg;
}

} // namespace glsfs
