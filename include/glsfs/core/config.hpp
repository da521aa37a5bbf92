/*
 * Configuration - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Settings read from a key=value rc file (default ~/.glsfsrc). Lines
 *   starting with '#' and blank lines are skipped, unknown keys ignored and
 *   malformed numbers keep their default.
 */
#pragma once
#include <cstddef>
#include <string>

namespace glsfs {

struct Config {
    std::string log_level = "info";
    // Sandbox / executor
    bool use_sandbox = true;            // try the container backend first
    bool sandbox_required = false;      // raise instead of falling back to local
    std::string sandbox_image = "glsfs-sandbox";
    std::string container_name = "glsfs-sandbox-exec";
    std::string memory_limit = "512m";
    long cpu_quota = 50000;
    std::string runtime_binary = "docker";
    std::string sandbox_home = "/home/user";
    std::string host_home;              // empty: $HOME
    std::string workspace_dir;          // empty: <host_home>/glsfs/data/workspace
    int exec_timeout = 30;              // seconds
    int ready_retries = 10;
    int ready_interval_ms = 500;
    std::string local_path = "/usr/bin:/bin:/usr/local/bin";
    // Operation log
    std::string log_file;               // empty: <host_home>/glsfs/logs/operations.jsonl
    std::size_t log_capacity = 1000;
    bool auto_execute = true;
    // Command generator
    std::string llm_provider = "stub";  // openai|ollama|stub
    std::string llm_model;
    std::string llm_endpoint;
    std::string llm_api_key_env;
    std::string llm_api_key;
    std::string llm_stub_file;
    int llm_timeout = 60;
    int llm_max_tokens = 256;
    double llm_temperature = 0.3;
};

// Parse rc file contents into cfg (keys not present keep their value).
void apply_config_text(Config& cfg, const std::string& text);

// Load from path; a missing file leaves defaults. Resolves empty path fields
// (host_home, workspace_dir, log_file) from $HOME afterwards.
Config load_config(const std::string& path);

// Default rc path: $HOME/.glsfsrc
std::string default_config_path();

// Fill derived defaults for empty path fields.
void resolve_config_paths(Config& cfg);

} // namespace glsfs
