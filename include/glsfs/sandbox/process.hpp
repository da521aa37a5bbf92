/*
 * Child process runner - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   fork/exec with stdout and stderr captured on two separate pipes and a
 *   wall-clock deadline. The child leads its own process group so that a
 *   timeout kills everything it spawned (bash -c pipelines included).
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace glsfs {

struct ProcessRequest {
    std::vector<std::string> argv;                 // argv[0] looked up in PATH
    std::string cwd;                               // empty: inherit
    std::optional<std::vector<std::string>> env;   // KEY=VALUE, replaces environ
    std::chrono::milliseconds timeout{0};          // 0: wait forever
};

struct ProcessResult {
    int exit_code = -1;         // 128+N when killed by signal N, 127 when exec failed
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

// Throws std::system_error when pipe() or fork() fail; everything the child
// does (including a failed exec) is reported through the result.
ProcessResult run_process(const ProcessRequest& req);

} // namespace glsfs
