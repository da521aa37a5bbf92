/*
 * Sandbox Executor - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Runs validated commands, inside the sandbox container when it can be
 *   brought up and directly on the host (restricted environment, workspace
 *   as cwd, sandbox paths translated back to host paths) otherwise.
 *
 *   Uninitialized -> MountsProbed -> SandboxReady
 *                                 -> SandboxUnavailable -> LocalFallbackReady
 *
 *   initialize() runs once (std::call_once); a failed attempt may be
 *   retried. execute() never throws: faults come back as Error results.
 *   One command in flight per instance; callers serialize.
 */
#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <glsfs/core/config.hpp>
#include <glsfs/path/normalizer.hpp>
#include <glsfs/sandbox/mounts.hpp>
#include <glsfs/sandbox/runtime.hpp>
#include <glsfs/sandbox/sandbox_handle.hpp>

namespace glsfs {

enum class ExecutionStatus { Success, Error };
enum class ExecutionMethod { Sandboxed, Local };
enum class ExecutorState { Uninitialized, MountsProbed, SandboxReady, SandboxUnavailable, LocalFallbackReady };

const char* to_string(ExecutionStatus s);
const char* to_string(ExecutionMethod m);
const char* to_string(ExecutorState s);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Error;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::string command;
    std::chrono::system_clock::time_point timestamp;
    ExecutionMethod method = ExecutionMethod::Local;

    bool ok() const { return status==ExecutionStatus::Success; }
};

struct FolderListing {
    FolderMapping mount;
    ExecutionResult result;
};

class SandboxExecutor {
public:
    SandboxExecutor(Config cfg, ContainerRuntime& runtime);
    ~SandboxExecutor();
    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    // Probe mounts and bring up the sandbox. Throws InitializationError when
    // the workspace cannot be created, or when sandbox_required is set and
    // the sandbox cannot be started.
    void initialize();

    ExecutionResult execute(const std::string& command, std::optional<std::chrono::seconds> timeout = std::nullopt);

    std::vector<FolderListing> get_workspace_contents();

    void cleanup() noexcept;

    ExecutorState state() const { return m_state; }
    bool sandboxed() const { return m_state==ExecutorState::SandboxReady; }
    const MountTable& mounts() const { return m_mounts; }
private:
    void do_initialize();
    void bring_up_sandbox();
    void smoke_test();
    ExecutionResult run_sandboxed(const std::string& command, std::chrono::seconds timeout);
    ExecutionResult run_local(const std::string& command, std::chrono::seconds timeout);

    Config m_cfg;
    ContainerRuntime& m_runtime;
    PathNormalizer m_normalizer;
    MountTable m_mounts;
    std::unique_ptr<SandboxHandle> m_sandbox;
    ExecutorState m_state = ExecutorState::Uninitialized;
    std::once_flag m_init_once;
};

// Single-quote a word for /bin/sh.
std::string shell_quote(const std::string& word);

} // namespace glsfs
