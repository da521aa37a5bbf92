/*
 * Sandbox handle - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Owns one named container for its open()..close() lifetime. open() removes
 * any stale container with the same name so mounts always match the current
 * mount table.
 */
#pragma once
#include <chrono>
#include <string>
#include <glsfs/sandbox/runtime.hpp>

namespace glsfs {

class SandboxHandle {
public:
    SandboxHandle(ContainerRuntime& runtime, ContainerSpec spec,
                  int ready_retries = 10, std::chrono::milliseconds ready_interval = std::chrono::milliseconds(500));
    ~SandboxHandle();
    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    // Throws InitializationError (runtime unreachable, image missing) or
    // RuntimeError (create/start failed, never reached running state).
    void open();
    // Restart a stopped container, recreate a vanished one.
    void ensure_running();
    ProcessResult exec(const std::string& command, std::chrono::seconds timeout);
    // Stop and remove; failures are logged.
    void close() noexcept;

    bool is_open() const { return m_open; }
    const std::string& name() const { return m_spec.name; }
    const ContainerSpec& spec() const { return m_spec; }
private:
    void wait_running();

    ContainerRuntime& m_runtime;
    ContainerSpec m_spec;
    int m_ready_retries;
    std::chrono::milliseconds m_ready_interval;
    bool m_open = false;
};

} // namespace glsfs
