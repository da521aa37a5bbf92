/*
 * Sandbox handle - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/sandbox/sandbox_handle.hpp>
#include <glsfs/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace glsfs {

SandboxHandle::SandboxHandle(ContainerRuntime& runtime, ContainerSpec spec,
                             int ready_retries, std::chrono::milliseconds ready_interval)
    : m_runtime(runtime), m_spec(std::move(spec)),
      m_ready_retries(ready_retries>0 ? ready_retries : 1), m_ready_interval(ready_interval) {}

SandboxHandle::~SandboxHandle() { close(); }

void SandboxHandle::open() {
    if (m_open) return;
    if (!m_runtime.ping()) throw InitializationError("container runtime is not reachable");
    if (!m_runtime.image_exists(m_spec.image))
        throw InitializationError("sandbox image '" + m_spec.image + "' not found (docker build -t " + m_spec.image + " sandbox/)");
    if (m_runtime.state(m_spec.name)!=ContainerState::Absent) {
        spdlog::info("sandbox: removing stale container {}", m_spec.name);
        m_runtime.remove(m_spec.name);
    }
    spdlog::info("sandbox: creating container {} from {}", m_spec.name, m_spec.image);
    m_runtime.run(m_spec);
    m_open = true;
    wait_running();
}

void SandboxHandle::wait_running() {
    for (int i=0;i<m_ready_retries;++i) {
        if (m_runtime.state(m_spec.name)==ContainerState::Running) return;
        std::this_thread::sleep_for(m_ready_interval);
    }
    throw RuntimeError("container " + m_spec.name + " did not reach running state");
}

void SandboxHandle::ensure_running() {
    if (!m_open) throw RuntimeError("sandbox is not open");
    switch (m_runtime.state(m_spec.name)) {
        case ContainerState::Running: return;
        case ContainerState::Stopped:
            spdlog::warn("sandbox: container {} stopped, restarting", m_spec.name);
            m_runtime.start(m_spec.name);
            break;
        case ContainerState::Absent:
            spdlog::warn("sandbox: container {} vanished, recreating", m_spec.name);
            m_runtime.run(m_spec);
            break;
    }
    wait_running();
}

ProcessResult SandboxHandle::exec(const std::string& command, std::chrono::seconds timeout) {
    if (!m_open) throw RuntimeError("sandbox is not open");
    return m_runtime.exec(m_spec.name, m_spec.workdir, command, timeout);
}

void SandboxHandle::close() noexcept {
    if (!m_open) return;
    m_open = false;
    try {
        m_runtime.stop(m_spec.name);
    } catch (const std::exception& e) {
        spdlog::warn("sandbox: stop {} failed: {}", m_spec.name, e.what());
    }
    try {
        m_runtime.remove(m_spec.name);
        spdlog::info("sandbox: container {} removed", m_spec.name);
    } catch (const std::exception& e) {
        spdlog::warn("sandbox: remove {} failed: {}", m_spec.name, e.what());
    }
}

} // namespace glsfs
