/*
 * Sandbox Executor - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/sandbox/executor.hpp>
#include <glsfs/core/errors.hpp>
#include <glsfs/safety/command_table.hpp>
#include <glsfs/safety/validator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <system_error>

namespace glsfs {

namespace {

ExecutionResult make_result(const std::string& command, ExecutionMethod method) {
    ExecutionResult r;
    r.command = command;
    r.method = method;
    r.timestamp = std::chrono::system_clock::now();
    return r;
}

void fill_from(ExecutionResult& r, ProcessResult&& p, std::chrono::seconds timeout) {
    r.stdout_text = std::move(p.stdout_text);
    if (p.timed_out) {
        r.status = ExecutionStatus::Error;
        r.exit_code = -1;
        r.stderr_text = "Command timed out after " + std::to_string(timeout.count()) + " seconds";
        return;
    }
    r.exit_code = p.exit_code;
    r.stderr_text = std::move(p.stderr_text);
    r.status = p.exit_code==0 ? ExecutionStatus::Success : ExecutionStatus::Error;
}

bool may_write(const TokenList& segment) {
    if (classify_segment(segment).cls!=CommandClass::ReadOnly) return true;
    for (auto &t : redirection_targets(segment))
        if (unquote(t).rfind("/dev/", 0)!=0) return true;
    return false;
}

bool has_parent_step(const TokenList& tokens) {
    for (auto &tok : split_chain_operators(tokens)) {
        auto w = unquote(tok);
        std::size_t pos = 0;
        while (pos<=w.size()) {
            auto next = w.find('/', pos);
            if (w.compare(pos, (next==std::string::npos ? w.size() : next)-pos, "..")==0) return true;
            if (next==std::string::npos) break;
            pos = next+1;
        }
    }
    return false;
}

// Locally the read-only folders are the user's real ones: a command that may
// write must not name them, directly or through "..".
std::optional<std::string> readonly_conflict(const MountTable& mounts, const std::string& command) {
    auto tokens = tokenize(command);
    auto segs = split_segments(tokens);
    if (std::none_of(segs.begin(), segs.end(), may_write)) return std::nullopt;
    if (auto m = mounts.readonly_reference(command)) return "read-only folder " + m->sandbox_path;
    if (has_parent_step(tokens)) return std::string("a read-only folder through '..'");
    return std::nullopt;
}

} // namespace

const char* to_string(ExecutionStatus s) { return s==ExecutionStatus::Success ? "success" : "error"; }
const char* to_string(ExecutionMethod m) { return m==ExecutionMethod::Sandboxed ? "sandboxed" : "local"; }

const char* to_string(ExecutorState s) {
    switch (s) {
        case ExecutorState::Uninitialized: return "uninitialized";
        case ExecutorState::MountsProbed: return "mounts-probed";
        case ExecutorState::SandboxReady: return "sandbox-ready";
        case ExecutorState::SandboxUnavailable: return "sandbox-unavailable";
        case ExecutorState::LocalFallbackReady: return "local-fallback-ready";
    }
    return "uninitialized";
}

std::string shell_quote(const std::string& word) {
    std::string out = "'";
    for (char c : word) {
        if (c=='\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

SandboxExecutor::SandboxExecutor(Config cfg, ContainerRuntime& runtime)
    : m_cfg(std::move(cfg)), m_runtime(runtime), m_normalizer(m_cfg.sandbox_home) {
    resolve_config_paths(m_cfg);
}

SandboxExecutor::~SandboxExecutor() { cleanup(); }

void SandboxExecutor::initialize() {
    std::call_once(m_init_once, [this]{ do_initialize(); });
}

void SandboxExecutor::do_initialize() {
    m_mounts = MountTable::probe(m_normalizer.sandbox_home(), m_cfg.host_home, m_cfg.workspace_dir);
    m_state = ExecutorState::MountsProbed;

    if (m_cfg.use_sandbox) {
        try {
            bring_up_sandbox();
            m_state = ExecutorState::SandboxReady;
            spdlog::info("executor: sandbox ready ({})", m_cfg.container_name);
            return;
        } catch (const std::exception& e) {
            m_sandbox.reset();
            m_state = ExecutorState::SandboxUnavailable;
            if (m_cfg.sandbox_required)
                throw InitializationError(std::string("sandbox required but unavailable: ") + e.what());
            spdlog::warn("executor: sandbox unavailable: {}", e.what());
        }
    }
    m_state = ExecutorState::LocalFallbackReady;
    spdlog::info("executor: local execution in {}", m_mounts.workspace_host());
}

void SandboxExecutor::bring_up_sandbox() {
    ContainerSpec spec;
    spec.name = m_cfg.container_name;
    spec.image = m_cfg.sandbox_image;
    spec.mounts = m_mounts.mounts();
    spec.memory_limit = m_cfg.memory_limit;
    spec.cpu_quota = m_cfg.cpu_quota;
    spec.workdir = m_normalizer.sandbox_home();
    // /workspace alias is a second bind of the workspace
    if (auto alias = m_mounts.find("/workspace")) spec.mounts.push_back(*alias);
    m_sandbox = std::make_unique<SandboxHandle>(m_runtime, std::move(spec), m_cfg.ready_retries,
                                                std::chrono::milliseconds(m_cfg.ready_interval_ms));
    m_sandbox->open();
    smoke_test();
}

void SandboxExecutor::smoke_test() {
    for (auto &m : m_mounts.mounts()) {
        auto r = m_sandbox->exec("ls " + shell_quote(m.sandbox_path) + " >/dev/null", std::chrono::seconds(10));
        if (!r.timed_out && r.exit_code==0) {
            spdlog::debug("executor: mount {} ok", m.sandbox_path);
            continue;
        }
        spdlog::warn("executor: cannot list {} inside sandbox: {}", m.sandbox_path,
                     r.timed_out ? "timed out" : r.stderr_text);
        m_mounts.set_available(m.sandbox_path, false);
    }
}

ExecutionResult SandboxExecutor::execute(const std::string& command, std::optional<std::chrono::seconds> timeout) {
    auto t = timeout.value_or(std::chrono::seconds(m_cfg.exec_timeout));
    std::string cmd = m_normalizer.normalize(command);
    try {
        initialize();
    } catch (const Error& e) {
        spdlog::error("executor: initialization failed: {}", e.what());
        auto r = make_result(cmd, ExecutionMethod::Local);
        r.stderr_text = std::string("Executor initialization failed: ") + e.what();
        return r;
    }
    spdlog::debug("executor: [{}] {}", sandboxed() ? "sandboxed" : "local", cmd);
    if (sandboxed()) {
        try {
            m_sandbox->ensure_running();
        } catch (const std::exception& e) {
            spdlog::warn("executor: sandbox not running ({}), using local execution", e.what());
            return run_local(cmd, t);
        }
        return run_sandboxed(cmd, t);
    }
    return run_local(cmd, t);
}

ExecutionResult SandboxExecutor::run_sandboxed(const std::string& command, std::chrono::seconds timeout) {
    auto r = make_result(command, ExecutionMethod::Sandboxed);
    try {
        fill_from(r, m_sandbox->exec(command, timeout), timeout);
    } catch (const std::exception& e) {
        spdlog::error("executor: sandbox exec failed: {}", e.what());
        r.status = ExecutionStatus::Error;
        r.exit_code = -1;
        r.stderr_text = std::string("Sandbox execution error: ") + e.what();
    }
    return r;
}

ExecutionResult SandboxExecutor::run_local(const std::string& command, std::chrono::seconds timeout) {
    auto r = make_result(command, ExecutionMethod::Local);
    if (auto conflict = readonly_conflict(m_mounts, command)) {
        spdlog::warn("executor: refusing '{}' in local mode: may modify {}", command, *conflict);
        r.status = ExecutionStatus::Error;
        r.exit_code = -1;
        r.stderr_text = "Refused: command may modify " + *conflict + " in local mode";
        return r;
    }
    ProcessRequest req;
    req.argv = {"/bin/sh", "-c", m_mounts.to_host(command)};
    req.cwd = m_mounts.workspace_host();
    req.env = std::vector<std::string>{
        "PATH=" + m_cfg.local_path,
        "HOME=" + m_mounts.workspace_host(),
        "USER=safeuser",
        "LANG=C.UTF-8",
    };
    req.timeout = timeout;
    try {
        fill_from(r, run_process(req), timeout);
    } catch (const std::system_error& e) {
        spdlog::error("executor: local exec failed: {}", e.what());
        r.status = ExecutionStatus::Error;
        r.exit_code = -1;
        r.stderr_text = std::string("Local execution error: ") + e.what();
    }
    return r;
}

std::vector<FolderListing> SandboxExecutor::get_workspace_contents() {
    std::vector<FolderListing> out;
    try {
        initialize();
    } catch (const Error& e) {
        spdlog::error("executor: initialization failed: {}", e.what());
        return out;
    }
    for (auto &m : m_mounts.mounts()) {
        if (!m.available) continue;
        if (sandboxed()) {
            out.push_back({m, execute("ls -la " + shell_quote(m.sandbox_path))});
            continue;
        }
        auto r = make_result("ls -la " + m.sandbox_path, ExecutionMethod::Local);
        std::chrono::seconds t(m_cfg.exec_timeout);
        ProcessRequest req;
        req.argv = {"ls", "-la", m.host_path};
        req.env = std::vector<std::string>{"PATH=" + m_cfg.local_path, "LANG=C.UTF-8"};
        req.timeout = t;
        try {
            fill_from(r, run_process(req), t);
        } catch (const std::system_error& e) {
            r.stderr_text = std::string("Local execution error: ") + e.what();
        }
        out.push_back({m, std::move(r)});
    }
    return out;
}

void SandboxExecutor::cleanup() noexcept {
    if (!m_sandbox) return;
    m_sandbox->close();
    m_sandbox.reset();
    if (m_state==ExecutorState::SandboxReady) m_state = ExecutorState::LocalFallbackReady;
}

} // namespace glsfs
