/*
 * Docker CLI runtime - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/sandbox/runtime.hpp>
#include <glsfs/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace glsfs {

namespace {

std::string first_line(const std::string& s) {
    auto e = s.find_first_of("\r\n");
    return e==std::string::npos ? s : s.substr(0, e);
}

} // namespace

ProcessResult DockerCliRuntime::call(std::vector<std::string> args, std::chrono::seconds timeout) {
    args.insert(args.begin(), m_bin);
    ProcessRequest req;
    req.argv = std::move(args);
    req.timeout = timeout;
    return run_process(req);
}

void DockerCliRuntime::check(const ProcessResult& r, const std::string& what) {
    if (r.timed_out) throw RuntimeError(m_bin + " " + what + ": timed out");
    if (r.exit_code!=0)
        throw RuntimeError(m_bin + " " + what + " failed (exit " + std::to_string(r.exit_code) + "): " + first_line(r.stderr_text));
}

bool DockerCliRuntime::ping() {
    auto r = call({"info", "--format", "{{.ServerVersion}}"}, std::chrono::seconds(10));
    if (r.exit_code!=0) spdlog::debug("docker: daemon unreachable: {}", first_line(r.stderr_text));
    return !r.timed_out && r.exit_code==0;
}

bool DockerCliRuntime::image_exists(const std::string& image) {
    auto r = call({"image", "inspect", "--format", "{{.Id}}", image});
    return !r.timed_out && r.exit_code==0;
}

ContainerState DockerCliRuntime::state(const std::string& name) {
    auto r = call({"inspect", "--format", "{{.State.Running}}", name});
    if (r.timed_out) throw RuntimeError(m_bin + " inspect: timed out");
    if (r.exit_code!=0) return ContainerState::Absent;
    return first_line(r.stdout_text)=="true" ? ContainerState::Running : ContainerState::Stopped;
}

std::vector<std::string> DockerCliRuntime::run_args(const ContainerSpec& spec) const {
    std::vector<std::string> a = {"run", "-d", "--name", spec.name, "--network", "none"};
    if (!spec.memory_limit.empty()) { a.push_back("--memory"); a.push_back(spec.memory_limit); }
    if (spec.cpu_quota>0) { a.push_back("--cpu-quota"); a.push_back(std::to_string(spec.cpu_quota)); }
    if (!spec.workdir.empty()) { a.push_back("-w"); a.push_back(spec.workdir); }
    for (auto &m : spec.mounts) {
        a.push_back("-v");
        a.push_back(m.host_path + ":" + m.sandbox_path + ":" + to_string(m.mode));
    }
    a.push_back(spec.image);
    a.push_back("sleep");
    a.push_back("infinity");
    return a;
}

void DockerCliRuntime::run(const ContainerSpec& spec) {
    check(call(run_args(spec), std::chrono::seconds(60)), "run " + spec.name);
}

void DockerCliRuntime::start(const std::string& name) { check(call({"start", name}), "start " + name); }

void DockerCliRuntime::stop(const std::string& name) {
    check(call({"stop", "-t", "2", name}), "stop " + name);
}

void DockerCliRuntime::remove(const std::string& name) { check(call({"rm", "-f", name}), "rm " + name); }

ProcessResult DockerCliRuntime::exec(const std::string& name, const std::string& workdir,
                                     const std::string& command, std::chrono::seconds timeout) {
    // The in-container timeout kills the command itself; our own deadline
    // (slightly longer) bounds the CLI call when the daemon does not answer.
    std::vector<std::string> a = {"exec"};
    if (!workdir.empty()) { a.push_back("-w"); a.push_back(workdir); }
    a.push_back(name);
    a.push_back("timeout");
    a.push_back("--signal=KILL");
    a.push_back(std::to_string(timeout.count()));
    a.push_back("bash");
    a.push_back("-c");
    a.push_back(command);
    auto t0 = std::chrono::steady_clock::now();
    auto r = call(std::move(a), timeout + std::chrono::seconds(5));
    // killed by timeout(1) only if the deadline was reached; OOM and kill -9 stay exit 137
    if (!r.timed_out && r.exit_code==137 && r.stderr_text.empty() &&
        std::chrono::steady_clock::now() - t0 >= timeout)
        r.timed_out = true;
    return r;
}

} // namespace glsfs
