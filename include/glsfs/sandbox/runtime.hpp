/*
 * Container runtime - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   The isolation runtime the sandbox handle talks to. DockerCliRuntime
 *   drives the docker (or a compatible, e.g. podman) CLI through
 *   run_process. Failed management calls raise RuntimeError; exec() returns
 *   the command's own exit status and streams as data.
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <glsfs/sandbox/mounts.hpp>
#include <glsfs/sandbox/process.hpp>

namespace glsfs {

enum class ContainerState { Running, Stopped, Absent };

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<FolderMapping> mounts;
    std::string memory_limit;   // e.g. 512m
    long cpu_quota = 0;         // microseconds per 100ms period, 0: unlimited
    std::string workdir;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;
    virtual bool ping() = 0;
    virtual bool image_exists(const std::string& image) = 0;
    virtual ContainerState state(const std::string& name) = 0;
    // Create and start a detached container that idles until stopped.
    virtual void run(const ContainerSpec& spec) = 0;
    virtual void start(const std::string& name) = 0;
    virtual void stop(const std::string& name) = 0;
    virtual void remove(const std::string& name) = 0;
    // bash -c <command> inside the container, stdout/stderr kept apart.
    virtual ProcessResult exec(const std::string& name, const std::string& workdir,
                               const std::string& command, std::chrono::seconds timeout) = 0;
};

class DockerCliRuntime : public ContainerRuntime {
public:
    explicit DockerCliRuntime(std::string binary = "docker") : m_bin(std::move(binary)) {}
    bool ping() override;
    bool image_exists(const std::string& image) override;
    ContainerState state(const std::string& name) override;
    void run(const ContainerSpec& spec) override;
    void start(const std::string& name) override;
    void stop(const std::string& name) override;
    void remove(const std::string& name) override;
    ProcessResult exec(const std::string& name, const std::string& workdir,
                       const std::string& command, std::chrono::seconds timeout) override;

    // docker run argument vector for spec (exposed for tests).
    std::vector<std::string> run_args(const ContainerSpec& spec) const;
private:
    ProcessResult call(std::vector<std::string> args, std::chrono::seconds timeout = std::chrono::seconds(30));
    void check(const ProcessResult& r, const std::string& what);

    std::string m_bin;
};

} // namespace glsfs
