/*
 * Sandbox executor tests - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <glsfs/core/errors.hpp>
#include <glsfs/sandbox/executor.hpp>
#include <glsfs/sandbox/runtime.hpp>
#include <glsfs/sandbox/sandbox_handle.hpp>
#include <unistd.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>

namespace fs = std::filesystem;
using namespace glsfs;
using namespace std::chrono_literals;

namespace {

// In-memory container runtime: records calls, exec answered by a callback.
class FakeRuntime : public ContainerRuntime {
public:
    bool reachable = true;
    bool has_image = true;
    bool fail_run = false;
    bool fail_stop = false;
    std::map<std::string, ContainerState> states;
    std::vector<std::string> calls;
    std::vector<std::string> commands;
    ContainerSpec last_spec;
    std::function<ProcessResult(const std::string&)> on_exec = [](const std::string&) {
        ProcessResult r; r.exit_code = 0; return r;
    };

    bool ping() override { calls.push_back("ping"); return reachable; }
    bool image_exists(const std::string&) override { return has_image; }
    ContainerState state(const std::string& name) override {
        auto it = states.find(name);
        return it==states.end() ? ContainerState::Absent : it->second;
    }
    void run(const ContainerSpec& spec) override {
        calls.push_back("run");
        if (fail_run) throw RuntimeError("run failed");
        last_spec = spec;
        states[spec.name] = ContainerState::Running;
    }
    void start(const std::string& name) override { calls.push_back("start"); states[name] = ContainerState::Running; }
    void stop(const std::string& name) override {
        calls.push_back("stop");
        if (fail_stop) throw RuntimeError("stop failed");
        states[name] = ContainerState::Stopped;
    }
    void remove(const std::string& name) override { calls.push_back("remove"); states.erase(name); }
    ProcessResult exec(const std::string&, const std::string&, const std::string& command, std::chrono::seconds) override {
        commands.push_back(command);
        return on_exec(command);
    }

    bool called(const std::string& what) const { return std::find(calls.begin(), calls.end(), what)!=calls.end(); }
};

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        host = fs::temp_directory_path() / ("glsfs_test_" + std::to_string(getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(host);
        fs::create_directories(host / "Documents");
        std::ofstream(host / "Documents" / "note.txt") << "hello";
        cfg.host_home = host.string();
        cfg.workspace_dir = (host / "ws").string();
        cfg.log_file = (host / "ops.jsonl").string();
        cfg.ready_retries = 2;
        cfg.ready_interval_ms = 1;
    }
    void TearDown() override { fs::remove_all(host); }

    fs::path host;
    Config cfg;
    FakeRuntime runtime;
};

ProcessResult exited(int code, std::string out = "", std::string err = "") {
    ProcessResult r;
    r.exit_code = code;
    r.stdout_text = std::move(out);
    r.stderr_text = std::move(err);
    return r;
}

} // namespace

TEST_F(ExecutorTest, SandboxReadyRunsNormalizedCommandInContainer) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    EXPECT_EQ(ex.state(), ExecutorState::SandboxReady);
    EXPECT_TRUE(ex.sandboxed());
    EXPECT_TRUE(runtime.called("run"));

    // workspace, Documents and the /workspace alias are bound; Desktop does not exist on the host
    ASSERT_EQ(runtime.last_spec.mounts.size(), 3u);
    EXPECT_EQ(runtime.last_spec.workdir, "/home/user");
    EXPECT_EQ(runtime.last_spec.memory_limit, "512m");

    runtime.on_exec = [](const std::string&) { return exited(0, "note.txt\n"); };
    auto r = ex.execute("ls ~/documents");
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.method, ExecutionMethod::Sandboxed);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_text, "note.txt\n");
    EXPECT_EQ(r.command, "ls /home/user/Documents");
    EXPECT_EQ(runtime.commands.back(), "ls /home/user/Documents");
}

TEST_F(ExecutorTest, StaleContainerIsReplaced) {
    runtime.states[cfg.container_name] = ContainerState::Stopped;
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    auto rm = std::find(runtime.calls.begin(), runtime.calls.end(), "remove");
    auto run = std::find(runtime.calls.begin(), runtime.calls.end(), "run");
    ASSERT_NE(rm, runtime.calls.end());
    EXPECT_LT(rm, run);
    EXPECT_TRUE(ex.sandboxed());
}

TEST_F(ExecutorTest, NonZeroExitIsAnErrorResult) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.on_exec = [](const std::string&) { return exited(2, "", "ls: cannot access 'x'\n"); };
    auto r = ex.execute("ls x");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_EQ(r.stderr_text, "ls: cannot access 'x'\n");
}

TEST_F(ExecutorTest, ExecFaultIsReportedNotThrown) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.on_exec = [](const std::string&) -> ProcessResult { throw RuntimeError("daemon gone"); };
    ExecutionResult r;
    EXPECT_NO_THROW(r = ex.execute("ls"));
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.stderr_text.rfind("Sandbox execution error: ", 0), 0u);
}

TEST_F(ExecutorTest, SandboxTimeout) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.on_exec = [](const std::string&) { auto r = exited(137); r.timed_out = true; return r; };
    auto r = ex.execute("sleep 100", 7s);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.stderr_text, "Command timed out after 7 seconds");
}

TEST_F(ExecutorTest, StoppedContainerIsRestarted) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.states[cfg.container_name] = ContainerState::Stopped;
    auto r = ex.execute("ls");
    EXPECT_TRUE(runtime.called("start"));
    EXPECT_EQ(r.method, ExecutionMethod::Sandboxed);
    EXPECT_TRUE(r.ok());
}

TEST_F(ExecutorTest, RecreateFailureFallsBackToLocalForThatCall) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.states.clear();
    runtime.fail_run = true;
    auto r = ex.execute("echo hi");
    EXPECT_EQ(r.method, ExecutionMethod::Local);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.stdout_text, "hi\n");
}

TEST_F(ExecutorTest, UnreachableRuntimeFallsBackToLocal) {
    runtime.reachable = false;
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    EXPECT_EQ(ex.state(), ExecutorState::LocalFallbackReady);
    EXPECT_FALSE(runtime.called("run"));
    auto r = ex.execute("echo hi");
    EXPECT_EQ(r.method, ExecutionMethod::Local);
    EXPECT_EQ(r.stdout_text, "hi\n");
}

TEST_F(ExecutorTest, MissingImageFallsBackToLocal) {
    runtime.has_image = false;
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    EXPECT_EQ(ex.state(), ExecutorState::LocalFallbackReady);
}

TEST_F(ExecutorTest, SandboxRequiredRaises) {
    runtime.reachable = false;
    cfg.sandbox_required = true;
    SandboxExecutor ex(cfg, runtime);
    EXPECT_THROW(ex.initialize(), InitializationError);
    EXPECT_EQ(ex.state(), ExecutorState::SandboxUnavailable);
    auto r = ex.execute("ls");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.stderr_text.rfind("Executor initialization failed: ", 0), 0u);
}

TEST_F(ExecutorTest, WorkspaceCreationFailureRaises) {
    std::ofstream(host / "blocker") << "x";
    cfg.workspace_dir = (host / "blocker" / "ws").string();
    SandboxExecutor ex(cfg, runtime);
    EXPECT_THROW(ex.initialize(), InitializationError);
}

TEST_F(ExecutorTest, LocalTranslatesPathsAndRestrictsEnvironment) {
    cfg.use_sandbox = false;
    SandboxExecutor ex(cfg, runtime);
    auto r = ex.execute("cat documents/note.txt");
    EXPECT_TRUE(r.ok()) << r.stderr_text;
    EXPECT_EQ(r.method, ExecutionMethod::Local);
    EXPECT_EQ(r.stdout_text, "hello");
    EXPECT_EQ(r.command, "cat /home/user/Documents/note.txt");

    auto ws = ex.mounts().workspace_host();
    r = ex.execute("echo \"$HOME:$USER\"; pwd -P");
    EXPECT_EQ(r.stdout_text, ws + ":safeuser\n" + fs::canonical(ws).string() + "\n");

    r = ex.execute("touch workspace/new.txt");
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(fs::exists(fs::path(ws) / "new.txt"));
    EXPECT_FALSE(runtime.called("ping"));
}

TEST_F(ExecutorTest, LocalTimeout) {
    cfg.use_sandbox = false;
    SandboxExecutor ex(cfg, runtime);
    auto t0 = std::chrono::steady_clock::now();
    auto r = ex.execute("sleep 20", 1s);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 10s);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.stderr_text, "Command timed out after 1 seconds");
}

TEST_F(ExecutorTest, SmokeTestFailureMarksMountUnavailable) {
    runtime.on_exec = [](const std::string& cmd) {
        return cmd.find("Documents")!=std::string::npos ? exited(2, "", "permission denied") : exited(0);
    };
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    EXPECT_TRUE(ex.sandboxed());
    ASSERT_NE(ex.mounts().find("/home/user/Documents"), nullptr);
    EXPECT_FALSE(ex.mounts().find("/home/user/Documents")->available);
    EXPECT_TRUE(ex.mounts().find("/home/user/workspace")->available);

    auto listing = ex.get_workspace_contents();
    ASSERT_EQ(listing.size(), 1u);
    EXPECT_EQ(listing[0].mount.sandbox_path, "/home/user/workspace");
    EXPECT_EQ(listing[0].result.method, ExecutionMethod::Sandboxed);
}

TEST_F(ExecutorTest, LocalWorkspaceContents) {
    cfg.use_sandbox = false;
    SandboxExecutor ex(cfg, runtime);
    auto listing = ex.get_workspace_contents();
    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing[0].mount.mode, MountMode::ReadWrite);
    EXPECT_EQ(listing[1].mount.sandbox_path, "/home/user/Documents");
    EXPECT_TRUE(listing[1].result.ok()) << listing[1].result.stderr_text;
    EXPECT_NE(listing[1].result.stdout_text.find("note.txt"), std::string::npos);
    EXPECT_EQ(listing[1].result.method, ExecutionMethod::Local);
}

TEST_F(ExecutorTest, SandboxedWorkspaceContentsListsThroughContainer) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.commands.clear();
    runtime.on_exec = [](const std::string& cmd) { return exited(0, "total 0 for " + cmd); };
    auto listing = ex.get_workspace_contents();
    ASSERT_EQ(listing.size(), 2u);
    std::vector<std::string> expected = {"ls -la '/home/user/workspace'", "ls -la '/home/user/Documents'"};
    EXPECT_EQ(runtime.commands, expected);
    EXPECT_EQ(listing[1].mount.sandbox_path, "/home/user/Documents");
    EXPECT_EQ(listing[1].result.method, ExecutionMethod::Sandboxed);
    EXPECT_EQ(listing[1].result.command, "ls -la '/home/user/Documents'");
    EXPECT_EQ(listing[1].result.stdout_text, "total 0 for ls -la '/home/user/Documents'");
}

TEST_F(ExecutorTest, SandboxedWorkspaceContentsSkipsUnavailableMounts) {
    runtime.on_exec = [](const std::string& cmd) {
        return cmd.find("Documents")!=std::string::npos ? exited(2, "", "permission denied") : exited(0);
    };
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.commands.clear();
    auto listing = ex.get_workspace_contents();
    ASSERT_EQ(listing.size(), 1u);
    EXPECT_EQ(runtime.commands, std::vector<std::string>{"ls -la '/home/user/workspace'"});
}

TEST_F(ExecutorTest, LocalModeRefusesWritesToReadOnlyFolders) {
    cfg.use_sandbox = false;
    std::ofstream(host / "Documents" / "a.txt") << "a";
    std::ofstream(host / "Documents" / "b.txt") << "b";
    std::ofstream(host / "Documents" / "c.txt") << "c";
    SandboxExecutor ex(cfg, runtime);

    const char* cmds[] = {
        "find Documents -name a.txt -delete",
        "sed -i 's/b/x/' Documents/b.txt",
        "cd Documents && rm c.txt",
        "cd ~/documents\nrm -f c.txt",
        "ls documents | xargs rm",
    };
    for (auto c : cmds) {
        auto r = ex.execute(c);
        EXPECT_FALSE(r.ok()) << c;
        EXPECT_EQ(r.exit_code, -1) << c;
        EXPECT_EQ(r.method, ExecutionMethod::Local);
        EXPECT_EQ(r.stderr_text, "Refused: command may modify read-only folder /home/user/Documents in local mode") << c;
    }
    auto r = ex.execute("rm -f ../Documents/c.txt");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.stderr_text, "Refused: command may modify a read-only folder through '..' in local mode");

    EXPECT_TRUE(fs::exists(host / "Documents" / "a.txt"));
    EXPECT_TRUE(fs::exists(host / "Documents" / "c.txt"));
    std::ifstream in(host / "Documents" / "b.txt");
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(body, "b");

    // reading them, and writing elsewhere, still works
    r = ex.execute("cd documents && cat b.txt");
    EXPECT_TRUE(r.ok()) << r.stderr_text;
    EXPECT_EQ(r.stdout_text, "b");
    r = ex.execute("find workspace -name '*.tmp' -delete");
    EXPECT_TRUE(r.ok()) << r.stderr_text;
}

TEST_F(ExecutorTest, CleanupIsIdempotentAndNeverThrows) {
    SandboxExecutor ex(cfg, runtime);
    ex.initialize();
    runtime.fail_stop = true;
    EXPECT_NO_THROW(ex.cleanup());
    EXPECT_TRUE(runtime.called("stop"));
    EXPECT_TRUE(runtime.called("remove"));
    EXPECT_EQ(ex.state(), ExecutorState::LocalFallbackReady);
    auto n = runtime.calls.size();
    EXPECT_NO_THROW(ex.cleanup());
    EXPECT_EQ(runtime.calls.size(), n);
}

TEST(SandboxHandle, ExecRequiresOpen) {
    FakeRuntime rt;
    ContainerSpec spec;
    spec.name = "c";
    SandboxHandle h(rt, spec, 1, 1ms);
    EXPECT_THROW(h.exec("ls", 1s), RuntimeError);
    EXPECT_THROW(h.ensure_running(), RuntimeError);
    h.open();
    EXPECT_TRUE(h.is_open());
    EXPECT_NO_THROW(h.exec("ls", 1s));
    h.close();
    EXPECT_FALSE(h.is_open());
    EXPECT_EQ(rt.state("c"), ContainerState::Absent);
}

TEST(DockerCliRuntime, RunArguments) {
    DockerCliRuntime rt("docker");
    ContainerSpec spec;
    spec.name = "box";
    spec.image = "img";
    spec.memory_limit = "256m";
    spec.cpu_quota = 50000;
    spec.workdir = "/home/user";
    spec.mounts.push_back({"/home/user/workspace", "/srv/ws", MountMode::ReadWrite, false, true});
    spec.mounts.push_back({"/home/user/Desktop", "/h/Desktop", MountMode::ReadOnly, false, true});
    std::vector<std::string> expected = {
        "run", "-d", "--name", "box", "--network", "none", "--memory", "256m", "--cpu-quota", "50000",
        "-w", "/home/user", "-v", "/srv/ws:/home/user/workspace:rw", "-v", "/h/Desktop:/home/user/Desktop:ro",
        "img", "sleep", "infinity"};
    EXPECT_EQ(rt.run_args(spec), expected);
}

TEST(DockerCliRuntime, MissingBinary) {
    DockerCliRuntime rt("/nonexistent/glsfs-docker");
    EXPECT_FALSE(rt.ping());
    EXPECT_FALSE(rt.image_exists("img"));
    EXPECT_EQ(rt.state("box"), ContainerState::Absent);
    EXPECT_THROW(rt.remove("box"), RuntimeError);
}

namespace {

// Stand-in docker binary: a shell script killed with SIGKILL after a delay.
fs::path killed_cli(const std::string& tag, int delay_seconds) {
    auto bin = fs::temp_directory_path() / ("glsfs_cli_" + std::to_string(getpid()) + "_" + tag);
    {
        std::ofstream out(bin);
        out << "#!/bin/sh\n";
        if (delay_seconds>0) out << "sleep " << delay_seconds << "\n";
        out << "kill -9 $$\n";
    }
    fs::permissions(bin, fs::perms::owner_all);
    return bin;
}

} // namespace

TEST(DockerCliRuntime, ExecKilledEarlyIsNotATimeout) {
    auto bin = killed_cli("early", 0);
    DockerCliRuntime rt(bin.string());
    auto r = rt.exec("box", "/home/user", "ls", 30s);
    EXPECT_EQ(r.exit_code, 137);
    EXPECT_FALSE(r.timed_out);
    fs::remove(bin);
}

TEST(DockerCliRuntime, ExecKilledAtDeadlineIsATimeout) {
    auto bin = killed_cli("deadline", 1);
    DockerCliRuntime rt(bin.string());
    auto r = rt.exec("box", "/home/user", "sleep 100", 1s);
    EXPECT_EQ(r.exit_code, 137);
    EXPECT_TRUE(r.timed_out);
    fs::remove(bin);
}
