// GLSFS main: natural-language file operations through the safety pipeline
#include <glsfs/ai/generator.hpp>
#include <glsfs/core/config.hpp>
#include <glsfs/core/errors.hpp>
#include <glsfs/core/log.hpp>
#include <glsfs/pipeline/operation_log.hpp>
#include <glsfs/pipeline/pipeline.hpp>
#include <glsfs/safety/validator.hpp>
#include <glsfs/sandbox/executor.hpp>
#include <glsfs/sandbox/runtime.hpp>

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <csignal>
#include <cctype>
#include <iostream>
#include <string>

namespace {

struct CliOptions {
    std::string config_path;
    std::string query;
    bool no_docker = false;
    bool rebuild_container = false;
    bool debug = false;
    bool help = false;
};

bool g_color = true;

std::string apply_color(const std::string& s, const char* code) {
    if (!g_color) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  -q, --query <text>     process one request, print the record as JSON\n"
              << "      --no-docker        run commands locally (no sandbox container)\n"
              << "      --rebuild-container  remove the sandbox container before starting\n"
              << "  -c, --config <file>    configuration file (default ~/.glsfsrc)\n"
              << "  -d, --debug            debug logging\n"
              << "  -h, --help             this help\n";
}

// Returns false on a usage error.
bool parse_args(int argc, char* argv[], CliOptions& o) {
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        auto need_value = [&](std::string& into) {
            if (i+1>=argc) { std::cerr << a << ": missing value\n"; return false; }
            into = argv[++i];
            return true;
        };
        if (a=="-q" || a=="--query") { if (!need_value(o.query)) return false; }
        else if (a=="-c" || a=="--config") { if (!need_value(o.config_path)) return false; }
        else if (a=="--no-docker") o.no_docker = true;
        else if (a=="--rebuild-container") o.rebuild_container = true;
        else if (a=="-d" || a=="--debug") o.debug = true;
        else if (a=="-h" || a=="--help") o.help = true;
        else { std::cerr << "unknown option: " << a << "\n"; return false; }
    }
    return true;
}

std::string trim(const std::string& s) {
    size_t a=0; while (a<s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b=s.size(); while (b>a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b-a);
}

bool ask_confirmation(const std::string& command, const glsfs::ValidationResult& v) {
    std::cout << apply_color("Warnings:", "33") << "\n";
    for (auto &w : v.warnings) std::cout << "  - " << w << "\n";
    std::cout << "Run '" << command << "'? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    answer = trim(answer);
    return answer=="y" || answer=="Y" || answer=="yes";
}

void print_record(const glsfs::OperationRecord& rec) {
    if (!rec.generated_command.empty()) std::cout << apply_color("Command: ", "1") << rec.generated_command << "\n";
    if (!rec.explanation.empty()) std::cout << apply_color("Explanation: ", "1") << rec.explanation << "\n";
    switch (rec.status) {
        case glsfs::OperationStatus::GenerationError:
            std::cout << apply_color("Generation failed: ", "31") << rec.error << "\n";
            return;
        case glsfs::OperationStatus::Blocked:
            std::cout << apply_color("Blocked: ", "31") << rec.error << "\n";
            return;
        case glsfs::OperationStatus::CancelledByUser:
            std::cout << apply_color("Cancelled.", "33") << "\n";
            return;
        case glsfs::OperationStatus::Completed:
            break;
    }
    if (rec.validation)
        for (auto &w : rec.validation->warnings) std::cout << apply_color("warning: ", "33") << w << "\n";
    if (!rec.execution) return;
    auto &r = *rec.execution;
    std::cout << apply_color(std::string("[") + glsfs::to_string(r.method) + "] ", "36") << r.command << "\n";
    if (!r.stdout_text.empty()) std::cout << r.stdout_text << (r.stdout_text.back()=='\n' ? "" : "\n");
    if (!r.ok()) {
        std::cout << apply_color("exit " + std::to_string(r.exit_code), "31") << "\n";
        if (!r.stderr_text.empty()) std::cout << apply_color(r.stderr_text, "31") << (r.stderr_text.back()=='\n' ? "" : "\n");
    }
}

void print_workspace(glsfs::SandboxExecutor& executor) {
    for (auto &l : executor.get_workspace_contents()) {
        std::cout << apply_color(l.mount.sandbox_path, "1;34") << " (" << glsfs::to_string(l.mount.mode) << ")\n";
        std::cout << (l.result.ok() ? l.result.stdout_text : l.result.stderr_text) << "\n";
    }
}

void print_help() {
    std::cout << "Ask for file operations in plain language, e.g. 'find all pdf files in documents'.\n"
              << "Commands: help, workspace (list mounted folders), exit\n"
              << "Desktop, Documents and Downloads are read-only; workspace is writable.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) { print_usage(argv[0]); return 2; }
    if (opts.help) { print_usage(argv[0]); return 0; }
    g_color = isatty(STDOUT_FILENO) && opts.query.empty();

    auto cfg = glsfs::load_config(opts.config_path.empty() ? glsfs::default_config_path() : opts.config_path);
    if (opts.no_docker) cfg.use_sandbox = false;
    glsfs::init_logging(opts.debug ? "debug" : cfg.log_level);

    glsfs::DockerCliRuntime runtime(cfg.runtime_binary);
    if (opts.rebuild_container && cfg.use_sandbox) {
        try {
            if (runtime.state(cfg.container_name)!=glsfs::ContainerState::Absent) runtime.remove(cfg.container_name);
            spdlog::info("removed container {}", cfg.container_name);
        } catch (const glsfs::RuntimeError& e) {
            spdlog::warn("cannot remove container {}: {}", cfg.container_name, e.what());
        }
    }

    try {
        glsfs::ai::LLMCommandGenerator generator(glsfs::ai::make_llm(glsfs::ai::llm_config_from(cfg)));
        glsfs::ValidatorPolicy policy;
        policy.sandbox_home = cfg.sandbox_home;
        glsfs::SafetyValidator validator(policy);
        glsfs::SandboxExecutor executor(cfg, runtime);
        glsfs::OperationLog oplog(cfg.log_file, cfg.log_capacity);
        oplog.load();
        glsfs::Pipeline pipeline(generator, validator, executor, &oplog);

        if (!opts.query.empty()) {
            auto rec = pipeline.process(opts.query, true);
            std::cout << glsfs::to_json(rec) << "\n";
            executor.cleanup();
            if (rec.status!=glsfs::OperationStatus::Completed) return 1;
            return rec.execution && rec.execution->ok() ? 0 : 1;
        }

        pipeline.set_confirm(ask_confirmation);
        std::signal(SIGINT, SIG_IGN);
        std::cout << "\n" << apply_color("GLSFS", "1;36") << " - safe natural-language file operations\n";
        std::cout << "Mode: " << (executor.sandboxed() ? apply_color("sandboxed", "32") : apply_color("local (no isolation)", "33"))
                  << " | provider=" << cfg.llm_provider << "\n";
        std::cout << "Type 'help' for help, 'exit' to quit.\n\n";
        std::string line;
        while (true) {
            std::cout << apply_color("glsfs> ", "1;32") << std::flush;
            if (!std::getline(std::cin, line)) break;
            line = trim(line);
            if (line.empty()) continue;
            if (line=="exit" || line=="quit") break;
            if (line=="help") { print_help(); continue; }
            if (line=="workspace") { print_workspace(executor); continue; }
            print_record(pipeline.process(line, cfg.auto_execute));
        }
        executor.cleanup();
    } catch (const glsfs::Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
