/*
 * Operation log - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/pipeline/operation_log.hpp>
#include <glsfs/core/json_text.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace glsfs {

namespace {

std::string opt_quote(const std::optional<std::string>& s) { return s ? json_quote(*s) : "null"; }

} // namespace

const char* to_string(OperationStatus s) {
    switch (s) {
        case OperationStatus::Completed: return "completed";
        case OperationStatus::GenerationError: return "generation_error";
        case OperationStatus::Blocked: return "blocked";
        case OperationStatus::CancelledByUser: return "cancelled_by_user";
    }
    return "completed";
}

std::string to_json(const ValidationResult& v) {
    std::ostringstream o;
    o << "{\"is_safe\":" << (v.is_safe ? "true" : "false")
      << ",\"verdict\":" << json_quote(to_string(v.verdict))
      << ",\"warnings\":[";
    for (size_t i=0;i<v.warnings.size();++i) { if (i) o << ','; o << json_quote(v.warnings[i]); }
    o << "],\"sanitized_command\":" << opt_quote(v.sanitized_command)
      << ",\"reason\":" << json_quote(v.reason)
      << ",\"base_command\":" << json_quote(v.base_command)
      << ",\"command_class\":" << json_quote(to_string(v.command_class)) << "}";
    return o.str();
}

std::string to_json(const ExecutionResult& r) {
    std::ostringstream o;
    o << "{\"status\":" << json_quote(to_string(r.status))
      << ",\"exit_code\":" << r.exit_code
      << ",\"stdout\":" << json_quote(r.stdout_text)
      << ",\"stderr\":" << json_quote(r.stderr_text)
      << ",\"command\":" << json_quote(r.command)
      << ",\"timestamp\":" << json_quote(format_timestamp(r.timestamp))
      << ",\"execution_method\":" << json_quote(to_string(r.method)) << "}";
    return o.str();
}

std::string to_json(const OperationRecord& rec) {
    std::ostringstream o;
    o << "{\"timestamp\":" << json_quote(format_timestamp(rec.timestamp))
      << ",\"query\":" << json_quote(rec.query)
      << ",\"generated_command\":" << json_quote(rec.generated_command)
      << ",\"explanation\":" << json_quote(rec.explanation)
      << ",\"status\":" << json_quote(to_string(rec.status))
      << ",\"validation\":" << (rec.validation ? to_json(*rec.validation) : "null")
      << ",\"final_command\":" << opt_quote(rec.final_command)
      << ",\"execution\":" << (rec.execution ? to_json(*rec.execution) : "null")
      << ",\"error\":" << (rec.error.empty() ? "null" : json_quote(rec.error)) << "}";
    return o.str();
}

OperationLog::OperationLog(std::string path, std::size_t capacity)
    : m_path(std::move(path)), m_capacity(capacity>0 ? capacity : 1) {}

void OperationLog::load() {
    m_entries.clear();
    if (m_path.empty()) return;
    std::ifstream in(m_path);
    if (!in) return;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        m_entries.push_back(line);
        if (m_entries.size()>m_capacity) m_entries.pop_front();
    }
    spdlog::debug("oplog: loaded {} records from {}", m_entries.size(), m_path);
}

void OperationLog::append(const OperationRecord& rec) {
    m_entries.push_back(to_json(rec));
    bool evicted = false;
    while (m_entries.size()>m_capacity) { m_entries.pop_front(); evicted = true; }
    persist(evicted);
}

void OperationLog::persist(bool rewrite) {
    if (m_path.empty()) return;
    std::error_code ec;
    auto dir = fs::path(m_path).parent_path();
    if (!dir.empty()) fs::create_directories(dir, ec);
    if (!rewrite) {
        std::ofstream out(m_path, std::ios::app);
        if (out) out << m_entries.back() << '\n';
        if (!out) spdlog::warn("oplog: cannot append to {}", m_path);
        return;
    }
    std::string tmp = m_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        for (auto &e : m_entries) out << e << '\n';
        if (!out) { spdlog::warn("oplog: cannot write {}", tmp); return; }
    }
    fs::rename(tmp, m_path, ec);
    if (ec) spdlog::warn("oplog: cannot replace {}: {}", m_path, ec.message());
}

} // namespace glsfs
