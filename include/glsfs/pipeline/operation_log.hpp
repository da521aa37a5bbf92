/*
 * Operation log - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   One OperationRecord per processed query, kept as JSON Lines. Only the
 *   most recent `capacity` records survive; older ones are evicted first.
 *   Write failures are logged and otherwise ignored.
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <glsfs/safety/validator.hpp>
#include <glsfs/sandbox/executor.hpp>

namespace glsfs {

enum class OperationStatus { Completed, GenerationError, Blocked, CancelledByUser };

const char* to_string(OperationStatus s);

struct OperationRecord {
    std::string query;
    std::string generated_command;
    std::string explanation;
    std::optional<ValidationResult> validation;
    std::optional<std::string> final_command;
    std::optional<ExecutionResult> execution;
    OperationStatus status = OperationStatus::Completed;
    std::string error;
    std::chrono::system_clock::time_point timestamp;
};

// Single-line JSON object.
std::string to_json(const OperationRecord& rec);
std::string to_json(const ValidationResult& v);
std::string to_json(const ExecutionResult& r);

class OperationLog {
public:
    // Empty path: in-memory only.
    explicit OperationLog(std::string path = {}, std::size_t capacity = 1000);

    // Reload the last `capacity` lines of an existing file.
    void load();
    void append(const OperationRecord& rec);

    const std::deque<std::string>& entries() const { return m_entries; }
    std::size_t size() const { return m_entries.size(); }
    std::size_t capacity() const { return m_capacity; }
    const std::string& path() const { return m_path; }
private:
    void persist(bool rewrite);

    std::string m_path;
    std::size_t m_capacity;
    std::deque<std::string> m_entries;
};

} // namespace glsfs
