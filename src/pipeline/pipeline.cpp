/*
 * Pipeline - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/pipeline/pipeline.hpp>
#include <glsfs/core/errors.hpp>
#include <spdlog/spdlog.h>

namespace glsfs {

Pipeline::Pipeline(ai::CommandGenerator& generator, const SafetyValidator& validator,
                   SandboxExecutor& executor, OperationLog* log)
    : m_generator(generator), m_validator(validator), m_executor(executor), m_log(log) {
    m_executor.initialize();
}

OperationRecord Pipeline::finish(OperationRecord rec) {
    spdlog::info("pipeline: '{}' -> {}", rec.query, to_string(rec.status));
    if (m_log) m_log->append(rec);
    return rec;
}

OperationRecord Pipeline::process(const std::string& query, bool auto_execute) {
    OperationRecord rec;
    rec.query = query;
    rec.timestamp = std::chrono::system_clock::now();

    ai::GeneratedCommand gen;
    try {
        gen = m_generator.generate(query);
    } catch (const GenerationError& e) {
        rec.status = OperationStatus::GenerationError;
        rec.error = e.what();
        return finish(std::move(rec));
    }
    rec.generated_command = gen.command;
    rec.explanation = gen.explanation;

    auto validation = m_validator.validate(gen.command);
    rec.validation = validation;
    if (!validation.is_safe) {
        rec.status = OperationStatus::Blocked;
        rec.error = validation.reason;
        return finish(std::move(rec));
    }
    const std::string& command = *validation.sanitized_command;
    if (!validation.warnings.empty() && !auto_execute) {
        if (!m_confirm || !m_confirm(command, validation)) {
            rec.status = OperationStatus::CancelledByUser;
            rec.error = "Operation cancelled by user";
            return finish(std::move(rec));
        }
    }
    rec.final_command = command;
    rec.execution = m_executor.execute(command);
    rec.status = OperationStatus::Completed;
    return finish(std::move(rec));
}

} // namespace glsfs
