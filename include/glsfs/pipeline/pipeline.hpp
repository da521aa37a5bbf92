/*
 * Pipeline - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   query -> generate -> validate -> (confirm) -> execute -> record.
 *   Generation failures, rejections and cancellations are recorded, not
 *   thrown. Construction initializes the executor, so an
 *   InitializationError surfaces to whoever builds the pipeline.
 */
#pragma once
#include <functional>
#include <string>
#include <glsfs/ai/generator.hpp>
#include <glsfs/pipeline/operation_log.hpp>
#include <glsfs/safety/validator.hpp>
#include <glsfs/sandbox/executor.hpp>

namespace glsfs {

class Pipeline {
public:
    // Asked before running a command that passed validation with warnings.
    using ConfirmFn = std::function<bool(const std::string& command, const ValidationResult& validation)>;

    Pipeline(ai::CommandGenerator& generator, const SafetyValidator& validator,
             SandboxExecutor& executor, OperationLog* log = nullptr);

    void set_confirm(ConfirmFn fn) { m_confirm = std::move(fn); }

    // auto_execute skips the confirmation step.
    OperationRecord process(const std::string& query, bool auto_execute);
private:
    OperationRecord finish(OperationRecord rec);

    ai::CommandGenerator& m_generator;
    const SafetyValidator& m_validator;
    SandboxExecutor& m_executor;
    OperationLog* m_log;
    ConfirmFn m_confirm;
};

} // namespace glsfs
