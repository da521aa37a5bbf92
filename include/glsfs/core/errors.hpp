/*
 * Error types - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Only resource acquisition failures are raised. Rejected commands and failed
 * executions are returned as ValidationResult / ExecutionResult values.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace glsfs {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Sandbox required but unavailable, or workspace could not be created.
struct InitializationError : Error {
    using Error::Error;
};

// Upstream command generator failed or returned nothing usable.
struct GenerationError : Error {
    using Error::Error;
};

// A container runtime call failed (non-zero CLI exit, unreachable daemon).
struct RuntimeError : Error {
    using Error::Error;
};

} // namespace glsfs
