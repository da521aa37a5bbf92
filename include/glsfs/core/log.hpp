/*
 * Logging setup - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace glsfs {

// Configure spdlog's default logger (stderr, level from config).
// Unknown level names fall back to "info".
void init_logging(const std::string& level);

} // namespace glsfs
