/*
 * Minimal JSON text helpers - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <chrono>

namespace glsfs {

// Escape a string for inclusion between JSON double quotes.
std::string json_escape(const std::string& in);

// "\"<escaped>\"" convenience.
std::string json_quote(const std::string& in);

// ISO-8601 local time with seconds, e.g. 2025-03-01T10:22:31
std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace glsfs
