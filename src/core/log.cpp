/*
 * Logging setup - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <glsfs/core/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace glsfs {

void init_logging(const std::string& level) {
    auto logger = spdlog::get("glsfs");
    if (!logger) logger = spdlog::stderr_color_mt("glsfs");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
    spdlog::set_level(lvl);
}

} // namespace glsfs
