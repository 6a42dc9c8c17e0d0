// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "backends/SpdlogBackend.h"
#include <array>
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ACE {

namespace {

constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
// File lines keep the call site, the console stays short
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v";

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    logger_ = std::make_shared<spdlog::logger>("ACE", console);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (std::filesystem::path(logDir) / "ace.log").string(), true);
        file->set_pattern(FILE_PATTERN);
        logger_->sinks().push_back(std::move(file));
    }

    // Kept out of the spdlog registry so a second backend can reuse the name
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    logger_->set_level(envLevel ? spdlog::level::from_str(envLevel) : spdlog::level::info);
}

void SpdlogBackend::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    logger_->log(where, toSpdlog(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::toSpdlog(LogLevel level) {
    static constexpr std::array<spdlog::level::level_enum, 7> LEVELS = {
        spdlog::level::trace, spdlog::level::debug,    spdlog::level::info, spdlog::level::warn,
        spdlog::level::err,   spdlog::level::critical, spdlog::level::off};
    const auto index = static_cast<size_t>(level);
    return index < LEVELS.size() ? LEVELS[index] : spdlog::level::info;
}

}  // namespace ACE
