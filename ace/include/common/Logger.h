// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <functional>
#include <memory>
#include <source_location>
#include <string>

namespace ACE {

/**
 * @brief Process-wide logging entry point used through the LOG_* macros
 *
 * Messages are prefixed with the short name of the calling function
 * ("AutomatonEngine::next() - ...") and handed to the installed backend.
 * A SpdlogBackend writing to the console is created on first use when the
 * host has not installed anything.
 *
 * @code
 * ACE::Logger::initialize("logs", true);  // console + logs/ace.log
 * LOG_INFO("Loaded {} states", count);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Install a backend
     * @param backend New backend, nullptr to fall back to the default on next use
     * @return Backend that was installed before, may be nullptr
     */
    static std::unique_ptr<ILoggerBackend> setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Create the default spdlog backend if no backend is installed
     * @param logDir Directory for ace.log, empty for console only
     * @param logToFile Enable the file sink
     */
    static void initialize(const std::string &logDir = "", bool logToFile = false);

    static void setLevel(LogLevel level);

    static void log(LogLevel level, const std::string &message,
                    const std::source_location &loc = std::source_location::current());

    static void flush();

    /**
     * @brief "Class::method" of a call site, without namespace, return type or parameters
     */
    static std::string shortFunctionName(const std::source_location &loc);

private:
    static void withBackend(const std::function<void(ILoggerBackend &)> &use);
};

}  // namespace ACE

#define ACE_LOG(level, ...) ::ACE::Logger::log(level, std::format(__VA_ARGS__), std::source_location::current())

#define LOG_TRACE(...) ACE_LOG(::ACE::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ACE_LOG(::ACE::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) ACE_LOG(::ACE::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) ACE_LOG(::ACE::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ACE_LOG(::ACE::LogLevel::Error, __VA_ARGS__)
