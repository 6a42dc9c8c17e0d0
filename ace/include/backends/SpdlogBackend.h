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
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace ACE {

/**
 * @brief Default ACE::Logger backend writing through a private spdlog logger
 *
 * Always logs to a colored console. With a log directory and logToFile set,
 * ace.log is truncated and receives the same lines with file and line of the
 * call site. SPDLOG_LEVEL, when set, overrides the initial info level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    static spdlog::level::level_enum toSpdlog(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ACE
