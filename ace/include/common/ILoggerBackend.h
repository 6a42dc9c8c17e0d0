// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include <source_location>
#include <string>

namespace ACE {

// Ordered from most to least verbose; a backend drops anything below its level
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Sink for engine diagnostics
 *
 * Every engine message reaches exactly one backend. SpdlogBackend is used
 * unless the host installs another one through Logger::setBackend(), e.g. to
 * route transitions of a tokenizer machine into its own trace stream:
 *
 * @code
 * class TokenizerTrace : public ACE::ILoggerBackend {
 * public:
 *     void log(ACE::LogLevel level, const std::string &message, const std::source_location &) override {
 *         if (level >= min_) trace_.push_back(message);
 *     }
 *     void setLevel(ACE::LogLevel level) override { min_ = level; }
 *     void flush() override {}
 * };
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param message Formatted text, already prefixed with the calling function
     * @param loc Call site, for backends that print file and line
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace ACE
