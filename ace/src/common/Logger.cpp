// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "common/Logger.h"
#include "backends/SpdlogBackend.h"
#include <cctype>
#include <functional>
#include <mutex>
#include <string_view>

namespace ACE {

namespace {

std::mutex &backendMutex() {
    static std::mutex mutex;
    return mutex;
}

std::unique_ptr<ILoggerBackend> &installedBackend() {
    static std::unique_ptr<ILoggerBackend> backend;
    return backend;
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':' || c == '~';
}

}  // namespace

std::unique_ptr<ILoggerBackend> Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex());
    installedBackend().swap(backend);
    return backend;
}

void Logger::initialize(const std::string &logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex());
    if (!installedBackend()) {
        installedBackend() = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    withBackend([level](ILoggerBackend &backend) { backend.setLevel(level); });
}

void Logger::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    const std::string line = shortFunctionName(loc) + "() - " + message;
    withBackend([&](ILoggerBackend &backend) { backend.log(level, line, loc); });
}

void Logger::flush() {
    withBackend([](ILoggerBackend &backend) { backend.flush(); });
}

// The lock is held for the whole call so setBackend() cannot destroy a backend in use
void Logger::withBackend(const std::function<void(ILoggerBackend &)> &use) {
    std::lock_guard<std::mutex> lock(backendMutex());
    auto &backend = installedBackend();
    if (!backend) {
        backend = std::make_unique<SpdlogBackend>();
    }
    use(*backend);
}

std::string Logger::shortFunctionName(const std::source_location &loc) {
    std::string_view full = loc.function_name();

    // Parameter list: first '(' outside the return type's template arguments
    size_t open = std::string_view::npos;
    int depth = 0;
    for (size_t i = 0; i < full.size(); ++i) {
        if (full[i] == '<') {
            ++depth;
        } else if (full[i] == '>') {
            --depth;
        } else if (full[i] == '(' && depth <= 0) {
            open = i;
            break;
        }
    }
    if (open == std::string_view::npos) {
        return std::string(full);
    }

    // Skip explicit template arguments of the function itself
    size_t end = open;
    if (end > 0 && full[end - 1] == '>') {
        int nested = 0;
        while (end > 0) {
            --end;
            if (full[end] == '>') {
                ++nested;
            } else if (full[end] == '<' && --nested == 0) {
                break;
            }
        }
    }

    size_t begin = end;
    while (begin > 0 && isNameChar(full[begin - 1])) {
        --begin;
    }

    std::string_view name = full.substr(begin, end - begin);
    if (name.starts_with("ACE::")) {
        name.remove_prefix(5);
    }

    return name.empty() ? "UnknownFunction" : std::string(name);
}

}  // namespace ACE
