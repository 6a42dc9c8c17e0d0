// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "ACETypes.h"
#include <cstddef>
#include <string>

namespace ACE {

/**
 * @brief Construction-time settings of an AutomatonEngine
 */
struct EngineConfig {
    std::string name;          // Diagnostic label used in logs and error messages
    size_t maxHistory = 0;     // 0 = unbounded
    bool resetAtRoot = false;  // Reset whenever a transition re-enters the root
    bool debug = false;        // Trace every step at info level

    /**
     * @brief Read settings from a JSON object
     *
     * Recognized keys: "name", "maxHistory", "resetAtRoot", "debug".
     * Missing keys keep their defaults.
     *
     * @throws std::invalid_argument on a wrongly typed value or a negative maxHistory
     */
    static EngineConfig fromJson(const Value &object);
};

}  // namespace ACE
