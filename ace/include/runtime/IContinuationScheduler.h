// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include <functional>

namespace ACE {

/**
 * @brief Hand-off point for continuations of AutomatonEngine::next()
 *
 * A posted task must not run inside post(): it runs on a later turn of the
 * host's scheduler, after the step that posted it has emitted all of its
 * notifications. Hosts with their own event loop implement this to route
 * continuations into it; TaskQueue is the default.
 */
class IContinuationScheduler {
public:
    virtual ~IContinuationScheduler() = default;

    /**
     * @brief Queue a task for deferred execution
     * @param task Task to run on a later turn
     */
    virtual void post(std::function<void()> task) = 0;
};

}  // namespace ACE
