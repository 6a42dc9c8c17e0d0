// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "runtime/IContinuationScheduler.h"
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>

namespace ACE {

/**
 * @brief FIFO continuation queue drained explicitly by the host
 *
 * runPending() runs one "tick": only the tasks queued when it was called.
 * Tasks posted while a tick is running (for example a continuation that
 * chains another next()) wait for the following tick. runUntilIdle() keeps
 * ticking until the queue stays empty.
 *
 * post() may be called from any thread; draining is expected to happen on
 * the thread that drives the engine.
 */
class TaskQueue : public IContinuationScheduler {
public:
    TaskQueue() = default;
    ~TaskQueue() override = default;

    TaskQueue(const TaskQueue &) = delete;
    TaskQueue &operator=(const TaskQueue &) = delete;

    void post(std::function<void()> task) override;

    /**
     * @brief Run the oldest queued task
     * @return true if a task was run, false if the queue was empty
     */
    bool runOne();

    /**
     * @brief Run the tasks queued at the time of the call
     * @return Number of tasks run
     */
    size_t runPending();

    /**
     * @brief Run ticks until no task is left
     * @return Number of tasks run
     */
    size_t runUntilIdle();

    bool hasPending() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::queue<std::function<void()>> tasks_;
};

}  // namespace ACE
