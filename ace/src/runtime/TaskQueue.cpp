// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/TaskQueue.h"
#include "common/Logger.h"
#include <utility>

namespace ACE {

void TaskQueue::post(std::function<void()> task) {
    if (!task) {
        LOG_WARN("TaskQueue: Ignoring empty task");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push(std::move(task));
}

bool TaskQueue::runOne() {
    std::function<void()> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) {
            return false;
        }
        task = std::move(tasks_.front());
        tasks_.pop();
    }

    // Run outside the lock so the task can post follow-ups
    task();
    return true;
}

size_t TaskQueue::runPending() {
    // Move the current batch out under lock; later posts belong to the next tick
    std::queue<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(batch, tasks_);
    }

    size_t processed = 0;
    while (!batch.empty()) {
        auto task = std::move(batch.front());
        batch.pop();
        task();
        ++processed;
    }

    if (processed > 0) {
        LOG_TRACE("TaskQueue: Ran {} continuation(s)", processed);
    }
    return processed;
}

size_t TaskQueue::runUntilIdle() {
    size_t total = 0;
    while (size_t processed = runPending()) {
        total += processed;
    }
    return total;
}

bool TaskQueue::hasPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !tasks_.empty();
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}  // namespace ACE
