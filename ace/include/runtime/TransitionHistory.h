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
#include <deque>
#include <string>

namespace ACE {

/**
 * @brief Ordered log of the states entered since the last reset
 *
 * With a positive maximum the log is a sliding window: recording past the
 * limit evicts the oldest entry (FIFO). Zero means unbounded. Machines with
 * cycles that never reach a terminal state need a bound.
 */
class TransitionHistory {
public:
    explicit TransitionHistory(size_t maxHistory = 0) : maxHistory_(maxHistory) {}

    /**
     * @brief Append a record, evicting the oldest one if over the limit
     */
    void record(const std::string &stateName, const Value &input);

    /**
     * @brief Start a new run at the root
     * @param rootName Root state name, recorded with a null input
     * @return Records accumulated since the previous restart
     */
    History restart(const std::string &rootName);

    /**
     * @brief Copy of the current window, oldest first
     */
    History snapshot() const;

    size_t size() const {
        return records_.size();
    }

    bool empty() const {
        return records_.empty();
    }

    size_t getMaxHistory() const {
        return maxHistory_;
    }

    bool isBounded() const {
        return maxHistory_ > 0;
    }

private:
    size_t maxHistory_;
    std::deque<HistoryRecord> records_;
};

}  // namespace ACE
