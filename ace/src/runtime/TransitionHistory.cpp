// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/TransitionHistory.h"

namespace ACE {

void TransitionHistory::record(const std::string &stateName, const Value &input) {
    records_.emplace_back(stateName, input);

    // Enforce maximum history limit (FIFO)
    while (isBounded() && records_.size() > maxHistory_) {
        records_.pop_front();
    }
}

History TransitionHistory::restart(const std::string &rootName) {
    History previous(records_.begin(), records_.end());

    records_.clear();
    records_.emplace_back(rootName, Value());

    return previous;
}

History TransitionHistory::snapshot() const {
    return History(records_.begin(), records_.end());
}

}  // namespace ACE
