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
#include <optional>
#include <string>

namespace ACE {

/**
 * @brief Immutable, criteria-guarded edge to a named target state
 *
 * The target is kept by name and resolved against the engine's registry
 * only when the transition is examined during traversal.
 */
class TransitionNode {
public:
    /**
     * @brief Constructor
     * @param targetStateName Name of the target state
     * @param criteria Normalized match predicate
     * @param accept Optional side-effect accept function
     * @param literal Literal the predicate was built from, if any (diagnostics only)
     */
    TransitionNode(const std::string &targetStateName, CriteriaPredicate criteria, AcceptFunction accept = nullptr,
                   std::optional<Value> literal = std::nullopt);

    const std::string &getTargetStateName() const;

    /**
     * @brief Evaluate the criteria against an input
     * @param input Current input
     * @param previousState State occupied before the current one, may be nullptr
     * @return true if this transition should be taken
     */
    bool matches(const Value &input, const StateNode *previousState) const;

    bool hasAccept() const;

    /**
     * @brief Invoke the transition-level accept function
     * @return Produced value, std::nullopt if absent or no accept defined
     */
    std::optional<Value> accept(const Value &input, const History &history) const;

    bool isLiteral() const;

    /**
     * @brief Human readable criteria, used in logs
     */
    std::string describeCriteria() const;

private:
    std::string targetStateName_;
    CriteriaPredicate criteria_;
    AcceptFunction accept_;
    std::optional<Value> literal_;
};

}  // namespace ACE
