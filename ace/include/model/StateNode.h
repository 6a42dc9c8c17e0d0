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
#include "model/StateConfig.h"
#include "model/TransitionNode.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ACE {

/**
 * @brief Immutable node of the automaton graph
 *
 * Validates its own configuration on construction and normalizes literal
 * criteria into equality predicates. Never mutated by traversal.
 */
class StateNode {
public:
    /**
     * @brief Constructor
     * @param config State configuration
     * @throws std::invalid_argument if the configuration is malformed
     */
    explicit StateNode(const StateConfig &config);

    /**
     * @brief Destructor
     */
    ~StateNode();

    const std::string &getName() const;

    /**
     * @brief Is this the root node?
     */
    bool isInitial() const;

    /**
     * @brief Does entering this node reset the machine?
     */
    bool isTerminal() const;

    /**
     * @brief Return outgoing transitions in match-priority order
     * @return Read-only list of transitions
     */
    const std::vector<std::shared_ptr<TransitionNode>> &getTransitions() const;

    bool hasAccept() const;

    /**
     * @brief Invoke the state's accept function
     * @param input Input that led into this state
     * @param history History before this state is entered
     * @return Produced value, std::nullopt if absent or no accept defined
     */
    std::optional<Value> accept(const Value &input, const History &history) const;

private:
    static void validateConfig(const StateConfig &config);

    std::string name_;
    bool isInitial_;
    bool isTerminal_;
    std::vector<std::shared_ptr<TransitionNode>> transitions_;
    AcceptFunction accept_;
};

}  // namespace ACE
