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
#include <utility>
#include <variant>
#include <vector>

namespace ACE {

/**
 * @brief Transition criteria: a literal compared by equality, or a predicate
 */
using Criteria = std::variant<Value, CriteriaPredicate>;

/**
 * @brief Description of one outgoing transition before normalization
 *
 * Example:
 * @code
 * StateConfig zero{"$0.00", true};
 * zero.outgoingTransitions.push_back(TransitionConfig::onValue("$0.05", 0.05));
 * zero.outgoingTransitions.push_back(TransitionConfig::when("$0.10", [](const Value &in, const StateNode *) {
 *     return in.is_number() && in.get<double>() >= 0.10;
 * }));
 * @endcode
 */
struct TransitionConfig {
    std::string targetStateName;
    std::optional<Criteria> criteria;
    AcceptFunction accept;

    TransitionConfig() = default;

    TransitionConfig(const std::string &target, std::optional<Criteria> crit, AcceptFunction acc = nullptr)
        : targetStateName(target), criteria(std::move(crit)), accept(std::move(acc)) {}

    static TransitionConfig onValue(const std::string &target, const Value &literal, AcceptFunction acc = nullptr) {
        return TransitionConfig(target, Criteria(std::in_place_index<0>, literal), std::move(acc));
    }

    static TransitionConfig when(const std::string &target, CriteriaPredicate predicate, AcceptFunction acc = nullptr) {
        return TransitionConfig(target, Criteria(std::in_place_index<1>, std::move(predicate)), std::move(acc));
    }

    // Catch-all transition
    static TransitionConfig always(const std::string &target, AcceptFunction acc = nullptr) {
        return when(
            target, [](const Value &, const StateNode *) { return true; }, std::move(acc));
    }
};

/**
 * @brief Description of one state, validated by StateNode on construction
 */
struct StateConfig {
    std::string name;
    bool isInitial = false;
    bool isTerminal = false;
    std::vector<TransitionConfig> outgoingTransitions;
    AcceptFunction accept;

    StateConfig() = default;

    StateConfig(const std::string &stateName, bool initial = false, bool terminal = false)
        : name(stateName), isInitial(initial), isTerminal(terminal) {}
};

}  // namespace ACE
