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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ACE {

class StateNode;

/**
 * @brief Dynamically typed value used for machine input and produced values
 *
 * Equality is type-aware: a string never equals a number and a boolean never
 * equals an integer, which gives literal criteria strict-equality semantics.
 */
using Value = nlohmann::json;

/**
 * @brief One entry of the transition history
 *
 * The root entry written on reset carries a null input.
 */
struct HistoryRecord {
    std::string stateName;
    Value input;

    HistoryRecord() = default;

    HistoryRecord(const std::string &name, const Value &in) : stateName(name), input(in) {}

    bool operator==(const HistoryRecord &other) const {
        return stateName == other.stateName && input == other.input;
    }

    bool operator!=(const HistoryRecord &other) const {
        return !(*this == other);
    }
};

using History = std::vector<HistoryRecord>;

/**
 * @brief Value-producing hook of a state or transition
 *
 * Returning std::nullopt means nothing is produced for this step.
 */
using AcceptFunction = std::function<std::optional<Value>(const Value &input, const History &history)>;

/**
 * @brief Transition guard
 *
 * previousState is the state occupied before the current one, or nullptr
 * right after a reset.
 */
using CriteriaPredicate = std::function<bool(const Value &input, const StateNode *previousState)>;

/**
 * @brief Result of a reset: the state left behind and the run's history
 */
struct ResetInfo {
    std::string priorStateName;
    History history;
};

struct StateChangeInfo {
    std::string from;
    std::string to;
    Value input;
    History history;
    std::optional<Value> transitionSideEffectValue;
};

struct RuntimeErrorInfo {
    std::string message;
    std::string currentStateName;
    Value input;
};

/**
 * @brief Complete, committed outcome of a single next() call
 */
struct StepOutcome {
    bool matched = false;  // false when the step hit a dead end
    std::vector<Value> producedValues;
    std::optional<ResetInfo> resetInfo;
    std::string currentStateName;
    History history;
};

struct EngineStatus {
    std::string stateName;
    History history;
};

using Continuation = std::function<void(const StepOutcome &)>;

}  // namespace ACE
