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
#include "model/StateNode.h"
#include "runtime/EngineConfig.h"
#include "runtime/IContinuationScheduler.h"
#include "runtime/IEngineObserver.h"
#include "runtime/TaskQueue.h"
#include "runtime/TransitionHistory.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ACE {

/**
 * @brief Deterministic finite-state-machine engine
 *
 * Owns a graph of named states, consumes one input per next() call, resolves
 * the first matching outgoing transition of the current state and reports the
 * outcome through IEngineObserver notifications, the returned StepOutcome and
 * an optional deferred continuation.
 *
 * Transitions are tried in declaration order and the first match wins.
 * Criteria of one state should be mutually exclusive for the machine to be
 * deterministic; this is not checked. Put the most probable transitions first.
 *
 * Graph errors (malformed states, duplicate names, a second root) throw.
 * Errors on live input (no matching transition, unknown target) are reported
 * through onRuntimeError and recovered by a reset.
 *
 * Not thread-safe: one driver feeds input at a time.
 *
 * Example:
 * @code
 * ACE::AutomatonEngine engine({.name = "vending-machine", .maxHistory = 10});
 * engine.addStates({zero, five, ten});
 * auto outcome = engine.next(0.05);
 * @endcode
 */
class AutomatonEngine {
public:
    /**
     * @brief Constructor
     * @param config Engine settings
     * @param scheduler Scheduler for continuations, an internal TaskQueue when nullptr
     */
    explicit AutomatonEngine(EngineConfig config = {}, std::shared_ptr<IContinuationScheduler> scheduler = nullptr);

    ~AutomatonEngine();

    AutomatonEngine(const AutomatonEngine &) = delete;
    AutomatonEngine &operator=(const AutomatonEngine &) = delete;

    /**
     * @brief Create a state and add it to the graph
     *
     * Adding the initial state sets the current state to the root.
     *
     * @param config State configuration
     * @throws std::invalid_argument on malformed config, duplicate name or a second root
     */
    void addState(const StateConfig &config);

    /**
     * @brief Add states in order
     * @throws std::invalid_argument as addState(); states added before the failure stay registered
     */
    void addStates(const std::vector<StateConfig> &configs);

    /**
     * @brief Feed one input to the machine
     *
     * @param input Input value
     * @param continuation Optional callback posted to the scheduler with the committed outcome
     * @return Committed outcome of this step
     * @throws std::logic_error if no initial state has been added
     */
    StepOutcome next(const Value &input, Continuation continuation = nullptr);

    /**
     * @brief Return the machine to its root and start a new history
     *
     * @return Name of the state left behind and the history since the previous reset
     * @throws std::logic_error if no initial state has been added
     */
    ResetInfo reset();

    /**
     * @brief Snapshot of the current state name and history
     * @throws std::logic_error if no initial state has been added
     */
    EngineStatus currentStatus() const;

    /**
     * @brief Look up a state by name
     * @return State, nullptr if unknown
     */
    const StateNode *getStateByName(const std::string &name) const;

    /**
     * @brief Names of all states in the order they were added
     */
    const std::vector<std::string> &getStateNames() const;

    /**
     * @brief Eagerly check the graph
     *
     * Reports a missing root and transitions whose target is not registered.
     * Traversal still resolves targets lazily; this pass only reports.
     *
     * @return One message per problem, empty when the graph is consistent
     */
    std::vector<std::string> validateGraph() const;

    bool isInitialized() const {
        return root_ != nullptr;
    }

    const EngineConfig &getConfig() const {
        return config_;
    }

    const std::string &getName() const {
        return config_.name;
    }

    std::shared_ptr<IContinuationScheduler> getScheduler() const {
        return scheduler_;
    }

    /**
     * @brief Drain the internal TaskQueue for one tick
     *
     * Only meaningful when no scheduler was injected; an injected scheduler is
     * drained by its owner and this returns 0.
     *
     * @return Number of continuations run
     */
    size_t runPendingContinuations();

    void addObserver(IEngineObserver *observer);
    void removeObserver(IEngineObserver *observer);

private:
    struct Edge {
        const StateNode *target = nullptr;
        const TransitionNode *transition = nullptr;
    };

    /**
     * @brief Find the first transition of currentState matching input
     *
     * Short-circuits on the first match. A transition naming an unknown state
     * raises a runtime error and stops the search with no match.
     */
    Edge findNextState(const Value &input, const StateNode &currentState, const StateNode *previousState);

    /**
     * @brief Run the transition accept, move to the target and record history
     */
    void commitTransition(const Value &input, const StateNode &target, const TransitionNode &transition,
                          StepOutcome &outcome);

    void produceValue(const Value &value, StepOutcome &outcome);
    void finishStep(StepOutcome &outcome, Continuation continuation);

    [[noreturn]] void throwFatalError(const std::string &message) const;
    void emitError(const std::string &message, const Value &input);
    void trace(const std::string &message) const;
    std::string label() const;

    void forEachObserver(const char *what, const std::function<void(IEngineObserver &)> &notify);
    void notifyStateChange(const StateChangeInfo &info);
    void notifyReset(const ResetInfo &info);
    void notifyValueProduced(const Value &value);
    void notifyRuntimeError(const RuntimeErrorInfo &info);

    EngineConfig config_;
    std::shared_ptr<IContinuationScheduler> scheduler_;
    std::shared_ptr<TaskQueue> defaultQueue_;

    // States are stored by name for fast reference and duplicate checks
    std::unordered_map<std::string, std::shared_ptr<StateNode>> states_;
    std::vector<std::string> stateOrder_;

    const StateNode *root_ = nullptr;
    const StateNode *current_ = nullptr;
    const StateNode *previous_ = nullptr;
    TransitionHistory history_;

    std::vector<IEngineObserver *> observers_;
};

}  // namespace ACE
