// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/AutomatonEngine.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace ACE {

AutomatonEngine::AutomatonEngine(EngineConfig config, std::shared_ptr<IContinuationScheduler> scheduler)
    : config_(std::move(config)), scheduler_(std::move(scheduler)), history_(config_.maxHistory) {
    if (!scheduler_) {
        defaultQueue_ = std::make_shared<TaskQueue>();
        scheduler_ = defaultQueue_;
    }

    LOG_DEBUG("{} Engine created (maxHistory={}, resetAtRoot={})", label(), config_.maxHistory,
              config_.resetAtRoot);
}

AutomatonEngine::~AutomatonEngine() = default;

void AutomatonEngine::addState(const StateConfig &config) {
    auto state = std::make_shared<StateNode>(config);
    const std::string &name = state->getName();

    if (states_.find(name) != states_.end()) {
        throwFatalError("The state \"" + name + "\" has already been defined.");
    }

    if (state->isInitial() && root_) {
        throwFatalError("Cannot redefine root node with state: " + name);
    }

    states_.emplace(name, state);
    stateOrder_.push_back(name);

    // The root is the starting point whenever the machine is reset
    if (state->isInitial()) {
        root_ = state.get();
        current_ = root_;
        previous_ = nullptr;
        history_.restart(root_->getName());
        LOG_DEBUG("{} Root state set to {}", label(), name);
    }

    LOG_DEBUG("{} Added state {} ({} states)", label(), name, states_.size());
}

void AutomatonEngine::addStates(const std::vector<StateConfig> &configs) {
    for (const auto &config : configs) {
        addState(config);
    }
}

StepOutcome AutomatonEngine::next(const Value &input, Continuation continuation) {
    if (!current_) {
        throw std::logic_error(label() + " Cannot start processing data without a starting state.");
    }

    StepOutcome outcome;
    const StateNode &source = *current_;
    Edge edge = findNextState(input, source, previous_);

    // Dead end: the machine's state is invalid and must be reset
    if (!edge.target) {
        emitError("Cannot find valid transition from: \"" + source.getName() +
                      "\" with input: " + JsonUtils::toCompactString(input),
                  input);

        outcome.resetInfo = reset();
        finishStep(outcome, std::move(continuation));
        return outcome;
    }

    outcome.matched = true;

    if (edge.target->hasAccept()) {
        if (auto value = edge.target->accept(input, history_.snapshot())) {
            produceValue(*value, outcome);
        }
    }

    commitTransition(input, *edge.target, *edge.transition, outcome);

    if (edge.target->isTerminal() || (edge.target->isInitial() && config_.resetAtRoot)) {
        outcome.resetInfo = reset();
    }

    finishStep(outcome, std::move(continuation));
    return outcome;
}

AutomatonEngine::Edge AutomatonEngine::findNextState(const Value &input, const StateNode &currentState,
                                                     const StateNode *previousState) {
    for (const auto &transition : currentState.getTransitions()) {
        auto it = states_.find(transition->getTargetStateName());

        if (it == states_.end()) {
            // An edge leads to a non-existent node
            emitError("The current state: \"" + currentState.getName() +
                          "\" specified an outbound transition that does not exist: \"" +
                          transition->getTargetStateName() + "\"",
                      input);
            return {};
        }

        if (transition->matches(input, previousState)) {
            return {it->second.get(), transition.get()};
        }
    }

    return {};
}

void AutomatonEngine::commitTransition(const Value &input, const StateNode &target, const TransitionNode &transition,
                                       StepOutcome &outcome) {
    const StateNode *source = current_;

    // The transition action fires before the machine moves
    std::optional<Value> sideEffect;
    if (transition.hasAccept()) {
        sideEffect = transition.accept(input, history_.snapshot());
        if (sideEffect) {
            produceValue(*sideEffect, outcome);
        }
    }

    previous_ = source;
    current_ = &target;
    history_.record(target.getName(), input);

    trace(std::format("{} -> {} on {}", source->getName(), target.getName(), JsonUtils::toCompactString(input)));

    StateChangeInfo info;
    info.from = source->getName();
    info.to = target.getName();
    info.input = input;
    info.history = history_.snapshot();
    info.transitionSideEffectValue = std::move(sideEffect);
    notifyStateChange(info);
}

void AutomatonEngine::produceValue(const Value &value, StepOutcome &outcome) {
    outcome.producedValues.push_back(value);
    notifyValueProduced(value);
}

void AutomatonEngine::finishStep(StepOutcome &outcome, Continuation continuation) {
    outcome.currentStateName = current_->getName();
    outcome.history = history_.snapshot();

    if (continuation) {
        // Runs after this call returns, with the outcome as committed now
        scheduler_->post([continuation = std::move(continuation), outcome]() { continuation(outcome); });
    }
}

ResetInfo AutomatonEngine::reset() {
    if (!root_) {
        throw std::logic_error(label() + " Cannot reset a machine without a starting state.");
    }

    ResetInfo info;
    info.priorStateName = current_ ? current_->getName() : root_->getName();

    previous_ = nullptr;
    current_ = root_;
    info.history = history_.restart(root_->getName());

    trace(std::format("Reset from {} after {} record(s)", info.priorStateName, info.history.size()));
    notifyReset(info);
    return info;
}

EngineStatus AutomatonEngine::currentStatus() const {
    if (!current_) {
        throw std::logic_error(label() + " Machine has no starting state.");
    }
    return EngineStatus{current_->getName(), history_.snapshot()};
}

const StateNode *AutomatonEngine::getStateByName(const std::string &name) const {
    auto it = states_.find(name);
    return it != states_.end() ? it->second.get() : nullptr;
}

const std::vector<std::string> &AutomatonEngine::getStateNames() const {
    return stateOrder_;
}

std::vector<std::string> AutomatonEngine::validateGraph() const {
    std::vector<std::string> problems;

    if (!root_) {
        problems.push_back(label() + " No initial state defined");
    }

    for (const auto &name : stateOrder_) {
        const auto &state = states_.at(name);
        for (const auto &transition : state->getTransitions()) {
            if (states_.find(transition->getTargetStateName()) == states_.end()) {
                problems.push_back(label() + " State \"" + name + "\" has a transition to undefined state \"" +
                                   transition->getTargetStateName() + "\"");
            }
        }
    }

    for (const auto &problem : problems) {
        LOG_WARN("{}", problem);
    }
    return problems;
}

size_t AutomatonEngine::runPendingContinuations() {
    return defaultQueue_ ? defaultQueue_->runPending() : 0;
}

void AutomatonEngine::addObserver(IEngineObserver *observer) {
    if (!observer) {
        LOG_ERROR("{} Cannot add null observer", label());
        return;
    }

    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void AutomatonEngine::removeObserver(IEngineObserver *observer) {
    auto it = std::find(observers_.begin(), observers_.end(), observer);
    if (it != observers_.end()) {
        observers_.erase(it);
    } else {
        LOG_DEBUG("{} Observer not found for removal", label());
    }
}

void AutomatonEngine::throwFatalError(const std::string &message) const {
    throw std::invalid_argument(label() + " " + message);
}

void AutomatonEngine::emitError(const std::string &message, const Value &input) {
    RuntimeErrorInfo info;
    info.message = label() + " " + message;
    info.currentStateName = current_ ? current_->getName() : "";
    info.input = input;

    LOG_ERROR("{}", info.message);
    notifyRuntimeError(info);
}

void AutomatonEngine::trace(const std::string &message) const {
    if (config_.debug) {
        LOG_INFO("{} {}", label(), message);
    } else {
        LOG_DEBUG("{} {}", label(), message);
    }
}

std::string AutomatonEngine::label() const {
    return "[ACE:" + config_.name + "]";
}

// Observer exceptions are logged and never abort a step. Callbacks may attach
// or detach observers: the fan-out walks a snapshot and skips anything detached
// since it started.
void AutomatonEngine::forEachObserver(const char *what, const std::function<void(IEngineObserver &)> &notify) {
    const std::vector<IEngineObserver *> snapshot = observers_;
    for (auto *observer : snapshot) {
        if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
            continue;
        }
        try {
            notify(*observer);
        } catch (const std::exception &e) {
            LOG_ERROR("{} Observer exception during {} notification: {}", label(), what, e.what());
        }
    }
}

void AutomatonEngine::notifyStateChange(const StateChangeInfo &info) {
    forEachObserver("state change", [&info](IEngineObserver &observer) { observer.onStateChange(info); });
}

void AutomatonEngine::notifyReset(const ResetInfo &info) {
    forEachObserver("reset", [&info](IEngineObserver &observer) { observer.onReset(info); });
}

void AutomatonEngine::notifyValueProduced(const Value &value) {
    forEachObserver("value", [&value](IEngineObserver &observer) { observer.onValueProduced(value); });
}

void AutomatonEngine::notifyRuntimeError(const RuntimeErrorInfo &info) {
    forEachObserver("error", [&info](IEngineObserver &observer) { observer.onRuntimeError(info); });
}

}  // namespace ACE
