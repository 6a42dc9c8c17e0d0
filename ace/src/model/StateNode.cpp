// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "model/StateNode.h"
#include "common/Logger.h"
#include <stdexcept>
#include <utility>

ACE::StateNode::StateNode(const StateConfig &config)
    : name_(config.name), isInitial_(config.isInitial), isTerminal_(config.isTerminal), accept_(config.accept) {
    validateConfig(config);

    transitions_.reserve(config.outgoingTransitions.size());
    for (const auto &transition : config.outgoingTransitions) {
        const auto &criteria = *transition.criteria;

        if (const auto *literal = std::get_if<Value>(&criteria)) {
            // Replace the value-based criteria with a strict comparison
            Value expected = *literal;
            auto predicate = [expected](const Value &input, const StateNode *) { return input == expected; };
            transitions_.push_back(std::make_shared<TransitionNode>(transition.targetStateName, std::move(predicate),
                                                                    transition.accept, expected));
        } else {
            transitions_.push_back(std::make_shared<TransitionNode>(
                transition.targetStateName, std::get<CriteriaPredicate>(criteria), transition.accept));
        }
    }

    LOG_DEBUG("Created state {} (initial={}, terminal={}, transitions={}, accepting={})", name_, isInitial_,
              isTerminal_, transitions_.size(), hasAccept());
}

ACE::StateNode::~StateNode() = default;

void ACE::StateNode::validateConfig(const StateConfig &config) {
    if (config.name.empty()) {
        throw std::invalid_argument("[ACE] States must have a name");
    }

    const std::string label = "[ACE:" + config.name + "] ";

    if (config.isInitial && config.isTerminal) {
        throw std::invalid_argument(label + "States cannot be both a terminal node and the root node.");
    }

    // Every outgoing transition needs a target and a way to compare input
    for (const auto &transition : config.outgoingTransitions) {
        if (transition.targetStateName.empty()) {
            throw std::invalid_argument(label + "All outgoing transitions must have a target state specified by name.");
        }

        const auto *literal = transition.criteria ? std::get_if<Value>(&*transition.criteria) : nullptr;
        if (!transition.criteria || (literal && literal->is_null())) {
            throw std::invalid_argument(label + "All outgoing transitions must have some criteria for transition. "
                                                "The following did not have one: " +
                                        transition.targetStateName);
        }

        if (const auto *predicate = std::get_if<CriteriaPredicate>(&*transition.criteria); predicate && !*predicate) {
            throw std::invalid_argument(label + "Criteria for the transition to " + transition.targetStateName +
                                        " must be a callable predicate or a literal value.");
        }
    }

    if (config.isTerminal && !config.outgoingTransitions.empty()) {
        throw std::invalid_argument(label + "States cannot be terminal and have outgoing transitions");
    }
}

const std::string &ACE::StateNode::getName() const {
    return name_;
}

bool ACE::StateNode::isInitial() const {
    return isInitial_;
}

bool ACE::StateNode::isTerminal() const {
    return isTerminal_;
}

const std::vector<std::shared_ptr<ACE::TransitionNode>> &ACE::StateNode::getTransitions() const {
    return transitions_;
}

bool ACE::StateNode::hasAccept() const {
    return static_cast<bool>(accept_);
}

std::optional<ACE::Value> ACE::StateNode::accept(const Value &input, const History &history) const {
    if (!accept_) {
        return std::nullopt;
    }
    return accept_(input, history);
}
