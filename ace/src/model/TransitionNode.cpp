// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

// TransitionNode.cpp
#include "model/TransitionNode.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <utility>

ACE::TransitionNode::TransitionNode(const std::string &targetStateName, CriteriaPredicate criteria,
                                    AcceptFunction accept, std::optional<Value> literal)
    : targetStateName_(targetStateName), criteria_(std::move(criteria)), accept_(std::move(accept)),
      literal_(std::move(literal)) {
    LOG_TRACE("Creating transition node: -> {} when {}", targetStateName_, describeCriteria());
}

const std::string &ACE::TransitionNode::getTargetStateName() const {
    return targetStateName_;
}

bool ACE::TransitionNode::matches(const Value &input, const StateNode *previousState) const {
    return criteria_ && criteria_(input, previousState);
}

bool ACE::TransitionNode::hasAccept() const {
    return static_cast<bool>(accept_);
}

std::optional<ACE::Value> ACE::TransitionNode::accept(const Value &input, const History &history) const {
    if (!accept_) {
        return std::nullopt;
    }
    return accept_(input, history);
}

bool ACE::TransitionNode::isLiteral() const {
    return literal_.has_value();
}

std::string ACE::TransitionNode::describeCriteria() const {
    if (literal_) {
        return "input == " + JsonUtils::toCompactString(*literal_);
    }
    return "<predicate>";
}
