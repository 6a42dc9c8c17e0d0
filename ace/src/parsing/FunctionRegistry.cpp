// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "parsing/FunctionRegistry.h"
#include "common/Logger.h"
#include <algorithm>
#include <mutex>
#include <utility>

namespace ACE {

bool FunctionRegistry::registerPredicate(const std::string &name, CriteriaPredicate predicate) {
    if (name.empty() || !predicate) {
        LOG_ERROR("FunctionRegistry: Cannot register predicate with empty name or function");
        return false;
    }

    // Use unique lock for write operations
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!predicates_.emplace(name, std::move(predicate)).second) {
        LOG_WARN("FunctionRegistry: Predicate '{}' already registered", name);
        return false;
    }

    LOG_DEBUG("FunctionRegistry: Registered predicate '{}'", name);
    return true;
}

bool FunctionRegistry::registerAccept(const std::string &name, AcceptFunction accept) {
    if (name.empty() || !accept) {
        LOG_ERROR("FunctionRegistry: Cannot register accept function with empty name or function");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!accepts_.emplace(name, std::move(accept)).second) {
        LOG_WARN("FunctionRegistry: Accept function '{}' already registered", name);
        return false;
    }

    LOG_DEBUG("FunctionRegistry: Registered accept function '{}'", name);
    return true;
}

bool FunctionRegistry::hasPredicate(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return predicates_.find(name) != predicates_.end();
}

bool FunctionRegistry::hasAccept(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return accepts_.find(name) != accepts_.end();
}

CriteriaPredicate FunctionRegistry::getPredicate(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = predicates_.find(name);
    if (it == predicates_.end()) {
        return nullptr;
    }
    return it->second;
}

AcceptFunction FunctionRegistry::getAccept(const std::string &name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = accepts_.find(name);
    if (it == accepts_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> FunctionRegistry::getPredicateNames() const {
    std::vector<std::string> names;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    names.reserve(predicates_.size());
    for (const auto &[name, predicate] : predicates_) {
        names.push_back(name);
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> FunctionRegistry::getAcceptNames() const {
    std::vector<std::string> names;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    names.reserve(accepts_.size());
    for (const auto &[name, accept] : accepts_) {
        names.push_back(name);
    }

    std::sort(names.begin(), names.end());
    return names;
}

void FunctionRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    predicates_.clear();
    accepts_.clear();
}

}  // namespace ACE
