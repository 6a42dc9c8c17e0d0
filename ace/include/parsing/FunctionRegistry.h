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
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ACE {

/**
 * @brief Registry of named criteria predicates and accept functions
 *
 * JSON graph documents cannot carry code, so they refer to behaviour by name.
 * The host registers the callables under those names before loading.
 */
class FunctionRegistry {
public:
    FunctionRegistry() = default;

    // Non-copyable
    FunctionRegistry(const FunctionRegistry &) = delete;
    FunctionRegistry &operator=(const FunctionRegistry &) = delete;

    /**
     * @brief Register a transition predicate
     * @param name Name used by {"predicate": "<name>"} criteria
     * @param predicate Callable guard
     * @return false if the name is empty, the predicate is empty or the name is taken
     */
    bool registerPredicate(const std::string &name, CriteriaPredicate predicate);

    /**
     * @brief Register an accept function for states and transitions
     * @param name Name used by "accept": "<name>"
     * @param accept Value-producing callable
     * @return false if the name is empty, the function is empty or the name is taken
     */
    bool registerAccept(const std::string &name, AcceptFunction accept);

    bool hasPredicate(const std::string &name) const;
    bool hasAccept(const std::string &name) const;

    /**
     * @return Registered predicate, or an empty function if unknown
     */
    CriteriaPredicate getPredicate(const std::string &name) const;

    /**
     * @return Registered accept function, or an empty function if unknown
     */
    AcceptFunction getAccept(const std::string &name) const;

    std::vector<std::string> getPredicateNames() const;
    std::vector<std::string> getAcceptNames() const;

    /**
     * @brief Clear all registrations
     */
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CriteriaPredicate> predicates_;
    std::unordered_map<std::string, AcceptFunction> accepts_;
};

}  // namespace ACE
