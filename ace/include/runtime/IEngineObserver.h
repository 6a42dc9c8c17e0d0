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

namespace ACE {

/**
 * @brief Observer interface for engine notifications
 *
 * Decouples downstream collaborators (a token stream adapter, a debugger)
 * from the engine. Notifications are delivered synchronously from inside
 * next()/reset(), in registration order.
 */
class IEngineObserver {
public:
    virtual ~IEngineObserver() = default;

    /**
     * @brief Called after a transition has been committed
     * @param info Source, target, input, history and transition side-effect value
     */
    virtual void onStateChange(const StateChangeInfo &info) = 0;

    /**
     * @brief Called when the machine returns to its root
     * @param info State left behind and the history of the finished run
     */
    virtual void onReset(const ResetInfo &info) = 0;

    /**
     * @brief Called for each value produced by a state or transition accept
     */
    virtual void onValueProduced(const Value &value) = 0;

    /**
     * @brief Called for non-fatal traversal errors; a reset always follows
     */
    virtual void onRuntimeError(const RuntimeErrorInfo &info) = 0;
};

}  // namespace ACE
