// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include "runtime/AutomatonEngine.h"
#include <memory>
#include <vector>

namespace ACE {

/**
 * @brief Builder pattern for AutomatonEngine construction with dependency injection
 *
 * Observers are not owned; the caller keeps them alive for the engine's lifetime.
 */
class AutomatonEngineBuilder {
private:
    EngineConfig config_;
    std::shared_ptr<IContinuationScheduler> scheduler_;
    std::vector<IEngineObserver *> observers_;
    std::vector<StateConfig> states_;

public:
    AutomatonEngineBuilder() = default;

    /**
     * @brief Set engine settings
     * @param config Name, history bound and reset policy
     * @return Reference to builder for method chaining
     */
    AutomatonEngineBuilder &withConfig(const EngineConfig &config) {
        config_ = config;
        return *this;
    }

    /**
     * @brief Set scheduler for deferred continuations
     * @param scheduler Shared pointer to scheduler, engine-owned TaskQueue when unset
     * @return Reference to builder for method chaining
     */
    AutomatonEngineBuilder &withScheduler(std::shared_ptr<IContinuationScheduler> scheduler) {
        scheduler_ = scheduler;
        return *this;
    }

    AutomatonEngineBuilder &withObserver(IEngineObserver *observer) {
        observers_.push_back(observer);
        return *this;
    }

    /**
     * @brief Append states to be added in order at build time
     * @return Reference to builder for method chaining
     */
    AutomatonEngineBuilder &withStates(const std::vector<StateConfig> &states) {
        states_.insert(states_.end(), states.begin(), states.end());
        return *this;
    }

    /**
     * @brief Build AutomatonEngine with injected dependencies
     *
     * Observers are attached before states are added.
     *
     * @return Shared pointer to AutomatonEngine
     * @throws std::invalid_argument if a state configuration is rejected
     */
    std::shared_ptr<AutomatonEngine> build() {
        auto engine = std::make_shared<AutomatonEngine>(config_, scheduler_);

        for (auto *observer : observers_) {
            engine->addObserver(observer);
        }

        engine->addStates(states_);
        return engine;
    }
};

}  // namespace ACE
