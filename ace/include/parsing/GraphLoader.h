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
#include "parsing/FunctionRegistry.h"
#include "runtime/AutomatonEngine.h"
#include "runtime/EngineConfig.h"
#include <memory>
#include <string>
#include <vector>

namespace ACE {

/**
 * @brief Engine settings and state configurations read from a JSON document
 */
struct GraphDefinition {
    EngineConfig config;
    std::vector<StateConfig> states;
};

/**
 * @brief Loads state graphs from JSON
 *
 * Document layout:
 * @code
 * {
 *   "machine": {"name": "stoplight", "maxHistory": 3},
 *   "states": [
 *     {"name": "red", "isInitial": true,
 *      "outgoingTransitions": [{"state": "yellow", "criteria": "timer"}]},
 *     {"name": "done", "isTerminal": true, "accept": "emitTotal"}
 *   ]
 * }
 * @endcode
 *
 * A criteria object of the form {"predicate": "<name>"} and every "accept"
 * string are bound through the FunctionRegistry. Any other criteria is a
 * literal matched with strict equality.
 */
class GraphLoader {
public:
    /**
     * @brief Constructor
     * @param registry Named predicates and accept functions, an empty registry when nullptr
     */
    explicit GraphLoader(std::shared_ptr<FunctionRegistry> registry = nullptr);

    ~GraphLoader();

    /**
     * @brief Read a parsed JSON document
     * @throws std::invalid_argument on a malformed document or an unknown function name
     */
    GraphDefinition load(const Value &document) const;

    /**
     * @brief Parse and read a JSON string
     * @throws std::invalid_argument on a JSON syntax error or a malformed document
     */
    GraphDefinition loadFromString(const std::string &content) const;

    /**
     * @brief Read a JSON file
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument on a JSON syntax error or a malformed document
     */
    GraphDefinition loadFromFile(const std::string &filePath) const;

    /**
     * @brief Add the definition's states to an existing engine, in document order
     *
     * The definition's machine settings are not applied; they are fixed at
     * engine construction.
     */
    static void populate(AutomatonEngine &engine, const GraphDefinition &definition);

    /**
     * @brief Create an engine from the definition's settings and states
     */
    static std::shared_ptr<AutomatonEngine> createEngine(const GraphDefinition &definition,
                                                         std::shared_ptr<IContinuationScheduler> scheduler = nullptr);

    std::shared_ptr<FunctionRegistry> getRegistry() const {
        return registry_;
    }

private:
    StateConfig parseState(const Value &object, size_t index) const;
    TransitionConfig parseTransition(const Value &object, const std::string &stateName, size_t index) const;
    Criteria parseCriteria(const Value &criteria, const std::string &stateName, const std::string &target) const;
    AcceptFunction resolveAccept(const Value &accept, const std::string &owner) const;

    std::shared_ptr<FunctionRegistry> registry_;
};

}  // namespace ACE
