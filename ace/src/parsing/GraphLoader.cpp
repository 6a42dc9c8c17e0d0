// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "parsing/GraphLoader.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ACE {

GraphLoader::GraphLoader(std::shared_ptr<FunctionRegistry> registry) : registry_(std::move(registry)) {
    if (!registry_) {
        registry_ = std::make_shared<FunctionRegistry>();
    }
}

GraphLoader::~GraphLoader() = default;

GraphDefinition GraphLoader::load(const Value &document) const {
    if (!document.is_object()) {
        throw std::invalid_argument("[ACE] Graph document must be a JSON object");
    }

    GraphDefinition definition;

    if (JsonUtils::hasKey(document, "machine")) {
        definition.config = EngineConfig::fromJson(document["machine"]);
    }

    if (!JsonUtils::hasKey(document, "states") || !document["states"].is_array()) {
        throw std::invalid_argument("[ACE] Graph document must contain a 'states' array");
    }

    const auto &states = document["states"];
    definition.states.reserve(states.size());
    for (size_t i = 0; i < states.size(); ++i) {
        definition.states.push_back(parseState(states[i], i));
    }

    LOG_DEBUG("GraphLoader: Loaded machine '{}' with {} states", definition.config.name, definition.states.size());
    return definition;
}

GraphDefinition GraphLoader::loadFromString(const std::string &content) const {
    std::string error;
    auto document = JsonUtils::parseJson(content, &error);
    if (!document) {
        throw std::invalid_argument("[ACE] Invalid graph JSON: " + error);
    }
    return load(*document);
}

GraphDefinition GraphLoader::loadFromFile(const std::string &filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        LOG_ERROR("GraphLoader: Failed to open file: {}", filePath);
        throw std::runtime_error("[ACE] Cannot open graph file: " + filePath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO("GraphLoader: Loading graph from {}", filePath);
    return loadFromString(buffer.str());
}

void GraphLoader::populate(AutomatonEngine &engine, const GraphDefinition &definition) {
    engine.addStates(definition.states);
}

std::shared_ptr<AutomatonEngine> GraphLoader::createEngine(const GraphDefinition &definition,
                                                           std::shared_ptr<IContinuationScheduler> scheduler) {
    auto engine = std::make_shared<AutomatonEngine>(definition.config, std::move(scheduler));
    populate(*engine, definition);
    return engine;
}

StateConfig GraphLoader::parseState(const Value &object, size_t index) const {
    if (!object.is_object()) {
        throw std::invalid_argument("[ACE] State #" + std::to_string(index) + " must be a JSON object");
    }

    // A state without a string name cannot be referenced by transitions
    if (!JsonUtils::hasKey(object, "name") || !object["name"].is_string()) {
        throw std::invalid_argument("[ACE] State #" + std::to_string(index) + " must have a name");
    }

    StateConfig config(object["name"].get<std::string>());
    const std::string label = "[ACE:" + config.name + "] ";

    for (const char *flag : {"isInitial", "isTerminal"}) {
        if (JsonUtils::hasKey(object, flag) && !object[flag].is_boolean()) {
            throw std::invalid_argument(label + "'" + flag + "' must be a boolean");
        }
    }
    config.isInitial = JsonUtils::getBool(object, "isInitial", false);
    config.isTerminal = JsonUtils::getBool(object, "isTerminal", false);

    if (JsonUtils::hasKey(object, "outgoingTransitions")) {
        const auto &transitions = object["outgoingTransitions"];
        if (!transitions.is_array()) {
            throw std::invalid_argument(label + "Outgoing transitions must be an array.");
        }

        config.outgoingTransitions.reserve(transitions.size());
        for (size_t i = 0; i < transitions.size(); ++i) {
            config.outgoingTransitions.push_back(parseTransition(transitions[i], config.name, i));
        }
    }

    if (JsonUtils::hasKey(object, "accept")) {
        config.accept = resolveAccept(object["accept"], config.name);
    }

    return config;
}

TransitionConfig GraphLoader::parseTransition(const Value &object, const std::string &stateName,
                                              size_t index) const {
    const std::string label = "[ACE:" + stateName + "] ";

    if (!object.is_object()) {
        throw std::invalid_argument(label + "Transition #" + std::to_string(index) + " must be a JSON object");
    }

    if (!JsonUtils::hasKey(object, "state") || !object["state"].is_string()) {
        throw std::invalid_argument(label + "All outgoing transitions must have a target state specified by name.");
    }

    const std::string target = object["state"].get<std::string>();

    // Only a missing or null criteria is rejected; 0, false and "" are valid literals
    if (!JsonUtils::hasKey(object, "criteria")) {
        throw std::invalid_argument(label + "All outgoing transitions must have some criteria for transition. "
                                            "The following did not have one: " +
                                    target);
    }

    TransitionConfig config(target, parseCriteria(object["criteria"], stateName, target));

    if (JsonUtils::hasKey(object, "accept")) {
        config.accept = resolveAccept(object["accept"], stateName + " -> " + target);
    }

    return config;
}

Criteria GraphLoader::parseCriteria(const Value &criteria, const std::string &stateName,
                                    const std::string &target) const {
    if (!criteria.is_object() || !criteria.contains("predicate") || !criteria["predicate"].is_string()) {
        return Criteria(std::in_place_index<0>, criteria);
    }

    const std::string name = criteria["predicate"].get<std::string>();
    auto predicate = registry_->getPredicate(name);
    if (!predicate) {
        throw std::invalid_argument("[ACE:" + stateName + "] Unknown predicate '" + name +
                                    "' for the transition to " + target);
    }

    return Criteria(std::in_place_index<1>, std::move(predicate));
}

AcceptFunction GraphLoader::resolveAccept(const Value &accept, const std::string &owner) const {
    if (!accept.is_string()) {
        throw std::invalid_argument("[ACE:" + owner + "] Accept must name a registered function");
    }

    const std::string name = accept.get<std::string>();
    auto function = registry_->getAccept(name);
    if (!function) {
        throw std::invalid_argument("[ACE:" + owner + "] Unknown accept function '" + name + "'");
    }
    return function;
}

}  // namespace ACE
