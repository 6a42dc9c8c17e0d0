// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "runtime/EngineConfig.h"
#include "common/JsonUtils.h"
#include <stdexcept>

namespace ACE {

EngineConfig EngineConfig::fromJson(const Value &object) {
    if (!object.is_object()) {
        throw std::invalid_argument("[ACE] Machine configuration must be a JSON object");
    }

    EngineConfig config;

    if (JsonUtils::hasKey(object, "name")) {
        if (!object["name"].is_string()) {
            throw std::invalid_argument("[ACE] Machine 'name' must be a string");
        }
        config.name = object["name"].get<std::string>();
    }

    if (JsonUtils::hasKey(object, "maxHistory")) {
        const auto &maxHistory = object["maxHistory"];
        if (!maxHistory.is_number_integer() ||
            (!maxHistory.is_number_unsigned() && maxHistory.get<long long>() < 0)) {
            throw std::invalid_argument("[ACE] Machine 'maxHistory' must be a non-negative integer");
        }
        config.maxHistory = maxHistory.get<size_t>();
    }

    for (const char *key : {"resetAtRoot", "debug"}) {
        if (JsonUtils::hasKey(object, key) && !object[key].is_boolean()) {
            throw std::invalid_argument(std::string("[ACE] Machine '") + key + "' must be a boolean");
        }
    }

    config.resetAtRoot = JsonUtils::getBool(object, "resetAtRoot", false);
    config.debug = JsonUtils::getBool(object, "debug", false);

    return config;
}

}  // namespace ACE
