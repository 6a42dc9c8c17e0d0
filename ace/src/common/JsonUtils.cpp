// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#include "common/JsonUtils.h"

namespace ACE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        return std::nullopt;
    }
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    const json *member = hasKey(object, key) ? &object.at(key) : nullptr;
    return member && member->is_boolean() ? member->get<bool>() : defaultValue;
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object.at(key).is_null();
}

}  // namespace ACE
