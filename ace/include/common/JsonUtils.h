// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-ACE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of ACE (Automaton Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ACE {

using json = nlohmann::json;

/**
 * @brief nlohmann::json helpers used by the engine and the graph loader
 */
class JsonUtils {
public:
    /**
     * @brief Parse a document without throwing
     * @param errorOut Receives the parser message on failure when non-null
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    // Compact dump; invalid UTF-8 in strings is replaced so any input value can be printed
    static std::string toCompactString(const json &value);

    // Value of a boolean member, defaultValue when absent or of another type
    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    // True when object is an object holding key with a non-null value
    static bool hasKey(const json &object, const std::string &key);
};

}  // namespace ACE
