/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/environment.hpp"
#include <cstring>

namespace wa {

std::string Environment::get(const std::string& key, const std::string& def) const {
    auto it = vars.find(key);
    return it == vars.end() ? def : it->second;
}

bool Environment::has(const std::string& key) const {
    return vars.count(key) != 0;
}

Environment environment_from_cgi(char** envp, std::istream* input) {
    Environment env;
    env.input = input;
    for (char** p = envp; p && *p; ++p) {
        const char* eq = std::strchr(*p, '=');
        if (!eq) continue;
        env.vars[std::string(*p, eq - *p)] = std::string(eq + 1);
    }
    return env;
}

} // namespace wa
