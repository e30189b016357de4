/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <string>
#include <ctime>

namespace wa::internal {
// Cookie date "Wdy, DD Mon YYYY HH:MM:SS GMT" for the given epoch.
std::string http_date(std::time_t t);
} // namespace wa::internal
