/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/internal/time.hpp"
#include <cstdio>

namespace wa::internal {

std::string http_date(std::time_t t) {
    static const char* kDays[]   = {"Sun","Mon","Tue","Wed","Thu","Fri","Sat"};
    static const char* kMonths[] = {"Jan","Feb","Mar","Apr","May","Jun",
                                    "Jul","Aug","Sep","Oct","Nov","Dec"};
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    // strftime would localise day/month names.
    char buf[40]{0};
    const int n = std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                                kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon],
                                tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf, n > 0 ? (std::size_t)n : 0);
}

} // namespace wa::internal
