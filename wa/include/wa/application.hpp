/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include "wa/http_outcome.hpp"

namespace wa {

class Context;

// A mountable application. Overrides supply the pages that
// notfound/unavailableforlegalreasons/internalerror return when called
// without a message while this application is innermost on the stack.
class Application {
public:
    virtual ~Application() = default;

    virtual HttpOutcome notfound(Context& ctx) const;
    virtual HttpOutcome unavailableforlegalreasons(Context& ctx) const;
    virtual HttpOutcome internalerror(Context& ctx) const;
};

} // namespace wa
