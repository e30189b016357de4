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
#include <vector>
#include "wa/storage.hpp"
#include "wa/types.hpp"

namespace wa {

// Default for one input name. Its kind also decides how a present value
// is shaped: List keeps every submitted value, File keeps the upload
// object instead of its bytes.
class FieldDefault {
public:
    enum class Kind { Text, List, File };

    FieldDefault() = default;

    static FieldDefault text(std::string value);
    static FieldDefault list(std::vector<std::string> values = {});
    static FieldDefault file();

    Kind kind() const { return _kind; }
    Value value() const;

private:
    Kind _kind = Kind::Text;
    std::string _text;
    std::vector<std::string> _list;
};

using Defaults = OrderedMap<FieldDefault>;

/**
 * Shape a raw mapping for handler use.
 *
 * Every required name and every key of `raw`, in that order:
 *   - missing required name -> MissingFieldError
 *   - list value: kept whole under a List default, else its last element
 *   - upload: raw bytes unless the default is File
 *   - text: repaired to valid UTF-8 when `unicode`
 *   - scalar under a List default: wrapped in a one-element list
 * Keys only in `defaults` take the default value.
 */
Storage storify(const Storage& raw,
                const std::vector<std::string>& required,
                const Defaults& defaults,
                bool unicode);

} // namespace wa
