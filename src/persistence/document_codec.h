/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The prefvault project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <string>
#include "value.h"
#include "persist_result.h"

namespace prefvault { 
namespace persist {

/**
 * DocumentCodec - canonical JSON encoding of a ValueMap
 *
 * Encoding is deterministic: keys sorted bytewise, two-space indent,
 * trailing newline. Blobs are written as base64 strings.
 *
 * Decoding accepts any JSON object. Entries for known keys whose JSON type
 * disagrees with the key's semantic type are dropped with a warning;
 * entries for unknown names are kept when they map onto a supported kind
 * so a newer writer's data survives a round trip through an older reader.
 */
class DocumentCodec {
public:
    static std::string encode(const ValueMap& values);

    // Replaces out only on success
    static PersistResult decode(const std::string& text, ValueMap& out);

    /**
     * Set (or add) one boolean member of the JSON object in text and
     * re-serialize it, leaving every other member as written. Used to
     * record a flag in a file this library does not own.
     */
    static PersistResult set_bool_member(const std::string& text, const std::string& name,
                                         bool value, std::string& out);

    // Single values, used by the CLI
    static std::string encode_value(const Value& value);
    static PersistResult decode_value(const std::string& text, ValueType expected, Value& out);
};

} // namespace persist
} // namespace prefvault
