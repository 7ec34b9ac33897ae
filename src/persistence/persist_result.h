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
#include <cstdint>
#include <string>
#include <utility>

namespace prefvault {
    namespace persist {

        enum class PersistError : uint8_t {
            None      = 0,
            Decode    = 1,   // document unreadable or malformed
            Write     = 2,   // durable write failed (disk full, permissions, I/O)
            Migration = 3    // write during migration failed, rolled back
        };

        inline const char* persist_error_name(PersistError e) {
            switch (e) {
                case PersistError::None:      return "None";
                case PersistError::Decode:    return "DecodeError";
                case PersistError::Write:     return "WriteError";
                case PersistError::Migration: return "MigrationError";
            }
            return "Unknown";
        }

        // Outcome of a document-level operation. err carries errno when
        // the failure came from the file system, 0 otherwise.
        struct PersistResult {
            bool         ok = true;
            PersistError error = PersistError::None;
            int          err = 0;
            std::string  message;

            explicit operator bool() const { return ok; }

            static PersistResult success() { return {}; }

            static PersistResult failure(PersistError e, int err, std::string msg) {
                PersistResult r;
                r.ok = false;
                r.error = e;
                r.err = err;
                r.message = std::move(msg);
                return r;
            }
        };

    } // namespace persist
} // namespace prefvault
