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

#include "recovery.h"
#include "platform_fs.h"
#include "../util/log.h"

#include <cerrno>

namespace prefvault {
    namespace persist {

        const char* load_source_name(LoadSource s) {
            switch (s) {
                case LoadSource::Primary: return "primary";
                case LoadSource::Backup:  return "backup";
                case LoadSource::Empty:   return "empty";
            }
            return "unknown";
        }

        LoadOutcome Recovery::load() const {
            LoadOutcome outcome;

            outcome.primary_status = DurableDocument::read(doc_.primary_path(), outcome.values);
            if (outcome.primary_status) {
                outcome.source = LoadSource::Primary;
                info() << "Loaded " << outcome.values.size() << " keys from " << doc_.primary_path();
                return outcome;
            }

            const bool primary_missing = outcome.primary_status.err == ENOENT;
            const bool backup_present = PlatformFS::exists(doc_.backup_path());

            if (primary_missing && !backup_present) {
                info() << "No state at " << doc_.primary_path() << ", starting fresh";
                outcome.values.clear();
                return outcome;
            }

            if (!primary_missing) {
                warning() << "Load failed - " << outcome.primary_status.message
                          << ", attempting recovery";
            }

            outcome.backup_status = DurableDocument::read(doc_.backup_path(), outcome.values);
            if (outcome.backup_status) {
                outcome.source = LoadSource::Backup;
                info() << "Recovered " << outcome.values.size() << " keys from backup";
                return outcome;
            }

            warning() << "Backup unusable - " << outcome.backup_status.message
                      << ", starting with an empty store";
            outcome.values.clear();
            outcome.source = LoadSource::Empty;
            return outcome;
        }

    } // namespace persist
} // namespace prefvault
