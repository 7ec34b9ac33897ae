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
#include "durable_document.h"

namespace prefvault { 
    namespace persist {

        enum class LoadSource : uint8_t {
            Primary,
            Backup,
            Empty
        };

        const char* load_source_name(LoadSource s);

        struct LoadOutcome {
            ValueMap      values;
            LoadSource    source = LoadSource::Empty;
            PersistResult primary_status;   // why the primary was not used (if it wasn't)
            PersistResult backup_status;
        };

        class Recovery {
        public:
            explicit Recovery(const DurableDocument& doc) : doc_(doc) {}

            // primary -> backup -> empty. Never fails; every fallback is logged.
            LoadOutcome load() const;

        private:
            const DurableDocument& doc_;
        };

    } // namespace persist
} // namespace prefvault
