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
#include <optional>
#include <string>
#include <vector>
#include "value.h"
#include "persist_result.h"
#include "durable_document.h"
#include "legacy_store.h"

namespace prefvault {
    namespace persist {

        // One row of the legacy import table. The target type is the
        // semantic type of key; fallback is used when the legacy store has
        // no value (nullopt: leave the key unset).
        struct LegacyMapping {
            std::string          legacy_key;
            Key                  key;
            std::optional<Value> fallback;
        };

        const std::vector<LegacyMapping>& default_legacy_mappings();

        /**
         * One-time import from the legacy preference store.
         *
         *   NotStarted -> Snapshotting -> Importing -> Writing -> Committed
         *                                                     \-> RolledBack
         *   NotStarted -> Skipped            (flag already set)
         *
         * Import never replaces a key that already holds a value other than
         * the mapping's fallback, so a run interrupted after Writing and
         * before the flag is recorded converges when retried. A failed
         * write restores both the in-memory map and the primary document.
         */
        class MigrationEngine {
        public:
            enum class State : uint8_t {
                NotStarted,
                Snapshotting,
                Importing,
                Writing,
                Committed,
                RolledBack,
                Skipped
            };

            struct Report {
                State         state = State::NotStarted;
                size_t        imported = 0;          // keys written from legacy values or fallbacks
                size_t        kept_existing = 0;     // keys left alone because they already held data
                bool          flag_recorded = false;
                PersistResult result;
            };

            MigrationEngine(DurableDocument& doc, LegacyStore& legacy,
                            std::vector<LegacyMapping> mappings = default_legacy_mappings(),
                            std::string flag_name = "");

            bool needed() const;

            // values is the live in-memory store; on rollback it is restored
            Report run(ValueMap& values);

            State state() const { return state_; }

        private:
            bool snapshot();
            void import(ValueMap& values, Report& report);
            void commit(Report& report);
            void rollback(ValueMap& values, const ValueMap& snapshot, Report& report);

            DurableDocument& doc_;
            LegacyStore& legacy_;
            std::vector<LegacyMapping> mappings_;
            std::string flag_name_;
            State state_ = State::NotStarted;
            bool had_primary_ = false;
        };

        const char* migration_state_name(MigrationEngine::State s);

    } // namespace persist
} // namespace prefvault
