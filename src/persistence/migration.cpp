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

#include "migration.h"
#include "config.h"
#include "platform_fs.h"
#include "../util/log.h"

#include <stdexcept>

namespace prefvault {
    namespace persist {

        const std::vector<LegacyMapping>& default_legacy_mappings() {
            static const std::vector<LegacyMapping> table = {
                // Bool migrations
                { "chameleonEnabled",          Key::ChameleonEnabled,    Value{true} },
                { "liquidGlass",               Key::LiquidGlass,         Value{false} },
                { "hapticEnabled",             Key::HapticEnabled,       Value{true} },
                { "gestureEyeEnabled",         Key::GestureEyeEnabled,   Value{false} },

                // Array migrations
                { "excluded_apps",             Key::ExcludedApps,        std::nullopt },
                { "TipEngine.seenTipIDs",      Key::SeenTipIds,          std::nullopt },

                // Dict migrations
                { "menubar_redundancies",      Key::MenuBarRedundancies, std::nullopt },

                // String migrations
                { "notchTheme",                Key::NotchTheme,          std::nullopt },
                { "notch.relay.base_url",      Key::RelayBaseUrl,        std::nullopt },
                { "notch.relay.device_token",  Key::RelayDeviceToken,    std::nullopt },
                { "notch.relay.api_key",       Key::RelayApiKey,         std::nullopt },
                { "notch.rescuetime.api_key",  Key::RescueTimeApiKey,    std::nullopt },
            };
            return table;
        }

        const char* migration_state_name(MigrationEngine::State s) {
            switch (s) {
                case MigrationEngine::State::NotStarted:   return "NotStarted";
                case MigrationEngine::State::Snapshotting: return "Snapshotting";
                case MigrationEngine::State::Importing:    return "Importing";
                case MigrationEngine::State::Writing:      return "Writing";
                case MigrationEngine::State::Committed:    return "Committed";
                case MigrationEngine::State::RolledBack:   return "RolledBack";
                case MigrationEngine::State::Skipped:      return "Skipped";
            }
            return "Unknown";
        }

        MigrationEngine::MigrationEngine(DurableDocument& doc, LegacyStore& legacy,
                                         std::vector<LegacyMapping> mappings,
                                         std::string flag_name)
            : doc_(doc), legacy_(legacy), mappings_(std::move(mappings)),
              flag_name_(flag_name.empty() ? migration::kFlagName : std::move(flag_name)) {
            for (const auto& m : mappings_) {
                if (key_type(m.key) == ValueType::Blob) {
                    throw std::invalid_argument("legacy mapping '" + m.legacy_key +
                                                "' targets a blob key");
                }
                if (m.fallback && value_type(*m.fallback) != key_type(m.key)) {
                    throw std::invalid_argument("legacy mapping '" + m.legacy_key +
                                                "' has a fallback of the wrong type");
                }
            }
        }

        bool MigrationEngine::needed() const {
            return !legacy_.migration_flag(flag_name_);
        }

        MigrationEngine::Report MigrationEngine::run(ValueMap& values) {
            Report report;

            if (!needed()) {
                state_ = State::Skipped;
                report.state = state_;
                return report;
            }

            info() << "Migrating from legacy preferences...";

            state_ = State::Snapshotting;
            const ValueMap snapshot_values = values;  // in-memory snapshot for rollback
            if (!snapshot()) {
                // Without a restorable copy of the primary there is no safe rollback
                report.result = PersistResult::failure(PersistError::Migration, 0,
                    "could not snapshot " + doc_.primary_path());
                state_ = State::RolledBack;
                report.state = state_;
                error() << "Migration aborted - " << report.result.message;
                return report;
            }

            state_ = State::Importing;
            import(values, report);

            state_ = State::Writing;
            PersistResult written = doc_.persist(values);
            if (written) {
                commit(report);
            } else {
                report.result = PersistResult::failure(PersistError::Migration, written.err,
                                                       written.message);
                rollback(values, snapshot_values, report);
            }

            report.state = state_;
            return report;
        }

        bool MigrationEngine::snapshot() {
            const std::string pre = doc_.pre_migration_path();
            had_primary_ = doc_.exists();

            if (!had_primary_) {
                // A leftover from an earlier attempt must not be restored later
                FSResult rm = PlatformFS::remove(pre);
                if (!rm.ok) {
                    error() << "Could not remove stale " << pre << ": " << errnoWithDescription(rm.err);
                    return false;
                }
                return true;
            }

            FSResult res = PlatformFS::copy_file(doc_.primary_path(), pre);
            if (!res.ok) {
                error() << "Could not copy " << doc_.primary_path() << " to " << pre
                        << ": " << errnoWithDescription(res.err);
                return false;
            }
            return true;
        }

        void MigrationEngine::import(ValueMap& values, Report& report) {
            for (const auto& m : mappings_) {
                const std::string name = key_name(m.key);

                auto current = values.find(name);
                if (current != values.end() &&
                    (!m.fallback || current->second != *m.fallback)) {
                    // Holds data from an earlier run or from the user
                    report.kept_existing++;
                    continue;
                }

                std::optional<Value> legacy = legacy_.read(m.legacy_key, key_type(m.key));
                if (!legacy) {
                    legacy = m.fallback;
                }
                if (!legacy) {
                    continue;
                }

                values[name] = std::move(*legacy);
                report.imported++;
            }
        }

        void MigrationEngine::commit(Report& report) {
            state_ = State::Committed;

            report.flag_recorded = legacy_.set_migration_flag(flag_name_, true);
            if (!report.flag_recorded) {
                // Document is already migrated; the next start repeats the
                // import, which leaves it unchanged.
                warning() << "Migration written but " << flag_name_ << " not recorded";
            }

            FSResult rm = PlatformFS::remove(doc_.pre_migration_path());
            if (!rm.ok) {
                warning() << "Could not remove " << doc_.pre_migration_path() << ": "
                          << errnoWithDescription(rm.err);
            }

            info() << "Migration complete (" << report.imported << " keys imported, "
                   << report.kept_existing << " kept)";
        }

        void MigrationEngine::rollback(ValueMap& values, const ValueMap& snapshot,
                                       Report& report) {
            error() << "Migration FAILED - " << report.result.message << ", rolling back";

            state_ = State::RolledBack;
            values = snapshot;  // Restore in-memory state

            const std::string pre = doc_.pre_migration_path();
            if (had_primary_) {
                FSResult res = PlatformFS::atomic_replace(pre, doc_.primary_path());
                if (!res.ok) {
                    severe() << "Could not restore " << doc_.primary_path() << " from " << pre
                             << ": " << errnoWithDescription(res.err);
                }
            } else {
                FSResult res = PlatformFS::remove(doc_.primary_path());
                if (!res.ok) {
                    severe() << "Could not remove partial " << doc_.primary_path() << ": "
                             << errnoWithDescription(res.err);
                }
            }

            report.imported = 0;
            report.kept_existing = 0;
        }

    } // namespace persist
} // namespace prefvault
