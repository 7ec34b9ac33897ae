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

#include "value.h"

#include <stdexcept>

namespace prefvault {
    namespace persist {

        namespace {
            const std::vector<KeyInfo>& key_table() {
                static const std::vector<KeyInfo> table = {
                    { Key::ChameleonEnabled,    "chameleonEnabled",          ValueType::Bool },
                    { Key::LiquidGlass,         "liquidGlass",               ValueType::Bool },
                    { Key::NotchTheme,          "notchTheme",                ValueType::String },
                    { Key::HapticEnabled,       "hapticEnabled",             ValueType::Bool },
                    { Key::GestureEyeEnabled,   "gestureEyeEnabled",         ValueType::Bool },
                    { Key::FeatureEnabled,      "featureEnabled",            ValueType::Bool },
                    { Key::ApiKey,              "apiKey",                    ValueType::String },
                    { Key::RelayBaseUrl,        "notch.relay.base_url",      ValueType::String },
                    { Key::RelayDeviceToken,    "notch.relay.device_token",  ValueType::String },
                    { Key::RelayApiKey,         "notch.relay.api_key",       ValueType::String },
                    { Key::RescueTimeApiKey,    "notch.rescuetime.api_key",  ValueType::String },
                    { Key::ExcludedApps,        "excluded_apps",             ValueType::StringList },
                    { Key::MenuBarRedundancies, "menubar_redundancies",      ValueType::BoolMap },
                    { Key::SeenTipIds,          "TipEngine.seenTipIDs",      ValueType::StringList },
                    { Key::VaultItems,          "notch_vault_items",         ValueType::Blob },
                    { Key::BrainDumpItems,      "braindump_items",           ValueType::Blob },
                    { Key::QuickNotes,          "quicknotes_items",          ValueType::Blob },
                    { Key::ScriptHistory,       "script_history",            ValueType::Blob },
                    { Key::PinnedApps,          "quicklaunch_pinned",        ValueType::Blob },
                    { Key::EvolutionGenome,     "evolution_genome",          ValueType::Blob },
                    { Key::UserProfileAccent,   "user_profile_accent",       ValueType::String },
                };
                return table;
            }
        }

        const char* value_type_name(ValueType t) {
            switch (t) {
                case ValueType::Bool:       return "bool";
                case ValueType::String:     return "string";
                case ValueType::StringList: return "string-list";
                case ValueType::BoolMap:    return "bool-map";
                case ValueType::Blob:       return "blob";
            }
            return "unknown";
        }

        const std::vector<KeyInfo>& all_keys() {
            return key_table();
        }

        const KeyInfo& key_info(Key key) {
            const auto& table = key_table();
            size_t idx = static_cast<size_t>(key);
            if (idx >= table.size() || table[idx].key != key) {
                throw std::out_of_range("key_info: unknown key");
            }
            return table[idx];
        }

        std::optional<Key> key_from_name(std::string_view name) {
            for (const auto& info : key_table()) {
                if (name == info.name) {
                    return info.key;
                }
            }
            return std::nullopt;
        }

    } // namespace persist
} // namespace prefvault
