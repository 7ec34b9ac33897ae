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
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace prefvault {
    namespace persist {

        using StringList = std::vector<std::string>;
        using BoolMap    = std::map<std::string, bool>;
        using Blob       = std::vector<uint8_t>;

        // Alternative order must match ValueType
        using Value = std::variant<bool, std::string, StringList, BoolMap, Blob>;

        enum class ValueType : uint8_t {
            Bool       = 0,
            String     = 1,
            StringList = 2,
            BoolMap    = 3,
            Blob       = 4
        };

        // Canonical in-memory store: wire name -> value, sorted for
        // deterministic encoding.
        using ValueMap = std::map<std::string, Value>;

        inline ValueType value_type(const Value& v) {
            return static_cast<ValueType>(v.index());
        }

        const char* value_type_name(ValueType t);

        /**
         * Stable key identifiers. The wire name and semantic type of a key
         * are fixed for the lifetime of the program (and of the document
         * format); new keys are appended before Count.
         */
        enum class Key : uint8_t {
            ChameleonEnabled,
            LiquidGlass,
            NotchTheme,
            HapticEnabled,
            GestureEyeEnabled,
            FeatureEnabled,
            ApiKey,
            RelayBaseUrl,
            RelayDeviceToken,
            RelayApiKey,
            RescueTimeApiKey,
            ExcludedApps,
            MenuBarRedundancies,
            SeenTipIds,
            VaultItems,
            BrainDumpItems,
            QuickNotes,
            ScriptHistory,
            PinnedApps,
            EvolutionGenome,
            UserProfileAccent,
            Count
        };

        struct KeyInfo {
            Key         key;
            const char* name;   // wire name in the document
            ValueType   type;
        };

        const KeyInfo& key_info(Key key);
        const std::vector<KeyInfo>& all_keys();
        std::optional<Key> key_from_name(std::string_view name);

        inline const char* key_name(Key key) { return key_info(key).name; }
        inline ValueType   key_type(Key key) { return key_info(key).type; }

    } // namespace persist
} // namespace prefvault
