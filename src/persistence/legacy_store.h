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
#include <map>
#include <optional>
#include <string>
#include "value.h"

namespace prefvault {
    namespace persist {

        /**
         * Read access to the external flat preference store that predates
         * the JSON document. Values are never written back; the only
         * mutation is the migration-completed flag, which lives here so it
         * survives a reset of the document.
         *
         * Typed getters return nullopt when the key is absent or holds a
         * different type.
         */
        class LegacyStore {
        public:
            virtual ~LegacyStore() = default;

            virtual std::optional<bool>        get_bool(const std::string& key) const = 0;
            virtual std::optional<std::string> get_string(const std::string& key) const = 0;
            virtual std::optional<StringList>  get_string_list(const std::string& key) const = 0;
            virtual std::optional<BoolMap>     get_bool_map(const std::string& key) const = 0;

            virtual bool migration_flag(const std::string& name) const = 0;
            // false if the flag could not be persisted
            virtual bool set_migration_flag(const std::string& name, bool value) = 0;

            // Typed read dispatched on the semantic type of a target key
            std::optional<Value> read(const std::string& key, ValueType type) const;
        };

        // Map-backed store for embedding and tests
        class MemoryLegacyStore final : public LegacyStore {
        public:
            void put(const std::string& key, Value value) { values_[key] = std::move(value); }
            void erase(const std::string& key) { values_.erase(key); }

            std::optional<bool>        get_bool(const std::string& key) const override;
            std::optional<std::string> get_string(const std::string& key) const override;
            std::optional<StringList>  get_string_list(const std::string& key) const override;
            std::optional<BoolMap>     get_bool_map(const std::string& key) const override;

            bool migration_flag(const std::string& name) const override;
            bool set_migration_flag(const std::string& name, bool value) override;

        private:
            template <typename T>
            std::optional<T> typed(const std::string& key) const {
                auto it = values_.find(key);
                if (it == values_.end()) return std::nullopt;
                if (const T* v = std::get_if<T>(&it->second)) return *v;
                return std::nullopt;
            }

            ValueMap values_;
            std::map<std::string, bool> flags_;
        };

        /**
         * Legacy preferences exported as one flat JSON object. The file is
         * read once at load(). set_migration_flag() rewrites it atomically,
         * changing only the flag member; entries the reader cannot type
         * (numbers, nulls, nested objects) are written back untouched.
         */
        class JsonLegacyStore final : public LegacyStore {
        public:
            explicit JsonLegacyStore(std::string path) : path_(std::move(path)) {}

            // false if the file is missing or unreadable (store stays empty)
            bool load();

            const std::string& path() const { return path_; }

            std::optional<bool>        get_bool(const std::string& key) const override;
            std::optional<std::string> get_string(const std::string& key) const override;
            std::optional<StringList>  get_string_list(const std::string& key) const override;
            std::optional<BoolMap>     get_bool_map(const std::string& key) const override;

            bool migration_flag(const std::string& name) const override;
            bool set_migration_flag(const std::string& name, bool value) override;

        private:
            template <typename T>
            std::optional<T> typed(const std::string& key) const {
                auto it = values_.find(key);
                if (it == values_.end()) return std::nullopt;
                if (const T* v = std::get_if<T>(&it->second)) return *v;
                return std::nullopt;
            }

            std::string path_;
            ValueMap values_;
        };

    } // namespace persist
} // namespace prefvault
