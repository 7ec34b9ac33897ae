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

#include "legacy_store.h"
#include "document_codec.h"
#include "durable_document.h"
#include "platform_fs.h"
#include "config.h"
#include "../util/log.h"

#include <cerrno>

namespace prefvault {
    namespace persist {

        std::optional<Value> LegacyStore::read(const std::string& key, ValueType type) const {
            switch (type) {
                case ValueType::Bool:
                    if (auto v = get_bool(key)) return Value{*v};
                    break;
                case ValueType::String:
                    if (auto v = get_string(key)) return Value{std::move(*v)};
                    break;
                case ValueType::StringList:
                    if (auto v = get_string_list(key)) return Value{std::move(*v)};
                    break;
                case ValueType::BoolMap:
                    if (auto v = get_bool_map(key)) return Value{std::move(*v)};
                    break;
                case ValueType::Blob:
                    // the legacy store never held encoded payloads
                    break;
            }
            return std::nullopt;
        }

        // ---- MemoryLegacyStore ----

        std::optional<bool> MemoryLegacyStore::get_bool(const std::string& key) const {
            return typed<bool>(key);
        }

        std::optional<std::string> MemoryLegacyStore::get_string(const std::string& key) const {
            return typed<std::string>(key);
        }

        std::optional<StringList> MemoryLegacyStore::get_string_list(const std::string& key) const {
            return typed<StringList>(key);
        }

        std::optional<BoolMap> MemoryLegacyStore::get_bool_map(const std::string& key) const {
            return typed<BoolMap>(key);
        }

        bool MemoryLegacyStore::migration_flag(const std::string& name) const {
            auto it = flags_.find(name);
            return it != flags_.end() && it->second;
        }

        bool MemoryLegacyStore::set_migration_flag(const std::string& name, bool value) {
            flags_[name] = value;
            return true;
        }

        // ---- JsonLegacyStore ----

        bool JsonLegacyStore::load() {
            ValueMap loaded;
            PersistResult res = DurableDocument::read(path_, loaded);
            if (!res) {
                if (res.err == ENOENT) {
                    debug() << "No legacy preferences at " << path_;
                } else {
                    warning() << "Legacy preferences unreadable - " << res.message;
                }
                values_.clear();
                return false;
            }
            values_.swap(loaded);
            info() << "Loaded " << values_.size() << " legacy preferences from " << path_;
            return true;
        }

        std::optional<bool> JsonLegacyStore::get_bool(const std::string& key) const {
            return typed<bool>(key);
        }

        std::optional<std::string> JsonLegacyStore::get_string(const std::string& key) const {
            return typed<std::string>(key);
        }

        std::optional<StringList> JsonLegacyStore::get_string_list(const std::string& key) const {
            return typed<StringList>(key);
        }

        std::optional<BoolMap> JsonLegacyStore::get_bool_map(const std::string& key) const {
            return typed<BoolMap>(key);
        }

        bool JsonLegacyStore::migration_flag(const std::string& name) const {
            return get_bool(name).value_or(false);
        }

        bool JsonLegacyStore::set_migration_flag(const std::string& name, bool value) {
            // Patch the file as it is on disk now. values_ only holds what
            // decoded, and entries it dropped must survive the rewrite.
            auto [rd, current] = PlatformFS::read_file(path_);
            if (!rd.ok && rd.err != ENOENT) {
                error() << "Could not record " << name << " in " << path_ << ": "
                        << errnoWithDescription(rd.err);
                return false;
            }

            std::string updated;
            PersistResult patched = DocumentCodec::set_bool_member(current, name, value, updated);
            if (!patched) {
                error() << "Could not record " << name << " in " << path_ << ": " << patched.message;
                return false;
            }

            const std::string tmp = path_ + files::kTempSuffix;
            FSResult res = PlatformFS::write_file_synced(tmp, updated);
            if (res.ok) {
                res = PlatformFS::atomic_replace(tmp, path_);
            }
            if (!res.ok) {
                PlatformFS::remove(tmp);
                error() << "Could not record " << name << " in " << path_ << ": "
                        << errnoWithDescription(res.err);
                return false;
            }

            values_[name] = value;
            return true;
        }

    } // namespace persist
} // namespace prefvault
