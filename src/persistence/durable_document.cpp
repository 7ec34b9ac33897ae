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

#include "durable_document.h"
#include "document_codec.h"
#include "platform_fs.h"
#include "config.h"
#include "../util/log.h"

#include <cerrno>
#include <filesystem>
#include <utility>

namespace prefvault { 
    namespace persist {

        namespace {
            PersistResult write_error(const std::string& what, int err) {
                return PersistResult::failure(PersistError::Write, err,
                                              what + ": " + errnoWithDescription(err));
            }
        }

        DurableDocument::DurableDocument(std::string primary_path)
            : primary_(std::move(primary_path)) {}

        std::string DurableDocument::backup_path() const {
            return primary_ + files::kBackupSuffix;
        }

        std::string DurableDocument::temp_path() const {
            return primary_ + files::kTempSuffix;
        }

        std::string DurableDocument::pre_migration_path() const {
            return primary_ + files::kPreMigrationSuffix;
        }

        std::string DurableDocument::directory() const {
            std::string dir = std::filesystem::path(primary_).parent_path().string();
            return dir.empty() ? "." : dir;
        }

        bool DurableDocument::exists() const {
            return PlatformFS::exists(primary_);
        }

        PersistResult DurableDocument::persist(const ValueMap& values) {
            // Serialize first so an encoding problem never touches the disk
            std::string bytes = DocumentCodec::encode(values);

            FSResult dir = PlatformFS::ensure_directory(directory());
            if (!dir.ok) {
                auto r = write_error("create " + directory(), dir.err);
                error() << "Save failed - " << r.message;
                return r;
            }

            PersistResult rotated = rotate_backup();
            if (!rotated) {
                error() << "Save failed - " << rotated.message;
                return rotated;
            }

            PersistResult written = write_atomically(bytes);
            if (!written) {
                error() << "Save failed - " << written.message;
                return written;
            }

            writes_.fetch_add(1, std::memory_order_relaxed);
            debug() << "Saved " << values.size() << " keys (" << bytes.size() << " bytes) to " << primary_;
            return PersistResult::success();
        }

        PersistResult DurableDocument::rotate_backup() {
            if (!PlatformFS::exists(primary_)) {
                return PersistResult::success();
            }

            auto [res, bytes] = PlatformFS::read_file(primary_);
            if (!res.ok) {
                return write_error("read " + primary_, res.err);
            }

            // A damaged primary must not replace a good backup
            ValueMap decoded;
            if (!DocumentCodec::decode(bytes, decoded)) {
                warning() << primary_ << " is not decodable, keeping existing " << backup_path();
                return PersistResult::success();
            }

            const std::string staging = backup_path() + files::kTempSuffix;
            res = PlatformFS::write_file_synced(staging, bytes);
            if (res.ok) {
                res = PlatformFS::atomic_replace(staging, backup_path());
            }
            if (!res.ok) {
                PlatformFS::remove(staging);
                return write_error("rotate backup " + backup_path(), res.err);
            }
            return PersistResult::success();
        }

        PersistResult DurableDocument::write_atomically(const std::string& bytes) {
            const std::string tmp = temp_path();

            FSResult res = PlatformFS::write_file_synced(tmp, bytes);
            if (!res.ok) {
                PlatformFS::remove(tmp);
                return write_error("write " + tmp, res.err);
            }

            res = PlatformFS::atomic_replace(tmp, primary_);
            if (!res.ok) {
                PlatformFS::remove(tmp);
                return write_error("replace " + primary_, res.err);
            }
            return PersistResult::success();
        }

        PersistResult DurableDocument::read(const std::string& path, ValueMap& out) {
            auto [res, bytes] = PlatformFS::read_file(path);
            if (!res.ok) {
                return PersistResult::failure(PersistError::Decode, res.err,
                                              "read " + path + ": " + errnoWithDescription(res.err));
            }
            PersistResult decoded = DocumentCodec::decode(bytes, out);
            if (!decoded) {
                decoded.message = path + ": " + decoded.message;
            }
            return decoded;
        }

    } // namespace persist
} // namespace prefvault
