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
#include <atomic>
#include <cstdint>
#include <string>
#include "value.h"
#include "persist_result.h"

namespace prefvault {
    namespace persist {

        /**
         * One durable JSON document plus its sibling files:
         *
         *   <primary>                 current generation
         *   <primary>.backup          previous generation (rotated before each write)
         *   <primary>.tmp             staging file for the atomic replace
         *   <primary>.pre-migration   snapshot held while a migration is in flight
         *
         * persist() leaves the primary either fully old or fully new. On any
         * failure the primary is untouched and the error is returned; the
         * caller keeps its in-memory copy as the authoritative state.
         */
        class DurableDocument {
        public:
            explicit DurableDocument(std::string primary_path);
            virtual ~DurableDocument() = default;

            DurableDocument(const DurableDocument&) = delete;
            DurableDocument& operator=(const DurableDocument&) = delete;

            virtual PersistResult persist(const ValueMap& values);

            // Read and decode the document at path
            static PersistResult read(const std::string& path, ValueMap& out);

            const std::string& primary_path() const { return primary_; }
            std::string backup_path() const;
            std::string temp_path() const;
            std::string pre_migration_path() const;
            std::string directory() const;

            bool exists() const;

            // Successful persist() calls since construction
            uint64_t writes() const { return writes_.load(std::memory_order_relaxed); }

        protected:
            // Copy the current primary (if any) over the backup
            virtual PersistResult rotate_backup();

            // temp file + fdatasync + rename + directory fsync
            virtual PersistResult write_atomically(const std::string& bytes);

        private:
            std::string primary_;
            std::atomic<uint64_t> writes_{0};
        };

    } // namespace persist
} // namespace prefvault
