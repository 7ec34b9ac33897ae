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
#include <cstddef>
#include <string>
#include <utility>

namespace prefvault { 
    namespace persist {

        struct FSResult { 
            bool ok; 
            int err; 
        };

        // Thin POSIX file primitives. Every call reports errno through
        // FSResult instead of throwing.
        class PlatformFS {
        public:
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(tmp, final) followed by an fsync of final's directory
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            // Write bytes to path (truncating) and fdatasync before close
            static FSResult write_file_synced(const std::string& path, const std::string& bytes);

            // Durable copy: src -> dst.tmp -> atomic_replace(dst)
            static FSResult copy_file(const std::string& src, const std::string& dst);

            static std::pair<FSResult, std::string> read_file(const std::string& path);

            static bool     exists(const std::string& path);
            static FSResult remove(const std::string& path);  // missing file is not an error
            static FSResult ensure_directory(const std::string& path);
        };

    }
} // namespace prefvault::persist
