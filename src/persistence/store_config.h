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
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>
#include <filesystem>
#include "config.h"  // For defaults
#include "../util/log.h"

namespace prefvault {
namespace persist {

/**
 * Runtime configuration for a PrefStore instance.
 */
struct StoreConfig {
    // Directory holding the primary document and its siblings
    std::string data_dir;

    // Coalescing window for deferred writes
    std::chrono::milliseconds debounce = scheduling::kDefaultDebounce;

    // Spawn the background timer thread. Tests that drive the scheduler
    // with a manual clock turn this off and call run_pending().
    bool start_timer_thread = true;

    // Perform a final flush() from the destructor
    bool flush_on_close = true;

    // Run the legacy migration at open() when a legacy store is supplied
    bool run_migration = true;

    std::string state_path() const {
        return (std::filesystem::path(data_dir) / files::kStateFile).string();
    }

    // Where the CLI looks for a legacy export when none is named
    std::string legacy_path() const {
        return (std::filesystem::path(data_dir) / files::kLegacyPrefsFile).string();
    }

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StoreConfig defaults() {
        StoreConfig cfg;

        if (const char* env = std::getenv(env::kDataDir)) {
            cfg.data_dir = env;
        } else if (const char* home = std::getenv("HOME")) {
            cfg.data_dir = (std::filesystem::path(home) / files::kDefaultDataSubdir).string();
        } else {
            cfg.data_dir = files::kDefaultDataSubdir;
        }

        if (const char* env = std::getenv(env::kDebounceMs)) {
            unsigned long long ms = 0;
            const char* end = env + std::strlen(env);
            auto [ptr, ec] = std::from_chars(env, end, ms);
            if (ec == std::errc() && ptr == end && ptr != env) {
                cfg.debounce = std::chrono::milliseconds(ms);
            } else {
                warning() << "Ignoring " << env::kDebounceMs << "='" << env
                          << "', keeping " << cfg.debounce.count() << "ms";
            }
        }

        if (const char* env = std::getenv(env::kNoMigrate)) {
            cfg.run_migration = (std::string(env) == "0");
        }

        return cfg;
    }

    /**
     * Create config rooted at an explicit directory
     */
    static StoreConfig at(const std::string& dir) {
        StoreConfig cfg;
        cfg.data_dir = dir;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (data_dir.empty()) {
            return false;
        }
        if (debounce.count() < 0 || debounce > scheduling::kMaxDebounce) {
            return false;
        }
        return true;
    }
};

} // namespace persist
} // namespace prefvault
