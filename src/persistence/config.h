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
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace prefvault {
namespace persist {

// Write scheduling
namespace scheduling {
    constexpr std::chrono::milliseconds kDefaultDebounce{500};   // coalescing window for deferred sets
    constexpr std::chrono::milliseconds kMaxDebounce{60'000};    // config sanity bound
    constexpr std::chrono::milliseconds kIdleQuantum{1000};      // timer thread wake-up when idle
}

// File naming configuration
namespace files {
    constexpr const char* kStateFile        = "notch-state.json";
    constexpr const char* kBackupSuffix     = ".backup";         // one generation behind primary
    constexpr const char* kPreMigrationSuffix = ".pre-migration";
    constexpr const char* kTempSuffix       = ".tmp";
    constexpr const char* kDefaultDataSubdir = ".cortex/livenotch";  // under $HOME
    constexpr const char* kLegacyPrefsFile  = "legacy-defaults.json";
}

// Document format
namespace document {
    constexpr char   kIndentChar  = ' ';
    constexpr unsigned kIndentWidth = 2;
    constexpr size_t kMaxDocumentBytes = 64 * 1024 * 1024;  // refuse to parse anything larger
    constexpr size_t kMaxNestingDepth = 512;                 // bound for re-serializing foreign documents
}

// Migration from the legacy preference store
namespace migration {
    constexpr const char* kFlagName = "notchPersistence.migrated.v1";
}

// Environment overrides read by StoreConfig::defaults()
namespace env {
    constexpr const char* kDataDir    = "PREFVAULT_DATA_DIR";
    constexpr const char* kDebounceMs = "PREFVAULT_DEBOUNCE_MS";
    constexpr const char* kNoMigrate  = "PREFVAULT_SKIP_MIGRATION";
}

} // namespace persist
} // namespace prefvault
