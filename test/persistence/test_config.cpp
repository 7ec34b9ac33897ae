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

#include <gtest/gtest.h>
#include <cstdlib>
#include <optional>
#include <string>
#include "persistence/config.h"
#include "persistence/store_config.h"

using namespace prefvault::persist;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        save(env::kDataDir, saved_data_dir_);
        save(env::kDebounceMs, saved_debounce_);
        save(env::kNoMigrate, saved_no_migrate_);
        save("HOME", saved_home_);
        ::unsetenv(env::kDataDir);
        ::unsetenv(env::kDebounceMs);
        ::unsetenv(env::kNoMigrate);
    }

    void TearDown() override {
        restore(env::kDataDir, saved_data_dir_);
        restore(env::kDebounceMs, saved_debounce_);
        restore(env::kNoMigrate, saved_no_migrate_);
        restore("HOME", saved_home_);
    }

private:
    static void save(const char* name, std::optional<std::string>& slot) {
        const char* v = std::getenv(name);
        slot = v ? std::optional<std::string>(v) : std::nullopt;
    }

    static void restore(const char* name, const std::optional<std::string>& slot) {
        if (slot) {
            ::setenv(name, slot->c_str(), 1);
        } else {
            ::unsetenv(name);
        }
    }

    std::optional<std::string> saved_data_dir_, saved_debounce_, saved_no_migrate_, saved_home_;
};

TEST_F(ConfigTest, SchedulingConfiguration) {
    EXPECT_EQ(scheduling::kDefaultDebounce.count(), 500);
    EXPECT_LE(scheduling::kDefaultDebounce, scheduling::kMaxDebounce);
    EXPECT_GT(scheduling::kIdleQuantum.count(), 0);
}

TEST_F(ConfigTest, FileNamingConfiguration) {
    EXPECT_STREQ(files::kStateFile, "notch-state.json");
    EXPECT_STREQ(files::kBackupSuffix, ".backup");
    EXPECT_STREQ(files::kPreMigrationSuffix, ".pre-migration");
    EXPECT_STREQ(files::kTempSuffix, ".tmp");
    EXPECT_STREQ(migration::kFlagName, "notchPersistence.migrated.v1");
}

TEST_F(ConfigTest, ExplicitDirectory) {
    StoreConfig cfg = StoreConfig::at("/var/lib/prefs");
    EXPECT_TRUE(cfg.validate());
    EXPECT_EQ(cfg.state_path(), "/var/lib/prefs/notch-state.json");
    EXPECT_EQ(cfg.debounce, scheduling::kDefaultDebounce);
    EXPECT_TRUE(cfg.start_timer_thread);
    EXPECT_TRUE(cfg.flush_on_close);
    EXPECT_TRUE(cfg.run_migration);
}

TEST_F(ConfigTest, DefaultsUnderHome) {
    ::setenv("HOME", "/home/tester", 1);
    StoreConfig cfg = StoreConfig::defaults();
    EXPECT_EQ(cfg.data_dir, "/home/tester/.cortex/livenotch");
    EXPECT_EQ(cfg.debounce, scheduling::kDefaultDebounce);
    EXPECT_TRUE(cfg.run_migration);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv(env::kDataDir, "/tmp/prefvault-env", 1);
    ::setenv(env::kDebounceMs, "1250", 1);
    ::setenv(env::kNoMigrate, "1", 1);

    StoreConfig cfg = StoreConfig::defaults();
    EXPECT_EQ(cfg.data_dir, "/tmp/prefvault-env");
    EXPECT_EQ(cfg.debounce.count(), 1250);
    EXPECT_FALSE(cfg.run_migration);
    EXPECT_TRUE(cfg.validate());

    ::setenv(env::kNoMigrate, "0", 1);
    EXPECT_TRUE(StoreConfig::defaults().run_migration);
}

TEST_F(ConfigTest, MalformedDebounceKeepsDefault) {
    ::setenv(env::kDataDir, "/tmp/prefvault-env", 1);

    for (const char* bad : {"fast", "", "12ms", "-5"}) {
        ::setenv(env::kDebounceMs, bad, 1);
        StoreConfig cfg;
        ASSERT_NO_THROW(cfg = StoreConfig::defaults()) << "value '" << bad << "'";
        EXPECT_EQ(cfg.debounce, scheduling::kDefaultDebounce) << "value '" << bad << "'";
        EXPECT_EQ(cfg.data_dir, "/tmp/prefvault-env");
    }
}

TEST_F(ConfigTest, LegacyPathBesideState) {
    StoreConfig cfg = StoreConfig::at("/var/lib/prefs");
    EXPECT_EQ(cfg.legacy_path(), "/var/lib/prefs/legacy-defaults.json");
}

TEST_F(ConfigTest, Validation) {
    StoreConfig cfg;
    EXPECT_FALSE(cfg.validate());  // no directory

    cfg = StoreConfig::at("/tmp/x");
    cfg.debounce = scheduling::kMaxDebounce + std::chrono::milliseconds(1);
    EXPECT_FALSE(cfg.validate());

    cfg.debounce = std::chrono::milliseconds(0);
    EXPECT_TRUE(cfg.validate());
}
