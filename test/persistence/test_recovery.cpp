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
#include <string>
#include "persistence/recovery.h"
#include "persistence/document_codec.h"
#include "test_helpers.h"

using namespace prefvault::persist;
using namespace prefvault::persist::test;

class RecoveryTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string primary;

    void SetUp() override {
        test_dir = create_temp_dir("prefvault_recovery_test");
        primary = test_dir + "/notch-state.json";
    }

    void TearDown() override {
        remove_temp_dir(test_dir);
    }

    static ValueMap generation(int n) {
        ValueMap v;
        v["notchTheme"] = "gen-" + std::to_string(n);
        v["excluded_apps"] = StringList{"com.example.a", "com.example.b"};
        v["menubar_redundancies"] = BoolMap{{"clock", true}};
        v["quicknotes_items"] = Blob{1, 2, 3, 4, 5};
        return v;
    }
};

TEST_F(RecoveryTest, ColdStartWithNoData) {
    DurableDocument doc(primary);
    LoadOutcome out = Recovery(doc).load();
    EXPECT_EQ(out.source, LoadSource::Empty);
    EXPECT_TRUE(out.values.empty());
    EXPECT_EQ(out.primary_status.error, PersistError::Decode);
}

TEST_F(RecoveryTest, LoadsPrimary) {
    DurableDocument doc(primary);
    ASSERT_TRUE(doc.persist(generation(1)));
    ASSERT_TRUE(doc.persist(generation(2)));

    LoadOutcome out = Recovery(doc).load();
    EXPECT_EQ(out.source, LoadSource::Primary);
    EXPECT_EQ(out.values, generation(2));
}

TEST_F(RecoveryTest, CorruptPrimaryFallsBackToBackup) {
    DurableDocument doc(primary);
    ASSERT_TRUE(doc.persist(generation(1)));
    ASSERT_TRUE(doc.persist(generation(2)));
    corrupt_file(primary, 0, 4);

    LoadOutcome out = Recovery(doc).load();
    EXPECT_EQ(out.source, LoadSource::Backup);
    EXPECT_EQ(out.values, generation(1));
    EXPECT_FALSE(out.primary_status);
    EXPECT_TRUE(out.backup_status);
}

TEST_F(RecoveryTest, DeeplyNestedPrimaryFallsBackToBackup) {
    DurableDocument doc(primary);
    ASSERT_TRUE(doc.persist(generation(1)));
    ASSERT_TRUE(doc.persist(generation(2)));
    write_file(primary, "{\"notchTheme\": " + std::string(1 << 20, '['));

    LoadOutcome out = Recovery(doc).load();
    EXPECT_EQ(out.source, LoadSource::Backup);
    EXPECT_EQ(out.values, generation(1));
    EXPECT_EQ(out.primary_status.error, PersistError::Decode);
}

TEST_F(RecoveryTest, MissingPrimaryWithBackup) {
    DurableDocument doc(primary);
    ASSERT_TRUE(doc.persist(generation(1)));
    ASSERT_TRUE(doc.persist(generation(2)));
    std::filesystem::remove(primary);

    LoadOutcome out = Recovery(doc).load();
    EXPECT_EQ(out.source, LoadSource::Backup);
    EXPECT_EQ(out.values, generation(1));
}

TEST_F(RecoveryTest, BothDamagedYieldsEmpty) {
    DurableDocument doc(primary);
    ASSERT_TRUE(doc.persist(generation(1)));
    ASSERT_TRUE(doc.persist(generation(2)));
    write_file(primary, "garbage");
    write_file(doc.backup_path(), "[1, 2, 3]");

    LoadOutcome out = Recovery(doc).load();
    EXPECT_EQ(out.source, LoadSource::Empty);
    EXPECT_TRUE(out.values.empty());
    EXPECT_EQ(out.backup_status.error, PersistError::Decode);
}

// Every torn-write length of the primary must recover to one of the two
// complete generations, never to a partial map.
TEST_F(RecoveryTest, TruncationAtEveryOffset) {
    DurableDocument doc(primary);
    ASSERT_TRUE(doc.persist(generation(1)));
    ASSERT_TRUE(doc.persist(generation(2)));

    const std::string full = read_file(primary);
    const std::string backup = read_file(doc.backup_path());
    ASSERT_FALSE(full.empty());

    for (size_t len = 0; len < full.size(); len++) {
        write_file(primary, full.substr(0, len));
        write_file(doc.backup_path(), backup);

        LoadOutcome out = Recovery(doc).load();
        if (out.source == LoadSource::Primary) {
            // Only the trailing newline may be missing
            EXPECT_EQ(out.values, generation(2)) << "len=" << len;
        } else {
            EXPECT_EQ(out.source, LoadSource::Backup) << "len=" << len;
            EXPECT_EQ(out.values, generation(1)) << "len=" << len;
        }
    }
}

TEST_F(RecoveryTest, TruncatedPrimaryWithoutBackupYieldsEmpty) {
    DurableDocument doc(primary);
    ASSERT_TRUE(doc.persist(generation(1)));
    const std::string full = read_file(primary);

    for (size_t len = 0; len + 1 < full.size(); len += 7) {
        write_file(primary, full.substr(0, len));
        LoadOutcome out = Recovery(doc).load();
        EXPECT_EQ(out.source, LoadSource::Empty) << "len=" << len;
        EXPECT_TRUE(out.values.empty());
    }
}

TEST_F(RecoveryTest, SourceNames) {
    EXPECT_STREQ(load_source_name(LoadSource::Primary), "primary");
    EXPECT_STREQ(load_source_name(LoadSource::Backup), "backup");
    EXPECT_STREQ(load_source_name(LoadSource::Empty), "empty");
}
