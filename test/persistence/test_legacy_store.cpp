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
#include "rapidjson/document.h"
#include "persistence/legacy_store.h"
#include "persistence/durable_document.h"
#include "test_helpers.h"

using namespace prefvault::persist;
using namespace prefvault::persist::test;

TEST(MemoryLegacyStoreTest, TypedGetters) {
    MemoryLegacyStore legacy;
    legacy.put("hapticEnabled", false);
    legacy.put("notchTheme", std::string("ocean"));
    legacy.put("excluded_apps", StringList{"a", "b"});
    legacy.put("menubar_redundancies", BoolMap{{"wifi", true}});

    EXPECT_EQ(legacy.get_bool("hapticEnabled"), std::optional<bool>(false));
    EXPECT_EQ(legacy.get_string("notchTheme"), std::optional<std::string>("ocean"));
    EXPECT_EQ(legacy.get_string_list("excluded_apps")->size(), 2u);
    EXPECT_TRUE(legacy.get_bool_map("menubar_redundancies")->at("wifi"));

    // Absent and mistyped both read as nullopt
    EXPECT_FALSE(legacy.get_bool("missing").has_value());
    EXPECT_FALSE(legacy.get_bool("notchTheme").has_value());

    legacy.erase("notchTheme");
    EXPECT_FALSE(legacy.get_string("notchTheme").has_value());
}

TEST(MemoryLegacyStoreTest, ReadDispatchesOnType) {
    MemoryLegacyStore legacy;
    legacy.put("liquidGlass", true);

    auto v = legacy.read("liquidGlass", ValueType::Bool);
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(std::get<bool>(*v));

    EXPECT_FALSE(legacy.read("liquidGlass", ValueType::String).has_value());
    EXPECT_FALSE(legacy.read("liquidGlass", ValueType::Blob).has_value());
}

TEST(MemoryLegacyStoreTest, MigrationFlag) {
    MemoryLegacyStore legacy;
    EXPECT_FALSE(legacy.migration_flag("notchPersistence.migrated.v1"));
    EXPECT_TRUE(legacy.set_migration_flag("notchPersistence.migrated.v1", true));
    EXPECT_TRUE(legacy.migration_flag("notchPersistence.migrated.v1"));
    EXPECT_FALSE(legacy.migration_flag("other"));
}

class JsonLegacyStoreTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string path;

    void SetUp() override {
        test_dir = create_temp_dir("prefvault_legacy_store_test");
        path = test_dir + "/legacy-defaults.json";
    }

    void TearDown() override {
        remove_temp_dir(test_dir);
    }
};

TEST_F(JsonLegacyStoreTest, LoadsFlatExport) {
    write_file(path,
        "{\n"
        "  \"chameleonEnabled\": false,\n"
        "  \"notchTheme\": \"sunset\",\n"
        "  \"excluded_apps\": [\"com.example.x\"],\n"
        "  \"menubar_redundancies\": {\"battery\": true}\n"
        "}\n");

    JsonLegacyStore legacy(path);
    ASSERT_TRUE(legacy.load());
    EXPECT_EQ(legacy.get_bool("chameleonEnabled"), std::optional<bool>(false));
    EXPECT_EQ(legacy.get_string("notchTheme"), std::optional<std::string>("sunset"));
    EXPECT_EQ(*legacy.get_string_list("excluded_apps"), StringList{"com.example.x"});
    EXPECT_TRUE(legacy.get_bool_map("menubar_redundancies")->at("battery"));
}

TEST_F(JsonLegacyStoreTest, MissingFileIsEmpty) {
    JsonLegacyStore legacy(path);
    EXPECT_FALSE(legacy.load());
    EXPECT_FALSE(legacy.get_bool("chameleonEnabled").has_value());
    EXPECT_FALSE(legacy.migration_flag("notchPersistence.migrated.v1"));
}

TEST_F(JsonLegacyStoreTest, MalformedFileIsEmpty) {
    write_file(path, "{ \"chameleonEnabled\": ");
    JsonLegacyStore legacy(path);
    EXPECT_FALSE(legacy.load());
}

TEST_F(JsonLegacyStoreTest, FlagIsPersisted) {
    write_file(path, "{\"notchTheme\": \"sunset\"}");
    {
        JsonLegacyStore legacy(path);
        ASSERT_TRUE(legacy.load());
        ASSERT_TRUE(legacy.set_migration_flag("notchPersistence.migrated.v1", true));
        EXPECT_TRUE(legacy.migration_flag("notchPersistence.migrated.v1"));
    }

    JsonLegacyStore reopened(path);
    ASSERT_TRUE(reopened.load());
    EXPECT_TRUE(reopened.migration_flag("notchPersistence.migrated.v1"));
    // Other values are carried through the rewrite
    EXPECT_EQ(reopened.get_string("notchTheme"), std::optional<std::string>("sunset"));
    EXPECT_FALSE(file_exists(path + ".tmp"));
}

TEST_F(JsonLegacyStoreTest, FlagWriteFailureReported) {
    JsonLegacyStore legacy(test_dir + "/missing-dir/legacy.json");
    EXPECT_FALSE(legacy.load());
    EXPECT_FALSE(legacy.set_migration_flag("notchPersistence.migrated.v1", true));
    EXPECT_FALSE(legacy.migration_flag("notchPersistence.migrated.v1"));
}

TEST_F(JsonLegacyStoreTest, FlagWriteKeepsEntriesTheReaderDrops) {
    write_file(path,
        "{\"notchWidth\": 180, \"x\": null, \"geometry\": {\"top\": [1, 2]},"
        " \"chameleonEnabled\": false, \"notchTheme\": 7}");

    JsonLegacyStore legacy(path);
    ASSERT_TRUE(legacy.load());
    EXPECT_FALSE(legacy.get_string("notchTheme").has_value());
    ASSERT_TRUE(legacy.set_migration_flag("notchPersistence.migrated.v1", true));

    rapidjson::Document doc;
    std::string text = read_file(path);
    doc.Parse(text.c_str());
    ASSERT_FALSE(doc.HasParseError()) << text;
    ASSERT_TRUE(doc.IsObject());

    ASSERT_TRUE(doc.HasMember("notchWidth"));
    EXPECT_EQ(doc["notchWidth"].GetInt(), 180);
    ASSERT_TRUE(doc.HasMember("x"));
    EXPECT_TRUE(doc["x"].IsNull());
    ASSERT_TRUE(doc.HasMember("geometry"));
    EXPECT_EQ(doc["geometry"]["top"].Size(), 2u);
    EXPECT_EQ(doc["notchTheme"].GetInt(), 7);
    EXPECT_FALSE(doc["chameleonEnabled"].GetBool());
    EXPECT_TRUE(doc["notchPersistence.migrated.v1"].GetBool());
}

TEST_F(JsonLegacyStoreTest, FlagWriteUpdatesExistingMember) {
    write_file(path, "{\"notchPersistence.migrated.v1\": false, \"notchWidth\": 180}");

    JsonLegacyStore legacy(path);
    ASSERT_TRUE(legacy.load());
    EXPECT_FALSE(legacy.migration_flag("notchPersistence.migrated.v1"));
    ASSERT_TRUE(legacy.set_migration_flag("notchPersistence.migrated.v1", true));

    rapidjson::Document doc;
    std::string text = read_file(path);
    doc.Parse(text.c_str());
    ASSERT_TRUE(doc.IsObject()) << text;
    EXPECT_EQ(doc.MemberCount(), 2u);
    EXPECT_TRUE(doc["notchPersistence.migrated.v1"].GetBool());
    EXPECT_EQ(doc["notchWidth"].GetInt(), 180);
}

TEST_F(JsonLegacyStoreTest, FlagWriteLeavesMalformedFileAlone) {
    const std::string garbage = "{ \"notchWidth\": 180, ";
    write_file(path, garbage);

    JsonLegacyStore legacy(path);
    EXPECT_FALSE(legacy.load());
    EXPECT_FALSE(legacy.set_migration_flag("notchPersistence.migrated.v1", true));
    EXPECT_EQ(read_file(path), garbage);
    EXPECT_FALSE(file_exists(path + ".tmp"));
}

TEST_F(JsonLegacyStoreTest, FlagWriteCreatesMissingFile) {
    JsonLegacyStore legacy(path);
    EXPECT_FALSE(legacy.load());
    ASSERT_TRUE(legacy.set_migration_flag("notchPersistence.migrated.v1", true));

    JsonLegacyStore reopened(path);
    ASSERT_TRUE(reopened.load());
    EXPECT_TRUE(reopened.migration_flag("notchPersistence.migrated.v1"));
}
