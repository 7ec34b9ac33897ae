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

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../src/util/log.h"
#include "../src/util/log_runtime.h"
#include "../src/persistence/pref_store.h"
#include "../src/persistence/document_codec.h"
#include "../src/persistence/legacy_store.h"

using namespace prefvault;
using namespace prefvault::persist;
using namespace std;

namespace {

void usage() {
    cerr << "usage: prefvault_cli [--data-dir DIR] [--log-level LEVEL] <command>\n"
         << "\n"
         << "commands:\n"
         << "  get <key>                      print a value as JSON\n"
         << "  set <key> <json> [--critical]  store a value\n"
         << "  unset <key>                    remove a value\n"
         << "  dump                           print the whole document\n"
         << "  keys                           list known keys and their types\n"
         << "  migrate [legacy.json]          import from a legacy preference export\n"
         << "                                 (default: <data-dir>/legacy-defaults.json)\n";
}

bool lookup_key(const string& name, Key& out) {
    auto key = key_from_name(name);
    if (!key) {
        cerr << "unknown key '" << name << "' (see 'keys')\n";
        return false;
    }
    out = *key;
    return true;
}

int cmd_keys(const PrefStore& store) {
    for (const auto& info : all_keys()) {
        cout << (store.contains(info.key) ? "* " : "  ")
             << info.name << "\t" << value_type_name(info.type) << "\n";
    }
    return 0;
}

int cmd_get(const PrefStore& store, const string& name) {
    Key key;
    if (!lookup_key(name, key)) return 2;
    auto value = store.get(key);
    if (!value) {
        cerr << name << " is not set\n";
        return 1;
    }
    cout << DocumentCodec::encode_value(*value) << "\n";
    return 0;
}

int cmd_set(PrefStore& store, const string& name, const string& json, bool critical) {
    Key key;
    if (!lookup_key(name, key)) return 2;
    Value value;
    PersistResult parsed = DocumentCodec::decode_value(json, key_type(key), value);
    if (!parsed) {
        cerr << "cannot use '" << json << "' for " << name << ": " << parsed.message << "\n";
        return 2;
    }
    store.set(key, std::move(value), critical ? Priority::Critical : Priority::Deferred);
    return 0;
}

int cmd_unset(PrefStore& store, const string& name) {
    Key key;
    if (!lookup_key(name, key)) return 2;
    store.set(key, std::nullopt, Priority::Critical);
    return 0;
}

int report_migration(const PrefStore& store) {
    auto stats = store.stats();
    if (!stats.migration) {
        cerr << "migration did not run\n";
        return 1;
    }
    const auto& report = *stats.migration;
    cout << "migration: " << migration_state_name(report.state)
         << " (imported " << report.imported << ", kept " << report.kept_existing << ")\n";
    if (report.state == MigrationEngine::State::RolledBack) {
        cerr << persist_error_name(report.result.error) << ": " << report.result.message << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    StoreConfig config = StoreConfig::defaults();
    config.start_timer_thread = false;   // one command per process; close() flushes
    config.run_migration = false;

    LogRuntime::Config log_config = LogRuntime::Config::from_env();
    log_config.initial_level = LOG_WARNING;

    vector<string> args;
    bool critical = false;
    string level;
    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if (arg == "--data-dir" && i + 1 < argc) {
            config.data_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            level = argv[++i];
        } else if (arg == "--critical") {
            critical = true;
        } else if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    LogRuntime logging(log_config);
    if (!level.empty() && !setLogLevelFromString(level)) {
        cerr << "invalid log level '" << level << "'\n";
        return 2;
    }

    if (args.empty()) {
        usage();
        return 2;
    }

    const string& cmd = args[0];
    unique_ptr<JsonLegacyStore> legacy;
    if (cmd == "migrate") {
        if (args.size() > 2) { usage(); return 2; }
        const string source = args.size() == 2 ? args[1] : config.legacy_path();
        legacy = make_unique<JsonLegacyStore>(source);
        if (!legacy->load()) {
            cerr << "cannot read legacy preferences from " << source << "\n";
            return 1;
        }
        config.run_migration = true;
    }

    unique_ptr<PrefStore> store;
    try {
        store = PrefStore::open(config, legacy.get());
    } catch (const std::invalid_argument& e) {
        cerr << "cannot open store: " << e.what() << "\n";
        return 2;
    }

    int rc = 2;
    if (cmd == "keys" && args.size() == 1) {
        rc = cmd_keys(*store);
    } else if (cmd == "dump" && args.size() == 1) {
        cout << DocumentCodec::encode(store->snapshot());
        rc = 0;
    } else if (cmd == "get" && args.size() == 2) {
        rc = cmd_get(*store, args[1]);
    } else if (cmd == "set" && args.size() == 3) {
        rc = cmd_set(*store, args[1], args[2], critical);
    } else if (cmd == "unset" && args.size() == 2) {
        rc = cmd_unset(*store, args[1]);
    } else if (cmd == "migrate") {
        rc = report_migration(*store);
    } else {
        usage();
    }

    store->close();
    if (rc == 0 && store->dirty()) {
        cerr << "write failed: " << store->stats().last_error.message << "\n";
        rc = 1;
    }
    return rc;
}
