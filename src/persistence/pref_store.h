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
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "value.h"
#include "clock.h"
#include "persist_result.h"
#include "store_config.h"
#include "durable_document.h"
#include "recovery.h"
#include "write_scheduler.h"
#include "legacy_store.h"
#include "migration.h"

namespace prefvault {
    namespace persist {

        enum class Priority : uint8_t {
            Critical,   // durable before set() returns
            Deferred    // coalesced into one write after the debounce window
        };

        /**
         * Typed key-value store with debounced durable persistence.
         *
         * The in-memory map is authoritative. Every mutation is serialized
         * through mu_; durable writes additionally take io_mu_ (acquired
         * while mu_ is held, then mu_ is released for the I/O) so writes
         * land in the order their snapshots were taken.
         */
        class PrefStore {
        public:
            struct Stats {
                uint64_t writes = 0;            // successful durable writes
                uint64_t write_failures = 0;
                uint64_t timer_fires = 0;       // writes started by the debounce timer
                WriteScheduler::Stats scheduler;
                LoadSource loaded_from = LoadSource::Empty;
                std::optional<MigrationEngine::Report> migration;
                PersistResult last_error;       // most recent failed write, if any
            };

            // Recover from <data_dir>, migrate from legacy if needed, start the timer
            static std::unique_ptr<PrefStore> open(const StoreConfig& config,
                                                   LegacyStore* legacy = nullptr,
                                                   std::shared_ptr<Clock> clock = {});

            // Same, with a caller-supplied document (fault injection)
            static std::unique_ptr<PrefStore> open(const StoreConfig& config,
                                                   std::unique_ptr<DurableDocument> doc,
                                                   LegacyStore* legacy = nullptr,
                                                   std::shared_ptr<Clock> clock = {});

            ~PrefStore();

            PrefStore(const PrefStore&) = delete;
            PrefStore& operator=(const PrefStore&) = delete;

            std::optional<Value> get(Key key) const;

            template <typename T>
            std::optional<T> get_as(Key key) const {
                std::optional<Value> v = get(key);
                if (!v) return std::nullopt;
                if (const T* p = std::get_if<T>(&*v)) {
                    return *p;
                }
                return std::nullopt;
            }

            bool        get_bool(Key key, bool def = false) const;
            std::string get_string(Key key, const std::string& def = "") const;
            StringList  get_string_list(Key key) const;
            BoolMap     get_bool_map(Key key) const;

            bool contains(Key key) const;

            // nullopt removes the entry. Throws std::invalid_argument when the
            // value's type is not the key's type; the store is left unchanged.
            void set(Key key, std::optional<Value> value, Priority priority = Priority::Deferred);

            // Opaque payloads are user data and always written critically
            void set_encoded(Key key, std::optional<Blob> payload);
            std::optional<Blob> get_encoded(Key key) const;

            // Cancel any pending deferred write and write now
            void flush();

            // Fire the deferred write if its deadline has passed. Called by the
            // timer thread; tests call it directly with a ManualClock.
            bool run_pending();

            ValueMap snapshot() const;
            Stats stats() const;
            WriteScheduler::State scheduler_state() const;

            // true while the in-memory map has changes no write has covered
            bool dirty() const;

            const DurableDocument& document() const { return *doc_; }

            // Stop the timer thread and perform the final flush. Idempotent.
            // A set() after close() is written immediately whatever its priority.
            void close();

        private:
            PrefStore(const StoreConfig& config, std::unique_ptr<DurableDocument> doc,
                      std::shared_ptr<Clock> clock);

            void start_timer();
            void timer_loop();

            void check_type(Key key, const Value& value) const;

            // Called with lk holding mu_; returns with lk holding mu_ again
            PersistResult write_locked(std::unique_lock<std::mutex>& lk);
            void fire_locked(std::unique_lock<std::mutex>& lk);

            StoreConfig config_;
            std::unique_ptr<DurableDocument> doc_;
            std::shared_ptr<Clock> clock_;

            mutable std::mutex mu_;
            std::mutex io_mu_;
            std::condition_variable cv_;

            ValueMap values_;
            WriteScheduler scheduler_;
            uint64_t version_ = 0;            // bumped by every set
            uint64_t persisted_version_ = 0;  // version covered by the newest completed write
            Stats stats_;

            std::atomic<bool> running_{false};
            std::atomic<bool> closed_{false};
            std::thread th_;
        };

    } // namespace persist
} // namespace prefvault
