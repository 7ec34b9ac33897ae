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

#include "pref_store.h"
#include "../util/log.h"

#include <algorithm>
#include <stdexcept>

namespace prefvault {
    namespace persist {

        std::unique_ptr<PrefStore> PrefStore::open(const StoreConfig& config,
                                                   LegacyStore* legacy,
                                                   std::shared_ptr<Clock> clock) {
            return open(config, std::make_unique<DurableDocument>(config.state_path()),
                        legacy, std::move(clock));
        }

        std::unique_ptr<PrefStore> PrefStore::open(const StoreConfig& config,
                                                   std::unique_ptr<DurableDocument> doc,
                                                   LegacyStore* legacy,
                                                   std::shared_ptr<Clock> clock) {
            if (!config.validate()) {
                throw std::invalid_argument("invalid store config (data_dir='" + config.data_dir + "')");
            }
            if (!doc) {
                throw std::invalid_argument("PrefStore requires a document");
            }
            if (!clock) {
                clock = std::make_shared<SteadyClock>();
            }

            std::unique_ptr<PrefStore> store(new PrefStore(config, std::move(doc), std::move(clock)));

            // 1. Recovery: primary -> backup -> empty
            LoadOutcome loaded = Recovery(*store->doc_).load();
            store->values_ = std::move(loaded.values);
            store->stats_.loaded_from = loaded.source;

            // 2. One-time import from the legacy store
            if (legacy && config.run_migration) {
                MigrationEngine engine(*store->doc_, *legacy);
                MigrationEngine::Report report = engine.run(store->values_);
                if (report.state == MigrationEngine::State::Committed) {
                    store->stats_.writes++;
                } else if (report.state == MigrationEngine::State::RolledBack) {
                    store->stats_.write_failures++;
                    store->stats_.last_error = report.result;
                }
                store->stats_.migration = std::move(report);
            }

            info() << "Opened " << store->doc_->primary_path() << " ("
                   << store->values_.size() << " keys from "
                   << load_source_name(store->stats_.loaded_from) << ")";

            if (config.start_timer_thread) {
                store->start_timer();
            }
            return store;
        }

        PrefStore::PrefStore(const StoreConfig& config, std::unique_ptr<DurableDocument> doc,
                             std::shared_ptr<Clock> clock)
            : config_(config),
              doc_(std::move(doc)),
              clock_(std::move(clock)),
              scheduler_(std::chrono::duration_cast<Clock::duration>(config.debounce)) {}

        PrefStore::~PrefStore() {
            close();
        }

        void PrefStore::close() {
            if (closed_.exchange(true)) return;

            if (running_.exchange(false)) {
                {
                    std::lock_guard<std::mutex> lk(mu_);
                }
                cv_.notify_all();
                if (th_.joinable()) {
                    th_.join();
                }
            }

            if (config_.flush_on_close) {
                std::unique_lock<std::mutex> lk(mu_);
                scheduler_.cancel();
                if (version_ != persisted_version_) {
                    write_locked(lk);
                }
            }
        }

        //
        // Reads
        //

        std::optional<Value> PrefStore::get(Key key) const {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = values_.find(key_name(key));
            if (it == values_.end()) return std::nullopt;
            return it->second;
        }

        bool PrefStore::get_bool(Key key, bool def) const {
            return get_as<bool>(key).value_or(def);
        }

        std::string PrefStore::get_string(Key key, const std::string& def) const {
            return get_as<std::string>(key).value_or(def);
        }

        StringList PrefStore::get_string_list(Key key) const {
            return get_as<StringList>(key).value_or(StringList{});
        }

        BoolMap PrefStore::get_bool_map(Key key) const {
            return get_as<BoolMap>(key).value_or(BoolMap{});
        }

        std::optional<Blob> PrefStore::get_encoded(Key key) const {
            return get_as<Blob>(key);
        }

        bool PrefStore::contains(Key key) const {
            std::lock_guard<std::mutex> lk(mu_);
            return values_.count(key_name(key)) != 0;
        }

        ValueMap PrefStore::snapshot() const {
            std::lock_guard<std::mutex> lk(mu_);
            return values_;
        }

        PrefStore::Stats PrefStore::stats() const {
            std::lock_guard<std::mutex> lk(mu_);
            Stats s = stats_;
            s.scheduler = scheduler_.stats();
            return s;
        }

        WriteScheduler::State PrefStore::scheduler_state() const {
            std::lock_guard<std::mutex> lk(mu_);
            return scheduler_.state();
        }

        bool PrefStore::dirty() const {
            std::lock_guard<std::mutex> lk(mu_);
            return version_ != persisted_version_;
        }

        //
        // Writes
        //

        void PrefStore::check_type(Key key, const Value& value) const {
            const ValueType expected = key_type(key);
            const ValueType actual = value_type(value);
            if (expected != actual) {
                throw std::invalid_argument(std::string("key '") + key_name(key) + "' holds " +
                                            value_type_name(expected) + ", got " +
                                            value_type_name(actual));
            }
        }

        void PrefStore::set(Key key, std::optional<Value> value, Priority priority) {
            if (value) {
                check_type(key, *value);
            }

            std::unique_lock<std::mutex> lk(mu_);
            if (value) {
                values_[key_name(key)] = std::move(*value);
            } else {
                values_.erase(key_name(key));
            }
            version_++;

            // No timer runs after close(), so nothing would fire a deferred write
            if (priority == Priority::Deferred && closed_.load()) {
                debug() << "Store closed, writing " << key_name(key) << " immediately";
                priority = Priority::Critical;
            }

            if (priority == Priority::Critical) {
                scheduler_.on_critical();
                write_locked(lk);
                return;
            }

            scheduler_.on_deferred(clock_->now());
            cv_.notify_all();
        }

        void PrefStore::set_encoded(Key key, std::optional<Blob> payload) {
            if (payload) {
                set(key, Value{std::move(*payload)}, Priority::Critical);
            } else {
                set(key, std::nullopt, Priority::Critical);
            }
        }

        void PrefStore::flush() {
            std::unique_lock<std::mutex> lk(mu_);
            scheduler_.cancel();
            write_locked(lk);
        }

        bool PrefStore::run_pending() {
            std::unique_lock<std::mutex> lk(mu_);
            if (!scheduler_.due(clock_->now())) return false;
            fire_locked(lk);
            return true;
        }

        void PrefStore::fire_locked(std::unique_lock<std::mutex>& lk) {
            if (!scheduler_.begin_fire()) return;
            stats_.timer_fires++;
            write_locked(lk);
            scheduler_.end_fire();
            if (scheduler_.state() == WriteScheduler::State::Scheduled) {
                cv_.notify_all();
            }
        }

        PersistResult PrefStore::write_locked(std::unique_lock<std::mutex>& lk) {
            // Take the I/O slot before releasing mu_ so writes complete in
            // the order their snapshots were taken
            std::unique_lock<std::mutex> io(io_mu_);
            const ValueMap snap = values_;
            const uint64_t version = version_;
            lk.unlock();

            PersistResult res = doc_->persist(snap);

            io.unlock();
            lk.lock();

            if (res) {
                stats_.writes++;
                persisted_version_ = std::max(persisted_version_, version);
            } else {
                stats_.write_failures++;
                stats_.last_error = res;
                warning() << "Keeping " << snap.size() << " keys in memory after failed write ("
                          << persist_error_name(res.error) << ")";
            }
            return res;
        }

        //
        // Debounce timer
        //

        void PrefStore::start_timer() {
            bool expected = false;
            if (!running_.compare_exchange_strong(expected, true)) return;
            th_ = std::thread([this]{ timer_loop(); });
        }

        void PrefStore::timer_loop() {
            Logger::get().setThreadName("prefvault-timer");
            const auto quantum = std::chrono::duration_cast<Clock::duration>(scheduling::kIdleQuantum);

            std::unique_lock<std::mutex> lk(mu_);
            while (running_.load(std::memory_order_relaxed)) {
                const auto now = clock_->now();
                if (scheduler_.due(now)) {
                    fire_locked(lk);
                    continue;
                }

                auto wait = quantum;
                if (scheduler_.state() == WriteScheduler::State::Scheduled) {
                    wait = std::min(quantum, scheduler_.deadline() - now);
                }
                cv_.wait_for(lk, wait);
            }
        }

    } // namespace persist
} // namespace prefvault
