/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "log.h"
#include "logmanager.h"
#include <memory>
#include <mutex>

namespace prefvault {

/**
 * RAII manager for the logging subsystem.
 *
 * Usage:
 *   - Tests: Create in SetUpTestSuite(), destroy in TearDownTestSuite()
 *   - Production: Create at startup, destroy at shutdown
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;

        // Initial log level
        LogLevel initial_level;

        // Apply LOG_LEVEL from the environment after initial_level
        bool honor_env_level;

        Config()
            : enable_file_logging(false)
            , initial_level(LOG_INFO)
            , honor_env_level(true) {}

        /**
         * Build a config from PREFVAULT_LOG_* environment variables
         */
        static Config from_env() {
            Config config;
            if (const char* enable = std::getenv("PREFVAULT_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }
            if (const char* dir = std::getenv("PREFVAULT_LOG_DIR")) {
                config.log_dir = dir;
            }
            return config;
        }
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {

        logLevel.store(config_.initial_level, std::memory_order_relaxed);
        if (config_.honor_env_level) {
            initLoggingFromEnv();
        }

        if (config_.enable_file_logging && !config_.log_dir.empty()) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir);
            if (!log_manager_->enabled()) {
                log_manager_.reset();
            }
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Explicitly shutdown all logging components
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        // LogManager resets the logger to stderr before closing its file
        log_manager_.reset();
    }

    bool file_logging_active() const { return log_manager_ != nullptr; }

    std::string log_file_path() const {
        return log_manager_ ? log_manager_->path() : std::string();
    }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

} // namespace prefvault
