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

#include "log.h"

#include <boost/filesystem.hpp>

namespace prefvault {

    /**
     * Owns the log file. All Logger output goes to <logdir>/prefvault.log
     * while a LogManager is alive; rotate() moves the current file aside
     * under a timestamped name and reopens.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir, bool append = true)
            : _enabled(false), _append(append), _file(nullptr) {
            boost::system::error_code ec;
            boost::filesystem::create_directories(logdir, ec);
            if (ec) {
                cerr << "can't create log directory [" << logdir << "]: " << ec.message() << endl;
                return;
            }
            _path = (boost::filesystem::path(logdir) / "prefvault.log").string();
            start();
        }

        ~LogManager() {
            if (_file) {
                Logger::setLogFile(nullptr);
                fclose(_file);
                _file = nullptr;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        bool enabled() const { return _enabled; }
        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0)
                return "unknown-time";
            return buf;
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                if (rename( _path.c_str() , s.c_str() ) != 0) {
                    cerr << "can't rotate " << _path << ": " << errnoWithDescription() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                cerr << "can't open: " << _path << " for log file: " << errnoWithDescription() << endl;
                return;
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );
            _file = tmp;
        }

    private:
        void start() {
            bool exists = boost::filesystem::exists(_path);

            FILE * test = fopen( _path.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                cerr << "can't open [" << _path << "] for log file: " << errnoWithDescription() << endl;
                return;
            }

            if (_append && exists){
                const string msg = "\n\n***** PROCESS RESTARTED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), test);
            }

            fclose( test );

            _enabled = true;
            rotate_in_place();
        }

        void rotate_in_place() {
            FILE* tmp = fopen(_path.c_str(), "a");
            if ( !tmp ) {
                cerr << "can't open: " << _path << " for log file: " << errnoWithDescription() << endl;
                _enabled = false;
                return;
            }
            Logger::setLogFile(tmp);
            _file = tmp;
        }

        bool _enabled;
        bool _append;
        string _path;
        FILE *_file;
    };
}
