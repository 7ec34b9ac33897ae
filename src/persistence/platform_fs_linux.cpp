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
#include "platform_fs.h"

#ifdef PREFVAULT_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <filesystem>
#include <cstring>

namespace prefvault { 
    namespace persist {

        static std::string parent_of(const std::string& path) {
            std::filesystem::path p(path);
            std::string parent_dir = p.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }
            return parent_dir;
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            // Open directory for reading
            int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
            if (fd < 0) {
                return {false, errno};
            }
            
            // Fsync the directory to ensure metadata changes are persisted
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);
            
            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            // Use atomic rename with directory fsync for durability
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }
            
            return fsync_directory(parent_of(dst));
        }

        FSResult PlatformFS::write_file_synced(const std::string& path, const std::string& bytes) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            const char* p = bytes.data();
            size_t left = bytes.size();
            while (left > 0) {
                ssize_t n = ::write(fd, p, left);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int ec = errno;
                    ::close(fd);
                    return {false, ec};
                }
                p += n;
                left -= size_t(n);
            }

            if (::fdatasync(fd) != 0) {
                int ec = errno;
                ::close(fd);
                return {false, ec};
            }

            if (::close(fd) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::copy_file(const std::string& src, const std::string& dst) {
            auto [res, bytes] = read_file(src);
            if (!res.ok) {
                return res;
            }

            std::string tmp = dst + ".tmp";
            FSResult wr = write_file_synced(tmp, bytes);
            if (!wr.ok) {
                ::unlink(tmp.c_str());
                return wr;
            }

            FSResult mv = atomic_replace(tmp, dst);
            if (!mv.ok) {
                ::unlink(tmp.c_str());
            }
            return mv;
        }

        std::pair<FSResult, std::string> PlatformFS::read_file(const std::string& path) {
            int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                return { {false, errno}, {} };
            }

            std::string out;
            char buf[64 * 1024];
            for (;;) {
                ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int ec = errno;
                    ::close(fd);
                    return { {false, ec}, {} };
                }
                if (n == 0) break;
                out.append(buf, size_t(n));
            }

            ::close(fd);
            return { {true, 0}, std::move(out) };
        }

        bool PlatformFS::exists(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0;
        }

        FSResult PlatformFS::remove(const std::string& path) {
            if (::unlink(path.c_str()) == 0 || errno == ENOENT) {
                return {true, 0};
            }
            return {false, errno};
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec) {
                std::error_code dir_ec;
                if (std::filesystem::is_directory(path, dir_ec)) {
                    // Directory already exists
                    return {true, 0};
                }
                return {false, ec.value()};
            }
            return {true, 0};
        }

    } // namespace persist
} // namespace prefvault
#endif
