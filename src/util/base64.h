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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace prefvault {
namespace util {

    // Standard alphabet, '=' padded. Used for opaque payloads inside JSON.
    inline std::string base64_encode(const std::vector<uint8_t>& bytes) {
        using namespace boost::archive::iterators;
        using Encoder = base64_from_binary<
            transform_width<std::vector<uint8_t>::const_iterator, 6, 8>>;

        std::string out(Encoder(bytes.begin()), Encoder(bytes.end()));
        out.append((3 - bytes.size() % 3) % 3, '=');
        return out;
    }

    inline bool is_base64_char(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '+' || c == '/';
    }

    inline unsigned base64_sextet(char c) {
        if (c >= 'A' && c <= 'Z') return unsigned(c - 'A');
        if (c >= 'a' && c <= 'z') return unsigned(c - 'a') + 26;
        if (c >= '0' && c <= '9') return unsigned(c - '0') + 52;
        return c == '+' ? 62 : 63;
    }

    // Strict decode: rejects bad length, bad characters, misplaced padding
    // and nonzero bits under the padding.
    inline std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
        using namespace boost::archive::iterators;
        using Decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

        if (text.size() % 4 != 0) {
            return std::nullopt;
        }
        if (text.empty()) {
            return std::vector<uint8_t>{};
        }

        size_t padding = 0;
        if (text[text.size() - 1] == '=') padding++;
        if (text[text.size() - 2] == '=') padding++;

        for (size_t i = 0; i < text.size() - padding; i++) {
            if (!is_base64_char(text[i])) {
                return std::nullopt;
            }
        }

        // One '=' discards the low 2 bits of the last sextet, two discard 4
        if (padding > 0) {
            const unsigned unused = padding == 1 ? 0x3u : 0xFu;
            if (base64_sextet(text[text.size() - 1 - padding]) & unused) {
                return std::nullopt;
            }
        }

        // binary_from_base64 has no notion of padding; feed zero bits instead
        std::string body = text;
        for (size_t i = body.size() - padding; i < body.size(); i++) {
            body[i] = 'A';
        }

        std::vector<uint8_t> out(Decoder(body.cbegin()), Decoder(body.cend()));
        out.resize(body.size() / 4 * 3 - padding);
        return out;
    }

} // namespace util
} // namespace prefvault
