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
#include "../../src/util/base64.h"
#include <string>
#include <vector>

using prefvault::util::base64_decode;
using prefvault::util::base64_encode;

namespace {
std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(base64_encode(bytes("")), "");
    EXPECT_EQ(base64_encode(bytes("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64Test, DecodeKnownVectors) {
    EXPECT_EQ(*base64_decode("Zg=="), bytes("f"));
    EXPECT_EQ(*base64_decode("Zm8="), bytes("fo"));
    EXPECT_EQ(*base64_decode("Zm9vYmFy"), bytes("foobar"));
    EXPECT_TRUE(base64_decode("")->empty());
}

TEST(Base64Test, BinaryPayload) {
    std::vector<uint8_t> all(256);
    for (size_t i = 0; i < all.size(); i++) all[i] = static_cast<uint8_t>(i);
    auto decoded = base64_decode(base64_encode(all));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, all);
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_FALSE(base64_decode("Zg=").has_value());     // bad length
    EXPECT_FALSE(base64_decode("Z!==").has_value());    // bad character
    EXPECT_FALSE(base64_decode("Z=g=").has_value());    // padding inside
    EXPECT_FALSE(base64_decode("Zm9v\n").has_value());
}

TEST(Base64Test, RejectsNonzeroPaddingBits) {
    EXPECT_FALSE(base64_decode("QR==").has_value());
    EXPECT_FALSE(base64_decode("QUJ=").has_value());
    EXPECT_FALSE(base64_decode("Zm9vYh==").has_value());

    // canonical spellings of the same lengths still decode
    EXPECT_EQ(*base64_decode("QQ=="), (std::vector<uint8_t>{'A'}));
    EXPECT_EQ(*base64_decode("QUI="), (std::vector<uint8_t>{'A', 'B'}));
    EXPECT_EQ(*base64_decode("Zm9vYg=="), (std::vector<uint8_t>{'f', 'o', 'o', 'b'}));
}
