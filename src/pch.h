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

// pch.h : common includes for the logging layer

#pragma once

#include <ctime>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <sstream>
#include <string>
#include <iostream>

#include <boost/thread/tss.hpp>
#include <boost/thread/mutex.hpp>

namespace prefvault {

    using namespace std;

}
