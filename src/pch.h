/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
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

// pch.h : standard and boost headers shared by the logging and runtime layers

#pragma once

#include <sys/time.h>
#include <ctime>
#include <cstring>
#include <cerrno>
#include <cstdint>
#include <inttypes.h>
#include <string>
#include <sstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <map>
#include <set>
#include <vector>
#include <deque>
#include <stdio.h>
#include <stdlib.h>
#include <algorithm>
#include <functional>
#include <limits>
#include <stdexcept>

#include <boost/thread/tss.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/filesystem/operations.hpp>
