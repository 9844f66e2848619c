/*
* Spotisync
* Copyright 2026, Spotisync contributors
*
* Spotisync is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* Spotisync is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with Spotisync.  If not, see <http://www.gnu.org/licenses/>.
*
*/

#ifndef TIMECONSTANTS_H
#define TIMECONSTANTS_H

#include <QtGlobal>

constexpr qint64 kMsecPerSec = 1000LL;
constexpr qint64 kSecsPerMin = 60LL;

#endif  // TIMECONSTANTS_H
