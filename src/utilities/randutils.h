/*
 * Spotisync
 * This file was part of Strawberry.
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef RANDUTILS_H
#define RANDUTILS_H

#include <QByteArray>
#include <QString>

namespace Utilities {

// Bytes from the operating system's secure random source.
QByteArray CryptographicRandomBytes(const int len);

// Base64url encoding of len secure random bytes, without padding.
QString CryptographicRandomString(const int len);

}  // namespace Utilities

#endif  // RANDUTILS_H
