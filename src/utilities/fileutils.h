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

#ifndef FILEUTILS_H
#define FILEUTILS_H

#include <QByteArray>
#include <QString>

namespace Utilities {

bool ReadDataFromFile(const QString &filename, QByteArray *data, QString *error = nullptr);

// Replaces the whole file, readable and writable by the owner only.
// The parent directory is created when missing.
bool WritePrivateFile(const QString &filename, const QByteArray &data, QString *error = nullptr);

// Succeeds when the file is gone afterwards, including when it never existed.
bool RemoveFile(const QString &filename, QString *error = nullptr);

}  // namespace Utilities

#endif  // FILEUTILS_H
