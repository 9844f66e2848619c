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

#include <QtGlobal>
#include <QByteArray>
#include <QString>
#include <QIODevice>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileDevice>
#include <QSaveFile>

#include "core/logging.h"

#include "fileutils.h"

using namespace Qt::Literals::StringLiterals;

namespace Utilities {

bool ReadDataFromFile(const QString &filename, QByteArray *data, QString *error) {

  QFile file(filename);
  if (!file.open(QIODevice::ReadOnly)) {
    if (error) *error = QStringLiteral("Failed to open file %1 for reading: %2").arg(filename, file.errorString());
    return false;
  }
  if (data) *data = file.readAll();
  file.close();

  return true;

}

bool WritePrivateFile(const QString &filename, const QByteArray &data, QString *error) {

  const QString path = QFileInfo(filename).absolutePath();
  if (!QDir().mkpath(path)) {
    if (error) *error = QStringLiteral("Failed to create directory %1").arg(path);
    return false;
  }

  QSaveFile file(filename);
  if (!file.open(QIODevice::WriteOnly)) {
    if (error) *error = QStringLiteral("Failed to open file %1 for writing: %2").arg(filename, file.errorString());
    return false;
  }
  // Restrict the temporary file before any data is written to it.
  if (!file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
    file.cancelWriting();
    if (error) *error = QStringLiteral("Failed to set permissions on %1: %2").arg(filename, file.errorString());
    return false;
  }
  if (file.write(data) != data.size()) {
    file.cancelWriting();
    if (error) *error = QStringLiteral("Failed to write file %1: %2").arg(filename, file.errorString());
    return false;
  }
  if (!file.commit()) {
    if (error) *error = QStringLiteral("Failed to save file %1: %2").arg(filename, file.errorString());
    return false;
  }

  return true;

}

bool RemoveFile(const QString &filename, QString *error) {

  QFile file(filename);
  if (!file.exists()) return true;

  if (!file.remove()) {
    if (error) *error = QStringLiteral("Failed to remove file %1: %2").arg(filename, file.errorString());
    return false;
  }

  qLog(Debug) << "Removed" << filename;

  return true;

}

}  // namespace Utilities
