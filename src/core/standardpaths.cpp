/*
 * Spotisync
 * This file was part of Strawberry.
 * Copyright 2025, Jonas Kvinge <jonas@jkvinge.net>
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
#include <QString>
#include <QDir>
#include <QCoreApplication>

#include "standardpaths.h"

using namespace Qt::Literals::StringLiterals;

void StandardPaths::AppendOrganizationAndApplication(QString &path) {

  const QString organization_name = QCoreApplication::organizationName().toLower();
  if (!organization_name.isEmpty()) {
    path += u'/' + organization_name;
  }
  const QString application_name = QCoreApplication::applicationName().toLower();
  if (!application_name.isEmpty() && application_name != organization_name) {
    path += u'/' + application_name;
  }

}

QString StandardPaths::AppDataLocation() {

#if defined(Q_OS_UNIX) && !defined(Q_OS_MACOS)
  QString data_location = qEnvironmentVariable("XDG_DATA_HOME");
  if (!data_location.startsWith(u'/')) {
    data_location.clear();
  }
  if (data_location.isEmpty()) {
    data_location = QDir::homePath() + "/.local/share"_L1;
  }
  AppendOrganizationAndApplication(data_location);
  return data_location;
#else
  return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
#endif

}
