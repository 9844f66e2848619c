/*
 * Spotisync
 * This file was part of Strawberry.
 * Copyright 2024-2025, Jonas Kvinge <jonas@jkvinge.net>
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
#include <QSettings>
#include <QString>
#include <QCoreApplication>

#include "settings.h"

using namespace Qt::Literals::StringLiterals;

Settings::Settings(QObject *parent)
    : QSettings(DefaultFilename(), QSettings::IniFormat, parent) {}

Settings::Settings(const QString &filename, const Format format, QObject *parent)
    : QSettings(filename, format, parent) {}

QString Settings::OverrideFilename() {

  return qEnvironmentVariable(kConfigEnvironmentVariable).trimmed();

}

QString Settings::DefaultFilename() {

  const QString override_filename = OverrideFilename();
  if (!override_filename.isEmpty()) return override_filename;

  return QSettings(QSettings::IniFormat, QSettings::UserScope, QCoreApplication::organizationName().toLower(), QCoreApplication::applicationName().toLower()).fileName();

}
