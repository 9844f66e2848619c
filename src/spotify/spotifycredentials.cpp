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

#include "config.h"

#include <QtGlobal>
#include <QByteArray>
#include <QString>
#include <QFile>

#include "core/logging.h"
#include "utilities/fileutils.h"
#include "constants/spotifysettings.h"
#include "spotifyconfig.h"
#include "spotifycredentials.h"

using namespace Qt::Literals::StringLiterals;

SpotifyCredentials::SpotifyCredentials(const SpotifyConfig &config)
    : client_id_filename_(config.client_id_filename()),
      client_secret_filename_(config.client_secret_filename()) {}

QString SpotifyCredentials::DefaultClientId() {
  return QString::fromUtf8(QByteArray::fromBase64(QByteArray(SPOTISYNC_CLIENT_ID_B64))).trimmed();
}

QString SpotifyCredentials::DefaultClientSecret() {
  return QString::fromUtf8(QByteArray::fromBase64(QByteArray(SPOTISYNC_CLIENT_SECRET_B64))).trimmed();
}

QString SpotifyCredentials::ClientId() const {
  return Resolve(SpotifySettings::kClientIdEnvironmentVariable, client_id_filename_, DefaultClientId());
}

QString SpotifyCredentials::ClientSecret() const {
  return Resolve(SpotifySettings::kClientSecretEnvironmentVariable, client_secret_filename_, DefaultClientSecret());
}

SpotifyResult SpotifyCredentials::SetClientId(const QString &client_id) const {
  return WriteOverride(client_id_filename_, client_id);
}

SpotifyResult SpotifyCredentials::SetClientSecret(const QString &client_secret) const {
  return WriteOverride(client_secret_filename_, client_secret);
}

QString SpotifyCredentials::Resolve(const char *environment_variable, const QString &filename, const QString &default_value) {

  const QString environment_value = qEnvironmentVariable(environment_variable).trimmed();
  if (!environment_value.isEmpty()) {
    return environment_value;
  }

  if (QFile::exists(filename)) {
    QByteArray data;
    QString error;
    if (Utilities::ReadDataFromFile(filename, &data, &error)) {
      const QString file_value = QString::fromUtf8(data).trimmed();
      if (!file_value.isEmpty()) {
        return file_value;
      }
    }
    else {
      qLog(Warning) << "Ignoring unreadable credential override:" << error;
    }
  }

  return default_value;

}

SpotifyResult SpotifyCredentials::WriteOverride(const QString &filename, const QString &value) {

  const QString trimmed_value = value.trimmed();
  QString error;

  if (trimmed_value.isEmpty()) {
    if (!Utilities::RemoveFile(filename, &error)) {
      qLog(Error) << error;
      return SpotifyResult(SpotifyResult::ErrorCode::StorageError, error);
    }
    return SpotifyResult();
  }

  if (!Utilities::WritePrivateFile(filename, trimmed_value.toUtf8(), &error)) {
    qLog(Error) << error;
    return SpotifyResult(SpotifyResult::ErrorCode::StorageError, error);
  }

  qLog(Info) << "Stored credential override in" << filename;

  return SpotifyResult();

}
