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

#include <QByteArray>
#include <QString>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include "core/logging.h"
#include "utilities/fileutils.h"
#include "spotifytokenstore.h"

using namespace Qt::Literals::StringLiterals;

SpotifyTokenStore::SpotifyTokenStore(const QString &filename) : filename_(filename) {}

SpotifyTokenResult SpotifyTokenStore::Load() const {

  if (!QFile::exists(filename_)) {
    return SpotifyTokenResult(SpotifyResult::ErrorCode::NotFound, QStringLiteral("No token stored in %1").arg(filename_));
  }

  QByteArray data;
  QString error;
  if (!Utilities::ReadDataFromFile(filename_, &data, &error)) {
    qLog(Error) << error;
    return SpotifyTokenResult(SpotifyResult::ErrorCode::StorageError, error);
  }

  QJsonParseError json_error;
  const QJsonDocument json_document = QJsonDocument::fromJson(data, &json_error);
  if (json_error.error != QJsonParseError::NoError || !json_document.isObject()) {
    const QString error_message = QStringLiteral("Token file %1 is corrupt: %2").arg(filename_, json_error.errorString());
    qLog(Error) << error_message;
    return SpotifyTokenResult(SpotifyResult::ErrorCode::StorageError, error_message);
  }

  const SpotifyToken token = SpotifyToken::FromJson(json_document.object());
  if (!token.is_valid()) {
    const QString error_message = QStringLiteral("Token file %1 has no access token").arg(filename_);
    qLog(Error) << error_message;
    return SpotifyTokenResult(SpotifyResult::ErrorCode::StorageError, error_message);
  }

  qLog(Debug) << "Loaded token from" << filename_ << "expiring at" << token.expires_at;

  return token;

}

SpotifyResult SpotifyTokenStore::Save(const SpotifyToken &token) const {

  if (!token.is_valid()) {
    return SpotifyResult(SpotifyResult::ErrorCode::StorageError, u"Refusing to store a token without access token"_s);
  }

  QString error;
  if (!Utilities::WritePrivateFile(filename_, QJsonDocument(token.ToJson()).toJson(QJsonDocument::Indented), &error)) {
    qLog(Error) << error;
    return SpotifyResult(SpotifyResult::ErrorCode::StorageError, error);
  }

  qLog(Debug) << "Saved token" << logging::Redact(token.access_token) << "to" << filename_;

  return SpotifyResult();

}

SpotifyResult SpotifyTokenStore::Remove() const {

  QString error;
  if (!Utilities::RemoveFile(filename_, &error)) {
    qLog(Error) << error;
    return SpotifyResult(SpotifyResult::ErrorCode::StorageError, error);
  }

  return SpotifyResult();

}
