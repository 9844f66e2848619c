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

#include <QString>
#include <QJsonObject>
#include <QJsonValue>

#include "spotifytoken.h"

using namespace Qt::Literals::StringLiterals;

QJsonObject SpotifyToken::ToJson() const {

  QJsonObject json_object;
  json_object["access_token"_L1] = access_token;
  json_object["refresh_token"_L1] = refresh_token;
  json_object["expires_at"_L1] = expires_at;
  json_object["scope"_L1] = scope;
  json_object["token_type"_L1] = token_type;

  return json_object;

}

SpotifyToken SpotifyToken::FromJson(const QJsonObject &json_object) {

  SpotifyToken token;
  token.access_token = json_object["access_token"_L1].toString();
  token.refresh_token = json_object["refresh_token"_L1].toString();
  token.expires_at = json_object["expires_at"_L1].toInteger();
  token.scope = json_object["scope"_L1].toString();
  token.token_type = json_object["token_type"_L1].toString();

  return token;

}

SpotifyTokenResult SpotifyToken::FromTokenReply(const QJsonObject &json_object, const qint64 issued_at, const QString &previous_refresh_token) {

  if (!json_object.contains("access_token"_L1) || !json_object["access_token"_L1].isString() || json_object["access_token"_L1].toString().isEmpty()) {
    return SpotifyTokenResult(SpotifyResult::ErrorCode::ParseError, u"Token reply is missing access_token"_s);
  }

  if (!json_object.contains("expires_in"_L1) || !json_object["expires_in"_L1].isDouble()) {
    return SpotifyTokenResult(SpotifyResult::ErrorCode::ParseError, u"Token reply is missing expires_in"_s);
  }

  SpotifyToken token;
  token.access_token = json_object["access_token"_L1].toString();
  token.refresh_token = json_object["refresh_token"_L1].toString();
  if (token.refresh_token.isEmpty()) {
    token.refresh_token = previous_refresh_token;
  }
  token.expires_at = issued_at + json_object["expires_in"_L1].toInteger();
  token.scope = json_object["scope"_L1].toString();
  token.token_type = json_object["token_type"_L1].toString();

  return token;

}

bool SpotifyToken::operator==(const SpotifyToken &other) const {

  return access_token == other.access_token &&
         refresh_token == other.refresh_token &&
         expires_at == other.expires_at &&
         scope == other.scope &&
         token_type == other.token_type;

}
