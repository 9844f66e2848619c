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

#ifndef SPOTIFYTOKEN_H
#define SPOTIFYTOKEN_H

#include <QtGlobal>
#include <QString>
#include <QJsonObject>

#include "spotifyresult.h"

class SpotifyToken {
 public:
  SpotifyToken() : expires_at(0) {}

  // A token with less than this many seconds left is refreshed before use.
  static constexpr qint64 kRefreshMarginSecs = 30;

  QString access_token;
  QString refresh_token;
  // Absolute unix time in seconds.
  qint64 expires_at;
  QString scope;
  QString token_type;

  bool is_valid() const { return !access_token.isEmpty(); }
  bool IsStale(const qint64 now) const { return expires_at - now < kRefreshMarginSecs; }

  QJsonObject ToJson() const;
  static SpotifyToken FromJson(const QJsonObject &json_object);

  // Parses a token endpoint reply received at issued_at.
  // A reply without refresh_token keeps previous_refresh_token.
  static SpotifyValueResult<SpotifyToken> FromTokenReply(const QJsonObject &json_object, const qint64 issued_at, const QString &previous_refresh_token = QString());

  bool operator==(const SpotifyToken &other) const;
  bool operator!=(const SpotifyToken &other) const { return !(*this == other); }
};

using SpotifyTokenResult = SpotifyValueResult<SpotifyToken>;

#endif  // SPOTIFYTOKEN_H
