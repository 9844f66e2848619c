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

#ifndef SPOTIFYCREDENTIALS_H
#define SPOTIFYCREDENTIALS_H

#include <QString>

#include "spotifyresult.h"

class SpotifyConfig;

// Resolves the OAuth client id and secret.
// Order: environment variable, override file in the data directory, built-in default.
class SpotifyCredentials {
 public:
  explicit SpotifyCredentials(const SpotifyConfig &config);

  QString ClientId() const;
  QString ClientSecret() const;

  // An empty value removes the override.
  SpotifyResult SetClientId(const QString &client_id) const;
  SpotifyResult SetClientSecret(const QString &client_secret) const;

  static QString DefaultClientId();
  static QString DefaultClientSecret();

 private:
  static QString Resolve(const char *environment_variable, const QString &filename, const QString &default_value);
  static SpotifyResult WriteOverride(const QString &filename, const QString &value);

 private:
  const QString client_id_filename_;
  const QString client_secret_filename_;
};

#endif  // SPOTIFYCREDENTIALS_H
