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

#ifndef SPOTIFYCONFIG_H
#define SPOTIFYCONFIG_H

#include <QtGlobal>
#include <QString>
#include <QUrl>

class QSettings;

class SpotifyConfig {
 public:
  SpotifyConfig();

  QUrl authorize_url;
  QUrl access_token_url;
  QUrl api_url;
  QString scope;
  quint16 callback_port;
  QString callback_path;
  QString data_dir;
  int network_timeout_msec;
  QString log_levels;

  QString token_filename() const;
  QString client_id_filename() const;
  QString client_secret_filename() const;

  static SpotifyConfig Load(QSettings &s);
};

#endif  // SPOTIFYCONFIG_H
