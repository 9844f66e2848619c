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

#include <QtGlobal>
#include <QString>
#include <QUrl>
#include <QDir>
#include <QSettings>

#include "core/logging.h"
#include "core/standardpaths.h"
#include "constants/spotifysettings.h"
#include "spotifyconfig.h"

using namespace Qt::Literals::StringLiterals;

SpotifyConfig::SpotifyConfig()
    : authorize_url(QString::fromLatin1(SpotifySettings::kDefaultAuthorizeUrl)),
      access_token_url(QString::fromLatin1(SpotifySettings::kDefaultAccessTokenUrl)),
      api_url(QString::fromLatin1(SpotifySettings::kDefaultApiUrl)),
      scope(QString::fromLatin1(SpotifySettings::kDefaultScope)),
      callback_port(SpotifySettings::kDefaultCallbackPort),
      callback_path(QString::fromLatin1(SpotifySettings::kDefaultCallbackPath)),
      data_dir(StandardPaths::AppDataLocation()),
      network_timeout_msec(SpotifySettings::kDefaultNetworkTimeout),
      log_levels(QLatin1String(logging::kDefaultLogLevels)) {}

QString SpotifyConfig::token_filename() const {
  return QDir(data_dir).filePath(QLatin1String(SpotifySettings::kTokenFilename));
}

QString SpotifyConfig::client_id_filename() const {
  return QDir(data_dir).filePath(QLatin1String(SpotifySettings::kClientIdFilename));
}

QString SpotifyConfig::client_secret_filename() const {
  return QDir(data_dir).filePath(QLatin1String(SpotifySettings::kClientSecretFilename));
}

SpotifyConfig SpotifyConfig::Load(QSettings &s) {

  SpotifyConfig config;

  s.beginGroup(QLatin1String(SpotifySettings::kSettingsGroup));
  config.authorize_url = QUrl(s.value(QLatin1String(SpotifySettings::kAuthorizeUrl), config.authorize_url.toString()).toString());
  config.access_token_url = QUrl(s.value(QLatin1String(SpotifySettings::kAccessTokenUrl), config.access_token_url.toString()).toString());
  config.api_url = QUrl(s.value(QLatin1String(SpotifySettings::kApiUrl), config.api_url.toString()).toString());
  config.scope = s.value(QLatin1String(SpotifySettings::kScope), config.scope).toString();
  const int callback_port = s.value(QLatin1String(SpotifySettings::kCallbackPort), config.callback_port).toInt();
  config.callback_path = s.value(QLatin1String(SpotifySettings::kCallbackPath), config.callback_path).toString();
  config.data_dir = s.value(QLatin1String(SpotifySettings::kDataDir), config.data_dir).toString();
  config.network_timeout_msec = s.value(QLatin1String(SpotifySettings::kNetworkTimeout), config.network_timeout_msec).toInt();
  config.log_levels = s.value(QLatin1String(SpotifySettings::kLogLevels), config.log_levels).toString();
  s.endGroup();

  if (callback_port >= 0 && callback_port <= 65535) {
    config.callback_port = static_cast<quint16>(callback_port);
  }
  else {
    qLog(Warning) << "Ignoring invalid callback port" << callback_port;
  }

  if (!config.callback_path.startsWith(u'/')) {
    config.callback_path.prepend(u'/');
  }

  if (config.network_timeout_msec <= 0) {
    config.network_timeout_msec = SpotifySettings::kDefaultNetworkTimeout;
  }

  return config;

}
