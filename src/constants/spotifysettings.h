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

#ifndef SPOTIFYSETTINGS_H
#define SPOTIFYSETTINGS_H

namespace SpotifySettings {

constexpr char kSettingsGroup[] = "Spotify";

constexpr char kAuthorizeUrl[] = "authorize_url";
constexpr char kAccessTokenUrl[] = "access_token_url";
constexpr char kApiUrl[] = "api_url";
constexpr char kScope[] = "scope";
constexpr char kCallbackPort[] = "callback_port";
constexpr char kCallbackPath[] = "callback_path";
constexpr char kDataDir[] = "data_dir";
constexpr char kNetworkTimeout[] = "network_timeout";
constexpr char kLogLevels[] = "log_levels";

constexpr char kDefaultAuthorizeUrl[] = "https://accounts.spotify.com/authorize";
constexpr char kDefaultAccessTokenUrl[] = "https://accounts.spotify.com/api/token";
constexpr char kDefaultApiUrl[] = "https://api.spotify.com/v1";
constexpr char kDefaultScope[] = "user-library-read playlist-read-private playlist-read-collaborative";
constexpr char kDefaultCallbackPath[] = "/callback";
constexpr int kDefaultCallbackPort = 3000;
constexpr int kDefaultNetworkTimeout = 30000;

constexpr char kTokenFilename[] = "spotify_oauth.json";
constexpr char kClientIdFilename[] = "spotify_client_id";
constexpr char kClientSecretFilename[] = "spotify_client_secret";

constexpr char kClientIdEnvironmentVariable[] = "SPOTISYNC_CLIENT_ID";
constexpr char kClientSecretEnvironmentVariable[] = "SPOTISYNC_CLIENT_SECRET";

}  // namespace SpotifySettings

#endif  // SPOTIFYSETTINGS_H
