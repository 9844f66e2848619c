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

#ifndef SPOTIFYSERVICE_H
#define SPOTIFYSERVICE_H

#include <QString>

#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "spotifyresult.h"
#include "spotifymodels.h"
#include "spotifyconfig.h"

class HttpClient;
class Cancellable;
class SpotifyApiClient;
class SpotifySession;
class SpotifyLibrary;

// Entry point for the command line and for embedding. All calls block the calling thread.
class SpotifyService {
 public:
  explicit SpotifyService(const SpotifyConfig &config, const SharedPtr<HttpClient> http_client);
  ~SpotifyService();

  static constexpr int kDefaultLoginTimeoutMsec = 120000;

  const SpotifyConfig &config() const { return config_; }

  SpotifyStringResult StartLogin(const SharedPtr<Cancellable> cancellable);
  SpotifyResult WaitForLogin(const int timeout_msec = kDefaultLoginTimeoutMsec);
  SpotifyAuthStatusResult Status(const SharedPtr<Cancellable> cancellable);
  SpotifyResult Logout();

  SpotifyPlaylistListResult FetchPlaylists(const SharedPtr<Cancellable> cancellable);
  SpotifyTrackListResult FetchSavedTracks(const SharedPtr<Cancellable> cancellable);
  SpotifyPlaylistWithTracksResult FetchPlaylistWithTracks(const QString &playlist_id, const SharedPtr<Cancellable> cancellable);

  SpotifyResult SetClientId(const QString &client_id);
  SpotifyResult SetClientSecret(const QString &client_secret);

 private:
  const SpotifyConfig config_;
  SharedPtr<SpotifyApiClient> api_client_;
  ScopedPtr<SpotifySession> session_;
  ScopedPtr<SpotifyLibrary> library_;

  Q_DISABLE_COPY(SpotifyService)
};

#endif  // SPOTIFYSERVICE_H
