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

#include <memory>

#include <QString>

#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "core/logging.h"
#include "core/httpclient.h"
#include "core/cancellable.h"
#include "spotifyservice.h"
#include "spotifyapiclient.h"
#include "spotifysession.h"
#include "spotifylibrary.h"
#include "spotifycredentials.h"

SpotifyService::SpotifyService(const SpotifyConfig &config, const SharedPtr<HttpClient> http_client)
    : config_(config),
      api_client_(std::make_shared<SpotifyApiClient>(http_client)),
      session_(std::make_unique<SpotifySession>(config_, api_client_)),
      library_(std::make_unique<SpotifyLibrary>(session_.get(), api_client_, config_.api_url)) {

  qLog(Debug) << "Spotify service using" << config_.api_url << "and data directory" << config_.data_dir;

}

SpotifyService::~SpotifyService() {

  library_.reset();
  session_.reset();

}

SpotifyStringResult SpotifyService::StartLogin(const SharedPtr<Cancellable> cancellable) {
  return session_->StartLogin(cancellable);
}

SpotifyResult SpotifyService::WaitForLogin(const int timeout_msec) {
  return session_->WaitForLogin(timeout_msec);
}

SpotifyAuthStatusResult SpotifyService::Status(const SharedPtr<Cancellable> cancellable) {
  return session_->Status(cancellable);
}

SpotifyResult SpotifyService::Logout() {
  return session_->Logout();
}

SpotifyPlaylistListResult SpotifyService::FetchPlaylists(const SharedPtr<Cancellable> cancellable) {
  return library_->FetchPlaylists(cancellable);
}

SpotifyTrackListResult SpotifyService::FetchSavedTracks(const SharedPtr<Cancellable> cancellable) {
  return library_->FetchSavedTracks(cancellable);
}

SpotifyPlaylistWithTracksResult SpotifyService::FetchPlaylistWithTracks(const QString &playlist_id, const SharedPtr<Cancellable> cancellable) {
  return library_->FetchPlaylistWithTracks(playlist_id, cancellable);
}

SpotifyResult SpotifyService::SetClientId(const QString &client_id) {
  return session_->credentials().SetClientId(client_id);
}

SpotifyResult SpotifyService::SetClientSecret(const QString &client_secret) {
  return session_->credentials().SetClientSecret(client_secret);
}
