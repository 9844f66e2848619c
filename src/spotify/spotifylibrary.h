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

#ifndef SPOTIFYLIBRARY_H
#define SPOTIFYLIBRARY_H

#include <QString>
#include <QUrl>

#include "includes/shared_ptr.h"
#include "spotifyresult.h"
#include "spotifymodels.h"
#include "spotifyapiclient.h"

class Cancellable;
class SpotifySession;

// Reads the user's library. Every operation takes a fresh access token from the session,
// then fetches without holding the session lock.
class SpotifyLibrary {
 public:
  explicit SpotifyLibrary(SpotifySession *session, const SharedPtr<SpotifyApiClient> api_client, const QUrl &api_url);

  static constexpr int kPlaylistsLimit = 50;
  static constexpr int kSavedTracksLimit = 50;
  static constexpr int kPlaylistTracksLimit = 100;

  SpotifyPlaylistListResult FetchPlaylists(const SharedPtr<Cancellable> cancellable) const;
  SpotifyTrackListResult FetchSavedTracks(const SharedPtr<Cancellable> cancellable) const;
  SpotifyPlaylistWithTracksResult FetchPlaylistWithTracks(const QString &playlist_id, const SharedPtr<Cancellable> cancellable) const;

 private:
  struct TrackPage {
    TrackPage() : item_count(0), total(0) {}
    SpotifyTrackList tracks;
    int item_count;
    int total;
  };
  using TrackPageResult = SpotifyValueResult<TrackPage>;

  QUrl ApiUrl(const QString &path, const int limit = 0, const int offset = -1) const;
  TrackPageResult FetchTrackPage(const QString &path, const int limit, const int offset, const QString &access_token, const SharedPtr<Cancellable> cancellable) const;
  SpotifyTrackListResult FetchTracks(const QString &path, const int limit, const int total, const TrackPage &first_page, const QString &access_token, const SharedPtr<Cancellable> cancellable) const;

 private:
  SpotifySession *session_;
  const SharedPtr<SpotifyApiClient> api_client_;
  const QUrl api_url_;
};

#endif  // SPOTIFYLIBRARY_H
