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

#ifndef SPOTIFYMODELS_H
#define SPOTIFYMODELS_H

#include <QtGlobal>
#include <QList>
#include <QString>
#include <QStringList>
#include <QJsonObject>

#include "spotifyresult.h"

struct SpotifyArtist {
  QString id;
  QString name;
  QString external_url;
  QJsonObject ToJson() const;
};

struct SpotifyTrack {
  SpotifyTrack() : track_number(0), disc_number(0), total_tracks(0), duration_ms(0) {}

  QString track_id;
  QString name;
  // Display string of all artists joined with ", ".
  QString artists;
  QList<SpotifyArtist> artists_data;
  // First artist, empty when the track has none.
  QString artist_id;
  QString artist_url;
  QString album_id;
  QString album_name;
  QString album_artist;
  QString album_type;
  QString album_url;
  QString release_date;
  int track_number;
  int disc_number;
  int total_tracks;
  qint64 duration_ms;
  QString cover_url;
  QString external_url;
  QString isrc;

  QJsonObject ToJson() const;
};

using SpotifyTrackList = QList<SpotifyTrack>;

struct SpotifyPlaylist {
  SpotifyPlaylist() : track_count(0), is_public(false) {}
  QString id;
  QString name;
  QString owner;
  int track_count;
  QString cover_url;
  bool is_public;
  QJsonObject ToJson() const;
};

using SpotifyPlaylistList = QList<SpotifyPlaylist>;

struct SpotifyPlaylistWithTracks {
  SpotifyPlaylist playlist;
  SpotifyTrackList tracks;
  QJsonObject ToJson() const;
};

struct SpotifyProfile {
  QString id;
  QString display_name;
  QString email;
  QStringList avatar_urls;
  bool is_valid() const { return !id.isEmpty(); }
  QString avatar_url() const { return avatar_urls.isEmpty() ? QString() : avatar_urls.first(); }
};

struct SpotifyAuthStatus {
  SpotifyAuthStatus() : authenticated(false), expires_at(0) {}
  bool authenticated;
  QString display_name;
  QString user_id;
  QString avatar_url;
  qint64 expires_at;
  QString scope;
  QJsonObject ToJson() const;
};

using SpotifyTrackListResult = SpotifyValueResult<SpotifyTrackList>;
using SpotifyPlaylistListResult = SpotifyValueResult<SpotifyPlaylistList>;
using SpotifyPlaylistWithTracksResult = SpotifyValueResult<SpotifyPlaylistWithTracks>;
using SpotifyProfileResult = SpotifyValueResult<SpotifyProfile>;
using SpotifyAuthStatusResult = SpotifyValueResult<SpotifyAuthStatus>;
using SpotifyStringResult = SpotifyValueResult<QString>;

#endif  // SPOTIFYMODELS_H
