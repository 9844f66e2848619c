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
#include <QJsonArray>

#include "spotifymodels.h"

using namespace Qt::Literals::StringLiterals;

QJsonObject SpotifyArtist::ToJson() const {

  QJsonObject json_object;
  json_object["id"_L1] = id;
  json_object["name"_L1] = name;
  json_object["external_url"_L1] = external_url;
  return json_object;

}

QJsonObject SpotifyTrack::ToJson() const {

  QJsonArray json_artists;
  for (const SpotifyArtist &artist : artists_data) {
    json_artists.append(artist.ToJson());
  }

  QJsonObject json_object;
  json_object["spotify_id"_L1] = track_id;
  json_object["name"_L1] = name;
  json_object["artists"_L1] = artists;
  json_object["artists_data"_L1] = json_artists;
  json_object["artist_id"_L1] = artist_id;
  json_object["artist_url"_L1] = artist_url;
  json_object["album_id"_L1] = album_id;
  json_object["album_name"_L1] = album_name;
  json_object["album_artist"_L1] = album_artist;
  json_object["album_type"_L1] = album_type;
  json_object["album_url"_L1] = album_url;
  json_object["release_date"_L1] = release_date;
  json_object["track_number"_L1] = track_number;
  json_object["disc_number"_L1] = disc_number;
  json_object["total_tracks"_L1] = total_tracks;
  json_object["duration_ms"_L1] = duration_ms;
  json_object["images"_L1] = cover_url;
  json_object["external_urls"_L1] = external_url;
  json_object["isrc"_L1] = isrc;

  return json_object;

}

QJsonObject SpotifyPlaylist::ToJson() const {

  QJsonObject json_object;
  json_object["id"_L1] = id;
  json_object["name"_L1] = name;
  json_object["owner"_L1] = owner;
  json_object["tracks_total"_L1] = track_count;
  json_object["image_url"_L1] = cover_url;
  json_object["is_public"_L1] = is_public;
  return json_object;

}

QJsonObject SpotifyPlaylistWithTracks::ToJson() const {

  QJsonArray json_tracks;
  for (const SpotifyTrack &track : tracks) {
    json_tracks.append(track.ToJson());
  }

  QJsonObject json_object;
  json_object["playlist"_L1] = playlist.ToJson();
  json_object["tracks"_L1] = json_tracks;

  return json_object;

}

QJsonObject SpotifyAuthStatus::ToJson() const {

  QJsonObject json_object;
  json_object["authenticated"_L1] = authenticated;
  if (!authenticated) return json_object;

  json_object["display_name"_L1] = display_name;
  json_object["user_id"_L1] = user_id;
  json_object["avatar_url"_L1] = avatar_url;
  json_object["expires_at"_L1] = expires_at;
  json_object["scope"_L1] = scope;

  return json_object;

}
