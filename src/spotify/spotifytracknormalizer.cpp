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
#include <QStringList>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>

#include "spotifytracknormalizer.h"

using namespace Qt::Literals::StringLiterals;

QString SpotifyTrackNormalizer::FirstImageUrl(const QJsonObject &json_object) {

  const QJsonArray array_images = json_object["images"_L1].toArray();
  for (const QJsonValue &value_image : array_images) {
    const QString url = value_image.toObject()["url"_L1].toString();
    if (!url.isEmpty()) return url;
  }

  return QString();

}

QString SpotifyTrackNormalizer::SpotifyUrl(const QJsonObject &json_object) {
  return json_object["external_urls"_L1].toObject()["spotify"_L1].toString();
}

SpotifyTrack SpotifyTrackNormalizer::ParseTrack(const QJsonObject &json_track) {

  SpotifyTrack track;
  track.track_id = json_track["id"_L1].toString();
  track.name = json_track["name"_L1].toString();
  track.track_number = json_track["track_number"_L1].toInt();
  track.disc_number = json_track["disc_number"_L1].toInt();
  track.duration_ms = json_track["duration_ms"_L1].toInteger();
  track.external_url = SpotifyUrl(json_track);
  track.isrc = json_track["external_ids"_L1].toObject()["isrc"_L1].toString();

  QStringList artist_names;
  const QJsonArray array_artists = json_track["artists"_L1].toArray();
  for (const QJsonValue &value_artist : array_artists) {
    const QJsonObject object_artist = value_artist.toObject();
    SpotifyArtist artist;
    artist.id = object_artist["id"_L1].toString();
    artist.name = object_artist["name"_L1].toString();
    artist.external_url = SpotifyUrl(object_artist);
    artist_names << artist.name;
    track.artists_data << artist;
  }
  track.artists = artist_names.join(", "_L1);
  if (!track.artists_data.isEmpty()) {
    track.artist_id = track.artists_data.first().id;
    track.artist_url = track.artists_data.first().external_url;
  }

  const QJsonObject object_album = json_track["album"_L1].toObject();
  track.album_id = object_album["id"_L1].toString();
  track.album_name = object_album["name"_L1].toString();
  track.album_type = object_album["album_type"_L1].toString();
  track.album_url = SpotifyUrl(object_album);
  track.release_date = object_album["release_date"_L1].toString();
  track.total_tracks = object_album["total_tracks"_L1].toInt();
  track.cover_url = FirstImageUrl(object_album);

  QStringList album_artist_names;
  const QJsonArray array_album_artists = object_album["artists"_L1].toArray();
  for (const QJsonValue &value_artist : array_album_artists) {
    album_artist_names << value_artist.toObject()["name"_L1].toString();
  }
  track.album_artist = album_artist_names.join(", "_L1);

  return track;

}

SpotifyTrackList SpotifyTrackNormalizer::ParseTrackItems(const QJsonArray &json_items) {

  SpotifyTrackList tracks;
  tracks.reserve(json_items.count());
  for (const QJsonValue &value_item : json_items) {
    const QJsonValue value_track = value_item.toObject()["track"_L1];
    if (!value_track.isObject()) continue;
    tracks << ParseTrack(value_track.toObject());
  }

  return tracks;

}

SpotifyPlaylist SpotifyTrackNormalizer::ParsePlaylist(const QJsonObject &json_playlist) {

  SpotifyPlaylist playlist;
  playlist.id = json_playlist["id"_L1].toString();
  playlist.name = json_playlist["name"_L1].toString();
  playlist.owner = json_playlist["owner"_L1].toObject()["display_name"_L1].toString();
  playlist.track_count = json_playlist["tracks"_L1].toObject()["total"_L1].toInt();
  playlist.cover_url = FirstImageUrl(json_playlist);
  playlist.is_public = json_playlist["public"_L1].toBool();

  return playlist;

}

SpotifyProfile SpotifyTrackNormalizer::ParseProfile(const QJsonObject &json_profile) {

  SpotifyProfile profile;
  profile.id = json_profile["id"_L1].toString();
  profile.display_name = json_profile["display_name"_L1].toString();
  profile.email = json_profile["email"_L1].toString();

  const QJsonArray array_images = json_profile["images"_L1].toArray();
  for (const QJsonValue &value_image : array_images) {
    const QString url = value_image.toObject()["url"_L1].toString();
    if (!url.isEmpty()) profile.avatar_urls << url;
  }

  return profile;

}
