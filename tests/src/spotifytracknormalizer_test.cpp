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

#include "gtest_include.h"

#include <QByteArray>
#include <QString>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>

#include "test_utils.h"
#include "spotify/spotifymodels.h"
#include "spotify/spotifytracknormalizer.h"

using namespace Qt::Literals::StringLiterals;

namespace {

QJsonObject ParseJson(const char *json) {
  return QJsonDocument::fromJson(QByteArray(json)).object();
}

constexpr char kTrackJson[] = R"({
  "id": "track1",
  "name": "Song Title",
  "track_number": 3,
  "disc_number": 1,
  "duration_ms": 215000,
  "external_ids": { "isrc": "USRC17607839" },
  "external_urls": { "spotify": "https://open.spotify.com/track/track1" },
  "artists": [
    { "id": "artist1", "name": "First Artist", "external_urls": { "spotify": "https://open.spotify.com/artist/artist1" } },
    { "id": "artist2", "name": "Second Artist", "external_urls": { "spotify": "https://open.spotify.com/artist/artist2" } }
  ],
  "album": {
    "id": "album1",
    "name": "Album Name",
    "album_type": "album",
    "release_date": "2020-05-01",
    "total_tracks": 12,
    "external_urls": { "spotify": "https://open.spotify.com/album/album1" },
    "artists": [ { "id": "artist1", "name": "First Artist" } ],
    "images": [ { "url": "https://i.scdn.co/image/large", "width": 640 }, { "url": "https://i.scdn.co/image/small", "width": 64 } ]
  }
})";

TEST(SpotifyTrackNormalizerTest, ParseTrack) {

  const SpotifyTrack track = SpotifyTrackNormalizer::ParseTrack(ParseJson(kTrackJson));

  EXPECT_EQ(track.track_id, u"track1"_s);
  EXPECT_EQ(track.name, u"Song Title"_s);
  EXPECT_EQ(track.artists, u"First Artist, Second Artist"_s);
  ASSERT_EQ(track.artists_data.count(), 2);
  EXPECT_EQ(track.artists_data[1].id, u"artist2"_s);
  EXPECT_EQ(track.artists_data[1].external_url, u"https://open.spotify.com/artist/artist2"_s);
  EXPECT_EQ(track.artist_id, u"artist1"_s);
  EXPECT_EQ(track.artist_url, u"https://open.spotify.com/artist/artist1"_s);
  EXPECT_EQ(track.album_id, u"album1"_s);
  EXPECT_EQ(track.album_name, u"Album Name"_s);
  EXPECT_EQ(track.album_artist, u"First Artist"_s);
  EXPECT_EQ(track.album_type, u"album"_s);
  EXPECT_EQ(track.album_url, u"https://open.spotify.com/album/album1"_s);
  EXPECT_EQ(track.release_date, u"2020-05-01"_s);
  EXPECT_EQ(track.track_number, 3);
  EXPECT_EQ(track.disc_number, 1);
  EXPECT_EQ(track.total_tracks, 12);
  EXPECT_EQ(track.duration_ms, 215000);
  EXPECT_EQ(track.cover_url, u"https://i.scdn.co/image/large"_s);
  EXPECT_EQ(track.external_url, u"https://open.spotify.com/track/track1"_s);
  EXPECT_EQ(track.isrc, u"USRC17607839"_s);

}

TEST(SpotifyTrackNormalizerTest, ParseTrackWithoutArtistsOrImages) {

  const SpotifyTrack track = SpotifyTrackNormalizer::ParseTrack(ParseJson(R"({ "id": "track2", "name": "Bare", "album": { "images": [] } })"));

  EXPECT_EQ(track.track_id, u"track2"_s);
  EXPECT_TRUE(track.artists.isEmpty());
  EXPECT_TRUE(track.artists_data.isEmpty());
  EXPECT_TRUE(track.artist_id.isEmpty());
  EXPECT_TRUE(track.artist_url.isEmpty());
  EXPECT_TRUE(track.cover_url.isEmpty());

}

TEST(SpotifyTrackNormalizerTest, ParseTrackItemsDropsNullTracks) {

  QJsonArray json_items;
  QJsonObject json_item;
  json_item["track"_L1] = ParseJson(kTrackJson);
  json_items.append(json_item);
  QJsonObject json_null_item;
  json_null_item["track"_L1] = QJsonValue::Null;
  json_items.append(json_null_item);
  json_items.append(QJsonObject());
  json_items.append(json_item);

  const SpotifyTrackList tracks = SpotifyTrackNormalizer::ParseTrackItems(json_items);
  ASSERT_EQ(tracks.count(), 2);
  EXPECT_EQ(tracks[0].track_id, u"track1"_s);
  EXPECT_EQ(tracks[1].track_id, u"track1"_s);

}

TEST(SpotifyTrackNormalizerTest, ParsePlaylist) {

  const SpotifyPlaylist playlist = SpotifyTrackNormalizer::ParsePlaylist(ParseJson(R"({
    "id": "pl1",
    "name": "Road Trip",
    "public": true,
    "owner": { "display_name": "Jane" },
    "tracks": { "total": 130 },
    "images": [ { "url": "https://i.scdn.co/image/cover" } ]
  })"));

  EXPECT_EQ(playlist.id, u"pl1"_s);
  EXPECT_EQ(playlist.name, u"Road Trip"_s);
  EXPECT_EQ(playlist.owner, u"Jane"_s);
  EXPECT_EQ(playlist.track_count, 130);
  EXPECT_EQ(playlist.cover_url, u"https://i.scdn.co/image/cover"_s);
  EXPECT_TRUE(playlist.is_public);

  const QJsonObject json_playlist = playlist.ToJson();
  EXPECT_EQ(json_playlist["tracks_total"_L1].toInt(), 130);
  EXPECT_EQ(json_playlist["image_url"_L1].toString(), u"https://i.scdn.co/image/cover"_s);

}

TEST(SpotifyTrackNormalizerTest, ParseProfile) {

  const SpotifyProfile profile = SpotifyTrackNormalizer::ParseProfile(ParseJson(R"({
    "id": "user1",
    "display_name": "Jane",
    "email": "jane@example.com",
    "images": [ { "url": "https://i.scdn.co/image/avatar" } ]
  })"));

  EXPECT_TRUE(profile.is_valid());
  EXPECT_EQ(profile.display_name, u"Jane"_s);
  EXPECT_EQ(profile.avatar_url(), u"https://i.scdn.co/image/avatar"_s);

  EXPECT_FALSE(SpotifyTrackNormalizer::ParseProfile(QJsonObject()).is_valid());

}

TEST(SpotifyTrackNormalizerTest, TrackToJson) {

  const QJsonObject json_track = SpotifyTrackNormalizer::ParseTrack(ParseJson(kTrackJson)).ToJson();

  EXPECT_EQ(json_track["spotify_id"_L1].toString(), u"track1"_s);
  EXPECT_EQ(json_track["artists"_L1].toString(), u"First Artist, Second Artist"_s);
  EXPECT_EQ(json_track["artists_data"_L1].toArray().count(), 2);
  EXPECT_EQ(json_track["duration_ms"_L1].toInteger(), 215000);

}

}  // namespace
