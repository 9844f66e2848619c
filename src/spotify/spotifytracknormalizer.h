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

#ifndef SPOTIFYTRACKNORMALIZER_H
#define SPOTIFYTRACKNORMALIZER_H

#include <QString>
#include <QJsonObject>
#include <QJsonArray>

#include "spotifymodels.h"

// Converts Web API objects into the application's models. Pure functions, missing fields become empty values.
class SpotifyTrackNormalizer {
 public:
  static SpotifyTrack ParseTrack(const QJsonObject &json_track);

  // Saved track and playlist track pages wrap every track in {"track": ...}.
  // Items whose track is null or missing, such as tracks unavailable in the user's region, are dropped.
  static SpotifyTrackList ParseTrackItems(const QJsonArray &json_items);

  static SpotifyPlaylist ParsePlaylist(const QJsonObject &json_playlist);
  static SpotifyProfile ParseProfile(const QJsonObject &json_profile);

 private:
  static QString FirstImageUrl(const QJsonObject &json_object);
  static QString SpotifyUrl(const QJsonObject &json_object);
};

#endif  // SPOTIFYTRACKNORMALIZER_H
