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

#include <QList>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/cancellable.h"
#include "spotifylibrary.h"
#include "spotifysession.h"
#include "spotifypagefetcher.h"
#include "spotifytracknormalizer.h"

using namespace Qt::Literals::StringLiterals;

SpotifyLibrary::SpotifyLibrary(SpotifySession *session, const SharedPtr<SpotifyApiClient> api_client, const QUrl &api_url)
    : session_(session),
      api_client_(api_client),
      api_url_(api_url) {}

QUrl SpotifyLibrary::ApiUrl(const QString &path, const int limit, const int offset) const {

  QUrl url(api_url_.toString() + path);

  QUrlQuery url_query;
  if (limit > 0) {
    url_query.addQueryItem(u"limit"_s, QString::number(limit));
  }
  if (offset >= 0) {
    url_query.addQueryItem(u"offset"_s, QString::number(offset));
  }
  if (!url_query.isEmpty()) {
    url.setQuery(url_query);
  }

  return url;

}

SpotifyPlaylistListResult SpotifyLibrary::FetchPlaylists(const SharedPtr<Cancellable> cancellable) const {

  const SpotifyStringResult access_token = session_->AccessToken(cancellable);
  if (!access_token.success()) {
    return access_token;
  }

  SpotifyPlaylistList playlists;
  QUrl url = ApiUrl(u"/me/playlists"_s, kPlaylistsLimit);
  while (!url.isEmpty()) {
    const SpotifyApiClient::JsonObjectResult json_result = api_client_->GetJson(url, access_token.value, cancellable);
    if (!json_result.success()) {
      return json_result.Wrap(json_result.error_code, u"Fetch playlists page"_s);
    }

    const SpotifyApiClient::JsonArrayResult items_result = SpotifyApiClient::GetJsonArray(json_result.value, u"items"_s);
    if (!items_result.success()) {
      return items_result.Wrap(items_result.error_code, u"Fetch playlists page"_s);
    }
    for (const QJsonValue &value_item : items_result.value) {
      if (!value_item.isObject()) continue;
      playlists << SpotifyTrackNormalizer::ParsePlaylist(value_item.toObject());
    }

    const QUrl next_url(json_result.value["next"_L1].toString());
    if (next_url == url) {
      qLog(Warning) << "Playlist paging returned the same page twice, stopping";
      break;
    }
    url = next_url;
  }

  qLog(Debug) << "Fetched" << playlists.count() << "playlists";

  return playlists;

}

SpotifyLibrary::TrackPageResult SpotifyLibrary::FetchTrackPage(const QString &path, const int limit, const int offset, const QString &access_token, const SharedPtr<Cancellable> cancellable) const {

  const SpotifyApiClient::JsonObjectResult json_result = api_client_->GetJson(ApiUrl(path, limit, offset), access_token, cancellable);
  if (!json_result.success()) {
    return json_result;
  }

  const SpotifyApiClient::JsonArrayResult items_result = SpotifyApiClient::GetJsonArray(json_result.value, u"items"_s);
  if (!items_result.success()) {
    return items_result;
  }

  TrackPage page;
  page.tracks = SpotifyTrackNormalizer::ParseTrackItems(items_result.value);
  page.item_count = static_cast<int>(items_result.value.count());
  page.total = json_result.value["total"_L1].toInt();

  return page;

}

SpotifyTrackListResult SpotifyLibrary::FetchTracks(const QString &path, const int limit, const int total, const TrackPage &first_page, const QString &access_token, const SharedPtr<Cancellable> cancellable) const {

  SpotifyTrackList tracks = first_page.tracks;
  if (total <= first_page.item_count) {
    return tracks;
  }

  const SpotifyPageFetcher<SpotifyTrack>::Result fetch_result = SpotifyPageFetcher<SpotifyTrack>::Fetch(total, limit, [this, path, limit, access_token, cancellable](const int offset) -> SpotifyPageFetcher<SpotifyTrack>::PageResult {
    const TrackPageResult page_result = FetchTrackPage(path, limit, offset, access_token, cancellable);
    if (!page_result.success()) {
      return page_result;
    }
    return page_result.value.tracks;
  }, cancellable);

  if (!fetch_result.success()) {
    return fetch_result;
  }

  tracks << fetch_result.items();

  return tracks;

}

SpotifyTrackListResult SpotifyLibrary::FetchSavedTracks(const SharedPtr<Cancellable> cancellable) const {

  const SpotifyStringResult access_token = session_->AccessToken(cancellable);
  if (!access_token.success()) {
    return access_token;
  }

  const QString path = u"/me/tracks"_s;
  const TrackPageResult first_page_result = FetchTrackPage(path, kSavedTracksLimit, 0, access_token.value, cancellable);
  if (!first_page_result.success()) {
    return first_page_result.Wrap(first_page_result.error_code, u"Fetch saved tracks page"_s);
  }

  const SpotifyTrackListResult result = FetchTracks(path, kSavedTracksLimit, first_page_result.value.total, first_page_result.value, access_token.value, cancellable);
  if (result.success()) {
    qLog(Debug) << "Fetched" << result.value.count() << "saved tracks of" << first_page_result.value.total;
  }

  return result;

}

SpotifyPlaylistWithTracksResult SpotifyLibrary::FetchPlaylistWithTracks(const QString &playlist_id, const SharedPtr<Cancellable> cancellable) const {

  if (playlist_id.isEmpty()) {
    return SpotifyPlaylistWithTracksResult(SpotifyResult::ErrorCode::NotFound, u"Missing playlist id"_s);
  }

  const SpotifyStringResult access_token = session_->AccessToken(cancellable);
  if (!access_token.success()) {
    return access_token;
  }

  const QString playlist_path = "/playlists/"_L1 + QString::fromLatin1(QUrl::toPercentEncoding(playlist_id));

  const SpotifyApiClient::JsonObjectResult json_result = api_client_->GetJson(ApiUrl(playlist_path), access_token.value, cancellable);
  if (!json_result.success()) {
    return json_result.Wrap(json_result.error_code, u"Fetch playlist"_s);
  }

  SpotifyPlaylistWithTracks playlist_with_tracks;
  playlist_with_tracks.playlist = SpotifyTrackNormalizer::ParsePlaylist(json_result.value);

  const QString tracks_path = playlist_path + "/tracks"_L1;
  const TrackPageResult first_page_result = FetchTrackPage(tracks_path, kPlaylistTracksLimit, 0, access_token.value, cancellable);
  if (!first_page_result.success()) {
    return first_page_result.Wrap(first_page_result.error_code, u"Fetch playlist tracks page"_s);
  }

  // The playlist object's track total decides how many pages there are.
  const SpotifyTrackListResult tracks_result = FetchTracks(tracks_path, kPlaylistTracksLimit, playlist_with_tracks.playlist.track_count, first_page_result.value, access_token.value, cancellable);
  if (!tracks_result.success()) {
    return tracks_result;
  }

  playlist_with_tracks.tracks = tracks_result.value;

  qLog(Debug) << "Fetched playlist" << playlist_with_tracks.playlist.name << "with" << playlist_with_tracks.tracks.count() << "tracks";

  return playlist_with_tracks;

}
