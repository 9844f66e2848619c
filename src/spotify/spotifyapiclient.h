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

#ifndef SPOTIFYAPICLIENT_H
#define SPOTIFYAPICLIENT_H

#include <QList>
#include <QPair>
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QJsonObject>
#include <QJsonArray>

#include "includes/shared_ptr.h"
#include "core/httpclient.h"
#include "spotifyresult.h"

class Cancellable;

// JSON requests against the Web API and the accounts service.
// Holds no session state, every call gets its credentials passed in.
class SpotifyApiClient {
 public:
  explicit SpotifyApiClient(const SharedPtr<HttpClient> http_client);

  using Param = QPair<QString, QString>;
  using ParamList = QList<Param>;

  using JsonObjectResult = SpotifyValueResult<QJsonObject>;
  using JsonArrayResult = SpotifyValueResult<QJsonArray>;

  JsonObjectResult GetJson(const QUrl &url, const QString &access_token, const SharedPtr<Cancellable> cancellable) const;
  JsonObjectResult PostForm(const QUrl &url, const QString &client_id, const QString &client_secret, const ParamList &params, const SharedPtr<Cancellable> cancellable) const;

  static JsonObjectResult ParseReply(const HttpClient::Reply &reply);
  static JsonObjectResult GetJsonObject(const QByteArray &data);
  static JsonObjectResult GetJsonObject(const QJsonObject &json_object, const QString &name);
  static JsonArrayResult GetJsonArray(const QJsonObject &json_object, const QString &name);

  // Error text from a Web API ({"error": {"status", "message"}}) or accounts service ({"error", "error_description"}) body.
  static QString ProviderErrorMessage(const QByteArray &data);

 private:
  const SharedPtr<HttpClient> http_client_;
};

#endif  // SPOTIFYAPICLIENT_H
