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

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/httpclient.h"
#include "utilities/cryptutils.h"
#include "spotifyapiclient.h"

using namespace Qt::Literals::StringLiterals;

SpotifyApiClient::SpotifyApiClient(const SharedPtr<HttpClient> http_client) : http_client_(http_client) {}

SpotifyApiClient::JsonObjectResult SpotifyApiClient::GetJson(const QUrl &url, const QString &access_token, const SharedPtr<Cancellable> cancellable) const {

  const HttpClient::HeaderList headers = HttpClient::HeaderList() << HttpClient::Header("Authorization", "Bearer " + access_token.toUtf8());

  qLog(Debug) << "GET" << url.toString();

  return ParseReply(http_client_->Get(url, headers, cancellable));

}

SpotifyApiClient::JsonObjectResult SpotifyApiClient::PostForm(const QUrl &url, const QString &client_id, const QString &client_secret, const ParamList &params, const SharedPtr<Cancellable> cancellable) const {

  QUrlQuery url_query;
  for (const Param &param : params) {
    url_query.addQueryItem(QString::fromLatin1(QUrl::toPercentEncoding(param.first)), QString::fromLatin1(QUrl::toPercentEncoding(param.second)));
  }

  const HttpClient::HeaderList headers = HttpClient::HeaderList()
                                         << HttpClient::Header("Authorization", Utilities::BasicAuthorization(client_id, client_secret))
                                         << HttpClient::Header("Content-Type", "application/x-www-form-urlencoded");

  qLog(Debug) << "POST" << url.toString();

  return ParseReply(http_client_->Post(url, headers, url_query.toString(QUrl::FullyEncoded).toUtf8(), cancellable));

}

SpotifyApiClient::JsonObjectResult SpotifyApiClient::ParseReply(const HttpClient::Reply &reply) {

  switch (reply.error_code) {
    case HttpClient::ErrorCode::Success:
      break;
    case HttpClient::ErrorCode::Cancelled:
      return JsonObjectResult(SpotifyResult::ErrorCode::Cancelled, reply.error_message);
    case HttpClient::ErrorCode::NetworkError:
      return JsonObjectResult(SpotifyResult::ErrorCode::NetworkError, reply.error_message);
  }

  if (reply.http_status_code < 200 || reply.http_status_code > 299) {
    QString error_message = QStringLiteral("Received HTTP code %1").arg(reply.http_status_code);
    const QString provider_error_message = ProviderErrorMessage(reply.data);
    if (!provider_error_message.isEmpty()) {
      error_message += ": "_L1 + provider_error_message;
    }
    qLog(Error) << error_message;
    JsonObjectResult result(SpotifyResult::ErrorCode::HttpStatusError, error_message);
    result.http_status_code = reply.http_status_code;
    result.reply_data = reply.data;
    return result;
  }

  JsonObjectResult result = GetJsonObject(reply.data);
  result.http_status_code = reply.http_status_code;
  if (!result.success()) {
    qLog(Error) << "Unable to parse reply:" << result.error_message;
  }

  return result;

}

SpotifyApiClient::JsonObjectResult SpotifyApiClient::GetJsonObject(const QByteArray &data) {

  if (data.isEmpty()) {
    return JsonObjectResult(SpotifyResult::ErrorCode::ParseError, u"Empty data from server"_s);
  }

  QJsonParseError json_error;
  const QJsonDocument json_document = QJsonDocument::fromJson(data, &json_error);
  if (json_error.error != QJsonParseError::NoError) {
    return JsonObjectResult(SpotifyResult::ErrorCode::ParseError, json_error.errorString());
  }

  if (!json_document.isObject()) {
    return JsonObjectResult(SpotifyResult::ErrorCode::ParseError, u"Json document is not an object."_s);
  }

  return json_document.object();

}

SpotifyApiClient::JsonObjectResult SpotifyApiClient::GetJsonObject(const QJsonObject &json_object, const QString &name) {

  if (!json_object.contains(name)) {
    return JsonObjectResult(SpotifyResult::ErrorCode::ParseError, QStringLiteral("Json object is missing object %1.").arg(name));
  }

  const QJsonValue json_value = json_object[name];
  if (!json_value.isObject()) {
    return JsonObjectResult(SpotifyResult::ErrorCode::ParseError, QStringLiteral("Json value %1 is not a object.").arg(name));
  }

  return json_value.toObject();

}

SpotifyApiClient::JsonArrayResult SpotifyApiClient::GetJsonArray(const QJsonObject &json_object, const QString &name) {

  if (!json_object.contains(name)) {
    return JsonArrayResult(SpotifyResult::ErrorCode::ParseError, QStringLiteral("Json object is missing value %1.").arg(name));
  }

  const QJsonValue json_value = json_object[name];
  if (!json_value.isArray()) {
    return JsonArrayResult(SpotifyResult::ErrorCode::ParseError, QStringLiteral("Json object value %1 is not a array.").arg(name));
  }

  return json_value.toArray();

}

QString SpotifyApiClient::ProviderErrorMessage(const QByteArray &data) {

  if (data.isEmpty()) return QString();

  QJsonParseError json_error;
  const QJsonDocument json_document = QJsonDocument::fromJson(data, &json_error);
  if (json_error.error != QJsonParseError::NoError || !json_document.isObject()) {
    return QString();
  }

  const QJsonObject json_object = json_document.object();
  if (!json_object.contains("error"_L1)) return QString();

  const QJsonValue json_error_value = json_object["error"_L1];
  if (json_error_value.isObject()) {
    const QJsonObject object_error = json_error_value.toObject();
    const QString message = object_error["message"_L1].toString();
    if (object_error.contains("status"_L1)) {
      return QStringLiteral("%1 (%2)").arg(message).arg(object_error["status"_L1].toInt());
    }
    return message;
  }

  if (json_error_value.isString()) {
    const QString description = json_object["error_description"_L1].toString();
    if (description.isEmpty()) return json_error_value.toString();
    return QStringLiteral("%1 (%2)").arg(description, json_error_value.toString());
  }

  return QString();

}
