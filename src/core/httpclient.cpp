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

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QVariant>
#include <QEventLoop>
#include <QNetworkRequest>
#include <QNetworkReply>

#include "includes/shared_ptr.h"
#include "httpclient.h"
#include "networkaccessmanager.h"
#include "cancellable.h"
#include "logging.h"

using namespace Qt::Literals::StringLiterals;

NetworkHttpClient::NetworkHttpClient(const int transfer_timeout_msec) : transfer_timeout_msec_(transfer_timeout_msec) {}

HttpClient::Reply NetworkHttpClient::Get(const QUrl &url, const HeaderList &headers, const SharedPtr<Cancellable> cancellable) {

  QNetworkRequest network_request(url);
  for (const Header &header : headers) {
    network_request.setRawHeader(header.first, header.second);
  }

  return Execute(Operation::Get, network_request, QByteArray(), cancellable);

}

HttpClient::Reply NetworkHttpClient::Post(const QUrl &url, const HeaderList &headers, const QByteArray &data, const SharedPtr<Cancellable> cancellable) {

  QNetworkRequest network_request(url);
  for (const Header &header : headers) {
    network_request.setRawHeader(header.first, header.second);
  }

  return Execute(Operation::Post, network_request, data, cancellable);

}

HttpClient::Reply NetworkHttpClient::Execute(const Operation operation, const QNetworkRequest &network_request, const QByteArray &data, const SharedPtr<Cancellable> cancellable) const {

  if (cancellable && cancellable->is_cancelled()) {
    return Reply(ErrorCode::Cancelled, u"Operation cancelled"_s);
  }

  // Owned by this thread for the duration of the call, replies are its children.
  NetworkAccessManager network(transfer_timeout_msec_);
  QNetworkReply *reply = operation == Operation::Post ? network.post(network_request, data) : network.get(network_request);

  QEventLoop loop;
  QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
  if (cancellable) {
    QObject::connect(&*cancellable, &Cancellable::Cancelled, reply, &QNetworkReply::abort);
    if (cancellable->is_cancelled()) {
      reply->abort();
    }
  }
  if (!reply->isFinished()) {
    loop.exec();
  }

  QObject::disconnect(reply, nullptr, &loop, nullptr);
  if (cancellable) {
    QObject::disconnect(&*cancellable, nullptr, reply, nullptr);
  }

  if (reply->error() == QNetworkReply::OperationCanceledError && cancellable && cancellable->is_cancelled()) {
    qLog(Debug) << "Request for" << network_request.url().path() << "was cancelled";
    return Reply(ErrorCode::Cancelled, u"Operation cancelled"_s);
  }

  // Errors below 200 are transport level, above are HTTP errors with a status code and body.
  if (reply->error() != QNetworkReply::NoError && reply->error() < 200) {
    const QString error_message = QStringLiteral("%1 (%2)").arg(reply->errorString()).arg(reply->error());
    qLog(Error) << "Network request for" << network_request.url().toString(QUrl::RemoveQuery) << "failed:" << error_message;
    return Reply(ErrorCode::NetworkError, error_message);
  }

  const QVariant http_status_code = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
  if (!http_status_code.isValid()) {
    return Reply(ErrorCode::NetworkError, u"Missing HTTP status code"_s);
  }

  return Reply(http_status_code.toInt(), reply->readAll());

}
