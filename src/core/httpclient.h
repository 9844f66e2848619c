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

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <QtGlobal>
#include <QList>
#include <QPair>
#include <QByteArray>
#include <QString>
#include <QUrl>

#include "includes/shared_ptr.h"

class QNetworkRequest;
class Cancellable;

// Blocking HTTP transport. Implementations must be safe to call from several threads at once.
class HttpClient {
 public:
  HttpClient() = default;
  virtual ~HttpClient() = default;

  using Header = QPair<QByteArray, QByteArray>;
  using HeaderList = QList<Header>;

  enum class ErrorCode {
    Success,
    NetworkError,
    Cancelled,
  };

  // A reply that reached the server has error_code Success, whatever the HTTP status.
  class Reply {
   public:
    Reply(const ErrorCode _error_code = ErrorCode::Success, const QString &_error_message = QString())
        : error_code(_error_code),
          http_status_code(0),
          error_message(_error_message) {}
    Reply(const int _http_status_code, const QByteArray &_data)
        : error_code(ErrorCode::Success),
          http_status_code(_http_status_code),
          data(_data) {}
    ErrorCode error_code;
    int http_status_code;
    QByteArray data;
    QString error_message;
    bool success() const { return error_code == ErrorCode::Success; }
    bool http_success() const { return success() && http_status_code >= 200 && http_status_code < 300; }
  };

  virtual Reply Get(const QUrl &url, const HeaderList &headers, const SharedPtr<Cancellable> cancellable) = 0;
  virtual Reply Post(const QUrl &url, const HeaderList &headers, const QByteArray &data, const SharedPtr<Cancellable> cancellable) = 0;

 private:
  Q_DISABLE_COPY(HttpClient)
};

// Runs each request on a NetworkAccessManager owned by the calling thread and waits for it in a local event loop.
class NetworkHttpClient : public HttpClient {
 public:
  explicit NetworkHttpClient(const int transfer_timeout_msec);

  Reply Get(const QUrl &url, const HeaderList &headers, const SharedPtr<Cancellable> cancellable) override;
  Reply Post(const QUrl &url, const HeaderList &headers, const QByteArray &data, const SharedPtr<Cancellable> cancellable) override;

 private:
  enum class Operation {
    Get,
    Post
  };
  Reply Execute(const Operation operation, const QNetworkRequest &network_request, const QByteArray &data, const SharedPtr<Cancellable> cancellable) const;

 private:
  const int transfer_timeout_msec_;
};

#endif  // HTTPCLIENT_H
