/*
 * Spotisync
 * This file was part of Strawberry.
 * Copyright 2012, 2014, John Maguire <john.maguire@gmail.com>
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef LOCALREDIRECTSERVER_H
#define LOCALREDIRECTSERVER_H

#include <functional>

#include <QtGlobal>
#include <QObject>
#include <QByteArray>
#include <QHash>
#include <QString>
#include <QUrl>
#include <QTcpServer>

class QTcpSocket;

// Loopback HTTP listener for OAuth redirects.
// Requests to the callback path are passed to the handler, the first one ends the server.
// Anything else is answered with 404 and the server keeps listening.
class LocalRedirectServer : public QTcpServer {
  Q_OBJECT

 public:
  explicit LocalRedirectServer(const QString &callback_path, QObject *parent = nullptr);
  ~LocalRedirectServer() override;

  class Response {
   public:
    Response(const int _http_status_code = 200, const QString &_html = QString()) : http_status_code(_http_status_code), html(_html) {}
    int http_status_code;
    QString html;
  };

  using Handler = std::function<Response(const QUrl &request_url)>;

  const QUrl &url() const { return url_; }
  quint16 port() const { return url_.port() > 0 ? static_cast<quint16>(url_.port()) : 0; }
  const QString &error() const { return error_; }
  bool finished() const { return finished_; }

  void set_handler(const Handler &handler) { handler_ = handler; }

  // Binds 127.0.0.1 on the given port, 0 picks an ephemeral port.
  bool Listen(const quint16 port);

  static QByteArray ReasonPhrase(const int http_status_code);

 public Q_SLOTS:
  void Close();

 Q_SIGNALS:
  void Finished();

 protected:
  void incomingConnection(qintptr socket_descriptor) override;

 private:
  void ReadyRead(QTcpSocket *socket);
  void HandleRequest(QTcpSocket *socket, const QByteArray &request);
  void WriteResponse(QTcpSocket *socket, const Response &response);
  QUrl ParseUrlFromRequest(const QByteArray &request, QByteArray *method) const;
  void Finish();

 private:
  static constexpr int kMaxRequestSize = 16384;
  static constexpr int kWriteTimeoutMsec = 5000;

  const QString callback_path_;
  QUrl url_;
  Handler handler_;
  QHash<QTcpSocket*, QByteArray> buffers_;
  QString error_;
  bool finished_;
};

#endif  // LOCALREDIRECTSERVER_H
