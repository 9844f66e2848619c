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

#include "localredirectserver.h"

#include <QtGlobal>
#include <QByteArray>
#include <QByteArrayList>
#include <QHash>
#include <QList>
#include <QString>
#include <QUrl>
#include <QHostAddress>
#include <QTcpServer>
#include <QAbstractSocket>
#include <QTcpSocket>

#include "logging.h"

using namespace Qt::Literals::StringLiterals;

LocalRedirectServer::LocalRedirectServer(const QString &callback_path, QObject *parent)
    : QTcpServer(parent),
      callback_path_(callback_path),
      finished_(false) {}

LocalRedirectServer::~LocalRedirectServer() {
  if (isListening()) close();
}

bool LocalRedirectServer::Listen(const quint16 port) {

  if (!listen(QHostAddress::LocalHost, port)) {
    error_ = errorString();
    qLog(Debug) << "Unable to listen on port" << port << error_;
    return false;
  }

  error_.clear();
  url_.setScheme(u"http"_s);
  url_.setHost(u"127.0.0.1"_s);
  url_.setPort(serverPort());
  url_.setPath(callback_path_);

  qLog(Debug) << "Listening for redirects on" << url_.toString();

  return true;

}

void LocalRedirectServer::incomingConnection(qintptr socket_descriptor) {

  QTcpSocket *socket = new QTcpSocket(this);
  if (!socket->setSocketDescriptor(socket_descriptor)) {
    qLog(Error) << "Unable to set socket descriptor" << socket->errorString();
    delete socket;
    return;
  }

  if (finished_) {
    socket->abort();
    socket->deleteLater();
    return;
  }

  buffers_.insert(socket, QByteArray());
  QObject::connect(socket, &QAbstractSocket::readyRead, this, [this, socket]() { ReadyRead(socket); });
  QObject::connect(socket, &QAbstractSocket::disconnected, this, [this, socket]() {
    buffers_.remove(socket);
    socket->deleteLater();
  });

}

void LocalRedirectServer::ReadyRead(QTcpSocket *socket) {

  if (!buffers_.contains(socket)) return;

  QByteArray &buffer = buffers_[socket];
  buffer.append(socket->readAll());

  if (buffer.size() > kMaxRequestSize) {
    qLog(Warning) << "Discarding oversized request of" << buffer.size() << "bytes";
    buffers_.remove(socket);
    WriteResponse(socket, Response(400, u"<html><body><p>Request too large.</p></body></html>"_s));
    return;
  }

  // Only the request line and headers matter, the body is ignored.
  if (!buffer.contains("\r\n\r\n")) return;

  const QByteArray request = buffer;
  buffers_.remove(socket);
  HandleRequest(socket, request);

}

void LocalRedirectServer::HandleRequest(QTcpSocket *socket, const QByteArray &request) {

  // The handler can run a nested event loop, the socket must not be deleted there if the client goes away.
  QObject::disconnect(socket, &QAbstractSocket::disconnected, this, nullptr);

  QByteArray method;
  const QUrl request_url = ParseUrlFromRequest(request, &method);
  if (!request_url.isValid()) {
    qLog(Warning) << "Received malformed request line";
    WriteResponse(socket, Response(400, u"<html><body><p>Bad request.</p></body></html>"_s));
    return;
  }

  if (request_url.path() != callback_path_) {
    qLog(Debug) << "Ignoring request for" << request_url.path();
    WriteResponse(socket, Response(404, u"<html><body><p>Not found.</p></body></html>"_s));
    return;
  }

  if (method != "GET") {
    WriteResponse(socket, Response(405, u"<html><body><p>Method not allowed.</p></body></html>"_s));
    return;
  }

  if (finished_) {
    WriteResponse(socket, Response(410, u"<html><body><p>This login attempt has already completed.</p></body></html>"_s));
    return;
  }

  finished_ = true;

  const Response response = handler_ ? handler_(request_url) : Response(500, u"<html><body><p>No handler installed.</p></body></html>"_s);
  WriteResponse(socket, response);

  Finish();

}

void LocalRedirectServer::WriteResponse(QTcpSocket *socket, const Response &response) {

  const QByteArray body = response.html.toUtf8();

  QByteArray data;
  data.append("HTTP/1.1 " + QByteArray::number(response.http_status_code) + ' ' + ReasonPhrase(response.http_status_code) + "\r\n");
  data.append("Content-Type: text/html; charset=utf-8\r\n");
  data.append("Content-Length: " + QByteArray::number(body.size()) + "\r\n");
  data.append("Cache-Control: no-store\r\n");
  data.append("Connection: close\r\n");
  data.append("\r\n");
  data.append(body);

  socket->write(data);
  while (socket->bytesToWrite() > 0) {
    if (!socket->waitForBytesWritten(kWriteTimeoutMsec)) {
      qLog(Warning) << "Unable to write response:" << socket->errorString();
      break;
    }
  }
  socket->disconnectFromHost();
  socket->deleteLater();

}

QUrl LocalRedirectServer::ParseUrlFromRequest(const QByteArray &request, QByteArray *method) const {

  const QByteArray request_line = request.left(request.indexOf("\r\n"));
  const QByteArrayList parts = request_line.split(' ');
  if (parts.count() != 3 || !parts[2].startsWith("HTTP/") || !parts[1].startsWith('/')) {
    return QUrl();
  }

  if (method) *method = parts[0];

  const QUrl path_url = QUrl::fromEncoded(parts[1], QUrl::StrictMode);
  if (!path_url.isValid()) return QUrl();

  return url_.resolved(path_url);

}

void LocalRedirectServer::Close() {

  if (isListening()) close();

  const QList<QTcpSocket*> sockets = buffers_.keys();
  buffers_.clear();
  for (QTcpSocket *socket : sockets) {
    socket->abort();
    socket->deleteLater();
  }

  if (!finished_) {
    finished_ = true;
    error_ = u"Login attempt was closed before the callback arrived"_s;
    qLog(Debug) << "Redirect server closed without a callback";
    Q_EMIT Finished();
  }

}

void LocalRedirectServer::Finish() {

  if (isListening()) close();
  qLog(Debug) << "Redirect server on port" << port() << "finished";

  Q_EMIT Finished();

}

QByteArray LocalRedirectServer::ReasonPhrase(const int http_status_code) {

  switch (http_status_code) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 410: return "Gone";
    case 500: return "Internal Server Error";
    default: return "Unknown";
  }

}
