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

#include <QtGlobal>
#include <QObject>
#include <QMetaObject>
#include <QThread>
#include <QString>
#include <QUrl>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/cancellable.h"
#include "core/localredirectserver.h"
#include "spotifyloginsession.h"

using namespace Qt::Literals::StringLiterals;

SpotifyLoginSession::SpotifyLoginSession(const quint64 serial, const SpotifyPKCE &pkce, const QString &callback_path, const SharedPtr<Cancellable> cancellable)
    : serial_(serial),
      pkce_(pkce),
      callback_path_(callback_path),
      cancellable_(cancellable),
      result_slot_(new ResultSlot),
      server_(nullptr) {}

SpotifyLoginSession::~SpotifyLoginSession() {
  Shutdown();
}

SpotifyResult SpotifyLoginSession::Start(const quint16 preferred_port, const LocalRedirectServer::Handler &handler) {

  thread_.reset(new QThread);
  thread_->setObjectName(QStringLiteral("SpotifyLoginServer%1").arg(serial_));

  server_ = new LocalRedirectServer(callback_path_);
  server_->set_handler(handler);
  server_->moveToThread(&*thread_);
  QObject::connect(&*thread_, &QThread::finished, server_, &QObject::deleteLater);

  // Ends a login that is closed before any callback arrives, a handled callback has already published.
  const SharedPtr<ResultSlot> result_slot = result_slot_;
  QObject::connect(server_, &LocalRedirectServer::Finished, server_, [result_slot]() {
    result_slot->TryPush(SpotifyResult(SpotifyResult::ErrorCode::Cancelled, u"Login attempt was closed before it completed"_s));
  }, Qt::DirectConnection);

  thread_->start();

  bool listening = false;
  QString error;
  QUrl url;
  LocalRedirectServer *server = server_;
  QMetaObject::invokeMethod(server_, [server, preferred_port, &listening, &error, &url]() {
    if (preferred_port != 0) {
      listening = server->Listen(preferred_port);
      if (!listening) {
        qLog(Info) << "Port" << preferred_port << "is not available, using an ephemeral port";
      }
    }
    if (!listening) {
      listening = server->Listen(0);
    }
    error = server->error();
    url = server->url();
  }, Qt::BlockingQueuedConnection);

  if (!listening) {
    qLog(Error) << "Unable to start redirect server:" << error;
    Shutdown();
    return SpotifyResult(SpotifyResult::ErrorCode::ListenFailure, QStringLiteral("Unable to start local redirect server: %1").arg(error));
  }

  redirect_uri_ = url;

  if (cancellable_) {
    QObject::connect(&*cancellable_, &Cancellable::Cancelled, server_, &LocalRedirectServer::Close);
    if (cancellable_->is_cancelled()) {
      QMetaObject::invokeMethod(server_, &LocalRedirectServer::Close, Qt::QueuedConnection);
    }
  }

  return SpotifyResult();

}

bool SpotifyLoginSession::PublishResult(const SpotifyResult &result) const {

  const bool published = result_slot_->TryPush(result);
  if (!published) {
    qLog(Debug) << "Dropping login outcome" << result.ToString() << "for attempt" << serial_;
  }

  return published;

}

void SpotifyLoginSession::Shutdown() {

  if (!thread_) return;

  // The server lives until the thread has finished, so it is safe to post to it while the thread runs.
  if (thread_->isRunning()) {
    if (cancellable_) {
      QObject::disconnect(&*cancellable_, nullptr, server_, nullptr);
    }
    QMetaObject::invokeMethod(server_, &LocalRedirectServer::Close, Qt::QueuedConnection);
    thread_->quit();
    thread_->wait();
  }

  result_slot_->TryPush(SpotifyResult(SpotifyResult::ErrorCode::Cancelled, u"Login attempt was superseded"_s));

  server_ = nullptr;
  thread_.reset();

}
