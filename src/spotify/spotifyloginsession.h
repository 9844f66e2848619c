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

#ifndef SPOTIFYLOGINSESSION_H
#define SPOTIFYLOGINSESSION_H

#include <QtGlobal>
#include <QString>
#include <QUrl>

#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "includes/singleslot.h"
#include "core/localredirectserver.h"
#include "spotifyresult.h"
#include "spotifypkce.h"

class QThread;
class Cancellable;

// One login attempt: PKCE values, the loopback redirect server on its own thread and the outcome slot.
// Destroying the session shuts the server down and joins its thread.
class SpotifyLoginSession {
 public:
  using ResultSlot = SingleSlot<SpotifyResult>;

  explicit SpotifyLoginSession(const quint64 serial, const SpotifyPKCE &pkce, const QString &callback_path, const SharedPtr<Cancellable> cancellable);
  ~SpotifyLoginSession();

  quint64 serial() const { return serial_; }
  const SpotifyPKCE &pkce() const { return pkce_; }
  const QUrl &redirect_uri() const { return redirect_uri_; }
  SharedPtr<Cancellable> cancellable() const { return cancellable_; }
  SharedPtr<ResultSlot> result_slot() const { return result_slot_; }
  bool finished() const { return result_slot_->has_value(); }

  // Binds preferred_port, or an ephemeral port when it is 0 or taken.
  SpotifyResult Start(const quint16 preferred_port, const LocalRedirectServer::Handler &handler);

  // Dropped when an outcome was already published.
  bool PublishResult(const SpotifyResult &result) const;

 private:
  void Shutdown();

 private:
  const quint64 serial_;
  const SpotifyPKCE pkce_;
  const QString callback_path_;
  const SharedPtr<Cancellable> cancellable_;
  const SharedPtr<ResultSlot> result_slot_;
  ScopedPtr<QThread> thread_;
  LocalRedirectServer *server_;
  QUrl redirect_uri_;

  Q_DISABLE_COPY(SpotifyLoginSession)
};

#endif  // SPOTIFYLOGINSESSION_H
