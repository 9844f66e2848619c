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

#ifndef SPOTIFYSESSION_H
#define SPOTIFYSESSION_H

#include <QtGlobal>
#include <QMutex>
#include <QString>
#include <QUrl>

#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "core/localredirectserver.h"
#include "spotifyresult.h"
#include "spotifyconfig.h"
#include "spotifycredentials.h"
#include "spotifytoken.h"
#include "spotifytokenstore.h"
#include "spotifymodels.h"
#include "spotifyapiclient.h"

class Cancellable;
class SpotifyLoginSession;

// Owns the OAuth session: login attempts, the current token, its refresh and the cached profile.
// All state is guarded by one lock, including while the redirect callback is handled on the server thread.
class SpotifySession {
 public:
  explicit SpotifySession(const SpotifyConfig &config, const SharedPtr<SpotifyApiClient> api_client);
  ~SpotifySession();

  enum class State {
    Unauthenticated,
    LoginPending,
    Authenticated,
    Refreshing
  };

  // Returns the URL to open in the browser. Any earlier login attempt is torn down.
  SpotifyStringResult StartLogin(const SharedPtr<Cancellable> cancellable);

  // Outcome of the current login attempt, Cancelled when timeout_msec passes first.
  SpotifyResult WaitForLogin(const int timeout_msec);

  SpotifyAuthStatusResult Status(const SharedPtr<Cancellable> cancellable);
  SpotifyResult Logout();

  // Current access token, refreshed first when it is about to expire.
  SpotifyStringResult AccessToken(const SharedPtr<Cancellable> cancellable);

  State state() const;
  const SpotifyCredentials &credentials() const { return credentials_; }

  static QString StateName(const State state);
  static QUrl AuthorizeUrl(const SpotifyConfig &config, const QString &client_id, const QUrl &redirect_uri, const SpotifyPKCE &pkce);

 private:
  LocalRedirectServer::Response HandleCallback(const quint64 serial, const QUrl &request_url);
  LocalRedirectServer::Response FinishLoginLocked(const SpotifyResult &result, const int http_status_code, const QString &message);

  void UpdateLoginStateLocked();
  State IdleStateLocked() const;
  SpotifyResult LoadTokenLocked();
  SpotifyResult EnsureFreshTokenLocked(const SharedPtr<Cancellable> cancellable);
  SpotifyTokenResult RequestToken(const SpotifyApiClient::ParamList &params, const QString &previous_refresh_token, const SpotifyResult::ErrorCode failure_error_code, const SharedPtr<Cancellable> cancellable) const;
  SpotifyProfileResult FetchProfileLocked(const SharedPtr<Cancellable> cancellable);
  void DropTokenLocked();

  static QString CallbackPage(const QString &message);

 private:
  mutable QMutex mutex_;
  const SpotifyConfig config_;
  const SharedPtr<SpotifyApiClient> api_client_;
  const SpotifyTokenStore token_store_;
  const SpotifyCredentials credentials_;
  State state_;
  SpotifyToken token_;
  SpotifyProfile profile_;
  ScopedPtr<SpotifyLoginSession> login_session_;
  quint64 login_serial_;

  Q_DISABLE_COPY(SpotifySession)
};

#endif  // SPOTIFYSESSION_H
