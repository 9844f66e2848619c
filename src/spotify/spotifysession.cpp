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

#include <optional>
#include <utility>

#include <QtGlobal>
#include <QMutex>
#include <QMutexLocker>
#include <QDateTime>
#include <QDeadlineTimer>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QList>
#include <QPair>
#include <QJsonObject>

#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "core/logging.h"
#include "core/cancellable.h"
#include "core/localredirectserver.h"
#include "spotifysession.h"
#include "spotifyloginsession.h"
#include "spotifypkce.h"
#include "spotifytracknormalizer.h"

using namespace Qt::Literals::StringLiterals;

SpotifySession::SpotifySession(const SpotifyConfig &config, const SharedPtr<SpotifyApiClient> api_client)
    : config_(config),
      api_client_(api_client),
      token_store_(config.token_filename()),
      credentials_(config),
      state_(State::Unauthenticated),
      login_serial_(0) {}

SpotifySession::~SpotifySession() {

  ScopedPtr<SpotifyLoginSession> login_session;
  {
    QMutexLocker l(&mutex_);
    ++login_serial_;
    login_session = std::move(login_session_);
  }
  // A callback still in progress needs the lock to finish, so the server is joined outside it.
  login_session.reset();

}

QString SpotifySession::StateName(const State state) {

  switch (state) {
    case State::Unauthenticated: return u"Unauthenticated"_s;
    case State::LoginPending:    return u"LoginPending"_s;
    case State::Authenticated:   return u"Authenticated"_s;
    case State::Refreshing:      return u"Refreshing"_s;
  }

  return QString();

}

QUrl SpotifySession::AuthorizeUrl(const SpotifyConfig &config, const QString &client_id, const QUrl &redirect_uri, const SpotifyPKCE &pkce) {

  const QList<QPair<QString, QString>> params = QList<QPair<QString, QString>>()
                                                << qMakePair(u"client_id"_s, client_id)
                                                << qMakePair(u"response_type"_s, u"code"_s)
                                                << qMakePair(u"redirect_uri"_s, redirect_uri.toString())
                                                << qMakePair(u"state"_s, pkce.state)
                                                << qMakePair(u"scope"_s, config.scope)
                                                << qMakePair(u"code_challenge"_s, pkce.code_challenge)
                                                << qMakePair(u"code_challenge_method"_s, u"S256"_s)
                                                << qMakePair(u"show_dialog"_s, u"true"_s);

  QUrlQuery url_query;
  for (const QPair<QString, QString> &param : params) {
    url_query.addQueryItem(QString::fromLatin1(QUrl::toPercentEncoding(param.first)), QString::fromLatin1(QUrl::toPercentEncoding(param.second)));
  }

  QUrl url(config.authorize_url);
  url.setQuery(url_query);

  return url;

}

SpotifyStringResult SpotifySession::StartLogin(const SharedPtr<Cancellable> cancellable) {

  ScopedPtr<SpotifyLoginSession> previous_login_session;
  SpotifyStringResult result;
  {
    QMutexLocker l(&mutex_);

    previous_login_session = std::move(login_session_);
    const quint64 serial = ++login_serial_;

    const QString client_id = credentials_.ClientId();
    if (client_id.isEmpty()) {
      qLog(Warning) << "No client id configured, the token exchange will fail";
    }

    ScopedPtr<SpotifyLoginSession> login_session(new SpotifyLoginSession(serial, SpotifyPKCE::Generate(), config_.callback_path, cancellable));
    const SpotifyResult start_result = login_session->Start(config_.callback_port, [this, serial](const QUrl &request_url) { return HandleCallback(serial, request_url); });
    if (start_result.success()) {
      result = SpotifyStringResult(AuthorizeUrl(config_, client_id, login_session->redirect_uri(), login_session->pkce()).toString(QUrl::FullyEncoded));
      login_session_ = std::move(login_session);
      state_ = State::LoginPending;
      qLog(Info) << "Login started, waiting for redirect on" << login_session_->redirect_uri().toString();
    }
    else {
      result = SpotifyStringResult(start_result);
      state_ = IdleStateLocked();
    }
  }

  if (previous_login_session) {
    qLog(Debug) << "Tearing down previous login attempt" << previous_login_session->serial();
    previous_login_session.reset();
  }

  return result;

}

SpotifyResult SpotifySession::WaitForLogin(const int timeout_msec) {

  SharedPtr<SpotifyLoginSession::ResultSlot> result_slot;
  {
    QMutexLocker l(&mutex_);
    if (!login_session_) {
      return SpotifyResult(SpotifyResult::ErrorCode::NotAuthenticated, u"No login attempt in progress"_s);
    }
    result_slot = login_session_->result_slot();
  }

  const std::optional<SpotifyResult> result = result_slot->Wait(QDeadlineTimer(timeout_msec));
  if (!result.has_value()) {
    return SpotifyResult(SpotifyResult::ErrorCode::Cancelled, u"Timed out waiting for the login to complete"_s);
  }

  {
    QMutexLocker l(&mutex_);
    UpdateLoginStateLocked();
  }

  return result.value();

}

LocalRedirectServer::Response SpotifySession::HandleCallback(const quint64 serial, const QUrl &request_url) {

  QMutexLocker l(&mutex_);

  if (!login_session_ || login_session_->serial() != serial) {
    qLog(Warning) << "Ignoring callback for stale login attempt" << serial;
    return LocalRedirectServer::Response(400, CallbackPage(u"This login attempt is no longer active."_s));
  }

  const QUrlQuery url_query(request_url);

  if (url_query.hasQueryItem(u"error"_s)) {
    const QString error = url_query.queryItemValue(u"error"_s, QUrl::FullyDecoded);
    return FinishLoginLocked(SpotifyResult(SpotifyResult::ErrorCode::MalformedCallback, QStringLiteral("Authorization was denied: %1").arg(error)), 400, u"Invalid response from Spotify"_s);
  }

  const QString state = url_query.queryItemValue(u"state"_s, QUrl::FullyDecoded);
  const QString code = url_query.queryItemValue(u"code"_s, QUrl::FullyDecoded);
  if (state.isEmpty() || code.isEmpty()) {
    return FinishLoginLocked(SpotifyResult(SpotifyResult::ErrorCode::MalformedCallback, u"Callback is missing state or code"_s), 400, u"Invalid response from Spotify"_s);
  }

  if (state != login_session_->pkce().state) {
    return FinishLoginLocked(SpotifyResult(SpotifyResult::ErrorCode::StateMismatch, u"Callback state does not match the login attempt"_s), 400, u"State mismatch"_s);
  }

  qLog(Debug) << "Received authorization code" << logging::Redact(code);

  const SpotifyApiClient::ParamList params = SpotifyApiClient::ParamList() << SpotifyApiClient::Param(u"grant_type"_s, u"authorization_code"_s)
                                                                           << SpotifyApiClient::Param(u"code"_s, code)
                                                                           << SpotifyApiClient::Param(u"redirect_uri"_s, login_session_->redirect_uri().toString())
                                                                           << SpotifyApiClient::Param(u"code_verifier"_s, login_session_->pkce().code_verifier);

  const SpotifyTokenResult token_result = RequestToken(params, QString(), SpotifyResult::ErrorCode::TokenExchangeFailure, login_session_->cancellable());
  if (!token_result.success()) {
    return FinishLoginLocked(token_result, 500, QStringLiteral("Token exchange failed: %1").arg(token_result.error_message));
  }

  const SpotifyResult save_result = token_store_.Save(token_result.value);
  if (!save_result.success()) {
    return FinishLoginLocked(save_result, 500, QStringLiteral("Saving the token failed: %1").arg(save_result.error_message));
  }

  token_ = token_result.value;
  profile_ = SpotifyProfile();

  const SpotifyProfileResult profile_result = FetchProfileLocked(login_session_->cancellable());
  if (!profile_result.success()) {
    return FinishLoginLocked(profile_result, 500, QStringLiteral("Fetching the profile failed: %1").arg(profile_result.error_message));
  }

  qLog(Info) << "Logged in as" << profile_.display_name << "(" << profile_.id << ")";

  return FinishLoginLocked(SpotifyResult(), 200, u"Spotify login successful. You can close this window."_s);

}

LocalRedirectServer::Response SpotifySession::FinishLoginLocked(const SpotifyResult &result, const int http_status_code, const QString &message) {

  if (!result.success()) {
    qLog(Error) << "Login failed:" << result.ToString();
  }

  login_session_->PublishResult(result);
  state_ = IdleStateLocked();

  return LocalRedirectServer::Response(http_status_code, CallbackPage(message));

}

QString SpotifySession::CallbackPage(const QString &message) {
  return QStringLiteral("<html><body><p>%1</p></body></html>").arg(message.toHtmlEscaped());
}

void SpotifySession::UpdateLoginStateLocked() {

  if (state_ == State::LoginPending && (!login_session_ || login_session_->finished())) {
    state_ = IdleStateLocked();
  }

}

SpotifySession::State SpotifySession::IdleStateLocked() const {
  return token_.is_valid() ? State::Authenticated : State::Unauthenticated;
}

SpotifySession::State SpotifySession::state() const {

  QMutexLocker l(&mutex_);
  if (state_ == State::LoginPending && (!login_session_ || login_session_->finished())) {
    return IdleStateLocked();
  }

  return state_;

}

SpotifyResult SpotifySession::LoadTokenLocked() {

  if (token_.is_valid()) return SpotifyResult();

  const SpotifyTokenResult token_result = token_store_.Load();
  if (!token_result.success()) {
    return token_result;
  }

  token_ = token_result.value;
  profile_ = SpotifyProfile();
  if (state_ == State::Unauthenticated) {
    state_ = State::Authenticated;
  }

  return SpotifyResult();

}

SpotifyResult SpotifySession::EnsureFreshTokenLocked(const SharedPtr<Cancellable> cancellable) {

  if (!token_.is_valid()) {
    return SpotifyResult(SpotifyResult::ErrorCode::NotAuthenticated, u"Not authenticated"_s);
  }

  const qint64 now = QDateTime::currentSecsSinceEpoch();
  if (!token_.IsStale(now)) {
    return SpotifyResult();
  }

  if (token_.refresh_token.isEmpty()) {
    qLog(Error) << "Access token expired and there is no refresh token";
    return SpotifyResult(SpotifyResult::ErrorCode::MissingRefreshToken, u"Access token expired and no refresh token is stored"_s);
  }

  qLog(Debug) << "Refreshing access token expiring at" << token_.expires_at;

  const State previous_state = state_ == State::LoginPending ? State::LoginPending : State::Authenticated;
  state_ = State::Refreshing;

  const SpotifyApiClient::ParamList params = SpotifyApiClient::ParamList() << SpotifyApiClient::Param(u"grant_type"_s, u"refresh_token"_s)
                                                                           << SpotifyApiClient::Param(u"refresh_token"_s, token_.refresh_token);

  const SpotifyTokenResult token_result = RequestToken(params, token_.refresh_token, SpotifyResult::ErrorCode::RefreshFailure, cancellable);
  if (!token_result.success()) {
    // A rejected refresh token can never succeed again.
    if (token_result.cause == SpotifyResult::ErrorCode::HttpStatusError && (token_result.http_status_code == 400 || token_result.http_status_code == 401)) {
      qLog(Warning) << "Refresh token was rejected, dropping the session";
      DropTokenLocked();
      state_ = previous_state == State::LoginPending ? State::LoginPending : State::Unauthenticated;
    }
    else {
      state_ = previous_state;
    }
    return token_result;
  }

  token_ = token_result.value;
  state_ = previous_state;

  const SpotifyResult save_result = token_store_.Save(token_);
  if (!save_result.success()) {
    return save_result;
  }

  qLog(Debug) << "Access token refreshed, now expiring at" << token_.expires_at;

  return SpotifyResult();

}

SpotifyTokenResult SpotifySession::RequestToken(const SpotifyApiClient::ParamList &params, const QString &previous_refresh_token, const SpotifyResult::ErrorCode failure_error_code, const SharedPtr<Cancellable> cancellable) const {

  const QString client_id = credentials_.ClientId();
  const QString client_secret = credentials_.ClientSecret();
  if (client_id.isEmpty() || client_secret.isEmpty()) {
    qLog(Error) << "Missing client id or client secret";
    return SpotifyTokenResult(SpotifyResult::ErrorCode::MissingClientCredentials, u"Missing Spotify client id or client secret"_s);
  }

  const SpotifyApiClient::JsonObjectResult json_result = api_client_->PostForm(config_.access_token_url, client_id, client_secret, params, cancellable);
  if (!json_result.success()) {
    return json_result.Wrap(failure_error_code, u"Token request failed"_s);
  }

  const SpotifyTokenResult token_result = SpotifyToken::FromTokenReply(json_result.value, QDateTime::currentSecsSinceEpoch(), previous_refresh_token);
  if (!token_result.success()) {
    return token_result.Wrap(failure_error_code, u"Invalid token reply"_s);
  }

  qLog(Debug) << "Received access token" << logging::Redact(token_result.value.access_token) << "expiring at" << token_result.value.expires_at;

  return token_result;

}

SpotifyProfileResult SpotifySession::FetchProfileLocked(const SharedPtr<Cancellable> cancellable) {

  const SpotifyResult fresh_result = EnsureFreshTokenLocked(cancellable);
  if (!fresh_result.success()) {
    return fresh_result;
  }

  const SpotifyApiClient::JsonObjectResult json_result = api_client_->GetJson(QUrl(config_.api_url.toString() + "/me"_L1), token_.access_token, cancellable);
  if (!json_result.success()) {
    return json_result;
  }

  const SpotifyProfile profile = SpotifyTrackNormalizer::ParseProfile(json_result.value);
  if (!profile.is_valid()) {
    return SpotifyProfileResult(SpotifyResult::ErrorCode::ParseError, u"Profile reply is missing the user id"_s);
  }

  profile_ = profile;

  return profile;

}

void SpotifySession::DropTokenLocked() {

  token_ = SpotifyToken();
  profile_ = SpotifyProfile();
  const SpotifyResult remove_result = token_store_.Remove();
  if (!remove_result.success()) {
    qLog(Error) << "Unable to remove stored token:" << remove_result.error_message;
  }

}

SpotifyAuthStatusResult SpotifySession::Status(const SharedPtr<Cancellable> cancellable) {

  QMutexLocker l(&mutex_);

  UpdateLoginStateLocked();

  const SpotifyResult load_result = LoadTokenLocked();
  if (load_result.error_code == SpotifyResult::ErrorCode::NotFound) {
    return SpotifyAuthStatus();
  }
  if (!load_result.success()) {
    return load_result;
  }

  const SpotifyResult fresh_result = EnsureFreshTokenLocked(cancellable);
  if (!fresh_result.success()) {
    return fresh_result;
  }

  if (!profile_.is_valid()) {
    const SpotifyProfileResult profile_result = FetchProfileLocked(cancellable);
    if (!profile_result.success()) {
      return profile_result;
    }
  }

  SpotifyAuthStatus status;
  status.authenticated = true;
  status.display_name = profile_.display_name;
  status.user_id = profile_.id;
  status.avatar_url = profile_.avatar_url();
  status.expires_at = token_.expires_at;
  status.scope = token_.scope;

  return status;

}

SpotifyResult SpotifySession::Logout() {

  QMutexLocker l(&mutex_);

  UpdateLoginStateLocked();

  token_ = SpotifyToken();
  profile_ = SpotifyProfile();
  if (state_ != State::LoginPending) {
    state_ = State::Unauthenticated;
  }

  const SpotifyResult remove_result = token_store_.Remove();
  if (!remove_result.success()) {
    return remove_result;
  }

  qLog(Info) << "Logged out";

  return SpotifyResult();

}

SpotifyStringResult SpotifySession::AccessToken(const SharedPtr<Cancellable> cancellable) {

  QMutexLocker l(&mutex_);

  UpdateLoginStateLocked();

  const SpotifyResult load_result = LoadTokenLocked();
  if (load_result.error_code == SpotifyResult::ErrorCode::NotFound) {
    return SpotifyStringResult(SpotifyResult::ErrorCode::NotAuthenticated, u"Not authenticated"_s);
  }
  if (!load_result.success()) {
    return load_result;
  }

  const SpotifyResult fresh_result = EnsureFreshTokenLocked(cancellable);
  if (!fresh_result.success()) {
    return fresh_result;
  }

  return token_.access_token;

}
