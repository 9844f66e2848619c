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

#include "gtest_include.h"
#include "gmock_include.h"

#include <memory>

#include <QtGlobal>
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QFile>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonArray>

#include "test_utils.h"
#include "mock_httpclient.h"
#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "spotify/spotifyconfig.h"
#include "spotify/spotifycredentials.h"
#include "spotify/spotifyapiclient.h"
#include "spotify/spotifytoken.h"
#include "spotify/spotifytokenstore.h"
#include "spotify/spotifypkce.h"
#include "spotify/spotifysession.h"

using namespace Qt::Literals::StringLiterals;
using ::testing::_;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::DoAll;
using ::testing::NiceMock;

namespace {

HttpClient::Reply TokenReply(const QString &access_token, const QString &refresh_token = QString(), const int expires_in = 3600) {

  QJsonObject json_reply;
  json_reply["access_token"_L1] = access_token;
  if (!refresh_token.isEmpty()) {
    json_reply["refresh_token"_L1] = refresh_token;
  }
  json_reply["expires_in"_L1] = expires_in;
  json_reply["token_type"_L1] = u"Bearer"_s;
  json_reply["scope"_L1] = u"user-library-read playlist-read-private playlist-read-collaborative"_s;

  return MockHttpClient::JsonReply(json_reply);

}

HttpClient::Reply ProfileReply() {

  QJsonObject json_image;
  json_image["url"_L1] = u"https://i.scdn.co/image/avatar"_s;

  QJsonObject json_reply;
  json_reply["id"_L1] = u"user1"_s;
  json_reply["display_name"_L1] = u"Jane"_s;
  json_reply["images"_L1] = QJsonArray() << json_image;

  return MockHttpClient::JsonReply(json_reply);

}

class SpotifySessionTest : public ::testing::Test {
 protected:
  void SetUp() override {

    config_ = data_dir_.config();
    const SpotifyCredentials credentials(config_);
    ASSERT_TRUE(credentials.SetClientId(u"client_id"_s).success());
    ASSERT_TRUE(credentials.SetClientSecret(u"client_secret"_s).success());

    http_client_ = std::make_shared<NiceMock<MockHttpClient>>();
    session_ = std::make_unique<SpotifySession>(config_, std::make_shared<SpotifyApiClient>(http_client_));

  }

  void TearDown() override {
    session_.reset();
  }

  void StoreToken(const qint64 expires_in, const QString &refresh_token = u"refresh1"_s) {

    SpotifyToken token;
    token.access_token = u"access1"_s;
    token.refresh_token = refresh_token;
    token.expires_at = QDateTime::currentSecsSinceEpoch() + expires_in;
    token.token_type = u"Bearer"_s;
    ASSERT_TRUE(SpotifyTokenStore(config_.token_filename()).Save(token).success());

  }

  QUrl TokenUrl() const { return config_.access_token_url; }
  QUrl ProfileUrl() const { return QUrl(config_.api_url.toString() + "/me"_L1); }

  // Starts a login and returns the redirect URI and the state sent to the browser.
  void StartLogin(QUrl *redirect_uri, QString *state) {

    const SpotifyStringResult result = session_->StartLogin(nullptr);
    ASSERT_TRUE(result.success()) << result.ToString();

    const QUrlQuery authorize_query(QUrl(result.value));
    *redirect_uri = QUrl(authorize_query.queryItemValue(u"redirect_uri"_s, QUrl::FullyDecoded));
    *state = authorize_query.queryItemValue(u"state"_s, QUrl::FullyDecoded);

  }

  static QUrl CallbackUrl(const QUrl &redirect_uri, const QString &query) {
    QUrl url(redirect_uri);
    url.setQuery(query);
    return url;
  }

  TemporaryDataDir data_dir_;
  SpotifyConfig config_;
  SharedPtr<NiceMock<MockHttpClient>> http_client_;
  ScopedPtr<SpotifySession> session_;
};

TEST_F(SpotifySessionTest, AuthorizeUrl) {

  const SpotifyStringResult result = session_->StartLogin(nullptr);
  ASSERT_TRUE(result.success()) << result.ToString();
  EXPECT_EQ(session_->state(), SpotifySession::State::LoginPending);

  const QUrl authorize_url(result.value);
  EXPECT_EQ(authorize_url.host(), config_.authorize_url.host());
  EXPECT_EQ(authorize_url.path(), config_.authorize_url.path());

  const QUrlQuery url_query(authorize_url);
  EXPECT_EQ(url_query.queryItemValue(u"client_id"_s), u"client_id"_s);
  EXPECT_EQ(url_query.queryItemValue(u"response_type"_s), u"code"_s);
  EXPECT_EQ(url_query.queryItemValue(u"code_challenge_method"_s), u"S256"_s);
  EXPECT_EQ(url_query.queryItemValue(u"show_dialog"_s), u"true"_s);
  EXPECT_EQ(url_query.queryItemValue(u"scope"_s, QUrl::FullyDecoded), config_.scope);
  EXPECT_EQ(url_query.queryItemValue(u"code_challenge"_s).length(), 43);
  EXPECT_EQ(url_query.queryItemValue(u"state"_s).length(), 43);

  const QUrl redirect_uri(url_query.queryItemValue(u"redirect_uri"_s, QUrl::FullyDecoded));
  EXPECT_EQ(redirect_uri.scheme(), u"http"_s);
  EXPECT_EQ(redirect_uri.host(), u"127.0.0.1"_s);
  EXPECT_EQ(redirect_uri.path(), config_.callback_path);

}

TEST_F(SpotifySessionTest, SuccessfulLogin) {

  QByteArray token_request_body;
  EXPECT_CALL(*http_client_, Post(TokenUrl(), _, _, _)).WillOnce(DoAll(SaveArg<2>(&token_request_body), Return(TokenReply(u"access1"_s, u"refresh1"_s))));
  EXPECT_CALL(*http_client_, Get(ProfileUrl(), _, _)).WillOnce(Return(ProfileReply()));

  QUrl redirect_uri;
  QString state;
  StartLogin(&redirect_uri, &state);

  const QByteArray response = HttpGet(CallbackUrl(redirect_uri, u"code=auth_code&state="_s + state));
  EXPECT_EQ(HttpStatusCode(response), 200);
  EXPECT_TRUE(response.contains("Spotify login successful"));

  const SpotifyResult login_result = session_->WaitForLogin(5000);
  ASSERT_TRUE(login_result.success()) << login_result.ToString();
  EXPECT_EQ(session_->state(), SpotifySession::State::Authenticated);

  const QUrlQuery token_request(QString::fromUtf8(token_request_body));
  EXPECT_EQ(token_request.queryItemValue(u"grant_type"_s), u"authorization_code"_s);
  EXPECT_EQ(token_request.queryItemValue(u"code"_s), u"auth_code"_s);
  EXPECT_EQ(token_request.queryItemValue(u"code_verifier"_s).length(), 86);
  EXPECT_EQ(QUrl(token_request.queryItemValue(u"redirect_uri"_s, QUrl::FullyDecoded)), redirect_uri);

  const SpotifyTokenResult stored_token = SpotifyTokenStore(config_.token_filename()).Load();
  ASSERT_TRUE(stored_token.success());
  EXPECT_EQ(stored_token.value.access_token, u"access1"_s);
  EXPECT_EQ(stored_token.value.refresh_token, u"refresh1"_s);

  // The profile fetched during login is reused.
  const SpotifyAuthStatusResult status = session_->Status(nullptr);
  ASSERT_TRUE(status.success()) << status.ToString();
  EXPECT_TRUE(status.value.authenticated);
  EXPECT_EQ(status.value.display_name, u"Jane"_s);
  EXPECT_EQ(status.value.user_id, u"user1"_s);
  EXPECT_EQ(status.value.avatar_url, u"https://i.scdn.co/image/avatar"_s);

}

TEST_F(SpotifySessionTest, StateMismatch) {

  EXPECT_CALL(*http_client_, Post(_, _, _, _)).Times(0);

  QUrl redirect_uri;
  QString state;
  StartLogin(&redirect_uri, &state);

  EXPECT_EQ(HttpStatusCode(HttpGet(CallbackUrl(redirect_uri, u"code=auth_code&state=wrong"_s))), 400);

  const SpotifyResult login_result = session_->WaitForLogin(5000);
  EXPECT_EQ(login_result.error_code, SpotifyResult::ErrorCode::StateMismatch);
  EXPECT_FALSE(QFile::exists(config_.token_filename()));
  EXPECT_EQ(session_->state(), SpotifySession::State::Unauthenticated);

}

TEST_F(SpotifySessionTest, MissingCode) {

  EXPECT_CALL(*http_client_, Post(_, _, _, _)).Times(0);

  QUrl redirect_uri;
  QString state;
  StartLogin(&redirect_uri, &state);

  const QByteArray response = HttpGet(CallbackUrl(redirect_uri, u"state="_s + state));
  EXPECT_EQ(HttpStatusCode(response), 400);
  EXPECT_TRUE(response.contains("Invalid response from Spotify"));

  EXPECT_EQ(session_->WaitForLogin(5000).error_code, SpotifyResult::ErrorCode::MalformedCallback);

}

TEST_F(SpotifySessionTest, ProviderDeniedAuthorization) {

  EXPECT_CALL(*http_client_, Post(_, _, _, _)).Times(0);

  QUrl redirect_uri;
  QString state;
  StartLogin(&redirect_uri, &state);

  EXPECT_EQ(HttpStatusCode(HttpGet(CallbackUrl(redirect_uri, u"error=access_denied&state="_s + state))), 400);

  const SpotifyResult login_result = session_->WaitForLogin(5000);
  EXPECT_EQ(login_result.error_code, SpotifyResult::ErrorCode::MalformedCallback);
  EXPECT_TRUE(login_result.error_message.contains(u"access_denied"_s));

}

TEST_F(SpotifySessionTest, TokenExchangeFailure) {

  EXPECT_CALL(*http_client_, Post(TokenUrl(), _, _, _)).WillOnce(Return(HttpClient::Reply(400, R"({"error":"invalid_grant","error_description":"Invalid authorization code"})")));
  EXPECT_CALL(*http_client_, Get(_, _, _)).Times(0);

  QUrl redirect_uri;
  QString state;
  StartLogin(&redirect_uri, &state);

  EXPECT_EQ(HttpStatusCode(HttpGet(CallbackUrl(redirect_uri, u"code=bad&state="_s + state))), 500);

  const SpotifyResult login_result = session_->WaitForLogin(5000);
  EXPECT_EQ(login_result.error_code, SpotifyResult::ErrorCode::TokenExchangeFailure);
  EXPECT_EQ(login_result.cause, SpotifyResult::ErrorCode::HttpStatusError);
  EXPECT_EQ(login_result.http_status_code, 400);
  EXPECT_FALSE(QFile::exists(config_.token_filename()));

}

TEST_F(SpotifySessionTest, MissingClientCredentials) {

  if (!SpotifyCredentials::DefaultClientId().isEmpty() || !SpotifyCredentials::DefaultClientSecret().isEmpty()) {
    GTEST_SKIP() << "Built with default client credentials";
  }

  const SpotifyCredentials credentials(config_);
  ASSERT_TRUE(credentials.SetClientSecret(QString()).success());

  EXPECT_CALL(*http_client_, Post(_, _, _, _)).Times(0);

  QUrl redirect_uri;
  QString state;
  StartLogin(&redirect_uri, &state);

  EXPECT_EQ(HttpStatusCode(HttpGet(CallbackUrl(redirect_uri, u"code=auth_code&state="_s + state))), 500);
  EXPECT_EQ(session_->WaitForLogin(5000).error_code, SpotifyResult::ErrorCode::MissingClientCredentials);

}

TEST_F(SpotifySessionTest, NewLoginSupersedesPrevious) {

  QUrl first_redirect_uri;
  QString first_state;
  StartLogin(&first_redirect_uri, &first_state);

  QUrl second_redirect_uri;
  QString second_state;
  StartLogin(&second_redirect_uri, &second_state);

  EXPECT_NE(first_state, second_state);
  // The first listener is gone.
  EXPECT_TRUE(HttpGet(CallbackUrl(first_redirect_uri, u"code=auth_code&state="_s + first_state)).isEmpty());

  EXPECT_CALL(*http_client_, Post(TokenUrl(), _, _, _)).WillOnce(Return(TokenReply(u"access2"_s, u"refresh2"_s)));
  EXPECT_CALL(*http_client_, Get(ProfileUrl(), _, _)).WillOnce(Return(ProfileReply()));

  EXPECT_EQ(HttpStatusCode(HttpGet(CallbackUrl(second_redirect_uri, u"code=auth_code&state="_s + second_state))), 200);
  EXPECT_TRUE(session_->WaitForLogin(5000).success());

}

TEST_F(SpotifySessionTest, WaitForLogin) {

  EXPECT_EQ(session_->WaitForLogin(10).error_code, SpotifyResult::ErrorCode::NotAuthenticated);

  QUrl redirect_uri;
  QString state;
  StartLogin(&redirect_uri, &state);

  EXPECT_EQ(session_->WaitForLogin(50).error_code, SpotifyResult::ErrorCode::Cancelled);
  EXPECT_EQ(session_->state(), SpotifySession::State::LoginPending);

}

TEST_F(SpotifySessionTest, RefreshWhenAboutToExpire) {

  StoreToken(10);

  QByteArray refresh_request_body;
  EXPECT_CALL(*http_client_, Post(TokenUrl(), _, _, _)).Times(1).WillOnce(DoAll(SaveArg<2>(&refresh_request_body), Return(TokenReply(u"access2"_s))));

  const SpotifyStringResult access_token = session_->AccessToken(nullptr);
  ASSERT_TRUE(access_token.success()) << access_token.ToString();
  EXPECT_EQ(access_token.value, u"access2"_s);

  const QUrlQuery refresh_request(QString::fromUtf8(refresh_request_body));
  EXPECT_EQ(refresh_request.queryItemValue(u"grant_type"_s), u"refresh_token"_s);
  EXPECT_EQ(refresh_request.queryItemValue(u"refresh_token"_s), u"refresh1"_s);

  // The refresh token is kept when the reply does not rotate it.
  const SpotifyTokenResult stored_token = SpotifyTokenStore(config_.token_filename()).Load();
  ASSERT_TRUE(stored_token.success());
  EXPECT_EQ(stored_token.value.access_token, u"access2"_s);
  EXPECT_EQ(stored_token.value.refresh_token, u"refresh1"_s);
  EXPECT_GT(stored_token.value.expires_at, QDateTime::currentSecsSinceEpoch() + 3000);

  // Fresh now, no second refresh.
  EXPECT_EQ(session_->AccessToken(nullptr).value, u"access2"_s);

}

TEST_F(SpotifySessionTest, NoRefreshWithTimeLeft) {

  StoreToken(3600);

  EXPECT_CALL(*http_client_, Post(_, _, _, _)).Times(0);

  const SpotifyStringResult access_token = session_->AccessToken(nullptr);
  ASSERT_TRUE(access_token.success()) << access_token.ToString();
  EXPECT_EQ(access_token.value, u"access1"_s);
  EXPECT_EQ(session_->state(), SpotifySession::State::Authenticated);

}

TEST_F(SpotifySessionTest, ExpiredWithoutRefreshToken) {

  StoreToken(-60, QString());

  EXPECT_CALL(*http_client_, Post(_, _, _, _)).Times(0);

  EXPECT_EQ(session_->AccessToken(nullptr).error_code, SpotifyResult::ErrorCode::MissingRefreshToken);

}

TEST_F(SpotifySessionTest, RejectedRefreshDropsSession) {

  StoreToken(-60);

  EXPECT_CALL(*http_client_, Post(TokenUrl(), _, _, _)).WillOnce(Return(HttpClient::Reply(400, R"({"error":"invalid_grant","error_description":"Refresh token revoked"})")));

  const SpotifyStringResult access_token = session_->AccessToken(nullptr);
  EXPECT_EQ(access_token.error_code, SpotifyResult::ErrorCode::RefreshFailure);
  EXPECT_EQ(access_token.cause, SpotifyResult::ErrorCode::HttpStatusError);
  EXPECT_FALSE(QFile::exists(config_.token_filename()));
  EXPECT_EQ(session_->state(), SpotifySession::State::Unauthenticated);

  EXPECT_EQ(session_->AccessToken(nullptr).error_code, SpotifyResult::ErrorCode::NotAuthenticated);

}

TEST_F(SpotifySessionTest, RefreshNetworkErrorKeepsToken) {

  StoreToken(-60);

  EXPECT_CALL(*http_client_, Post(TokenUrl(), _, _, _)).WillOnce(Return(HttpClient::Reply(HttpClient::ErrorCode::NetworkError, u"Host not found"_s)));

  const SpotifyStringResult access_token = session_->AccessToken(nullptr);
  EXPECT_EQ(access_token.error_code, SpotifyResult::ErrorCode::RefreshFailure);
  EXPECT_EQ(access_token.cause, SpotifyResult::ErrorCode::NetworkError);
  EXPECT_TRUE(QFile::exists(config_.token_filename()));
  EXPECT_EQ(session_->state(), SpotifySession::State::Authenticated);

}

TEST_F(SpotifySessionTest, StatusWithoutToken) {

  EXPECT_CALL(*http_client_, Get(_, _, _)).Times(0);
  EXPECT_CALL(*http_client_, Post(_, _, _, _)).Times(0);

  const SpotifyAuthStatusResult status = session_->Status(nullptr);
  ASSERT_TRUE(status.success()) << status.ToString();
  EXPECT_FALSE(status.value.authenticated);

}

TEST_F(SpotifySessionTest, StatusLoadsStoredToken) {

  StoreToken(3600);

  EXPECT_CALL(*http_client_, Get(ProfileUrl(), _, _)).WillOnce(Return(ProfileReply()));

  const SpotifyAuthStatusResult status = session_->Status(nullptr);
  ASSERT_TRUE(status.success()) << status.ToString();
  EXPECT_TRUE(status.value.authenticated);
  EXPECT_EQ(status.value.display_name, u"Jane"_s);

}

TEST_F(SpotifySessionTest, LogoutWithoutLogin) {

  const SpotifyResult logout_result = session_->Logout();
  EXPECT_TRUE(logout_result.success()) << logout_result.ToString();
  EXPECT_FALSE(QFile::exists(config_.token_filename()));

  const SpotifyAuthStatusResult status = session_->Status(nullptr);
  ASSERT_TRUE(status.success());
  EXPECT_FALSE(status.value.authenticated);

}

TEST_F(SpotifySessionTest, LogoutRemovesToken) {

  StoreToken(3600);
  ASSERT_TRUE(session_->AccessToken(nullptr).success());

  EXPECT_TRUE(session_->Logout().success());
  EXPECT_FALSE(QFile::exists(config_.token_filename()));
  EXPECT_EQ(session_->state(), SpotifySession::State::Unauthenticated);
  EXPECT_EQ(session_->AccessToken(nullptr).error_code, SpotifyResult::ErrorCode::NotAuthenticated);

  // Twice is fine.
  EXPECT_TRUE(session_->Logout().success());

}

}  // namespace
