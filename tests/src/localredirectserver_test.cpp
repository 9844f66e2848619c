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

#include <atomic>
#include <memory>
#include <optional>

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <QDeadlineTimer>
#include <QTcpServer>
#include <QTcpSocket>
#include <QEventLoop>
#include <QTimer>
#include <QHostAddress>

#include "test_utils.h"
#include "includes/shared_ptr.h"
#include "core/cancellable.h"
#include "core/localredirectserver.h"
#include "spotify/spotifyresult.h"
#include "spotify/spotifypkce.h"
#include "spotify/spotifyloginsession.h"

using namespace Qt::Literals::StringLiterals;

namespace {

LocalRedirectServer::Response OkHandler(const QUrl&) {
  return LocalRedirectServer::Response(200, u"<html><body>done</body></html>"_s);
}

TEST(LocalRedirectServerTest, ReasonPhrase) {

  EXPECT_EQ(LocalRedirectServer::ReasonPhrase(200), "OK");
  EXPECT_EQ(LocalRedirectServer::ReasonPhrase(400), "Bad Request");
  EXPECT_EQ(LocalRedirectServer::ReasonPhrase(404), "Not Found");
  EXPECT_EQ(LocalRedirectServer::ReasonPhrase(500), "Internal Server Error");

}

TEST(LocalRedirectServerTest, CallbackIsPassedToHandler) {

  SpotifyLoginSession login_session(1, SpotifyPKCE::Generate(), u"/callback"_s, nullptr);

  QUrl received_url;
  const SpotifyResult start_result = login_session.Start(0, [&login_session, &received_url](const QUrl &request_url) {
    received_url = request_url;
    login_session.PublishResult(SpotifyResult());
    return LocalRedirectServer::Response(200, u"<html><body>Login successful</body></html>"_s);
  });
  ASSERT_TRUE(start_result.success()) << start_result.ToString();

  const QUrl redirect_uri = login_session.redirect_uri();
  EXPECT_EQ(redirect_uri.host(), u"127.0.0.1"_s);
  EXPECT_EQ(redirect_uri.path(), u"/callback"_s);
  EXPECT_GT(redirect_uri.port(), 0);

  QUrl callback_url(redirect_uri);
  callback_url.setQuery(u"code=abc&state=xyz"_s);
  const QByteArray response = HttpGet(callback_url);

  EXPECT_EQ(HttpStatusCode(response), 200);
  EXPECT_TRUE(response.contains("Content-Type: text/html"));
  EXPECT_TRUE(response.contains("Login successful"));

  EXPECT_EQ(QUrlQuery(received_url).queryItemValue(u"code"_s), u"abc"_s);
  EXPECT_EQ(QUrlQuery(received_url).queryItemValue(u"state"_s), u"xyz"_s);

  const std::optional<SpotifyResult> result = login_session.result_slot()->Wait(QDeadlineTimer(5000));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->success());

}

TEST(LocalRedirectServerTest, OtherPathsAreNotFound) {

  SpotifyLoginSession login_session(1, SpotifyPKCE::Generate(), u"/callback"_s, nullptr);
  std::atomic<int> handled(0);
  ASSERT_TRUE(login_session.Start(0, [&handled](const QUrl &request_url) { ++handled; return OkHandler(request_url); }).success());

  const quint16 port = static_cast<quint16>(login_session.redirect_uri().port());
  EXPECT_EQ(HttpStatusCode(SendHttpRequest(port, "GET /favicon.ico HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n")), 404);
  EXPECT_EQ(handled.load(), 0);
  EXPECT_FALSE(login_session.finished());

  // The session is still waiting for its callback.
  EXPECT_EQ(HttpStatusCode(HttpGet(login_session.redirect_uri())), 200);
  EXPECT_EQ(handled.load(), 1);

}

TEST(LocalRedirectServerTest, MalformedRequestLine) {

  SpotifyLoginSession login_session(1, SpotifyPKCE::Generate(), u"/callback"_s, nullptr);
  ASSERT_TRUE(login_session.Start(0, OkHandler).success());

  const quint16 port = static_cast<quint16>(login_session.redirect_uri().port());
  EXPECT_EQ(HttpStatusCode(SendHttpRequest(port, "garbage\r\n\r\n")), 400);
  EXPECT_EQ(HttpStatusCode(SendHttpRequest(port, "POST /callback HTTP/1.1\r\n\r\n")), 405);

}

TEST(LocalRedirectServerTest, ClientClosingDuringCallbackHandling) {

  SpotifyLoginSession login_session(1, SpotifyPKCE::Generate(), u"/callback"_s, nullptr);
  std::atomic<int> handled(0);
  ASSERT_TRUE(login_session.Start(0, [&login_session, &handled](const QUrl&) {
    // Token exchange runs a nested event loop while the browser may already be gone.
    QEventLoop loop;
    QTimer::singleShot(200, &loop, &QEventLoop::quit);
    loop.exec();
    ++handled;
    login_session.PublishResult(SpotifyResult());
    return LocalRedirectServer::Response(200, u"<html><body>done</body></html>"_s);
  }).success());

  QTcpSocket socket;
  socket.connectToHost(QHostAddress::LocalHost, static_cast<quint16>(login_session.redirect_uri().port()));
  ASSERT_TRUE(socket.waitForConnected(5000));
  socket.write("GET /callback?code=abc&state=xyz HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n");
  ASSERT_TRUE(socket.waitForBytesWritten(5000));
  socket.disconnectFromHost();
  if (socket.state() != QAbstractSocket::UnconnectedState) {
    socket.waitForDisconnected(5000);
  }

  const std::optional<SpotifyResult> result = login_session.result_slot()->Wait(QDeadlineTimer(5000));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->success()) << result->ToString();
  EXPECT_EQ(handled.load(), 1);

}

TEST(LocalRedirectServerTest, PreferredPortTakenFallsBackToEphemeral) {

  QTcpServer blocker;
  ASSERT_TRUE(blocker.listen(QHostAddress::LocalHost, 0));

  SpotifyLoginSession login_session(1, SpotifyPKCE::Generate(), u"/callback"_s, nullptr);
  const SpotifyResult start_result = login_session.Start(blocker.serverPort(), OkHandler);
  ASSERT_TRUE(start_result.success()) << start_result.ToString();
  EXPECT_NE(login_session.redirect_uri().port(), static_cast<int>(blocker.serverPort()));
  EXPECT_GT(login_session.redirect_uri().port(), 0);

}

TEST(LocalRedirectServerTest, CancelClosesServer) {

  SharedPtr<Cancellable> cancellable = std::make_shared<Cancellable>();
  SpotifyLoginSession login_session(1, SpotifyPKCE::Generate(), u"/callback"_s, cancellable);
  ASSERT_TRUE(login_session.Start(0, OkHandler).success());

  cancellable->Cancel();

  const std::optional<SpotifyResult> result = login_session.result_slot()->Wait(QDeadlineTimer(5000));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->error_code, SpotifyResult::ErrorCode::Cancelled);

  // Nothing listens any more.
  EXPECT_TRUE(HttpGet(login_session.redirect_uri()).isEmpty());

}

TEST(LocalRedirectServerTest, DestroyingSessionPublishesCancelled) {

  SharedPtr<SpotifyLoginSession::ResultSlot> result_slot;
  {
    SpotifyLoginSession login_session(1, SpotifyPKCE::Generate(), u"/callback"_s, nullptr);
    ASSERT_TRUE(login_session.Start(0, OkHandler).success());
    result_slot = login_session.result_slot();
  }

  ASSERT_TRUE(result_slot->has_value());
  EXPECT_EQ(result_slot->Wait()->error_code, SpotifyResult::ErrorCode::Cancelled);

}

}  // namespace
