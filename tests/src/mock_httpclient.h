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

#ifndef MOCK_HTTPCLIENT_H
#define MOCK_HTTPCLIENT_H

#include "gmock_include.h"

#include <QByteArray>
#include <QUrl>
#include <QJsonDocument>
#include <QJsonObject>

#include "includes/shared_ptr.h"
#include "core/httpclient.h"
#include "core/cancellable.h"

// clazy:excludeall=function-args-by-value

class MockHttpClient : public HttpClient {
 public:
  MOCK_METHOD3(Get, Reply(const QUrl &url, const HeaderList &headers, const SharedPtr<Cancellable> cancellable));
  MOCK_METHOD4(Post, Reply(const QUrl &url, const HeaderList &headers, const QByteArray &data, const SharedPtr<Cancellable> cancellable));

  static Reply JsonReply(const QJsonObject &json_object, const int http_status_code = 200) {
    return Reply(http_status_code, QJsonDocument(json_object).toJson(QJsonDocument::Compact));
  }

  static QByteArray HeaderValue(const HeaderList &headers, const QByteArray &name) {
    for (const Header &header : headers) {
      if (header.first == name) return header.second;
    }
    return QByteArray();
  }
};

#endif  // MOCK_HTTPCLIENT_H
