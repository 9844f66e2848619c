/*
 * Spotisync
 * This file was part of Strawberry and Clementine.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include "config.h"

#include <QtGlobal>
#include <QCoreApplication>
#include <QIODevice>
#include <QByteArray>
#include <QString>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>

#include "networkaccessmanager.h"

using namespace Qt::Literals::StringLiterals;

NetworkAccessManager::NetworkAccessManager(const int transfer_timeout_msec, QObject *parent)
    : QNetworkAccessManager(parent) {

  setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
  setTransferTimeout(transfer_timeout_msec);

}

QByteArray NetworkAccessManager::UserAgent() {

  const QString application_name = QCoreApplication::applicationName().isEmpty() ? QStringLiteral(SPOTISYNC_APPLICATION_NAME) : QCoreApplication::applicationName();
  const QString application_version = QCoreApplication::applicationVersion().isEmpty() ? QStringLiteral(SPOTISYNC_VERSION) : QCoreApplication::applicationVersion();

  return QStringLiteral("%1/%2").arg(application_name, application_version).toUtf8();

}

QNetworkReply *NetworkAccessManager::createRequest(Operation op, const QNetworkRequest &network_request, QIODevice *outgoing_data) {

  QNetworkRequest new_network_request(network_request);
  new_network_request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
  new_network_request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
  new_network_request.setAttribute(QNetworkRequest::CacheSaveControlAttribute, false);

  if (!network_request.hasRawHeader("User-Agent")) {
    new_network_request.setHeader(QNetworkRequest::UserAgentHeader, UserAgent());
  }
  if (!network_request.hasRawHeader("Accept")) {
    new_network_request.setRawHeader("Accept", "application/json");
  }

  if (op == QNetworkAccessManager::PostOperation && !new_network_request.header(QNetworkRequest::ContentTypeHeader).isValid()) {
    new_network_request.setHeader(QNetworkRequest::ContentTypeHeader, u"application/x-www-form-urlencoded"_s);
  }

  return QNetworkAccessManager::createRequest(op, new_network_request, outgoing_data);

}
