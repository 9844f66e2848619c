/*
 * Spotisync
 * This file was part of Strawberry.
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

#include <QByteArray>
#include <QString>
#include <QCryptographicHash>

#include "cryptutils.h"

namespace Utilities {

QByteArray Base64UrlEncode(const QByteArray &data) {
  return data.toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
}

QByteArray Sha256Base64Url(const QByteArray &data) {
  return Base64UrlEncode(QCryptographicHash::hash(data, QCryptographicHash::Sha256));
}

QByteArray BasicAuthorization(const QString &username, const QString &password) {
  return "Basic " + QStringLiteral("%1:%2").arg(username, password).toUtf8().toBase64();
}

}  // namespace Utilities
