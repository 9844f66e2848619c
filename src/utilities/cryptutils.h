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

#ifndef CRYPTUTILS_H
#define CRYPTUTILS_H

#include <QByteArray>
#include <QString>
#include <QCryptographicHash>

namespace Utilities {

// RFC 4648 base64url without trailing padding.
QByteArray Base64UrlEncode(const QByteArray &data);

QByteArray Sha256Base64Url(const QByteArray &data);

// Value for an HTTP Basic Authorization header.
QByteArray BasicAuthorization(const QString &username, const QString &password);

}  // namespace Utilities

#endif  // CRYPTUTILS_H
