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

#include <cstring>

#include <QtGlobal>
#include <QList>
#include <QByteArray>
#include <QString>
#include <QRandomGenerator>

#include "randutils.h"
#include "cryptutils.h"

namespace Utilities {

QByteArray CryptographicRandomBytes(const int len) {

  if (len <= 0) return QByteArray();

  QList<quint32> words((len + 3) / 4);
  QRandomGenerator::system()->fillRange(words.data(), words.size());

  QByteArray bytes(len, Qt::Uninitialized);
  memcpy(bytes.data(), words.constData(), static_cast<size_t>(len));

  return bytes;

}

QString CryptographicRandomString(const int len) {
  return QString::fromLatin1(Base64UrlEncode(CryptographicRandomBytes(len)));
}

}  // namespace Utilities
