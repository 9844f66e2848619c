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

#include <QString>

#include "spotifyresult.h"

using namespace Qt::Literals::StringLiterals;

SpotifyResult SpotifyResult::Wrap(const ErrorCode wrapping_error_code, const QString &context) const {

  SpotifyResult result(*this);
  result.error_code = wrapping_error_code;
  result.cause = cause == ErrorCode::Success ? error_code : cause;
  result.error_message = context.isEmpty() ? error_message : QStringLiteral("%1: %2").arg(context, error_message);

  return result;

}

QString SpotifyResult::ToString() const {

  if (success()) return u"Success"_s;

  QString text = ErrorCodeName(error_code);
  if (!error_message.isEmpty()) {
    text += ": "_L1 + error_message;
  }

  return text;

}

QString SpotifyResult::ErrorCodeName(const ErrorCode error_code) {

  switch (error_code) {
    case ErrorCode::Success:                  return u"Success"_s;
    case ErrorCode::MalformedCallback:        return u"MalformedCallback"_s;
    case ErrorCode::StateMismatch:            return u"StateMismatch"_s;
    case ErrorCode::TokenExchangeFailure:     return u"TokenExchangeFailure"_s;
    case ErrorCode::RefreshFailure:           return u"RefreshFailure"_s;
    case ErrorCode::MissingRefreshToken:      return u"MissingRefreshToken"_s;
    case ErrorCode::MissingClientCredentials: return u"MissingClientCredentials"_s;
    case ErrorCode::NotAuthenticated:         return u"NotAuthenticated"_s;
    case ErrorCode::HttpStatusError:          return u"HttpStatusError"_s;
    case ErrorCode::PaginationFailure:        return u"PaginationFailure"_s;
    case ErrorCode::NetworkError:             return u"NetworkError"_s;
    case ErrorCode::ParseError:               return u"ParseError"_s;
    case ErrorCode::Cancelled:                return u"Cancelled"_s;
    case ErrorCode::ListenFailure:            return u"ListenFailure"_s;
    case ErrorCode::StorageError:             return u"StorageError"_s;
    case ErrorCode::NotFound:                 return u"NotFound"_s;
  }

  return u"Unknown"_s;

}
