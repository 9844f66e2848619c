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

#ifndef SPOTIFYRESULT_H
#define SPOTIFYRESULT_H

#include <QtGlobal>
#include <QByteArray>
#include <QString>

class SpotifyResult {
 public:
  enum class ErrorCode {
    Success,
    MalformedCallback,
    StateMismatch,
    TokenExchangeFailure,
    RefreshFailure,
    MissingRefreshToken,
    MissingClientCredentials,
    NotAuthenticated,
    HttpStatusError,
    PaginationFailure,
    NetworkError,
    ParseError,
    Cancelled,
    ListenFailure,
    StorageError,
    NotFound,
  };

  SpotifyResult(const ErrorCode _error_code = ErrorCode::Success, const QString &_error_message = QString())
      : error_code(_error_code),
        cause(ErrorCode::Success),
        http_status_code(0),
        offset(-1),
        error_message(_error_message) {}

  ErrorCode error_code;
  // Underlying error for wrapping codes such as PaginationFailure and RefreshFailure.
  ErrorCode cause;
  int http_status_code;
  // Page offset for PaginationFailure, -1 otherwise.
  int offset;
  // Response body for HttpStatusError.
  QByteArray reply_data;
  QString error_message;

  bool success() const { return error_code == ErrorCode::Success; }
  // True also when the operation failed because a wrapped step was cancelled.
  bool cancelled() const { return error_code == ErrorCode::Cancelled || cause == ErrorCode::Cancelled; }

  // Same error with a different code, the original code becomes the cause.
  SpotifyResult Wrap(const ErrorCode wrapping_error_code, const QString &context) const;

  QString ToString() const;

  static QString ErrorCodeName(const ErrorCode error_code);
};

template<typename T>
class SpotifyValueResult : public SpotifyResult {
 public:
  SpotifyValueResult() : SpotifyResult(), value() {}
  SpotifyValueResult(const ErrorCode _error_code, const QString &_error_message = QString()) : SpotifyResult(_error_code, _error_message), value() {}
  SpotifyValueResult(const SpotifyResult &result) : SpotifyResult(result), value() {}
  SpotifyValueResult(const T &_value) : SpotifyResult(ErrorCode::Success), value(_value) {}
  T value;
};

#endif  // SPOTIFYRESULT_H
