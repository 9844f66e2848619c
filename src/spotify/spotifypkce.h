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

#ifndef SPOTIFYPKCE_H
#define SPOTIFYPKCE_H

#include <QString>

// PKCE verifier/challenge pair (RFC 7636, S256) and the anti-CSRF state for one login attempt.
class SpotifyPKCE {
 public:
  static constexpr int kCodeVerifierBytes = 64;
  static constexpr int kStateBytes = 32;

  QString code_verifier;
  QString code_challenge;
  QString state;

  static SpotifyPKCE Generate();
  static QString CodeChallenge(const QString &code_verifier);
};

#endif  // SPOTIFYPKCE_H
