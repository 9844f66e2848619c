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

#include "utilities/randutils.h"
#include "utilities/cryptutils.h"
#include "spotifypkce.h"

SpotifyPKCE SpotifyPKCE::Generate() {

  SpotifyPKCE pkce;
  pkce.code_verifier = Utilities::CryptographicRandomString(kCodeVerifierBytes);
  pkce.code_challenge = CodeChallenge(pkce.code_verifier);
  pkce.state = Utilities::CryptographicRandomString(kStateBytes);

  return pkce;

}

QString SpotifyPKCE::CodeChallenge(const QString &code_verifier) {
  return QString::fromLatin1(Utilities::Sha256Base64Url(code_verifier.toLatin1()));
}
