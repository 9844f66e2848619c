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

#ifndef SPOTIFYTOKENSTORE_H
#define SPOTIFYTOKENSTORE_H

#include <QString>

#include "spotifyresult.h"
#include "spotifytoken.h"

// JSON token file, owner-only and always rewritten whole.
class SpotifyTokenStore {
 public:
  explicit SpotifyTokenStore(const QString &filename);

  const QString &filename() const { return filename_; }

  // NotFound when no token was saved.
  SpotifyTokenResult Load() const;
  SpotifyResult Save(const SpotifyToken &token) const;
  SpotifyResult Remove() const;

 private:
  const QString filename_;
};

#endif  // SPOTIFYTOKENSTORE_H
