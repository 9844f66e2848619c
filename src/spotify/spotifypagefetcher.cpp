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

#include <algorithm>

#include <QList>

#include "spotifypagefetcher.h"

QList<int> SpotifyPageFetcherBase::RemainingOffsets(const int total, const int page_size) {

  QList<int> offsets;
  if (page_size <= 0) return offsets;

  for (int offset = page_size; offset < total; offset += page_size) {
    offsets << offset;
  }

  return offsets;

}

int SpotifyPageFetcherBase::WorkerCount(const int offset_count) {
  return std::max(0, std::min(kMaxWorkers, offset_count));
}
