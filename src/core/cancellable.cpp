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

#include <QObject>

#include "cancellable.h"
#include "logging.h"

Cancellable::Cancellable(QObject *parent) : QObject(parent), cancelled_(false) {}

void Cancellable::Cancel() {

  if (cancelled_.exchange(true)) return;

  qLog(Debug) << "Operation cancelled";

  Q_EMIT Cancelled();

}
