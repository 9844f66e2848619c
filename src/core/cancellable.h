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

#ifndef CANCELLABLE_H
#define CANCELLABLE_H

#include <atomic>

#include <QObject>

// Cancellation signal shared by everything working on behalf of one caller.
// Cancel() may be called from any thread, Cancelled() is emitted once.
class Cancellable : public QObject {
  Q_OBJECT

 public:
  explicit Cancellable(QObject *parent = nullptr);

  bool is_cancelled() const { return cancelled_.load(); }

 public Q_SLOTS:
  void Cancel();

 Q_SIGNALS:
  void Cancelled();

 private:
  std::atomic<bool> cancelled_;
};

#endif  // CANCELLABLE_H
