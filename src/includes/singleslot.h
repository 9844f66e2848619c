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

#ifndef SINGLESLOT_H
#define SINGLESLOT_H

#include <optional>

#include <boost/noncopyable.hpp>

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QDeadlineTimer>

// Holds at most one value for its whole lifetime. Pushing into a filled slot drops the new value.
template<typename T>
class SingleSlot : public boost::noncopyable {
 public:
  SingleSlot() = default;

  bool TryPush(const T &value) {

    QMutexLocker l(&mutex_);
    if (value_.has_value()) return false;
    value_ = value;
    filled_.wakeAll();

    return true;

  }

  // Waits until the slot is filled or the deadline expires, the value stays in the slot.
  std::optional<T> Wait(const QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever)) const {

    QMutexLocker l(&mutex_);
    while (!value_.has_value()) {
      if (!filled_.wait(&mutex_, deadline)) break;
    }

    return value_;

  }

  bool has_value() const {
    QMutexLocker l(&mutex_);
    return value_.has_value();
  }

 private:
  mutable QMutex mutex_;
  mutable QWaitCondition filled_;
  std::optional<T> value_;
};

#endif  // SINGLESLOT_H
