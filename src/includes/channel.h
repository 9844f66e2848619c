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

#ifndef CHANNEL_H
#define CHANNEL_H

#include <boost/noncopyable.hpp>

#include <QtGlobal>
#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QQueue>

// Blocking multi-producer multi-consumer queue.
// A capacity of 0 means unbounded. After Close(), Push() fails and Pop() drains what is left.
template<typename T>
class Channel : public boost::noncopyable {
 public:
  explicit Channel(const qint64 capacity = 0) : capacity_(capacity), closed_(false) {}

  bool Push(const T &value) {

    QMutexLocker l(&mutex_);
    while (!closed_ && capacity_ > 0 && queue_.count() >= capacity_) {
      not_full_.wait(&mutex_);
    }
    if (closed_) return false;
    queue_.enqueue(value);
    not_empty_.wakeOne();

    return true;

  }

  bool Pop(T &value) {

    QMutexLocker l(&mutex_);
    while (queue_.isEmpty() && !closed_) {
      not_empty_.wait(&mutex_);
    }
    if (queue_.isEmpty()) return false;
    value = queue_.dequeue();
    not_full_.wakeOne();

    return true;

  }

  void Close() {

    QMutexLocker l(&mutex_);
    closed_ = true;
    not_empty_.wakeAll();
    not_full_.wakeAll();

  }

  bool is_closed() const {
    QMutexLocker l(&mutex_);
    return closed_;
  }

 private:
  mutable QMutex mutex_;
  QWaitCondition not_empty_;
  QWaitCondition not_full_;
  QQueue<T> queue_;
  const qint64 capacity_;
  bool closed_;
};

#endif  // CHANNEL_H
