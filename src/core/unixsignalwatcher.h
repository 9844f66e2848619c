/*
 * Spotisync
 * This file was part of Strawberry.
 * Copyright 2026, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef UNIXSIGNALWATCHER_H
#define UNIXSIGNALWATCHER_H

#include <csignal>

#include <QObject>
#include <QList>

class QSocketNotifier;

// Forwards Unix signals such as SIGINT into the event loop of the thread that owns the watcher.
// The POSIX handler only writes the signal number to a socket pair, a QSocketNotifier reads it back
// and UnixSignal() is emitted from the event loop.
// Only one instance may exist at a time.
class UnixSignalWatcher : public QObject {
  Q_OBJECT

 public:
  explicit UnixSignalWatcher(QObject *parent = nullptr);
  ~UnixSignalWatcher() override;

  bool WatchForSignal(const int signal);

 Q_SIGNALS:
  void UnixSignal(const int signal);

 private:
  static void SignalHandler(const int signal);
  void HandleSignalNotification();

  static UnixSignalWatcher *sInstance;
  int signal_fd_[2];
  QSocketNotifier *socket_notifier_;
  QList<int> watched_signals_;
  QList<struct sigaction> original_signal_actions_;
};

#endif  // UNIXSIGNALWATCHER_H
