/*
 * Spotisync
 * This file was part of Strawberry and Clementine.
 * Copyright 2012, David Sansome <me@davidsansome.com>
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

#ifndef COMMANDLINEOPTIONS_H
#define COMMANDLINEOPTIONS_H

#include "config.h"

#include <QtGlobal>
#include <QString>
#include <QStringList>

class CommandlineOptions {
 public:
  explicit CommandlineOptions(int argc = 0, char **argv = nullptr);

  enum class Command {
    None,
    Login,
    Status,
    Logout,
    Playlists,
    SavedTracks,
    Playlist,
    SetClientId,
    SetClientSecret
  };

  // False when the program should exit without running a command, see help_requested(), version_requested() and error().
  bool Parse();

  Command command() const { return command_; }
  QStringList arguments() const { return arguments_; }
  // Empty unless given on the command line.
  QString log_levels() const { return log_levels_; }
  int login_timeout_msec() const { return login_timeout_msec_; }
  bool help_requested() const { return help_requested_; }
  bool version_requested() const { return version_requested_; }
  QString error() const { return error_; }

  static QString HelpText();
  static QString VersionText();

 private:
  // These are "invalid" characters to pass to getopt_long for options that shouldn't have a short (single character) option.
  enum LongOptions {
    Quiet = 256,
    Verbose,
    LogLevels,
    Version,
    Timeout
  };

  bool ParseCommand(const QStringList &words);

  static QString OptArgToString(const char *opt);
  static QString DecodeName(char *opt);

 private:
  int argc_;
  char **argv_;

  Command command_;
  QStringList arguments_;
  QString log_levels_;
  int login_timeout_msec_;
  bool help_requested_;
  bool version_requested_;
  QString error_;
};

#endif  // COMMANDLINEOPTIONS_H
