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

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QFile>
#include <QString>
#include <QStringList>

#include "commandlineoptions.h"
#include "constants/timeconstants.h"

#include <getopt.h>

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kHelpText[] =
    "%1: spotisync [%2] <%3> [%4]\n"
    "\n"
    "%5:\n"
    "  login                      %6\n"
    "  status                     %7\n"
    "  logout                     %8\n"
    "  playlists                  %9\n"
    "  saved                      %10\n"
    "  playlist <id>              %11\n"
    "  set-client-id <id>         %12\n"
    "  set-client-secret <secret> %13\n"
    "\n"
    "%14:\n"
    "  -h, --help                 %15\n"
    "  -t, --timeout <seconds>    %16\n"
    "      --quiet                %17\n"
    "      --verbose              %18\n"
    "      --log-levels <levels>  %19\n"
    "      --version              %20\n";

constexpr char kVersionText[] = "Spotisync %1";

constexpr int kDefaultLoginTimeoutSecs = 120;

}  // namespace

CommandlineOptions::CommandlineOptions(int argc, char **argv)
    : argc_(argc),
      argv_(argv),
      command_(Command::None),
      login_timeout_msec_(static_cast<int>(kDefaultLoginTimeoutSecs * kMsecPerSec)),
      help_requested_(false),
      version_requested_(false) {}

QString CommandlineOptions::HelpText() {

  return QString::fromUtf8(kHelpText)
      .arg(QObject::tr("Usage"), QObject::tr("options"), QObject::tr("command"), QObject::tr("arguments"),
           QObject::tr("Commands"),
           QObject::tr("Log in to Spotify in the browser"),
           QObject::tr("Show the login status"),
           QObject::tr("Log out and remove the stored token"),
           QObject::tr("List the playlists of the user"))
      .arg(QObject::tr("List the saved tracks of the user"),
           QObject::tr("Show a playlist with all its tracks"),
           QObject::tr("Store a client id, an empty value restores the default"),
           QObject::tr("Store a client secret, an empty value restores the default"),
           QObject::tr("Options"),
           QObject::tr("Show this help"),
           QObject::tr("Seconds to wait for the browser login, default 120"),
           QObject::tr("Equivalent to --log-levels *:1"),
           QObject::tr("Equivalent to --log-levels *:3"))
      .arg(QObject::tr("Comma separated list of class:level, level is 0-3"),
           QObject::tr("Print out version information"));

}

QString CommandlineOptions::VersionText() {
  return QString::fromUtf8(kVersionText).arg(QLatin1String(SPOTISYNC_VERSION));
}

bool CommandlineOptions::Parse() {

  static const struct option kOptions[] = {
    { "help", no_argument, nullptr, 'h' },
    { "timeout", required_argument, nullptr, 't' },
    { "quiet", no_argument, nullptr, LongOptions::Quiet },
    { "verbose", no_argument, nullptr, LongOptions::Verbose },
    { "log-levels", required_argument, nullptr, LongOptions::LogLevels },
    { "version", no_argument, nullptr, LongOptions::Version },
    { nullptr, 0, nullptr, 0 }
  };

  // Reset getopt so the options can be parsed more than once per process.
  optind = 0;

  // Parse the arguments
  bool ok = false;
  Q_FOREVER {
    int c = getopt_long(argc_, argv_, "ht:", kOptions, nullptr);

    // End of the options
    if (c == -1) break;

    switch (c) {
      case 'h':
        help_requested_ = true;
        return false;

      case 't':{
        const int timeout_secs = OptArgToString(optarg).toInt(&ok);
        if (!ok || timeout_secs <= 0) {
          error_ = QObject::tr("Invalid timeout: %1").arg(OptArgToString(optarg));
          return false;
        }
        login_timeout_msec_ = static_cast<int>(timeout_secs * kMsecPerSec);
        break;
      }

      case LongOptions::Quiet:
        log_levels_ = u"1"_s;
        break;
      case LongOptions::Verbose:
        log_levels_ = u"3"_s;
        break;
      case LongOptions::LogLevels:
        log_levels_ = OptArgToString(optarg);
        break;
      case LongOptions::Version:
        version_requested_ = true;
        return false;

      case '?':
      default:
        error_ = QObject::tr("Invalid option, see --help");
        return false;
    }
  }

  // The command and its arguments follow the options
  QStringList words;
  for (int i = optind; i < argc_; ++i) {
    words << DecodeName(argv_[i]);
  }

  return ParseCommand(words);

}

bool CommandlineOptions::ParseCommand(const QStringList &words) {

  if (words.isEmpty()) {
    error_ = QObject::tr("Missing command, see --help");
    return false;
  }

  const QString &name = words.first();
  int argument_count = 0;
  if (name == "login"_L1) {
    command_ = Command::Login;
  }
  else if (name == "status"_L1) {
    command_ = Command::Status;
  }
  else if (name == "logout"_L1) {
    command_ = Command::Logout;
  }
  else if (name == "playlists"_L1) {
    command_ = Command::Playlists;
  }
  else if (name == "saved"_L1) {
    command_ = Command::SavedTracks;
  }
  else if (name == "playlist"_L1) {
    command_ = Command::Playlist;
    argument_count = 1;
  }
  else if (name == "set-client-id"_L1) {
    command_ = Command::SetClientId;
    argument_count = 1;
  }
  else if (name == "set-client-secret"_L1) {
    command_ = Command::SetClientSecret;
    argument_count = 1;
  }
  else {
    error_ = QObject::tr("Unknown command: %1").arg(name);
    return false;
  }

  arguments_ = words.mid(1);
  if (arguments_.count() != argument_count) {
    command_ = Command::None;
    error_ = QObject::tr("Command %1 takes %n argument(s)", nullptr, argument_count).arg(name);
    return false;
  }

  return true;

}

QString CommandlineOptions::OptArgToString(const char *opt) {

  return QString::fromUtf8(opt);
}

QString CommandlineOptions::DecodeName(char *opt) {

  return QFile::decodeName(opt);

}
