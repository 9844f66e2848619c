/*
 * Spotisync
 * This file was part of Strawberry and Clementine.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include <csignal>
#include <iostream>
#include <memory>

#include <QtGlobal>
#include <QCoreApplication>
#include <QFuture>
#include <QFutureWatcher>
#include <QtConcurrentRun>
#include <QLibraryInfo>
#include <QByteArray>
#include <QString>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/commandlineoptions.h"
#include "core/cancellable.h"
#include "core/httpclient.h"
#include "core/settings.h"
#include "core/unixsignalwatcher.h"
#include "spotify/spotifyconfig.h"
#include "spotify/spotifyservice.h"
#include "spotify/spotifyresult.h"
#include "spotify/spotifymodels.h"

using namespace Qt::Literals::StringLiterals;
using std::make_shared;

namespace {

void PrintJson(const QJsonObject &json_object) {
  std::cout << QJsonDocument(json_object).toJson(QJsonDocument::Indented).constData() << std::flush;
}

void PrintJson(const QJsonArray &json_array) {
  std::cout << QJsonDocument(json_array).toJson(QJsonDocument::Indented).constData() << std::flush;
}

int PrintError(const SpotifyResult &result) {

  std::cerr << result.ToString().toLocal8Bit().constData() << std::endl;
  return result.cancelled() ? 130 : 1;

}

int RunLogin(SpotifyService *service, const CommandlineOptions &options, const SharedPtr<Cancellable> cancellable) {

  const SpotifyStringResult authorize_url = service->StartLogin(cancellable);
  if (!authorize_url.success()) {
    return PrintError(authorize_url);
  }

  std::cerr << QCoreApplication::translate("main", "Open this URL in your browser to log in:").toLocal8Bit().constData() << std::endl;
  std::cout << authorize_url.value.toLocal8Bit().constData() << std::endl;

  const SpotifyResult login_result = service->WaitForLogin(options.login_timeout_msec());
  if (!login_result.success()) {
    return PrintError(login_result);
  }

  const SpotifyAuthStatusResult status = service->Status(cancellable);
  if (!status.success()) {
    return PrintError(status);
  }
  PrintJson(status.value.ToJson());

  return 0;

}

int RunCommand(SpotifyService *service, const CommandlineOptions &options, const SharedPtr<Cancellable> cancellable) {

  switch (options.command()) {
    case CommandlineOptions::Command::Login:
      return RunLogin(service, options, cancellable);

    case CommandlineOptions::Command::Status:{
      const SpotifyAuthStatusResult status = service->Status(cancellable);
      if (!status.success()) return PrintError(status);
      PrintJson(status.value.ToJson());
      return 0;
    }

    case CommandlineOptions::Command::Logout:{
      const SpotifyResult result = service->Logout();
      if (!result.success()) return PrintError(result);
      PrintJson(SpotifyAuthStatus().ToJson());
      return 0;
    }

    case CommandlineOptions::Command::Playlists:{
      const SpotifyPlaylistListResult playlists = service->FetchPlaylists(cancellable);
      if (!playlists.success()) return PrintError(playlists);
      QJsonArray json_playlists;
      for (const SpotifyPlaylist &playlist : playlists.value) {
        json_playlists.append(playlist.ToJson());
      }
      PrintJson(json_playlists);
      return 0;
    }

    case CommandlineOptions::Command::SavedTracks:{
      const SpotifyTrackListResult tracks = service->FetchSavedTracks(cancellable);
      if (!tracks.success()) return PrintError(tracks);
      QJsonArray json_tracks;
      for (const SpotifyTrack &track : tracks.value) {
        json_tracks.append(track.ToJson());
      }
      PrintJson(json_tracks);
      return 0;
    }

    case CommandlineOptions::Command::Playlist:{
      const SpotifyPlaylistWithTracksResult playlist = service->FetchPlaylistWithTracks(options.arguments().value(0), cancellable);
      if (!playlist.success()) return PrintError(playlist);
      PrintJson(playlist.value.ToJson());
      return 0;
    }

    case CommandlineOptions::Command::SetClientId:{
      const SpotifyResult result = service->SetClientId(options.arguments().value(0));
      if (!result.success()) return PrintError(result);
      return 0;
    }

    case CommandlineOptions::Command::SetClientSecret:{
      const SpotifyResult result = service->SetClientSecret(options.arguments().value(0));
      if (!result.success()) return PrintError(result);
      return 0;
    }

    case CommandlineOptions::Command::None:
      break;
  }

  return 1;

}

}  // namespace

int main(int argc, char *argv[]) {

  QCoreApplication::setApplicationName(QStringLiteral(SPOTISYNC_APPLICATION_NAME));
  QCoreApplication::setOrganizationName(QStringLiteral(SPOTISYNC_ORGANIZATION_NAME));
  QCoreApplication::setApplicationVersion(QStringLiteral(SPOTISYNC_VERSION));

  // Initialize logging. Log levels are set after the commandline options and settings are read below.
  logging::Init();

  QCoreApplication core_app(argc, argv);

  CommandlineOptions options(argc, argv);
  if (!options.Parse()) {
    if (options.help_requested()) {
      std::cout << CommandlineOptions::HelpText().toLocal8Bit().constData();
      return 0;
    }
    if (options.version_requested()) {
      std::cout << CommandlineOptions::VersionText().toLocal8Bit().constData() << std::endl;
      return 0;
    }
    std::cerr << options.error().toLocal8Bit().constData() << std::endl;
    return 2;
  }

  Settings s;
  const SpotifyConfig config = SpotifyConfig::Load(s);

  logging::SetLevels(options.log_levels().isEmpty() ? config.log_levels : options.log_levels());

  qLog(Debug) << "Spotisync" << SPOTISYNC_VERSION << "Qt" << QLibraryInfo::version().toString();
  qLog(Debug) << "Settings file" << s.fileName();

  SharedPtr<Cancellable> cancellable = make_shared<Cancellable>();

  UnixSignalWatcher signal_watcher;
  for (const int signal : { SIGINT, SIGTERM }) {
    if (!signal_watcher.WatchForSignal(signal)) {
      qLog(Warning) << "Unable to watch for signal" << signal;
    }
  }
  QObject::connect(&signal_watcher, &UnixSignalWatcher::UnixSignal, &*cancellable, [cancellable](const int signal) {
    qLog(Info) << "Cancelling on signal" << signal;
    cancellable->Cancel();
  });

  SpotifyService service(config, make_shared<NetworkHttpClient>(config.network_timeout_msec));

  // The command blocks, so it runs on a pool thread while this thread delivers signals.
  QFutureWatcher<int> command_watcher;
  QObject::connect(&command_watcher, &QFutureWatcher<int>::finished, &core_app, &QCoreApplication::quit);
  command_watcher.setFuture(QtConcurrent::run(&RunCommand, &service, options, cancellable));

  core_app.exec();

  return command_watcher.result();

}
