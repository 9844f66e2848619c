/* This file is part of Spotisync.
   Copyright 2011, David Sansome <me@davidsansome.com>
   Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
   Copyright 2026, Spotisync contributors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <QtGlobal>
#include <QByteArray>
#include <QMap>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QIODevice>
#include <QBuffer>
#include <QtMessageHandler>
#include <QMessageLogContext>
#include <QDebug>

#include "logging.h"

using namespace Qt::Literals::StringLiterals;

namespace logging {

namespace {

Level sDefaultLevel = Level_Info;
QMap<QString, Level> *sClassLevels = nullptr;
QIODevice *sNullDevice = nullptr;
QMutex sLevelsMutex;

constexpr char kMessageHandlerMagic[] = "__spotisync_log__";
const size_t kMessageHandlerMagicLen = strlen(kMessageHandlerMagic);
QtMessageHandler sOriginalMessageHandler = nullptr;

constexpr int kRedactVisibleChars = 4;

}  // namespace

const char *kDefaultLogLevels = "*:2";

template<class T>
static T CreateLogger(Level level, const QString &class_name, int line, const char *category);

template<class T>
class DebugBase : public QDebug {
 public:
  DebugBase() : QDebug(sNullDevice) {}
  explicit DebugBase(QtMsgType t) : QDebug(t) {}
  T &space() { return static_cast<T&>(QDebug::space()); }
  T &nospace() { return static_cast<T&>(QDebug::nospace()); }
};

// Collects the formatted line so the Qt message handler can print it in one piece.
class BufferedDebug : public DebugBase<BufferedDebug> {
 public:
  BufferedDebug() = default;
  explicit BufferedDebug(QtMsgType msg_type) : buf_(new QBuffer, later_deleter) {

    Q_UNUSED(msg_type)

    buf_->open(QIODevice::WriteOnly);

    QDebug other(buf_.get());
    swap(other);

  }

  // The QDebug base still refers to the raw buffer pointer until this object is gone.
  static void later_deleter(QBuffer *b) { b->deleteLater(); }

  std::shared_ptr<QBuffer> buf_;
};

// Goes straight to the message handler, tagged so it is not formatted twice.
class LoggedDebug : public DebugBase<LoggedDebug> {
 public:
  LoggedDebug() = default;
  explicit LoggedDebug(QtMsgType t) : DebugBase(t) { nospace() << kMessageHandlerMagic; }
};

static FILE *StreamForType(const QtMsgType type) {
  return type == QtCriticalMsg || type == QtFatalMsg || type == QtWarningMsg ? stderr : stdout;
}

static void MessageHandler(QtMsgType type, const QMessageLogContext &message_log_context, const QString &message) {

  Q_UNUSED(message_log_context)

  FILE *stream = StreamForType(type);

  if (message.startsWith(QLatin1String(kMessageHandlerMagic))) {
    const QByteArray message_data = message.toUtf8();
    fprintf(stream, "%s\n", message_data.constData() + kMessageHandlerMagicLen);
    fflush(stream);
    return;
  }

  Level level = Level_Debug;
  switch (type) {
    case QtFatalMsg:
    case QtCriticalMsg:
      level = Level_Error;
      break;
    case QtWarningMsg:
      level = Level_Warning;
      break;
    case QtInfoMsg:
      level = Level_Info;
      break;
    case QtDebugMsg:
    default:
      level = Level_Debug;
      break;
  }

  const char *category = message_log_context.category && strcmp(message_log_context.category, "default") != 0 ? message_log_context.category : nullptr;

  const QStringList lines = message.split(u'\n');
  for (const QString &line : lines) {
    BufferedDebug d = CreateLogger<BufferedDebug>(level, u"Qt"_s, -1, category);
    d << line.toLocal8Bit().constData();
    if (d.buf_) {
      d.buf_->close();
      fprintf(stream, "%s\n", d.buf_->buffer().constData());
      fflush(stream);
    }
  }

  if (type == QtFatalMsg) {
    abort();
  }

}

void Init() {

  QMutexLocker l(&sLevelsMutex);

  delete sClassLevels;
  delete sNullDevice;

  sClassLevels = new QMap<QString, Level>();
  sNullDevice = new NullDevice;
  sNullDevice->open(QIODevice::ReadWrite);

  if (!sOriginalMessageHandler) {
    sOriginalMessageHandler = qInstallMessageHandler(MessageHandler);
  }

}

void SetLevels(const QString &levels) {

  QMutexLocker l(&sLevelsMutex);

  if (!sClassLevels) return;

  const QStringList items = levels.split(u',', Qt::SkipEmptyParts);
  for (const QString &item : items) {
    const QStringList class_level = item.trimmed().split(u':');

    QString class_name;
    bool ok = false;
    int level = Level_Error;

    if (class_level.count() == 1) {
      level = class_level.last().toInt(&ok);
    }
    else if (class_level.count() == 2) {
      class_name = class_level.first();
      level = class_level.last().toInt(&ok);
    }

    if (!ok || level < Level_Error || level > Level_Debug) {
      continue;
    }

    if (class_name.isEmpty() || class_name == u'*') {
      sDefaultLevel = static_cast<Level>(level);
    }
    else {
      sClassLevels->insert(class_name, static_cast<Level>(level));
    }
  }

}

QString Redact(const QString &secret) {

  if (secret.isEmpty()) return u"<empty>"_s;
  if (secret.length() <= kRedactVisibleChars * 2) return QStringLiteral("<%1 chars>").arg(secret.length());

  return QStringLiteral("%1...<%2 chars>").arg(secret.left(kRedactVisibleChars)).arg(secret.length());

}

static QString ParsePrettyFunction(const char *pretty_function) {

  // Class name is the last scope before the function name, or the function name for free functions.
  QString class_name = QLatin1String(pretty_function);
  const qint64 paren = class_name.indexOf(u'(');
  if (paren != -1) {
    const qint64 colons = class_name.lastIndexOf("::"_L1, paren);
    if (colons != -1) {
      class_name = class_name.left(colons);
    }
    else {
      class_name = class_name.left(paren);
    }
  }

  const qint64 space = class_name.lastIndexOf(u' ');
  if (space != -1) {
    class_name = class_name.mid(space + 1);
  }

  // Template arguments and nested scopes don't take part in filtering.
  const qint64 angle = class_name.indexOf(u'<');
  if (angle != -1) {
    class_name = class_name.left(angle);
  }

  return class_name;

}

template <class T>
static T CreateLogger(Level level, const QString &class_name, int line, const char *category) {

  const char *level_name = nullptr;
  switch (level) {
    case Level_Debug:   level_name = " DEBUG "; break;
    case Level_Info:    level_name = " INFO  "; break;
    case Level_Warning: level_name = " WARN  "; break;
    case Level_Error:   level_name = " ERROR "; break;
    case Level_Fatal:   level_name = " FATAL "; break;
  }

  const QString filter_category = category != nullptr ? QLatin1String(category) : class_name;
  Level threshold_level = Level_Debug;
  {
    QMutexLocker l(&sLevelsMutex);
    threshold_level = sDefaultLevel;
    if (sClassLevels && sClassLevels->contains(filter_category)) {
      threshold_level = sClassLevels->value(filter_category);
    }
  }

  if (level > threshold_level) {
    return T();
  }

  QString function_line = class_name;
  if (line != -1) {
    function_line += u':' + QString::number(line);
  }
  if (category) {
    function_line += u'(' + QLatin1String(category) + u')';
  }

  QtMsgType type = QtDebugMsg;
  if (level == Level_Fatal) {
    type = QtFatalMsg;
  }
  else if (level == Level_Error) {
    type = QtCriticalMsg;
  }
  else if (level == Level_Warning) {
    type = QtWarningMsg;
  }

  T ret(type);
  ret.nospace() << QDateTime::currentDateTime().toString(u"hh:mm:ss.zzz"_s).toLatin1().constData() << level_name << function_line.leftJustified(32).toLatin1().constData();

  return ret.space();

}

#define qCreateLogger(line, pretty_function, category, level) logging::CreateLogger<LoggedDebug>(logging::Level_##level, logging::ParsePrettyFunction(pretty_function), line, category)

QDebug CreateLoggerFatal(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Fatal); }
QDebug CreateLoggerError(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Error); }

#ifdef QT_NO_INFO_OUTPUT
QNoDebug CreateLoggerInfo(const int line, const char *pretty_function, const char *category) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)
  Q_UNUSED(category)

  return QNoDebug();

}
#else
QDebug CreateLoggerInfo(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Info); }
#endif  // QT_NO_INFO_OUTPUT

#ifdef QT_NO_WARNING_OUTPUT
QNoDebug CreateLoggerWarning(const int line, const char *pretty_function, const char *category) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)
  Q_UNUSED(category)

  return QNoDebug();

}
#else
QDebug CreateLoggerWarning(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Warning); }
#endif  // QT_NO_WARNING_OUTPUT

#ifdef QT_NO_DEBUG_OUTPUT
QNoDebug CreateLoggerDebug(const int line, const char *pretty_function, const char *category) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)
  Q_UNUSED(category)

  return QNoDebug();

}
#else
QDebug CreateLoggerDebug(const int line, const char *pretty_function, const char *category) { return qCreateLogger(line, pretty_function, category, Debug); }
#endif  // QT_NO_DEBUG_OUTPUT

}  // namespace logging
