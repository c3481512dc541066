#pragma once

#include <QByteArrayList>
#include <QDateTime>
#include <QFile>
#include <QMutex>
#include <QString>
#include <QtGlobal>

namespace gw::agent::infra {

// Routes Qt logging (qDebug/qInfo/qWarning/qCritical) to an append-only log file
// and echoes each message to stderr.
//
//   file:    [yyyy-MM-dd HH:mm:ss] [LEVEL] message
//   stderr:  [LEVEL] message
//
// Installed for the lifetime of the object; only one may be alive at a time.
// Until open() is called, file entries are held in memory and written out
// ahead of everything else once the file is opened.
class LogFile final {
public:
    LogFile();
    explicit LogFile(const QString& path);
    ~LogFile();

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    // Opens `path` for appending and flushes the held entries into it.
    // On failure the held entries are dropped and logging continues on stderr only.
    bool open(const QString& path);

    bool isOpen() const { return file_.isOpen(); }

    static QString levelName(QtMsgType type);
    static QString formatEntry(QtMsgType type, const QString& message, const QDateTime& timestamp);

private:
    static void handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& message);
    void write(QtMsgType type, const QString& message);

    static LogFile* active_;

    QFile            file_;
    QByteArrayList   pending_;
    bool             buffering_{true};
    QMutex           mutex_;
    QtMessageHandler previous_{nullptr};
};

} // namespace gw::agent::infra
