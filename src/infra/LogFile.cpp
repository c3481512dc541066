#include "infra/LogFile.hpp"

#include <cstdio>

namespace gw::agent::infra {

LogFile* LogFile::active_ = nullptr;

LogFile::LogFile() {
    active_ = this;
    previous_ = qInstallMessageHandler(&LogFile::handleMessage);
}

LogFile::LogFile(const QString& path)
    : LogFile() {
    open(path);
}

bool LogFile::open(const QString& path) {
    QMutexLocker lock(&mutex_);

    if (file_.isOpen()) {
        file_.close();
    }
    file_.setFileName(path);
    buffering_ = false;

    if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "[WARNING] Cannot open log file %s: %s\n",
                     qPrintable(path), qPrintable(file_.errorString()));
        pending_.clear();
        return false;
    }

    for (const QByteArray& entry : pending_) {
        file_.write(entry);
    }
    pending_.clear();
    file_.flush();
    return true;
}

LogFile::~LogFile() {
    qInstallMessageHandler(previous_);
    active_ = nullptr;
}

QString LogFile::levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return QStringLiteral("DEBUG");
        case QtInfoMsg:     return QStringLiteral("INFO");
        case QtWarningMsg:  return QStringLiteral("WARNING");
        case QtCriticalMsg: return QStringLiteral("ERROR");
        case QtFatalMsg:    return QStringLiteral("CRITICAL");
    }
    return QStringLiteral("INFO");
}

QString LogFile::formatEntry(QtMsgType type, const QString& message, const QDateTime& timestamp) {
    return QStringLiteral("[%1] [%2] %3\n")
        .arg(timestamp.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")), levelName(type), message);
}

void LogFile::handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    Q_UNUSED(context);
    if (active_) {
        active_->write(type, message);
    }
}

void LogFile::write(QtMsgType type, const QString& message) {
    QMutexLocker lock(&mutex_);

    if (file_.isOpen() || buffering_) {
        const QByteArray entry = formatEntry(type, message, QDateTime::currentDateTime()).toUtf8();
        if (file_.isOpen()) {
            file_.write(entry);
            file_.flush();
        } else {
            pending_.append(entry);
        }
    }

    const QByteArray console = QStringLiteral("[%1] %2\n").arg(levelName(type), message).toLocal8Bit();
    std::fwrite(console.constData(), 1, static_cast<size_t>(console.size()), stderr);
    std::fflush(stderr);
}

} // namespace gw::agent::infra
