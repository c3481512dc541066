#include "infra/SnapshotRepository.hpp"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QDebug>

namespace gw::agent::infra {

using gw::agent::domain::AccountId;
using gw::agent::domain::GradeRecord;

namespace {

QJsonObject recordToJson(const GradeRecord& r) {
    QJsonObject o;
    o.insert(QStringLiteral("year"),     QString::fromStdString(r.year));
    o.insert(QStringLiteral("semester"), QString::fromStdString(r.semester));
    o.insert(QStringLiteral("subject"),  QString::fromStdString(r.subject));
    o.insert(QStringLiteral("type"),     QString::fromStdString(r.type));
    o.insert(QStringLiteral("date"),     QString::fromStdString(r.date));
    o.insert(QStringLiteral("grade"),    QString::fromStdString(r.grade));
    return o;
}

GradeRecord recordFromJson(const QJsonObject& o) {
    GradeRecord r;
    r.year     = o.value(QStringLiteral("year")).toString().toStdString();
    r.semester = o.value(QStringLiteral("semester")).toString().toStdString();
    r.subject  = o.value(QStringLiteral("subject")).toString().toStdString();
    r.type     = o.value(QStringLiteral("type")).toString().toStdString();
    r.date     = o.value(QStringLiteral("date")).toString().toStdString();
    r.grade    = o.value(QStringLiteral("grade")).toString().toStdString();
    return r;
}

} // namespace

SnapshotRepository::SnapshotRepository(QString directory)
    : directory_(std::move(directory)) {
}

QString SnapshotRepository::snapshotPath(const AccountId& account) const {
    return QDir(directory_).filePath(
        QStringLiteral("previous_grades_%1.json").arg(QString::fromStdString(account)));
}

std::vector<GradeRecord> SnapshotRepository::load(const AccountId& account) const {
    const QString path = snapshotPath(account);
    const QString id = QString::fromStdString(account);

    QFile file(path);
    if (!file.exists()) {
        qInfo().noquote() << QStringLiteral(
            "No previous grades file found for user '%1' at %2. Starting with empty grades.").arg(id, path);
        return {};
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCritical().noquote() << QStringLiteral(
            "Could not open %1: %2. Starting with empty grades for '%3'.").arg(path, file.errorString(), id);
        return {};
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isArray()) {
        const QString reason = parseErr.error != QJsonParseError::NoError
                                   ? parseErr.errorString()
                                   : QStringLiteral("top-level value is not an array");
        qCritical().noquote() << QStringLiteral(
            "Error decoding JSON from %1: %2. Starting with empty grades for '%3'.").arg(path, reason, id);
        return {};
    }

    const auto arr = doc.array();
    std::vector<GradeRecord> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.isObject()) {
            qWarning() << "Ignoring non-object entry in" << path;
            continue;
        }
        out.push_back(recordFromJson(v.toObject()));
    }

    qInfo().noquote() << QStringLiteral("Loaded %1 previous grades for user '%2' from %3")
                             .arg(static_cast<int>(out.size())).arg(id, path);
    return out;
}

bool SnapshotRepository::save(const AccountId& account, const std::vector<GradeRecord>& records) {
    const QString path = snapshotPath(account);
    const QString id = QString::fromStdString(account);

    QJsonArray arr;
    for (const auto& r : records) {
        arr.push_back(recordToJson(r));
    }

    if (!QDir().mkpath(directory_)) {
        qCritical() << "Failed to create snapshot directory:" << directory_;
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCritical().noquote() << QStringLiteral("Error saving current grades for user '%1' to %2: %3")
                                     .arg(id, path, file.errorString());
        return false;
    }

    if (file.write(QJsonDocument(arr).toJson(QJsonDocument::Indented)) < 0) {
        file.cancelWriting();
    }
    if (!file.commit()) {
        qCritical().noquote() << QStringLiteral("Error saving current grades for user '%1' to %2: %3")
                                     .arg(id, path, file.errorString());
        return false;
    }

    qInfo().noquote() << QStringLiteral("Saved %1 current grades for user '%2' to %3")
                             .arg(static_cast<int>(records.size())).arg(id, path);
    return true;
}

} // namespace gw::agent::infra
