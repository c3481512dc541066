#include "infra/RunHistoryRepository.hpp"

#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QDebug>
#include <chrono>

namespace gw::agent::infra {

using gw::agent::domain::AccountId;
using gw::agent::domain::AccountRunSummary;
using gw::agent::domain::FailureKind;
using gw::agent::domain::HandshakePath;
using gw::agent::domain::TimePoint;

namespace {

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixMs(qint64 ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

} // namespace

RunHistoryRepository::RunHistoryRepository(const QString& dbPath, const QString& connectionName)
    : connectionName_(connectionName) {
    if (QSqlDatabase::contains(connectionName_)) {
        db_ = QSqlDatabase::database(connectionName_);
    } else {
        db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName_);
        db_.setDatabaseName(dbPath);
    }

    if (!db_.open()) {
        qWarning() << "Failed to open run history DB, history disabled:" << db_.lastError().text();
        return;
    }

    initSchema();
}

RunHistoryRepository::~RunHistoryRepository() {
    if (db_.isOpen()) {
        db_.close();
    }
    db_ = QSqlDatabase();
    QSqlDatabase::removeDatabase(connectionName_);
}

void RunHistoryRepository::initSchema() const {
    if (!db_.isOpen()) {
        return;
    }

    QSqlQuery q(db_);
    if (!q.exec(
            "CREATE TABLE IF NOT EXISTS runs ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "account TEXT NOT NULL,"
            "outcome TEXT NOT NULL,"
            "record_count INTEGER,"
            "new_count INTEGER,"
            "changed_count INTEGER,"
            "failure_kind INTEGER,"
            "failure_path INTEGER,"
            "failure_message TEXT,"
            "http_status INTEGER,"
            "started_at INTEGER,"
            "finished_at INTEGER)")) {
        qWarning() << "Failed to create runs table:" << q.lastError().text();
        return;
    }

    if (!q.exec("CREATE INDEX IF NOT EXISTS runs_account_idx ON runs (account, started_at)")) {
        qWarning() << "Failed to create runs index:" << q.lastError().text();
    }
}

void RunHistoryRepository::recordRun(const AccountRunSummary& summary) {
    if (!db_.isOpen()) {
        return;
    }

    QSqlQuery q(db_);
    q.prepare(
        "INSERT INTO runs "
        "(account, outcome, record_count, new_count, changed_count,"
        " failure_kind, failure_path, failure_message, http_status, started_at, finished_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

    q.addBindValue(QString::fromStdString(summary.accountId));
    q.addBindValue(QString::fromStdString(to_string(summary.outcome)));
    q.addBindValue(summary.recordCount);
    q.addBindValue(summary.newCount);
    q.addBindValue(summary.changedCount);
    q.addBindValue(static_cast<int>(summary.failure.kind));
    q.addBindValue(static_cast<int>(summary.failure.path));
    q.addBindValue(QString::fromStdString(summary.failure.message));
    q.addBindValue(summary.failure.httpStatus);
    q.addBindValue(QVariant(toUnixMs(summary.startedAt)));
    q.addBindValue(QVariant(toUnixMs(summary.finishedAt)));

    if (!q.exec()) {
        qWarning() << "Failed to record run:" << q.lastError().text();
    }
}

std::vector<AccountRunSummary> RunHistoryRepository::loadRecentRuns(const AccountId& account, int limit) const {
    std::vector<AccountRunSummary> out;

    if (!db_.isOpen() || limit <= 0) {
        return out;
    }

    QSqlQuery q(db_);
    q.prepare(
        "SELECT account, outcome, record_count, new_count, changed_count,"
        " failure_kind, failure_path, failure_message, http_status, started_at, finished_at"
        " FROM runs WHERE account = ? ORDER BY started_at DESC, id DESC LIMIT ?");
    q.addBindValue(QString::fromStdString(account));
    q.addBindValue(limit);

    if (!q.exec()) {
        qWarning() << "Failed to load runs:" << q.lastError().text();
        return out;
    }

    while (q.next()) {
        AccountRunSummary s;
        s.accountId    = q.value(0).toString().toStdString();
        s.outcome      = gw::agent::domain::runOutcomeFromString(q.value(1).toString().toStdString());
        s.recordCount  = q.value(2).toInt();
        s.newCount     = q.value(3).toInt();
        s.changedCount = q.value(4).toInt();

        s.failure.kind       = static_cast<FailureKind>(q.value(5).toInt());
        s.failure.path       = static_cast<HandshakePath>(q.value(6).toInt());
        s.failure.message    = q.value(7).toString().toStdString();
        s.failure.httpStatus = q.value(8).toInt();

        s.startedAt  = fromUnixMs(q.value(9).toLongLong());
        s.finishedAt = fromUnixMs(q.value(10).toLongLong());

        out.push_back(std::move(s));
    }

    return out;
}

} // namespace gw::agent::infra
