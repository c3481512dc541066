#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QString>
#include <QTextStream>
#include <QThread>

#include <chrono>
#include <memory>

#include "app/GradeCheckAgent.hpp"
#include "infra/AgentConfigRepository.hpp"
#include "infra/DotEnvFile.hpp"
#include "infra/LogFile.hpp"
#include "infra/RunHistoryRepository.hpp"
#include "infra/SnapshotRepository.hpp"
#include "net/NtfyNotifier.hpp"
#include "net/QtHttpClient.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitAccountFailed = 2;

int printHistory(const QString& dbPath, const QString& account, int limit) {
    QTextStream out(stdout);
    if (dbPath.isEmpty()) {
        out << "Run history is disabled (history_db is empty).\n";
        return kExitFatal;
    }

    gw::agent::infra::RunHistoryRepository repo(dbPath);
    if (!repo.isOpen()) {
        return kExitFatal;
    }

    const auto runs = repo.loadRecentRuns(account.toStdString(), limit);
    if (runs.empty()) {
        out << "No runs recorded for " << account << ".\n";
        return kExitOk;
    }

    for (const auto& r : runs) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            r.startedAt.time_since_epoch()).count();
        out << QDateTime::fromMSecsSinceEpoch(ms).toString(Qt::ISODate) << "  "
            << QString::fromStdString(to_string(r.outcome)).leftJustified(10)
            << " records=" << r.recordCount
            << " new=" << r.newCount
            << " changed=" << r.changedCount;
        if (r.failure.kind != gw::agent::domain::FailureKind::None) {
            out << "  " << QString::fromStdString(to_string(r.failure.kind))
                << ": " << QString::fromStdString(r.failure.message);
        }
        out << "\n";
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("gradewatch"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Checks WebSinu accounts for new or changed grades."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOpt(QStringLiteral("config"),
                                       QStringLiteral("JSON settings file."),
                                       QStringLiteral("file"), QStringLiteral("gradewatch.json"));
    const QCommandLineOption envOpt(QStringLiteral("env-file"),
                                    QStringLiteral("KEY=VALUE secrets file."),
                                    QStringLiteral("file"), QStringLiteral(".env"));
    const QCommandLineOption logOpt(QStringLiteral("log-file"),
                                    QStringLiteral("Log file (overrides the config)."),
                                    QStringLiteral("file"));
    const QCommandLineOption historyOpt(QStringLiteral("history"),
                                        QStringLiteral("Print recent runs of one account and exit."),
                                        QStringLiteral("account"));
    const QCommandLineOption limitOpt(QStringLiteral("limit"),
                                      QStringLiteral("Number of runs shown by --history."),
                                      QStringLiteral("n"), QStringLiteral("10"));
    parser.addOptions({configOpt, envOpt, logOpt, historyOpt, limitOpt});
    parser.process(app);

    // Held in memory until the configured log path is known.
    gw::agent::infra::LogFile log;

    const QProcessEnvironment env = gw::agent::infra::DotEnvFile::mergeInto(
        QProcessEnvironment::systemEnvironment(),
        gw::agent::infra::DotEnvFile::load(parser.value(envOpt)));

    gw::agent::infra::AgentConfigRepository configRepo(parser.value(configOpt), env);
    gw::agent::app::AgentConfig config = configRepo.load();
    if (parser.isSet(logOpt)) {
        config.logFilePath = parser.value(logOpt);
    }

    if (!log.open(config.logFilePath)) {
        qWarning() << "Continuing without a log file.";
    }
    qDebug() << "Current working directory:" << QDir::currentPath();

    if (parser.isSet(historyOpt)) {
        bool ok = false;
        const int limit = parser.value(limitOpt).toInt(&ok);
        return printHistory(config.historyDbPath, parser.value(historyOpt), ok ? limit : 10);
    }

    if (config.ntfyTopicUrl.trimmed().isEmpty()) {
        qCritical() << "NTFY_TOPIC_URL is not configured (environment, .env or ntfy_topic_url)."
                    << "Agent cannot send notifications.";
        return kExitFatal;
    }

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.requestTimeout);

    gw::agent::net::QtHttpClient notifyHttp(timeout);
    gw::agent::net::NtfyNotifier notifier(notifyHttp, QUrl(config.ntfyTopicUrl.trimmed()));
    gw::agent::infra::SnapshotRepository snapshots(config.snapshotDir);

    std::unique_ptr<gw::agent::infra::RunHistoryRepository> history;
    if (!config.historyDbPath.isEmpty()) {
        history = std::make_unique<gw::agent::infra::RunHistoryRepository>(config.historyDbPath);
    }

    gw::agent::app::AgentContext ctx{
        notifier,
        snapshots,
        history.get(),
        [timeout]() -> std::unique_ptr<gw::agent::net::IHttpClient> {
            return std::make_unique<gw::agent::net::QtHttpClient>(timeout);
        },
        [](std::chrono::milliseconds d) {
            QThread::msleep(static_cast<unsigned long>(d.count()));
        },
    };

    gw::agent::app::GradeCheckAgent agent(std::move(ctx), std::move(config));
    const auto summaries = agent.runAll();

    for (const auto& s : summaries) {
        if (s.outcome == gw::agent::domain::RunOutcome::Failed ||
            s.outcome == gw::agent::domain::RunOutcome::Skipped ||
            s.failure.kind != gw::agent::domain::FailureKind::None) {
            return kExitAccountFailed;
        }
    }
    return kExitOk;
}
