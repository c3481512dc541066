#include "app/GradeCheckAgent.hpp"

#include <QDebug>

#include "app/INotifier.hpp"
#include "app/IRunHistoryRepository.hpp"
#include "app/ISnapshotRepository.hpp"
#include "app/portal/AuthHandshake.hpp"
#include "app/portal/GradesFetcher.hpp"
#include "domain/GradeDiff.hpp"
#include "infra/portal/GradesPageParser.hpp"

namespace gw::agent::app {

using namespace gw::agent::domain;

namespace {

const QString kStatusTitle = QStringLiteral("Agent Status");
const QString kErrorTitle  = QStringLiteral("WebSinu Agent Error");
const QString kUpdateTitle = QStringLiteral("WebSinu Grades Update");

inline QString q(const std::string& s) {
    return QString::fromStdString(s);
}

void logFailure(const AccountId& account, const Failure& f) {
    qCritical().noquote() << QStringLiteral("%1 for user '%2' (%3 path): %4")
                                 .arg(q(to_string(f.kind)), q(account), q(to_string(f.path)), q(f.message));
    if (!f.bodyExcerpt.empty()) {
        qCritical().noquote() << "Response excerpt (HTTP" << f.httpStatus << "):\n" << q(f.bodyExcerpt);
    }
}

} // namespace

GradeCheckAgent::GradeCheckAgent(AgentContext ctx, AgentConfig config)
    : ctx_(std::move(ctx))
    , config_(std::move(config)) {
}

void GradeCheckAgent::send(const QString& message, const QString& title, const QStringList& tags) {
    if (!ctx_.notifier.notify(message, title, tags)) {
        qDebug() << "Notification not delivered, continuing:" << message;
    }
}

std::vector<AccountRunSummary> GradeCheckAgent::runAll() {
    std::vector<AccountRunSummary> summaries;
    summaries.reserve(config_.accounts.size());

    send(QStringLiteral("WebSinu Grades agent started!"), kStatusTitle, {QStringLiteral("robot")});

    for (std::size_t i = 0; i < config_.accounts.size(); ++i) {
        const auto& account = config_.accounts[i];
        qInfo().noquote() << QStringLiteral("--- Processing grades for user: '%1' ---").arg(q(account.id));

        summaries.push_back(runAccount(account));
        if (summaries.back().outcome == RunOutcome::Skipped) {
            continue;
        }

        if (i + 1 < config_.accounts.size() && config_.delayBetweenAccounts.count() > 0) {
            qInfo() << "Pausing for" << config_.delayBetweenAccounts.count() << "seconds before next user...";
            if (ctx_.sleep) {
                ctx_.sleep(config_.delayBetweenAccounts);
            }
        }
    }

    qInfo() << "--- All user grade checks completed ---";
    send(QStringLiteral("All WebSinu grade checks completed!"), QStringLiteral("Agent Batch Complete"),
         {QStringLiteral("checkmark"), QStringLiteral("bell")});
    return summaries;
}

AccountRunSummary GradeCheckAgent::runAccount(const AccountConfig& account) {
    AccountRunSummary summary;
    summary.accountId = account.id;
    summary.startedAt = Clock::now();

    const QString id = q(account.id);

    if (!account.hasCredentials()) {
        qCritical().noquote() << QStringLiteral(
            "WebSinu username or password not found for user '%1'. Skipping this user.").arg(id);
        send(QStringLiteral("WebSinu credentials missing for user '%1'. Skipping.").arg(id), kErrorTitle,
             {QStringLiteral("error"), QStringLiteral("x")});
        summary.outcome = RunOutcome::Skipped;
        summary.failure.kind = FailureKind::Configuration;
        summary.failure.message = "credentials missing";
        return finish(std::move(summary));
    }

    send(QStringLiteral("Agent started checking for user '%1'.").arg(id), kStatusTitle,
         {QStringLiteral("robot"), QStringLiteral("sync")});

    const std::vector<GradeRecord> previous = ctx_.snapshots.load(account.id);

    // The session lives exactly as long as this account's run.
    const std::unique_ptr<gw::agent::net::IHttpClient> http = ctx_.makeHttpClient();
    const auto endpoints = gw::agent::net::portal::PortalEndpoints::fromBaseUrl(config_.portalBaseUrl);

    portal::AuthHandshake handshake(*http, endpoints);
    const portal::AuthResult auth = handshake.authenticate(account.username, account.password);
    if (!auth.ok) {
        logFailure(account.id, auth.failure);
        reportLoginFailure(account, auth.failure);
        summary.failure = auth.failure;
        return finish(std::move(summary));
    }

    qInfo().noquote() << QStringLiteral("Attempting to retrieve grades for user '%1'...").arg(id);
    portal::GradesFetcher fetcher(*http, endpoints);
    const portal::FetchResult page = fetcher.fetchGradesPage(auth.session);
    if (!page.ok) {
        logFailure(account.id, page.failure);
        reportRetrievalFailure(account);
        summary.failure = page.failure;
        return finish(std::move(summary));
    }

    const std::vector<GradeRecord> current = gw::agent::infra::portal::parseGradesPage(page.html, page.contentType);
    if (current.empty()) {
        Failure f;
        f.kind = FailureKind::Extraction;
        f.message = "no grade rows found";
        f.path = auth.session.path;
        logFailure(account.id, f);
        reportRetrievalFailure(account);
        summary.failure = f;
        return finish(std::move(summary));
    }

    summary.recordCount = static_cast<int>(current.size());
    qInfo().noquote() << QStringLiteral("Found %1 current grades for user '%2'.").arg(summary.recordCount).arg(id);

    if (previous.empty()) {
        qInfo().noquote() << QStringLiteral(
            "First run or no previous grades found for user '%1'. Not comparing, just saving current grades.").arg(id);
        send(QStringLiteral("First grade check completed for %1. Found %2 grades. Will notify on changes.")
                 .arg(id).arg(summary.recordCount),
             kUpdateTitle, {QStringLiteral("info")});
        summary.outcome = RunOutcome::FirstRun;
        summary.newCount = static_cast<int>(current.size());
    } else {
        const GradeDiffResult diff = diffGrades(previous, current);
        summary.newCount = static_cast<int>(diff.newRecords.size());
        summary.changedCount = static_cast<int>(diff.changedRecords.size());
        reportChanges(account, diff);
        summary.outcome = RunOutcome::Succeeded;
    }

    if (!ctx_.snapshots.save(account.id, current)) {
        // Notifications are already out; the next run will report the same deltas again.
        qCritical().noquote() << QStringLiteral("Could not save current grades for user '%1'.").arg(id);
        summary.failure.kind = FailureKind::Persistence;
        summary.failure.message = "snapshot could not be written";
    }

    return finish(std::move(summary));
}

void GradeCheckAgent::reportChanges(const AccountConfig& account, const GradeDiffResult& diff) {
    const QString id = q(account.id);

    for (const auto& r : diff.newRecords) {
        const QString msg = QStringLiteral("New grade for %1: %2 is %3 (on %4)")
                                .arg(id, q(r.subject), q(r.grade), q(r.date));
        send(msg, QStringLiteral("New WebSinu Grade for %1!").arg(id),
             {QStringLiteral("new"), QStringLiteral("sparkles")});
        qInfo().noquote() << "Notified:" << msg;
    }

    for (const auto& c : diff.changedRecords) {
        const QString msg = QStringLiteral("Grade for %1: %2 changed from %3 to %4 (on %5)")
                                .arg(id, q(c.subject), q(c.oldGrade), q(c.newGrade), q(c.date));
        send(msg, QStringLiteral("WebSinu Grade Changed for %1!").arg(id),
             {QStringLiteral("changed"), QStringLiteral("warning")});
        qInfo().noquote() << "Notified:" << msg;
    }

    if (diff.empty()) {
        qInfo().noquote() << QStringLiteral("No new or changed grades found for user '%1'.").arg(id);
        send(QStringLiteral("No new grades found for %1. All good.").arg(id), kUpdateTitle,
             {QStringLiteral("check")});
    }
}

void GradeCheckAgent::reportLoginFailure(const AccountConfig& account, const Failure& failure) {
    const QString id = q(account.id);
    QString msg;
    switch (failure.kind) {
        case FailureKind::Network:
            msg = QStringLiteral("WebSinu unreachable for %1 (network error). Check logs.").arg(id);
            break;
        case FailureKind::Protocol:
            msg = QStringLiteral("WebSinu page layout changed for %1 (protocol error). Check logs.").arg(id);
            break;
        default:
            msg = QStringLiteral("WebSinu login failed for %1. Check credentials or site changes.").arg(id);
            break;
    }
    send(msg, kUpdateTitle, {QStringLiteral("error"), QStringLiteral("x")});
}

void GradeCheckAgent::reportRetrievalFailure(const AccountConfig& account) {
    send(QStringLiteral("Failed to retrieve grades for %1. Check logs.").arg(q(account.id)), kUpdateTitle,
         {QStringLiteral("warning"), QStringLiteral("exclamation")});
}

AccountRunSummary GradeCheckAgent::finish(AccountRunSummary summary) {
    summary.finishedAt = Clock::now();
    if (ctx_.history) {
        ctx_.history->recordRun(summary);
    }
    return summary;
}

} // namespace gw::agent::app
