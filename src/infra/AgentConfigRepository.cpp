#include "infra/AgentConfigRepository.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

namespace gw::agent::infra {

using gw::agent::app::AccountConfig;
using gw::agent::app::AgentConfig;

namespace {

AccountConfig account(const QString& id) {
    AccountConfig a;
    a.id = id.toStdString();
    return a;
}

} // namespace

AgentConfigRepository::AgentConfigRepository(QString path, QProcessEnvironment environment)
    : path_(std::move(path))
    , env_(std::move(environment)) {
}

AgentConfig AgentConfigRepository::defaults() {
    AgentConfig cfg;
    cfg.accounts.push_back(account(QStringLiteral("STUDENT_A")));
    cfg.accounts.push_back(account(QStringLiteral("STUDENT_B")));
    return cfg;
}

AgentConfig AgentConfigRepository::load() const {
    AgentConfig cfg = defaults();

    QFile file(path_);
    if (!file.exists()) {
        qWarning() << "Agent config not found, using defaults:" << path_;
        applyEnvironment(cfg);
        return cfg;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open agent config, using defaults:" << path_;
        applyEnvironment(cfg);
        return cfg;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid agent config, using defaults:" << parseErr.errorString();
        applyEnvironment(cfg);
        return cfg;
    }

    const auto o = doc.object();

    cfg.ntfyTopicUrl = o.value(QStringLiteral("ntfy_topic_url")).toString(cfg.ntfyTopicUrl);

    const QString base = o.value(QStringLiteral("portal_base_url")).toString();
    if (!base.isEmpty()) {
        const QUrl url(base);
        if (url.isValid() && !url.scheme().isEmpty()) {
            cfg.portalBaseUrl = url;
        } else {
            qWarning() << "Invalid portal_base_url in config, keeping default:" << base;
        }
    }

    const int delay = o.value(QStringLiteral("delay_between_accounts_s"))
                          .toInt(static_cast<int>(cfg.delayBetweenAccounts.count()));
    cfg.delayBetweenAccounts = std::chrono::seconds(delay < 0 ? 0 : delay);

    const int timeout = o.value(QStringLiteral("request_timeout_s"))
                            .toInt(static_cast<int>(cfg.requestTimeout.count()));
    cfg.requestTimeout = std::chrono::seconds(timeout <= 0 ? 30 : timeout);

    cfg.snapshotDir   = o.value(QStringLiteral("snapshot_dir")).toString(cfg.snapshotDir);
    cfg.historyDbPath = o.value(QStringLiteral("history_db")).toString(cfg.historyDbPath);
    cfg.logFilePath   = o.value(QStringLiteral("log_file")).toString(cfg.logFilePath);

    if (o.contains(QStringLiteral("accounts"))) {
        if (!o.value(QStringLiteral("accounts")).isArray()) {
            qWarning() << "Invalid agent config:" << "'accounts' is not an array, keeping defaults";
        } else {
            cfg.accounts.clear();
            for (const auto& v : o.value(QStringLiteral("accounts")).toArray()) {
                QString id;
                if (v.isString()) {
                    id = v.toString();
                } else if (v.isObject()) {
                    id = v.toObject().value(QStringLiteral("id")).toString();
                }
                id = id.trimmed();
                if (id.isEmpty()) {
                    qWarning() << "Invalid account entry in config (missing id), skipping.";
                    continue;
                }
                cfg.accounts.push_back(account(id));
            }
        }
    }

    applyEnvironment(cfg);
    return cfg;
}

void AgentConfigRepository::applyEnvironment(AgentConfig& cfg) const {
    const QString ntfy = env_.value(QStringLiteral("NTFY_TOPIC_URL")).trimmed();
    if (!ntfy.isEmpty()) {
        cfg.ntfyTopicUrl = ntfy;
    }
    qDebug() << "NTFY_TOPIC_URL loaded:" << (cfg.ntfyTopicUrl.isEmpty() ? "No" : "Yes");

    for (auto& a : cfg.accounts) {
        const QString prefix = QString::fromStdString(a.id);
        a.username = env_.value(prefix + QStringLiteral("_WEBSINU_USERNAME"));
        a.password = env_.value(prefix + QStringLiteral("_WEBSINU_PASSWORD"));
        qDebug().noquote() << QStringLiteral("'%1_WEBSINU_USERNAME' loaded: %2, '%1_WEBSINU_PASSWORD' loaded: %3")
                                  .arg(prefix,
                                       a.username.isEmpty() ? QStringLiteral("No") : QStringLiteral("Yes"),
                                       a.password.isEmpty() ? QStringLiteral("No") : QStringLiteral("Yes"));
    }
}

} // namespace gw::agent::infra
