#pragma once

#include <chrono>
#include <vector>

#include <QString>
#include <QUrl>

#include "domain/grade_model.hpp"
#include "net/portal/PortalForms.hpp"

namespace gw::agent::app {

struct AccountConfig {
    gw::agent::domain::AccountId id; // e.g. "STUDENT_A"; prefixes the credential variables
    QString username;
    QString password;

    bool hasCredentials() const noexcept {
        return !username.isEmpty() && !password.isEmpty();
    }
};

struct AgentConfig {
    QString ntfyTopicUrl;
    QUrl    portalBaseUrl{QString::fromLatin1(gw::agent::net::portal::protocol::kDefaultBaseUrl)};

    std::vector<AccountConfig> accounts;

    std::chrono::seconds delayBetweenAccounts{5};
    std::chrono::seconds requestTimeout{30};

    QString snapshotDir{QStringLiteral(".")};
    QString historyDbPath{QStringLiteral("gradewatch_history.sqlite")}; // empty disables history
    QString logFilePath{QStringLiteral("websinu_agent.log")};
};

} // namespace gw::agent::app
