#pragma once

#include <QProcessEnvironment>
#include <QString>

#include "app/AgentConfig.hpp"

namespace gw::agent::infra {

class AgentConfigRepository {
public:
    AgentConfigRepository(QString path, QProcessEnvironment environment);

    // Reads the JSON settings file, then resolves secrets from the environment:
    //   NTFY_TOPIC_URL overrides "ntfy_topic_url";
    //   <ID>_WEBSINU_USERNAME / <ID>_WEBSINU_PASSWORD give each account's credentials.
    // If the file is missing or invalid, defaults are used and a warning is logged.
    // Missing secrets are left empty; callers decide what is fatal.
    gw::agent::app::AgentConfig load() const;

    static gw::agent::app::AgentConfig defaults();

private:
    void applyEnvironment(gw::agent::app::AgentConfig& cfg) const;

    QString             path_;
    QProcessEnvironment env_;
};

} // namespace gw::agent::infra
