#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include <QString>
#include <QStringList>

#include "app/AgentConfig.hpp"
#include "domain/grade_model.hpp"
#include "net/IHttpClient.hpp"

namespace gw::agent::app {

class INotifier;
class ISnapshotRepository;
class IRunHistoryRepository;

// Collaborators threaded through a run. Nothing here is owned by the agent.
struct AgentContext {
    INotifier&             notifier;
    ISnapshotRepository&   snapshots;
    IRunHistoryRepository* history{nullptr};

    // One fresh client per account: each account gets its own cookie jar.
    std::function<std::unique_ptr<gw::agent::net::IHttpClient>()> makeHttpClient;

    // Pause between accounts.
    std::function<void(std::chrono::milliseconds)> sleep;
};

// Checks every configured account in order:
//   load snapshot -> login -> fetch grades page -> extract -> diff -> notify -> save.
//
// Failures are account-scoped: each one is logged and notified, then the next
// account runs. Nothing is retried within a run.
class GradeCheckAgent final {
public:
    GradeCheckAgent(AgentContext ctx, AgentConfig config);

    const AgentConfig& config() const noexcept { return config_; }

    // All accounts, with the start/complete notifications and the pause between accounts.
    std::vector<gw::agent::domain::AccountRunSummary> runAll();

    gw::agent::domain::AccountRunSummary runAccount(const AccountConfig& account);

private:
    void send(const QString& message, const QString& title, const QStringList& tags);

    void reportChanges(const AccountConfig& account,
                       const gw::agent::domain::GradeDiffResult& diff);
    void reportLoginFailure(const AccountConfig& account, const gw::agent::domain::Failure& failure);
    void reportRetrievalFailure(const AccountConfig& account);

    gw::agent::domain::AccountRunSummary finish(gw::agent::domain::AccountRunSummary summary);

    AgentContext ctx_;
    AgentConfig  config_;
};

} // namespace gw::agent::app
