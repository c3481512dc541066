#pragma once

#include <vector>

#include "domain/grade_model.hpp"

namespace gw::agent::app {

// Port for the audit trail of account runs.
// Implementations live in infra (e.g. SQLite via QtSql).
class IRunHistoryRepository {
public:
    virtual ~IRunHistoryRepository() = default;

    virtual void recordRun(const gw::agent::domain::AccountRunSummary& summary) = 0;

    // Newest first, at most `limit` entries.
    virtual std::vector<gw::agent::domain::AccountRunSummary> loadRecentRuns(
        const gw::agent::domain::AccountId& account, int limit) const = 0;
};

} // namespace gw::agent::app
