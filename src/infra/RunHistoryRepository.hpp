#pragma once

#include <QString>
#include <QtSql/QSqlDatabase>
#include <vector>

#include "app/IRunHistoryRepository.hpp"
#include "domain/grade_model.hpp"

namespace gw::agent::infra {

// Run audit trail in SQLite: one row per account run in table `runs`.
// If the database cannot be opened, recording is a no-op and loading returns nothing.
class RunHistoryRepository : public gw::agent::app::IRunHistoryRepository {
public:
    explicit RunHistoryRepository(const QString& dbPath,
                                  const QString& connectionName = QStringLiteral("run_history"));
    ~RunHistoryRepository() override;

    bool isOpen() const { return db_.isOpen(); }

    void recordRun(const gw::agent::domain::AccountRunSummary& summary) override;

    std::vector<gw::agent::domain::AccountRunSummary> loadRecentRuns(
        const gw::agent::domain::AccountId& account, int limit) const override;

private:
    void initSchema() const;

    QString      connectionName_;
    QSqlDatabase db_;
};

} // namespace gw::agent::infra
