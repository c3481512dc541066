#pragma once

#include <QString>
#include <vector>

#include "app/ISnapshotRepository.hpp"
#include "domain/grade_model.hpp"

namespace gw::agent::infra {

// One JSON file per account: <dir>/previous_grades_<account>.json,
// an array of {year, semester, subject, type, date, grade} objects.
class SnapshotRepository : public gw::agent::app::ISnapshotRepository {
public:
    explicit SnapshotRepository(QString directory);

    // Missing file -> empty (first run). Unreadable or invalid JSON -> empty, logged.
    std::vector<gw::agent::domain::GradeRecord> load(const gw::agent::domain::AccountId& account) const override;

    // Written atomically; the previous file survives a failed write.
    bool save(const gw::agent::domain::AccountId& account,
              const std::vector<gw::agent::domain::GradeRecord>& records) override;

    QString snapshotPath(const gw::agent::domain::AccountId& account) const;

private:
    QString directory_;
};

} // namespace gw::agent::infra
