#pragma once

#include <vector>

#include "domain/grade_model.hpp"

namespace gw::agent::app {

// Port for the per-account grades snapshot kept between runs.
// Implementations live in infra (e.g. one JSON file per account).
class ISnapshotRepository {
public:
    virtual ~ISnapshotRepository() = default;

    // Empty if there is no snapshot yet or it cannot be read (logged, not fatal).
    virtual std::vector<gw::agent::domain::GradeRecord> load(const gw::agent::domain::AccountId& account) const = 0;

    // Replaces the whole snapshot. Returns false if it could not be written.
    virtual bool save(const gw::agent::domain::AccountId& account,
                      const std::vector<gw::agent::domain::GradeRecord>& records) = 0;
};

} // namespace gw::agent::app
