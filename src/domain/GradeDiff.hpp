#pragma once

#include <vector>

#include "domain/grade_model.hpp"

namespace gw::agent::domain {

// Classifies `current` against `previous` using the (subject, year, semester) key.
//
// Rules:
//  - key absent from previous            -> new
//  - key present, grade differs (exact)  -> changed
//  - otherwise                           -> nothing
// Output order follows `current`. Records that vanished from `current` are not reported.
// If `previous` repeats a key, the last occurrence wins.
GradeDiffResult diffGrades(const std::vector<GradeRecord>& previous,
                           const std::vector<GradeRecord>& current);

} // namespace gw::agent::domain
