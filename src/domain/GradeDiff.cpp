#include "domain/GradeDiff.hpp"

#include <map>
#include <string>

namespace gw::agent::domain {

GradeDiffResult diffGrades(const std::vector<GradeRecord>& previous,
                           const std::vector<GradeRecord>& current) {
    std::map<GradeKey, std::string> previousGrades;
    for (const auto& r : previous) {
        previousGrades[keyOf(r)] = r.grade;
    }

    GradeDiffResult res;
    for (const auto& r : current) {
        const auto it = previousGrades.find(keyOf(r));
        if (it == previousGrades.end()) {
            res.newRecords.push_back(r);
            continue;
        }
        if (it->second != r.grade) {
            GradeChange c;
            c.oldGrade = it->second;
            c.newGrade = r.grade;
            c.subject  = r.subject;
            c.year     = r.year;
            c.semester = r.semester;
            c.date     = r.date;
            res.changedRecords.push_back(std::move(c));
        }
    }
    return res;
}

} // namespace gw::agent::domain
