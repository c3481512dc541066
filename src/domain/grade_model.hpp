#pragma once

#include <chrono>
#include <string>
#include <tuple>
#include <vector>

namespace gw::agent::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using AccountId = std::string;

// --- Grade record -----------------------------------------------------------

// One row of the grades table, as decoded from the portal page.
// All fields are opaque text. Only `grade` is tracked for changes.
struct GradeRecord {
    std::string year;
    std::string semester;
    std::string subject;   // non-breaking spaces collapsed, trimmed
    std::string type;
    std::string date;
    std::string grade;
};

inline bool operator==(const GradeRecord& a, const GradeRecord& b) {
    return a.year == b.year && a.semester == b.semester && a.subject == b.subject &&
           a.type == b.type && a.date == b.date && a.grade == b.grade;
}

inline bool operator!=(const GradeRecord& a, const GradeRecord& b) {
    return !(a == b);
}

// Identity of a record across runs: (subject, year, semester).
struct GradeKey {
    std::string subject;
    std::string year;
    std::string semester;
};

inline bool operator<(const GradeKey& a, const GradeKey& b) {
    return std::tie(a.subject, a.year, a.semester) < std::tie(b.subject, b.year, b.semester);
}

inline bool operator==(const GradeKey& a, const GradeKey& b) {
    return a.subject == b.subject && a.year == b.year && a.semester == b.semester;
}

inline GradeKey keyOf(const GradeRecord& r) {
    return {r.subject, r.year, r.semester};
}

// --- Diff -------------------------------------------------------------------

struct GradeChange {
    std::string oldGrade;
    std::string newGrade;
    std::string subject;
    std::string year;
    std::string semester;
    std::string date;
};

inline bool operator==(const GradeChange& a, const GradeChange& b) {
    return a.oldGrade == b.oldGrade && a.newGrade == b.newGrade && a.subject == b.subject &&
           a.year == b.year && a.semester == b.semester && a.date == b.date;
}

struct GradeDiffResult {
    std::vector<GradeRecord> newRecords;
    std::vector<GradeChange> changedRecords;

    bool empty() const noexcept {
        return newRecords.empty() && changedRecords.empty();
    }
};

// --- Failures ---------------------------------------------------------------

enum class FailureKind {
    None          = 0,
    Network       = 1, // transport error or HTTP status >= 400
    Auth          = 2, // credentials rejected
    Protocol      = 3, // expected markup/token absent, page shape changed
    Extraction    = 4, // records trigger or rows not found
    Persistence   = 5,
    Configuration = 6
};

// Which branch of the login handshake a failure came from.
enum class HandshakePath {
    Unknown = 0,
    Direct  = 1,
    TwoHop  = 2
};

struct Failure {
    FailureKind   kind{FailureKind::None};
    std::string   message;
    int           httpStatus{0};
    std::string   bodyExcerpt; // first 500 chars of the offending page
    HandshakePath path{HandshakePath::Unknown};
};

// --- Account run ------------------------------------------------------------

enum class RunOutcome {
    Succeeded = 0,
    FirstRun  = 1, // no previous snapshot, nothing compared
    Skipped   = 2, // credentials missing
    Failed    = 3
};

struct AccountRunSummary {
    AccountId  accountId;
    RunOutcome outcome{RunOutcome::Failed};
    int        recordCount{0};
    int        newCount{0};
    int        changedCount{0};
    Failure    failure;

    TimePoint  startedAt{Clock::now()};
    TimePoint  finishedAt{Clock::now()};
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(FailureKind k) {
    switch (k) {
        case FailureKind::None:          return "None";
        case FailureKind::Network:       return "NetworkError";
        case FailureKind::Auth:          return "AuthError";
        case FailureKind::Protocol:      return "ProtocolError";
        case FailureKind::Extraction:    return "ExtractionError";
        case FailureKind::Persistence:   return "PersistenceError";
        case FailureKind::Configuration: return "ConfigurationError";
    }
    return "Unknown";
}

inline std::string to_string(HandshakePath p) {
    switch (p) {
        case HandshakePath::Unknown: return "unknown";
        case HandshakePath::Direct:  return "direct";
        case HandshakePath::TwoHop:  return "two-hop";
    }
    return "unknown";
}

inline std::string to_string(RunOutcome o) {
    switch (o) {
        case RunOutcome::Succeeded: return "Succeeded";
        case RunOutcome::FirstRun:  return "FirstRun";
        case RunOutcome::Skipped:   return "Skipped";
        case RunOutcome::Failed:    return "Failed";
    }
    return "Unknown";
}

inline RunOutcome runOutcomeFromString(const std::string& s) {
    if (s == "Succeeded") return RunOutcome::Succeeded;
    if (s == "FirstRun")  return RunOutcome::FirstRun;
    if (s == "Skipped")   return RunOutcome::Skipped;
    return RunOutcome::Failed;
}

} // namespace gw::agent::domain
