#pragma once

#include <vector>

#include <QByteArray>

#include "domain/grade_model.hpp"

namespace gw::agent::infra::portal {

// CSS class carried by the <table> that holds the grade rows.
inline constexpr const char* kGradesTableClass = "table";

// Extracts grade rows from the rendered grades page.
//
// A <tr> qualifies when it has exactly six direct <td> children and its nearest
// enclosing <table> carries kGradesTableClass. Cells are read as
// year, semester, subject, type, date, grade. Rows come out in page order.
// Never fails: unusable rows are skipped with a warning.
// `contentType` is the HTTP Content-Type of the page; its charset takes
// precedence over the page's own declaration.
std::vector<gw::agent::domain::GradeRecord> parseGradesPage(const QByteArray& html,
                                                            const QByteArray& contentType = QByteArray());

} // namespace gw::agent::infra::portal
