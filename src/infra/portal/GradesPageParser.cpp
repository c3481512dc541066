#include "infra/portal/GradesPageParser.hpp"

#include <array>
#include <optional>
#include <string>

#include <QDebug>
#include <QString>

#include "infra/html/HtmlDocument.hpp"

namespace gw::agent::infra::portal {

using gw::agent::domain::GradeRecord;
using gw::agent::infra::html::HtmlDocument;

namespace {

constexpr std::size_t kCellsPerRow = 6;

bool isGradeRow(const xmlNode* tr, const std::vector<xmlNode*>& cells) {
    if (cells.size() != kCellsPerRow) {
        return false;
    }
    const xmlNode* table = HtmlDocument::nearestAncestor(tr, "table");
    return table && HtmlDocument::hasClass(table, kGradesTableClass);
}

std::optional<GradeRecord> decodeRow(const std::vector<xmlNode*>& cells) {
    std::array<std::string, kCellsPerRow> text;
    for (std::size_t i = 0; i < kCellsPerRow; ++i) {
        const auto t = HtmlDocument::textContent(cells[i]);
        if (!t) {
            return std::nullopt;
        }
        text[i] = html::trimText(*t);
    }

    GradeRecord r;
    r.year     = text[0];
    r.semester = text[1];
    r.subject  = html::trimText(html::collapseNbsp(text[2]));
    r.type     = text[3];
    r.date     = text[4];
    r.grade    = text[5];
    return r;
}

} // namespace

std::vector<GradeRecord> parseGradesPage(const QByteArray& html, const QByteArray& contentType) {
    std::vector<GradeRecord> out;

    const HtmlDocument doc = HtmlDocument::parse(html, contentType);
    if (!doc.isValid()) {
        qWarning() << "Grades page is empty or could not be parsed.";
        return out;
    }

    doc.forEachElement("tr", [&](xmlNode* tr) {
        const auto cells = HtmlDocument::childElements(tr, "td");
        if (!isGradeRow(tr, cells)) {
            return;
        }

        auto record = decodeRow(cells);
        if (!record) {
            const auto raw = HtmlDocument::textContent(tr).value_or(std::string());
            qWarning() << "Skipping malformed grade row:" << QString::fromStdString(raw).simplified();
            return;
        }
        out.push_back(std::move(*record));
    });

    if (out.empty()) {
        qWarning() << "No grades found after parsing. The page structure might have changed.";
    }
    return out;
}

} // namespace gw::agent::infra::portal
