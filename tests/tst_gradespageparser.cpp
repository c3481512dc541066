#include <QtTest>

#include "FakeHttpClient.hpp"
#include "infra/html/HtmlDocument.hpp"
#include "infra/portal/GradesPageParser.hpp"

using gw::agent::domain::GradeRecord;
using gw::agent::infra::html::resolveEncoding;
using gw::agent::infra::portal::parseGradesPage;
namespace pages = gw::agent::test::pages;

class GradesPageParserTest : public QObject {
    Q_OBJECT

private slots:
    void decodesSixCellRowsInPageOrder();
    void skipsRowsWithWrongCellCount();
    void ignoresTablesWithoutMarkerClass();
    void usesNearestEnclosingTable();
    void normalizesSubjectWhitespace();
    void trimsEveryCell();
    void readsUtf8WithoutDeclaredCharset();
    void headerCharsetDecodesLatin2Page();
    void headerCharsetWinsOverMetaDeclaration();
    void undeclaredNonUtf8FallsBackToLatin1();
    void charsetWordInTextDoesNotChangeDecoding();
    void resolvesEncoding_data();
    void resolvesEncoding();
    void emptyOrUnrelatedPagesYieldNothing();
};

void GradesPageParserTest::decodesSixCellRowsInPageOrder() {
    const QByteArray html = pages::gradesTable(
        pages::gradeRow("2", "1", "Analiza matematica", "Examen", "20.01.2025", "9") +
        pages::gradeRow("2", "1", "Fizica", "Colocviu", "22.01.2025", "7") +
        pages::gradeRow("2", "2", "Baze de date", "Examen", "", ""));

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 3);

    GradeRecord first;
    first.year = "2";
    first.semester = "1";
    first.subject = "Analiza matematica";
    first.type = "Examen";
    first.date = "20.01.2025";
    first.grade = "9";
    QVERIFY(records[0] == first);

    QCOMPARE(records[1].subject, std::string("Fizica"));
    QCOMPARE(records[2].subject, std::string("Baze de date"));
    QCOMPARE(records[2].grade, std::string());
}

void GradesPageParserTest::skipsRowsWithWrongCellCount() {
    const QByteArray html = pages::gradesTable(
        "<tr><td>2</td><td>1</td><td>Five cells</td><td>Examen</td><td>9</td></tr>" +
        pages::gradeRow("2", "1", "Valid", "Examen", "20.01.2025", "10") +
        "<tr><td>2</td><td>1</td><td>Seven</td><td>Examen</td><td>d</td><td>9</td><td>x</td></tr>" +
        "<tr><td colspan=\"6\">Total credite: 30</td></tr>");

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].subject, std::string("Valid"));
    QCOMPARE(records[0].grade, std::string("10"));
}

void GradesPageParserTest::ignoresTablesWithoutMarkerClass() {
    const QByteArray html =
        "<html><body>"
        "<table class=\"menu\">" +
        pages::gradeRow("x", "x", "Menu row", "x", "x", "x") +
        "</table>"
        "<table class=\"tablet\">" +
        pages::gradeRow("x", "x", "Lookalike", "x", "x", "x") +
        "</table>"
        "<table>" +
        pages::gradeRow("x", "x", "Plain", "x", "x", "x") +
        "</table>"
        "<table class=\"note table\">" +
        pages::gradeRow("3", "2", "Grades", "Examen", "01.06.2025", "8") +
        "</table>"
        "</body></html>";

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].subject, std::string("Grades"));
}

void GradesPageParserTest::usesNearestEnclosingTable() {
    // Layout table around the grades table, and a decorative table nested inside it.
    const QByteArray html =
        "<html><body><table class=\"layout\"><tr><td>"
        "<table class=\"table\">" +
        pages::gradeRow("1", "1", "Outer", "Examen", "10.01.2025", "6") +
        "<tr><td>"
        "<table class=\"legend\">" +
        pages::gradeRow("x", "x", "Nested", "x", "x", "x") +
        "</table>"
        "</td></tr>"
        "</table>"
        "</td></tr></table></body></html>";

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].subject, std::string("Outer"));
}

void GradesPageParserTest::normalizesSubjectWhitespace() {
    const QByteArray html = pages::gradesTable(
        pages::gradeRow("2", "1", "&nbsp;Programare&nbsp;Java&nbsp;", "Examen", "20.01.2025", "10") +
        pages::gradeRow("2", "1", "Retele&nbsp;&nbsp;de calculatoare", "Examen", "21.01.2025", "8"));

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 2);
    QCOMPARE(records[0].subject, std::string("Programare Java"));
    QCOMPARE(records[1].subject, std::string("Retele  de calculatoare"));
}

void GradesPageParserTest::trimsEveryCell() {
    const QByteArray html = pages::gradesTable(
        "<tr><td> 2 </td><td>\n1\n</td><td>  Algebra </td><td>\tExamen</td>"
        "<td> 20.01.2025</td><td>&nbsp;9&nbsp;</td></tr>");

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].year, std::string("2"));
    QCOMPARE(records[0].semester, std::string("1"));
    QCOMPARE(records[0].subject, std::string("Algebra"));
    QCOMPARE(records[0].type, std::string("Examen"));
    QCOMPARE(records[0].date, std::string("20.01.2025"));
    QCOMPARE(records[0].grade, std::string("9"));
}

void GradesPageParserTest::readsUtf8WithoutDeclaredCharset() {
    const QByteArray html =
        "<html><body><table class=\"table\">"
        "<tr><td>1</td><td>1</td><td>Matematic\xc4\x83</td><td>Examen</td><td>d</td><td>9</td></tr>"
        "</table></body></html>";

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].subject, std::string("Matematic\xc4\x83"));
}

void GradesPageParserTest::headerCharsetDecodesLatin2Page() {
    // "Matematic\xe3" is "Matematica" with a-breve in ISO-8859-2.
    const QByteArray html =
        "<html><head><title>Note</title></head><body><table class=\"table\">" +
        pages::gradeRow("2", "1", "Matematic\xe3", "Examen", "20.01.2025", "9") +
        "</table></body></html>";

    const auto records = parseGradesPage(html, "text/html; charset=ISO-8859-2");
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].subject, std::string("Matematic\xc4\x83"));
}

void GradesPageParserTest::headerCharsetWinsOverMetaDeclaration() {
    const QByteArray html = pages::gradesTable(
        pages::gradeRow("2", "1", "Chimie organic\xe3", "Examen", "20.01.2025", "8"));
    QVERIFY(html.contains("<meta charset=\"utf-8\">"));

    const auto records = parseGradesPage(html, "text/html;charset=\"iso-8859-2\"");
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].subject, std::string("Chimie organic\xc4\x83"));
}

void GradesPageParserTest::undeclaredNonUtf8FallsBackToLatin1() {
    const QByteArray html =
        "<html><body><table class=\"table\">" +
        pages::gradeRow("1", "2", "Matematic\xe3", "Examen", "d", "10") +
        "</table></body></html>";

    const auto records = parseGradesPage(html, "text/html");
    QCOMPARE(static_cast<int>(records.size()), 1);
    // Latin-1 0xE3 is a-tilde; what matters is that the text is valid UTF-8.
    QCOMPARE(records[0].subject, std::string("Matematic\xc3\xa3"));
}

void GradesPageParserTest::charsetWordInTextDoesNotChangeDecoding() {
    const QByteArray html =
        "<html><body><p>Pagina foloseste charset implicit.</p><table class=\"table\">" +
        pages::gradeRow("1", "1", "Matematic\xc4\x83", "Examen", "d", "9") +
        "</table></body></html>";

    const auto records = parseGradesPage(html);
    QCOMPARE(static_cast<int>(records.size()), 1);
    QCOMPARE(records[0].subject, std::string("Matematic\xc4\x83"));
}

void GradesPageParserTest::resolvesEncoding_data() {
    QTest::addColumn<QByteArray>("html");
    QTest::addColumn<QByteArray>("contentType");
    QTest::addColumn<QString>("expected");

    const QByteArray metaUtf8 = "<html><head><meta charset=\"utf-8\"></head></html>";
    const QByteArray metaHttpEquiv =
        "<html><head><meta http-equiv=\"Content-Type\" content=\"text/html; charset=windows-1250\"></head></html>";

    QTest::newRow("header") << metaUtf8 << QByteArray("text/html; charset=windows-1250") << QStringLiteral("windows-1250");
    QTest::newRow("quoted header") << QByteArray("x") << QByteArray("text/html; Charset='ISO-8859-2'")
                                   << QStringLiteral("ISO-8859-2");
    QTest::newRow("meta charset") << metaUtf8 << QByteArray("text/html") << QStringLiteral("utf-8");
    QTest::newRow("meta http-equiv") << metaHttpEquiv << QByteArray() << QStringLiteral("windows-1250");
    QTest::newRow("valid utf-8") << QByteArray("<p>Not\xc4\x83</p>") << QByteArray() << QStringLiteral("UTF-8");
    QTest::newRow("invalid utf-8") << QByteArray("<p>Not\xe3</p>") << QByteArray() << QStringLiteral("ISO-8859-1");
    QTest::newRow("unsupported header") << QByteArray("<p>ok</p>") << QByteArray("text/html; charset=x-no-such-charset")
                                        << QStringLiteral("UTF-8");
    QTest::newRow("charset outside meta") << QByteArray("<p>charset=latin2</p>") << QByteArray() << QStringLiteral("UTF-8");
}

void GradesPageParserTest::resolvesEncoding() {
    QFETCH(QByteArray, html);
    QFETCH(QByteArray, contentType);
    QFETCH(QString, expected);

    QCOMPARE(QString::fromStdString(resolveEncoding(html, contentType)), expected);
}

void GradesPageParserTest::emptyOrUnrelatedPagesYieldNothing() {
    QVERIFY(parseGradesPage(QByteArray()).empty());
    QVERIFY(parseGradesPage("<html><body><p>Sesiune inchisa</p></body></html>").empty());
    QVERIFY(parseGradesPage(pages::gradesTable(QByteArray())).empty());
}

QTEST_APPLESS_MAIN(GradesPageParserTest)
#include "tst_gradespageparser.moc"
