#include <QtTest>

#include "net/portal/PortalForms.hpp"

using namespace gw::agent::net::portal;

class PortalFormsTest : public QObject {
    Q_OBJECT

private slots:
    void loginFormWireFormat();
    void roleSelectionFormWireFormat();
    void gradesViewFormWireFormat();
    void endpointsResolveAgainstBaseDirectory();
};

void PortalFormsTest::loginFormWireFormat() {
    LoginForm f;
    f.username = QStringLiteral("ion.pop@student");
    f.password = QStringLiteral("p ass&1+");

    QCOMPARE(f.encode(),
             QByteArray("hidSelfSubmit=default.asp&username=ion.pop%40student&password=p+ass%261%2B"
                        "&submit=+Intra+"));
}

void PortalFormsTest::roleSelectionFormWireFormat() {
    RoleSelectionForm f;
    f.sid = QStringLiteral("A1B2C3");
    QCOMPARE(f.encode(),
             QByteArray("hidSelfSubmit=roluri.asp&sid=A1B2C3&hidOperation=&hidNume_Facultate="
                        "&hidNume_Specializare="));

    f.selfSubmit = QStringLiteral("roluri2.asp");
    QVERIFY(f.encode().startsWith("hidSelfSubmit=roluri2.asp&sid=A1B2C3&"));
}

void PortalFormsTest::gradesViewFormWireFormat() {
    GradesViewForm f;
    f.sid = QStringLiteral("XYZ");
    f.facultyName = QStringLiteral("Automatica si Calculatoare");
    f.specializationName = QString::fromUtf8("Tehnologia informa\xc8\x9biei");

    QCOMPARE(f.encode(),
             QByteArray("hidSelfSubmit=roluri.asp&sid=XYZ&hidOperation=N"
                        "&hidNume_Facultate=Automatica+si+Calculatoare"
                        "&hidNume_Specializare=Tehnologia+informa%C8%9Biei"));
}

void PortalFormsTest::endpointsResolveAgainstBaseDirectory() {
    const auto prod = PortalEndpoints::fromBaseUrl(QUrl(QString::fromLatin1(protocol::kDefaultBaseUrl)));
    QCOMPARE(prod.loginUrl, QUrl(QStringLiteral("https://websinu.utcluj.ro/note/default.asp")));
    QCOMPARE(prod.rolesUrl, QUrl(QStringLiteral("https://websinu.utcluj.ro/note/roluri.asp")));

    const auto local = PortalEndpoints::fromBaseUrl(QUrl(QStringLiteral("http://127.0.0.1:8080/note")));
    QCOMPARE(local.loginUrl, QUrl(QStringLiteral("http://127.0.0.1:8080/note/default.asp")));
    QCOMPARE(local.rolesUrl, QUrl(QStringLiteral("http://127.0.0.1:8080/note/roluri.asp")));
}

QTEST_APPLESS_MAIN(PortalFormsTest)
#include "tst_portalforms.moc"
