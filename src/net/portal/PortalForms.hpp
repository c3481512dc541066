#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

namespace gw::agent::net::portal {

// Fixed strings of the WebSinu grades portal. Values are case-sensitive.
namespace protocol {
inline constexpr const char* kDefaultBaseUrl       = "https://websinu.utcluj.ro/note/";
inline constexpr const char* kLoginPage            = "default.asp";
inline constexpr const char* kRolesPage            = "roluri.asp";
inline constexpr const char* kLoginSubmitLabel     = " Intra ";
inline constexpr const char* kShowGradesOperation  = "N";

inline constexpr const char* kLandingTitle         = "Note din sesiunea curenta";
inline constexpr const char* kAutoSubmitMarker     = "document.frmData.submit()";
inline constexpr const char* kDataFormName         = "frmData";
inline constexpr const char* kGradesScriptFunction = "NoteSesiuneaCurenta";
} // namespace protocol

struct PortalEndpoints {
    QUrl loginUrl;
    QUrl rolesUrl;

    // Resolves default.asp / roluri.asp against a base directory URL.
    static PortalEndpoints fromBaseUrl(const QUrl& base);
};

// One typed struct per portal POST. Field names and order on the wire are fixed
// by encode(); callers can only supply the variable parts.

// default.asp: hidSelfSubmit=default.asp, username, password, submit=" Intra "
struct LoginForm {
    QString username;
    QString password;

    QByteArray encode() const;
};

// roluri.asp, second hop of the redirect login:
// hidSelfSubmit, sid, and empty hidOperation / hidNume_Facultate / hidNume_Specializare.
struct RoleSelectionForm {
    QString selfSubmit{QString::fromLatin1(protocol::kRolesPage)};
    QString sid;

    QByteArray encode() const;
};

// roluri.asp, renders the grades table:
// hidSelfSubmit=roluri.asp, sid, hidOperation=N, hidNume_Facultate, hidNume_Specializare.
struct GradesViewForm {
    QString sid;
    QString facultyName;
    QString specializationName;

    QByteArray encode() const;
};

} // namespace gw::agent::net::portal
