#include "net/portal/PortalForms.hpp"

#include <initializer_list>
#include <utility>

namespace gw::agent::net::portal {

namespace {

// application/x-www-form-urlencoded with '+' for spaces, as browsers send it.
QByteArray encodeFields(std::initializer_list<std::pair<const char*, QString>> fields) {
    QByteArray out;
    for (const auto& f : fields) {
        if (!out.isEmpty()) {
            out += '&';
        }
        out += QByteArray(f.first);
        out += '=';
        out += QUrl::toPercentEncoding(f.second).replace("%20", "+");
    }
    return out;
}

} // namespace

PortalEndpoints PortalEndpoints::fromBaseUrl(const QUrl& base) {
    QUrl dir = base;
    if (!dir.path().endsWith(QLatin1Char('/'))) {
        dir.setPath(dir.path() + QLatin1Char('/'));
    }

    PortalEndpoints e;
    e.loginUrl = dir.resolved(QUrl(QString::fromLatin1(protocol::kLoginPage)));
    e.rolesUrl = dir.resolved(QUrl(QString::fromLatin1(protocol::kRolesPage)));
    return e;
}

QByteArray LoginForm::encode() const {
    return encodeFields({
        {"hidSelfSubmit", QString::fromLatin1(protocol::kLoginPage)},
        {"username",      username},
        {"password",      password},
        {"submit",        QString::fromLatin1(protocol::kLoginSubmitLabel)},
    });
}

QByteArray RoleSelectionForm::encode() const {
    return encodeFields({
        {"hidSelfSubmit",        selfSubmit},
        {"sid",                  sid},
        {"hidOperation",         QString()},
        {"hidNume_Facultate",    QString()},
        {"hidNume_Specializare", QString()},
    });
}

QByteArray GradesViewForm::encode() const {
    return encodeFields({
        {"hidSelfSubmit",        QString::fromLatin1(protocol::kRolesPage)},
        {"sid",                  sid},
        {"hidOperation",         QString::fromLatin1(protocol::kShowGradesOperation)},
        {"hidNume_Facultate",    facultyName},
        {"hidNume_Specializare", specializationName},
    });
}

} // namespace gw::agent::net::portal
