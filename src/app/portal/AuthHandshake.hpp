#pragma once

#include <QByteArray>
#include <QString>

#include "domain/grade_model.hpp"
#include "infra/html/HtmlDocument.hpp"
#include "net/IHttpClient.hpp"
#include "net/portal/PortalForms.hpp"

namespace gw::agent::app::portal {

// Result of a completed login: the sid token and the landing page
// ("Note din sesiunea curenta") that carries the grades trigger link.
struct AuthenticatedSession {
    QString    sessionToken;
    QByteArray landingHtml;
    QByteArray landingContentType;
    gw::agent::domain::HandshakePath path{gw::agent::domain::HandshakePath::Unknown};
};

struct AuthResult {
    bool ok{false};
    AuthenticatedSession session;
    gw::agent::domain::Failure failure;
};

// Logs into the portal over the given HTTP session.
//
// The login POST answers in one of two ways:
//  - a script auto-submit page (frmData -> roluri.asp): the hidden sid and
//    hidSelfSubmit are posted to roluri.asp to obtain the landing page (two-hop);
//  - the landing page itself: sid is read from its frmData form (direct).
// Anything else is an AuthError. A missing form or sid, or a wrong title after
// the second hop, is a ProtocolError: the credentials were accepted but the
// pages no longer look as expected.
//
// No retries. The cookies collected here stay in `http` for the fetcher.
class AuthHandshake final {
public:
    AuthHandshake(gw::agent::net::IHttpClient& http, gw::agent::net::portal::PortalEndpoints endpoints);

    AuthResult authenticate(const QString& username, const QString& password);

    // Redirect pages contain both the auto-submit call and a roluri.asp reference.
    static bool isAutoSubmitRedirect(const QByteArray& body);

private:
    AuthResult completeTwoHop(const gw::agent::net::HttpResponse& redirect);
    AuthResult acceptDirect(const gw::agent::net::HttpResponse& landing,
                            const gw::agent::infra::html::HtmlDocument& page);

    gw::agent::net::IHttpClient&              http_;
    gw::agent::net::portal::PortalEndpoints   endpoints_;
};

} // namespace gw::agent::app::portal
