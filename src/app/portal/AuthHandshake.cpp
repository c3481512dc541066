#include "app/portal/AuthHandshake.hpp"

#include <QDebug>

#include "app/portal/PortalFailure.hpp"
#include "infra/html/HtmlDocument.hpp"

namespace gw::agent::app::portal {

using gw::agent::domain::FailureKind;
using gw::agent::domain::HandshakePath;
using gw::agent::infra::html::HtmlDocument;
using gw::agent::net::HttpRequest;
using gw::agent::net::HttpResponse;

namespace protocol = gw::agent::net::portal::protocol;

namespace {

bool hasLandingTitle(const HtmlDocument& doc) {
    return doc.title() == protocol::kLandingTitle;
}

AuthResult failed(gw::agent::domain::Failure f) {
    AuthResult r;
    r.ok = false;
    r.failure = std::move(f);
    return r;
}

} // namespace

AuthHandshake::AuthHandshake(gw::agent::net::IHttpClient& http,
                             gw::agent::net::portal::PortalEndpoints endpoints)
    : http_(http)
    , endpoints_(std::move(endpoints)) {
}

bool AuthHandshake::isAutoSubmitRedirect(const QByteArray& body) {
    return body.contains(protocol::kAutoSubmitMarker) && body.contains(protocol::kRolesPage);
}

AuthResult AuthHandshake::authenticate(const QString& username, const QString& password) {
    gw::agent::net::portal::LoginForm form;
    form.username = username;
    form.password = password;

    HttpRequest req;
    req.url = endpoints_.loginUrl;
    req.body = form.encode();

    qInfo() << "Attempting initial login POST request...";
    const HttpResponse resp = http_.post(req);
    if (!resp.ok) {
        return failed(networkFailure("Login POST", resp, HandshakePath::Unknown));
    }

    if (isAutoSubmitRedirect(resp.body)) {
        qInfo() << "Detected JavaScript redirect page. Following...";
        return completeTwoHop(resp);
    }

    const HtmlDocument doc = HtmlDocument::parse(resp.body, resp.contentType);
    if (hasLandingTitle(doc)) {
        qInfo() << "Logged in directly (no JavaScript redirect).";
        return acceptDirect(resp, doc);
    }

    qWarning() << "Login rejected. Status code:" << resp.status;
    qWarning().noquote() << "Response content (first 500 chars):\n"
                         << QString::fromStdString(bodyExcerpt(resp.body));
    return failed(makeFailure(FailureKind::Auth,
                              "login page did not lead to '" + std::string(protocol::kLandingTitle) + "'",
                              HandshakePath::Unknown, &resp));
}

AuthResult AuthHandshake::completeTwoHop(const HttpResponse& redirect) {
    const HtmlDocument page = HtmlDocument::parse(redirect.body, redirect.contentType);
    const auto form = page.findForm(protocol::kDataFormName, protocol::kRolesPage);
    if (!form) {
        qWarning() << "Could not find the intermediate form for JavaScript redirect.";
        return failed(makeFailure(FailureKind::Protocol, "redirect form frmData not found",
                                  HandshakePath::TwoHop, &redirect));
    }

    const std::string sid = form->input("sid").value_or(std::string());
    if (sid.empty()) {
        qWarning() << "Could not extract SID from intermediate redirect page.";
        return failed(makeFailure(FailureKind::Protocol, "sid missing from redirect form",
                                  HandshakePath::TwoHop, &redirect));
    }

    gw::agent::net::portal::RoleSelectionForm second;
    second.sid = QString::fromStdString(sid);
    const std::string selfSubmit = form->input("hidSelfSubmit").value_or(std::string());
    if (!selfSubmit.empty()) {
        second.selfSubmit = QString::fromStdString(selfSubmit);
    }
    qInfo() << "Extracted intermediate SID:" << second.sid;

    HttpRequest req;
    req.url = endpoints_.rolesUrl;
    req.body = second.encode();

    qInfo() << "Sending second POST request to roluri.asp to complete login...";
    const HttpResponse landing = http_.post(req);
    if (!landing.ok) {
        return failed(networkFailure("Second login POST", landing, HandshakePath::TwoHop));
    }

    if (!hasLandingTitle(HtmlDocument::parse(landing.body, landing.contentType))) {
        qWarning() << "Login sequence completed, but title" << protocol::kLandingTitle
                   << "not found on final page.";
        qWarning().noquote() << "Final response content (first 500 chars):\n"
                             << QString::fromStdString(bodyExcerpt(landing.body));
        return failed(makeFailure(FailureKind::Protocol,
                                  "landing page title mismatch after redirect",
                                  HandshakePath::TwoHop, &landing));
    }

    qInfo() << "Completed login sequence and landed on grades selection page.";
    AuthResult r;
    r.ok = true;
    r.session.sessionToken = second.sid;
    r.session.landingHtml = landing.body;
    r.session.landingContentType = landing.contentType;
    r.session.path = HandshakePath::TwoHop;
    return r;
}

AuthResult AuthHandshake::acceptDirect(const HttpResponse& landing, const HtmlDocument& page) {
    const auto form = page.findForm(protocol::kDataFormName, protocol::kRolesPage);
    if (!form) {
        qWarning() << "Form 'frmData' not found on directly landed page.";
        return failed(makeFailure(FailureKind::Protocol, "form frmData not found on landing page",
                                  HandshakePath::Direct, &landing));
    }

    const std::string sid = form->input("sid").value_or(std::string());
    if (sid.empty()) {
        qWarning() << "SID not found on directly landed page form.";
        return failed(makeFailure(FailureKind::Protocol, "sid missing from landing page form",
                                  HandshakePath::Direct, &landing));
    }

    AuthResult r;
    r.ok = true;
    r.session.sessionToken = QString::fromStdString(sid);
    r.session.landingHtml = landing.body;
    r.session.landingContentType = landing.contentType;
    r.session.path = HandshakePath::Direct;
    qInfo() << "Extracted SID from directly landed page:" << r.session.sessionToken;
    return r;
}

} // namespace gw::agent::app::portal
