#include "app/portal/GradesFetcher.hpp"

#include <string>

#include <QDebug>

#include "app/portal/PortalFailure.hpp"
#include "infra/html/HtmlDocument.hpp"
#include "infra/portal/ScriptCallParser.hpp"

namespace gw::agent::app::portal {

using gw::agent::domain::FailureKind;
using gw::agent::domain::HandshakePath;
using gw::agent::infra::html::HtmlDocument;
using gw::agent::net::HttpRequest;
using gw::agent::net::HttpResponse;

namespace protocol = gw::agent::net::portal::protocol;

namespace {

bool looksLikeGradesLink(const std::string& href) {
    const std::string h = gw::agent::infra::html::trimText(href);
    return h.rfind("javascript:", 0) == 0 && h.find(protocol::kGradesScriptFunction) != std::string::npos;
}

GradesTriggerResult triggerFailure(std::string message, const QByteArray& page) {
    GradesTriggerResult r;
    r.ok = false;
    r.failure = makeFailure(FailureKind::Extraction, std::move(message), HandshakePath::Unknown);
    r.failure.bodyExcerpt = bodyExcerpt(page);
    return r;
}

} // namespace

GradesFetcher::GradesFetcher(gw::agent::net::IHttpClient& http,
                             gw::agent::net::portal::PortalEndpoints endpoints)
    : http_(http)
    , endpoints_(std::move(endpoints)) {
}

GradesTriggerResult GradesFetcher::findGradesTrigger(const QByteArray& landingHtml,
                                                     const QByteArray& contentType) {
    const HtmlDocument doc = HtmlDocument::parse(landingHtml, contentType);

    std::string lastHref;
    std::string lastError;
    for (const auto& href : doc.anchorHrefs()) {
        if (!looksLikeGradesLink(href)) {
            continue;
        }

        const auto parsed = gw::agent::infra::portal::parseScriptCall(href);
        if (!parsed.ok) {
            lastHref = href;
            lastError = parsed.error;
            continue;
        }
        if (parsed.call.functionName != protocol::kGradesScriptFunction) {
            continue;
        }
        if (parsed.call.arguments.size() != 2) {
            lastHref = href;
            lastError = "expected 2 arguments, got " + std::to_string(parsed.call.arguments.size());
            continue;
        }

        GradesTriggerResult r;
        r.ok = true;
        r.trigger.facultyName = QString::fromStdString(parsed.call.arguments[0]);
        r.trigger.specializationName = QString::fromStdString(parsed.call.arguments[1]);
        return r;
    }

    if (!lastHref.empty()) {
        qWarning() << "Could not parse" << protocol::kGradesScriptFunction << "arguments:"
                   << QString::fromStdString(lastError);
        qWarning() << "JavaScript call found:" << QString::fromStdString(lastHref);
        return triggerFailure("grades link call does not parse: " + lastError, landingHtml);
    }

    qWarning() << "Could not find the grades link (<a> with" << protocol::kGradesScriptFunction
               << "call) on the landing page.";
    return triggerFailure("grades link not found on landing page", landingHtml);
}

FetchResult GradesFetcher::fetchGradesPage(const AuthenticatedSession& session) {
    FetchResult res;

    if (session.sessionToken.isEmpty()) {
        res.failure = makeFailure(FailureKind::Protocol, "no session token", session.path);
        return res;
    }

    const auto trigger = findGradesTrigger(session.landingHtml, session.landingContentType);
    if (!trigger.ok) {
        res.failure = trigger.failure;
        return res;
    }
    qInfo() << "Found faculty:" << trigger.trigger.facultyName
            << "specialization:" << trigger.trigger.specializationName;

    gw::agent::net::portal::GradesViewForm form;
    form.sid = session.sessionToken;
    form.facultyName = trigger.trigger.facultyName;
    form.specializationName = trigger.trigger.specializationName;

    HttpRequest req;
    req.url = endpoints_.rolesUrl;
    req.body = form.encode();

    qInfo() << "Sending POST request to display grades...";
    const HttpResponse resp = http_.post(req);
    if (!resp.ok) {
        res.failure = networkFailure("Grades POST", resp, session.path);
        return res;
    }

    qDebug() << "Grades page Content-Type:" << resp.contentType;
    qDebug().noquote() << "Grades page HTML:\n" << QString::fromUtf8(resp.body);

    res.ok = true;
    res.html = resp.body;
    res.contentType = resp.contentType;
    return res;
}

} // namespace gw::agent::app::portal
