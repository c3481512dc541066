#pragma once

#include <QByteArray>
#include <QString>

#include "app/portal/AuthHandshake.hpp"
#include "domain/grade_model.hpp"
#include "net/IHttpClient.hpp"
#include "net/portal/PortalForms.hpp"

namespace gw::agent::app::portal {

// Arguments of the landing page's `javascript: NoteSesiuneaCurenta('<faculty>', '<specialization>')` link.
struct GradesTrigger {
    QString facultyName;
    QString specializationName;
};

struct GradesTriggerResult {
    bool ok{false};
    GradesTrigger trigger;
    gw::agent::domain::Failure failure;
};

struct FetchResult {
    bool ok{false};
    QByteArray html;
    QByteArray contentType;
    gw::agent::domain::Failure failure;
};

// Retrieves the rendered grades page for an authenticated session.
// One POST, no pagination, no retries.
class GradesFetcher final {
public:
    GradesFetcher(gw::agent::net::IHttpClient& http, gw::agent::net::portal::PortalEndpoints endpoints);

    FetchResult fetchGradesPage(const AuthenticatedSession& session);

    // Finds the grades link on the landing page and decodes its two arguments.
    // ExtractionError if the link is missing or its call does not parse.
    static GradesTriggerResult findGradesTrigger(const QByteArray& landingHtml,
                                                 const QByteArray& contentType = QByteArray());

private:
    gw::agent::net::IHttpClient&            http_;
    gw::agent::net::portal::PortalEndpoints endpoints_;
};

} // namespace gw::agent::app::portal
