#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

namespace gw::agent::net {

struct HttpRequest {
    QUrl       url;
    QByteArray body;
    QByteArray contentType{"application/x-www-form-urlencoded"};
    QList<QPair<QByteArray, QByteArray>> headers;
};

struct HttpResponse {
    // false on transport failure or HTTP status >= 400.
    bool       ok{false};
    int        status{0};
    QByteArray body;
    // Content-Type header as received; may carry the charset of `body`.
    QByteArray contentType;
    QString    error;
};

// Port for a blocking, cookie-bearing HTTP session.
// One instance is one portal session: cookies live as long as the instance.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse post(const HttpRequest& request) = 0;
};

} // namespace gw::agent::net
