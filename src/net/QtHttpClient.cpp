#include "net/QtHttpClient.hpp"

#include <QEventLoop>
#include <QNetworkCookieJar>
#include <QNetworkRequest>
#include <QDebug>

#include <memory>

namespace gw::agent::net {

namespace {

constexpr auto kUserAgent = "Mozilla/5.0 (X11; Linux x86_64) gradewatch/1.0";

} // namespace

QtHttpClient::QtHttpClient(std::chrono::milliseconds transferTimeout)
    : timeout_(transferTimeout) {
    nam_.setCookieJar(new QNetworkCookieJar(&nam_));
    nam_.setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
}

QNetworkRequest QtHttpClient::makeRequest(const HttpRequest& request) const {
    QNetworkRequest req(request.url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, request.contentType);
    req.setHeader(QNetworkRequest::UserAgentHeader, QString::fromLatin1(kUserAgent));
    for (const auto& h : request.headers) {
        req.setRawHeader(h.first, h.second);
    }
    // The portal keys state on the session; never serve from cache.
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    req.setTransferTimeout(static_cast<int>(timeout_.count()));
    return req;
}

HttpResponse QtHttpClient::post(const HttpRequest& request) {
    // Owned here: no application event loop runs to honour deleteLater().
    const std::unique_ptr<QNetworkReply> reply(nam_.post(makeRequest(request), request.body));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    HttpResponse res;
    res.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    res.body   = reply->readAll();
    res.contentType = reply->rawHeader("Content-Type");
    res.ok     = (reply->error() == QNetworkReply::NoError) && res.status < 400;
    if (!res.ok) {
        res.error = reply->errorString();
        qDebug() << "HTTP POST" << request.url.toString() << "failed, status" << res.status
                 << ":" << res.error;
    }
    return res;
}

} // namespace gw::agent::net
