#pragma once

#include <chrono>

#include <QNetworkAccessManager>
#include <QNetworkReply>

#include "net/IHttpClient.hpp"

namespace gw::agent::net {

// IHttpClient over QNetworkAccessManager.
//
// Requests are blocking: each post() spins a local event loop until the reply
// finishes or the transfer timeout fires. Needs a QCoreApplication.
// Cookies are kept in a per-instance jar and discarded with the instance.
class QtHttpClient final : public IHttpClient {
public:
    explicit QtHttpClient(std::chrono::milliseconds transferTimeout = std::chrono::seconds(30));

    HttpResponse post(const HttpRequest& request) override;

private:
    QNetworkRequest makeRequest(const HttpRequest& request) const;

    QNetworkAccessManager     nam_;
    std::chrono::milliseconds timeout_;
};

} // namespace gw::agent::net
