#pragma once

#include <string>

#include <QByteArray>
#include <QString>

#include "domain/grade_model.hpp"
#include "net/IHttpClient.hpp"

namespace gw::agent::app::portal {

inline constexpr int kBodyExcerptChars = 500;

inline std::string bodyExcerpt(const QByteArray& body) {
    return QString::fromUtf8(body).left(kBodyExcerptChars).toStdString();
}

inline gw::agent::domain::Failure makeFailure(gw::agent::domain::FailureKind kind,
                                              std::string message,
                                              gw::agent::domain::HandshakePath path,
                                              const gw::agent::net::HttpResponse* response = nullptr) {
    gw::agent::domain::Failure f;
    f.kind = kind;
    f.message = std::move(message);
    f.path = path;
    if (response) {
        f.httpStatus = response->status;
        f.bodyExcerpt = bodyExcerpt(response->body);
    }
    return f;
}

// Transport failure or HTTP status >= 400.
inline gw::agent::domain::Failure networkFailure(const char* step,
                                                 const gw::agent::net::HttpResponse& response,
                                                 gw::agent::domain::HandshakePath path) {
    std::string msg = std::string(step) + " failed";
    if (response.status > 0) {
        msg += " with HTTP " + std::to_string(response.status);
    }
    if (!response.error.isEmpty()) {
        msg += ": " + response.error.toStdString();
    }
    return makeFailure(gw::agent::domain::FailureKind::Network, std::move(msg), path, &response);
}

} // namespace gw::agent::app::portal
