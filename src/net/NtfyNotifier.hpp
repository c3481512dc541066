#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "app/INotifier.hpp"
#include "net/IHttpClient.hpp"

namespace gw::agent::net {

// Publishes to an ntfy topic: POST <topic url>, UTF-8 message as body,
// `Title` and comma-joined `Tags` headers.
class NtfyNotifier final : public gw::agent::app::INotifier {
public:
    NtfyNotifier(IHttpClient& http, QUrl topicUrl);

    bool notify(const QString& message, const QString& title, const QStringList& tags) override;

    // Header values must be Latin-1; anything else goes out RFC 2047 encoded.
    static QByteArray encodeHeaderValue(const QString& value);

private:
    IHttpClient& http_;
    QUrl         topicUrl_;
};

} // namespace gw::agent::net
