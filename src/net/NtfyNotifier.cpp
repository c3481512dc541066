#include "net/NtfyNotifier.hpp"

#include <QDebug>

namespace gw::agent::net {

NtfyNotifier::NtfyNotifier(IHttpClient& http, QUrl topicUrl)
    : http_(http)
    , topicUrl_(std::move(topicUrl)) {
}

QByteArray NtfyNotifier::encodeHeaderValue(const QString& value) {
    bool ascii = true;
    for (QChar ch : value) {
        if (ch.unicode() < 0x20 || ch.unicode() > 0x7e) {
            ascii = false;
            break;
        }
    }
    if (ascii) {
        return value.toLatin1();
    }
    return QByteArray("=?UTF-8?B?") + value.toUtf8().toBase64() + QByteArray("?=");
}

bool NtfyNotifier::notify(const QString& message, const QString& title, const QStringList& tags) {
    if (!topicUrl_.isValid() || topicUrl_.isEmpty()) {
        qWarning() << "Ntfy topic URL is not configured. Cannot send notification.";
        return false;
    }

    HttpRequest req;
    req.url = topicUrl_;
    req.body = message.toUtf8();
    req.contentType = "text/plain; charset=utf-8";
    req.headers.append({QByteArray("Title"), encodeHeaderValue(title)});
    if (!tags.isEmpty()) {
        req.headers.append({QByteArray("Tags"), encodeHeaderValue(tags.join(QLatin1Char(',')))});
    }

    const HttpResponse resp = http_.post(req);
    if (!resp.ok) {
        qCritical() << "Failed to send Ntfy notification:" << resp.status << resp.error;
        return false;
    }

    qInfo().noquote() << QStringLiteral("Ntfy notification sent successfully: '%1'").arg(message);
    return true;
}

} // namespace gw::agent::net
