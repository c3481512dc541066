#pragma once

#include <QString>
#include <QStringList>

namespace gw::agent::app {

// Port for user-facing push notifications.
// Delivery is best-effort: implementations log failures and return false,
// callers never abort on it.
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual bool notify(const QString& message,
                        const QString& title,
                        const QStringList& tags) = 0;
};

} // namespace gw::agent::app
