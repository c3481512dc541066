#pragma once

#include <QByteArray>
#include <QMap>
#include <QProcessEnvironment>
#include <QString>

namespace gw::agent::infra {

// KEY=VALUE secrets file (".env"). Supports `#` comments, blank lines,
// an optional `export ` prefix and single- or double-quoted values.
class DotEnvFile final {
public:
    static QMap<QString, QString> parse(const QByteArray& text);

    // Missing file -> empty map.
    static QMap<QString, QString> load(const QString& path);

    // Adds entries that `env` does not define yet; real variables win.
    static QProcessEnvironment mergeInto(QProcessEnvironment env, const QMap<QString, QString>& values);

private:
    DotEnvFile() = delete;
};

} // namespace gw::agent::infra
