#include "infra/DotEnvFile.hpp"

#include <QFile>
#include <QList>
#include <QDebug>

namespace gw::agent::infra {

namespace {

QString unquote(const QString& v) {
    if (v.size() >= 2) {
        const QChar first = v.front();
        if ((first == QLatin1Char('"') || first == QLatin1Char('\'')) && v.back() == first) {
            return v.mid(1, v.size() - 2);
        }
    }
    return v;
}

} // namespace

QMap<QString, QString> DotEnvFile::parse(const QByteArray& text) {
    QMap<QString, QString> out;

    const QList<QByteArray> lines = text.split('\n');
    for (int i = 0; i < lines.size(); ++i) {
        QString line = QString::fromUtf8(lines[i]).trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }
        if (line.startsWith(QStringLiteral("export "))) {
            line = line.mid(7).trimmed();
        }

        const int eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            qWarning() << ".env line" << (i + 1) << "is not KEY=VALUE, ignored.";
            continue;
        }

        const QString key = line.left(eq).trimmed();
        QString value = line.mid(eq + 1).trimmed();
        const bool quoted = value.startsWith(QLatin1Char('"')) || value.startsWith(QLatin1Char('\''));
        if (!quoted) {
            // Unquoted values end at an inline comment.
            const int hash = value.indexOf(QStringLiteral(" #"));
            if (hash >= 0) {
                value = value.left(hash).trimmed();
            }
        }
        out.insert(key, unquote(value));
    }

    return out;
}

QMap<QString, QString> DotEnvFile::load(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        qDebug() << "No .env file at" << path;
        return {};
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open .env file:" << path << file.errorString();
        return {};
    }
    return parse(file.readAll());
}

QProcessEnvironment DotEnvFile::mergeInto(QProcessEnvironment env, const QMap<QString, QString>& values) {
    for (auto it = values.cbegin(); it != values.cend(); ++it) {
        if (!env.contains(it.key())) {
            env.insert(it.key(), it.value());
        }
    }
    return env;
}

} // namespace gw::agent::infra
