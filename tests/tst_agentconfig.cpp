#include <QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "infra/AgentConfigRepository.hpp"
#include "infra/DotEnvFile.hpp"

using gw::agent::infra::AgentConfigRepository;
using gw::agent::infra::DotEnvFile;

namespace {

QString writeConfig(const QTemporaryDir& dir, const QByteArray& json) {
    const QString path = dir.filePath(QStringLiteral("gradewatch.json"));
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) {
        f.write(json);
    }
    return path;
}

} // namespace

class AgentConfigTest : public QObject {
    Q_OBJECT

private slots:
    void defaultsWithoutFile();
    void readsSettingsFile();
    void accountsAcceptStringsAndObjects();
    void clampsInvalidDurations();
    void invalidJsonFallsBackToDefaults();
    void environmentProvidesSecrets();
    void environmentOverridesTopicUrl();

    void dotEnvParsesAssignments();
    void dotEnvIgnoresMalformedLines();
    void realEnvironmentWinsOverDotEnv();
    void missingDotEnvIsEmpty();
};

void AgentConfigTest::defaultsWithoutFile() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    AgentConfigRepository repo(dir.filePath(QStringLiteral("absent.json")), QProcessEnvironment());
    const auto cfg = repo.load();

    QCOMPARE(static_cast<int>(cfg.accounts.size()), 2);
    QCOMPARE(cfg.accounts[0].id, std::string("STUDENT_A"));
    QCOMPARE(cfg.accounts[1].id, std::string("STUDENT_B"));
    QVERIFY(!cfg.accounts[0].hasCredentials());
    QCOMPARE(cfg.portalBaseUrl, QUrl(QStringLiteral("https://websinu.utcluj.ro/note/")));
    QCOMPARE(static_cast<int>(cfg.delayBetweenAccounts.count()), 5);
    QCOMPARE(static_cast<int>(cfg.requestTimeout.count()), 30);
    QCOMPARE(cfg.snapshotDir, QStringLiteral("."));
    QCOMPARE(cfg.logFilePath, QStringLiteral("websinu_agent.log"));
    QVERIFY(cfg.ntfyTopicUrl.isEmpty());
}

void AgentConfigTest::readsSettingsFile() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeConfig(dir, R"({
        "ntfy_topic_url": "https://ntfy.sh/my-grades",
        "portal_base_url": "http://127.0.0.1:8080/note/",
        "accounts": ["ANA"],
        "delay_between_accounts_s": 0,
        "request_timeout_s": 12,
        "snapshot_dir": "/var/lib/gradewatch",
        "history_db": "",
        "log_file": "/var/log/gradewatch.log"
    })");

    const auto cfg = AgentConfigRepository(path, QProcessEnvironment()).load();

    QCOMPARE(cfg.ntfyTopicUrl, QStringLiteral("https://ntfy.sh/my-grades"));
    QCOMPARE(cfg.portalBaseUrl, QUrl(QStringLiteral("http://127.0.0.1:8080/note/")));
    QCOMPARE(static_cast<int>(cfg.accounts.size()), 1);
    QCOMPARE(cfg.accounts[0].id, std::string("ANA"));
    QCOMPARE(static_cast<int>(cfg.delayBetweenAccounts.count()), 0);
    QCOMPARE(static_cast<int>(cfg.requestTimeout.count()), 12);
    QCOMPARE(cfg.snapshotDir, QStringLiteral("/var/lib/gradewatch"));
    QVERIFY(cfg.historyDbPath.isEmpty());
    QCOMPARE(cfg.logFilePath, QStringLiteral("/var/log/gradewatch.log"));
}

void AgentConfigTest::accountsAcceptStringsAndObjects() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeConfig(dir, R"({"accounts": ["ANA", {"id": " BOGDAN "}, {"name": "x"}, ""]})");

    const auto cfg = AgentConfigRepository(path, QProcessEnvironment()).load();
    QCOMPARE(static_cast<int>(cfg.accounts.size()), 2);
    QCOMPARE(cfg.accounts[0].id, std::string("ANA"));
    QCOMPARE(cfg.accounts[1].id, std::string("BOGDAN"));
}

void AgentConfigTest::clampsInvalidDurations() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeConfig(dir, R"({"delay_between_accounts_s": -4, "request_timeout_s": 0})");

    const auto cfg = AgentConfigRepository(path, QProcessEnvironment()).load();
    QCOMPARE(static_cast<int>(cfg.delayBetweenAccounts.count()), 0);
    QCOMPARE(static_cast<int>(cfg.requestTimeout.count()), 30);
}

void AgentConfigTest::invalidJsonFallsBackToDefaults() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeConfig(dir, "{ \"accounts\": [");

    QProcessEnvironment env;
    env.insert(QStringLiteral("STUDENT_A_WEBSINU_USERNAME"), QStringLiteral("ana"));
    env.insert(QStringLiteral("STUDENT_A_WEBSINU_PASSWORD"), QStringLiteral("pw"));

    const auto cfg = AgentConfigRepository(path, env).load();
    QCOMPARE(static_cast<int>(cfg.accounts.size()), 2);
    QVERIFY(cfg.accounts[0].hasCredentials());
}

void AgentConfigTest::environmentProvidesSecrets() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeConfig(dir, R"({"accounts": ["ANA", "BOGDAN"]})");

    QProcessEnvironment env;
    env.insert(QStringLiteral("ANA_WEBSINU_USERNAME"), QStringLiteral("ana.pop"));
    env.insert(QStringLiteral("ANA_WEBSINU_PASSWORD"), QStringLiteral("p@ss"));
    env.insert(QStringLiteral("BOGDAN_WEBSINU_USERNAME"), QStringLiteral("bogdan"));

    const auto cfg = AgentConfigRepository(path, env).load();
    QCOMPARE(cfg.accounts[0].username, QStringLiteral("ana.pop"));
    QCOMPARE(cfg.accounts[0].password, QStringLiteral("p@ss"));
    QVERIFY(cfg.accounts[0].hasCredentials());
    QCOMPARE(cfg.accounts[1].username, QStringLiteral("bogdan"));
    QVERIFY(!cfg.accounts[1].hasCredentials());
}

void AgentConfigTest::environmentOverridesTopicUrl() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeConfig(dir, R"({"ntfy_topic_url": "https://ntfy.sh/from-file"})");

    QProcessEnvironment env;
    env.insert(QStringLiteral("NTFY_TOPIC_URL"), QStringLiteral(" https://ntfy.sh/from-env "));

    const auto cfg = AgentConfigRepository(path, env).load();
    QCOMPARE(cfg.ntfyTopicUrl, QStringLiteral("https://ntfy.sh/from-env"));
}

void AgentConfigTest::dotEnvParsesAssignments() {
    const auto values = DotEnvFile::parse(
        "# secrets\n"
        "NTFY_TOPIC_URL=https://ntfy.sh/grades\n"
        "\n"
        "export STUDENT_A_WEBSINU_USERNAME = ana.pop\n"
        "STUDENT_A_WEBSINU_PASSWORD=\"pa ss # not a comment\"\n"
        "STUDENT_B_WEBSINU_PASSWORD='x=y'\n"
        "STUDENT_B_WEBSINU_USERNAME=bogdan # trailing comment\r\n");

    QCOMPARE(values.value(QStringLiteral("NTFY_TOPIC_URL")), QStringLiteral("https://ntfy.sh/grades"));
    QCOMPARE(values.value(QStringLiteral("STUDENT_A_WEBSINU_USERNAME")), QStringLiteral("ana.pop"));
    QCOMPARE(values.value(QStringLiteral("STUDENT_A_WEBSINU_PASSWORD")), QStringLiteral("pa ss # not a comment"));
    QCOMPARE(values.value(QStringLiteral("STUDENT_B_WEBSINU_PASSWORD")), QStringLiteral("x=y"));
    QCOMPARE(values.value(QStringLiteral("STUDENT_B_WEBSINU_USERNAME")), QStringLiteral("bogdan"));
    QCOMPARE(static_cast<int>(values.size()), 5);
}

void AgentConfigTest::dotEnvIgnoresMalformedLines() {
    const auto values = DotEnvFile::parse("JUSTAWORD\n=value\nOK=1\n");
    QCOMPARE(static_cast<int>(values.size()), 1);
    QCOMPARE(values.value(QStringLiteral("OK")), QStringLiteral("1"));
}

void AgentConfigTest::realEnvironmentWinsOverDotEnv() {
    QProcessEnvironment env;
    env.insert(QStringLiteral("NTFY_TOPIC_URL"), QStringLiteral("https://ntfy.sh/real"));

    QMap<QString, QString> fileValues;
    fileValues.insert(QStringLiteral("NTFY_TOPIC_URL"), QStringLiteral("https://ntfy.sh/file"));
    fileValues.insert(QStringLiteral("STUDENT_A_WEBSINU_USERNAME"), QStringLiteral("ana"));

    const auto merged = DotEnvFile::mergeInto(env, fileValues);
    QCOMPARE(merged.value(QStringLiteral("NTFY_TOPIC_URL")), QStringLiteral("https://ntfy.sh/real"));
    QCOMPARE(merged.value(QStringLiteral("STUDENT_A_WEBSINU_USERNAME")), QStringLiteral("ana"));
}

void AgentConfigTest::missingDotEnvIsEmpty() {
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(DotEnvFile::load(dir.filePath(QStringLiteral(".env"))).isEmpty());
}

QTEST_GUILESS_MAIN(AgentConfigTest)
#include "tst_agentconfig.moc"
