#include <QtTest/QtTest>
#include "core/shared/settings_manager.h"

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testMissingFileReturnsNullopt();
    void testMalformedFileReturnsNullopt();
    void testSaveAndLoad();
    void testPartialFileKeepsDefaults();
    void testUnknownStrategyKeepsDefault();
    void testNegativeMaxRepairsClamped();
};

void TestSettingsManager::testDefaults()
{
    const rc::Settings settings;
    QCOMPARE(settings.retrievalTopK, 3);
    QCOMPARE(settings.maxRepairs, 2);
    QCOMPARE(settings.chunkSize, 500);
    QCOMPARE(settings.explanationMaxChars, 200);
    QVERIFY(!settings.repairBypassesTemplates);
    QCOMPARE(settings.generation.timeoutMs, 90000);
    QCOMPARE(settings.generation.maxTokens, 1000);
    QCOMPARE(settings.generation.temperature, 0.1);
}

void TestSettingsManager::testMissingFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!rc::SettingsManager::load(dir.filePath(QStringLiteral("absent.json"))).has_value());
}

void TestSettingsManager::testMalformedFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("settings.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY(!rc::SettingsManager::load(path).has_value());
}

void TestSettingsManager::testSaveAndLoad()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    rc::Settings settings;
    settings.docsDir = QStringLiteral("/srv/docs");
    settings.generation.enabled = false;
    settings.generation.model = QStringLiteral("llama3");
    settings.routingMode = rc::StrategyMode::Rules;
    settings.answerMode = rc::StrategyMode::Model;
    settings.retrievalTopK = 5;
    settings.repairBypassesTemplates = true;
    QVERIFY(rc::SettingsManager::save(settings, path));

    const auto loaded = rc::SettingsManager::load(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->docsDir, QStringLiteral("/srv/docs"));
    QCOMPARE(loaded->generation.enabled, false);
    QCOMPARE(loaded->generation.model, QStringLiteral("llama3"));
    QVERIFY(loaded->routingMode == rc::StrategyMode::Rules);
    QVERIFY(loaded->answerMode == rc::StrategyMode::Model);
    QCOMPARE(loaded->retrievalTopK, 5);
    QVERIFY(loaded->repairBypassesTemplates);
}

void TestSettingsManager::testPartialFileKeepsDefaults()
{
    const rc::Settings settings = rc::SettingsManager::fromJson(
        QJsonDocument::fromJson(R"({"dbPath": "x.sqlite", "generation": {"timeoutMs": 5000}})").object());
    QCOMPARE(settings.dbPath, QStringLiteral("x.sqlite"));
    QCOMPARE(settings.generation.timeoutMs, 5000);
    QCOMPARE(settings.generation.endpoint, QStringLiteral("http://localhost:11434"));
    QCOMPARE(settings.docsDir, QStringLiteral("docs"));
    QCOMPARE(settings.maxRepairs, 2);
}

void TestSettingsManager::testUnknownStrategyKeepsDefault()
{
    const rc::Settings settings = rc::SettingsManager::fromJson(
        QJsonDocument::fromJson(R"({"draftingMode": "magic"})").object());
    QVERIFY(settings.draftingMode == rc::StrategyMode::Model);
}

void TestSettingsManager::testNegativeMaxRepairsClamped()
{
    const rc::Settings settings = rc::SettingsManager::fromJson(
        QJsonDocument::fromJson(R"({"maxRepairs": -4})").object());
    QCOMPARE(settings.maxRepairs, 0);
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
