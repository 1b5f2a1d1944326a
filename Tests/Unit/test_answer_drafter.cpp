#include <QtTest/QtTest>
#include "core/answer/answer_drafter.h"
#include "Support/fake_generation_service.h"

#include <QJsonArray>
#include <QJsonObject>

namespace {

const QString kPolicyChunk = QStringLiteral(
    "- Perishables (Produce, Seafood, Dairy): 3-7 days.\n"
    "- Beverages unopened: 14 days; opened: no returns.\n"
    "- Non-perishables: 30 days.");

const QString kDamagedChunk = QStringLiteral(
    "Damaged or defective items may be returned within 60 days of delivery with proof of purchase.");

rc::RunState documentRun(const QString& text, const QString& hint)
{
    rc::RunState state;
    state.question.text = text;
    state.question.formatHint = rc::FormatHint::parse(hint);
    state.route = rc::Route::Document;

    rc::Snippet snippet;
    snippet.id = QStringLiteral("product_policy::chunk0");
    snippet.source = QStringLiteral("product_policy.md");
    snippet.content = kPolicyChunk;
    snippet.score = 0.6;
    state.snippets.push_back(snippet);
    return state;
}

rc::RunState structuredRun(const QString& hint, rc::QueryResult result)
{
    rc::RunState state;
    state.question.text = QStringLiteral("Top products by revenue");
    state.question.formatHint = rc::FormatHint::parse(hint);
    state.route = rc::Route::Structured;
    state.query = QStringLiteral("SELECT p.ProductName, SUM(x) AS Revenue FROM Products p");
    state.queryResult = std::move(result);
    return state;
}

rc::QueryResult productRows()
{
    return rc::QueryResult::fromRows(
        {QStringLiteral("ProductName"), QStringLiteral("Revenue")},
        {{QVariant(QStringLiteral("Chang")), QVariant(418.0)},
         {QVariant(QStringLiteral("Ikura")), QVariant(372.004)}});
}

} // namespace

class TestAnswerDrafter : public QObject {
    Q_OBJECT

private slots:
    // ── Day extraction ───────────────────────────────────────────
    void testExtractDays_data();
    void testExtractDays();
    void testExtractDaysNoMatch();

    // ── Rule drafting ────────────────────────────────────────────
    void testDocumentRouteAnswer();
    void testDocumentRouteWithoutEvidence();
    void testStructuredRowsCoerced();
    void testFailedQueryGivesDefault();

    // ── Model drafting ───────────────────────────────────────────
    void testModelAnswerUsed();
    void testModelForcesJsonOutput();
    void testModelPromptCarriesEvidence();
    void testModelMismatchFallsBack();
    void testModelFailureFallsBack();
    void testModelSkippedForFailedQuery();
    void testModelSkippedForEmptyRows();
};

// ── Day extraction ───────────────────────────────────────────────

void TestAnswerDrafter::testExtractDays_data()
{
    QTest::addColumn<QString>("question");
    QTest::addColumn<QString>("evidence");
    QTest::addColumn<int>("expected");

    QTest::newRow("unopened")
        << "According to the product policy, what is the return window (days) for unopened Beverages?"
        << kPolicyChunk << 14;
    QTest::newRow("non-perishable")
        << "How many days do customers have to return non-perishable goods?"
        << kPolicyChunk << 30;
    QTest::newRow("damaged")
        << "What is the return window for damaged items?"
        << kDamagedChunk << 60;
    QTest::newRow("no qualifier takes first")
        << "How long is the return window?"
        << kDamagedChunk << 60;
}

void TestAnswerDrafter::testExtractDays()
{
    QFETCH(QString, question);
    QFETCH(QString, evidence);
    QFETCH(int, expected);

    const std::optional<int> days = rc::RuleAnswerDrafter::extractDays(question, evidence);
    QVERIFY(days.has_value());
    QCOMPARE(*days, expected);
}

void TestAnswerDrafter::testExtractDaysNoMatch()
{
    QVERIFY(!rc::RuleAnswerDrafter::extractDays(QStringLiteral("unopened?"),
                                                QStringLiteral("No numbers here."))
                 .has_value());
}

// ── Rule drafting ────────────────────────────────────────────────

void TestAnswerDrafter::testDocumentRouteAnswer()
{
    rc::RuleAnswerDrafter drafter;
    const QJsonValue answer = drafter.draft(documentRun(
        QStringLiteral("What is the return window (days) for unopened Beverages?"),
        QStringLiteral("int")));
    QVERIFY(answer.isDouble());
    QCOMPARE(answer.toInt(), 14);
}

void TestAnswerDrafter::testDocumentRouteWithoutEvidence()
{
    rc::RunState state = documentRun(QStringLiteral("Return window for unopened Beverages?"),
                                     QStringLiteral("int"));
    state.snippets.clear();

    rc::RuleAnswerDrafter drafter;
    const QJsonValue answer = drafter.draft(state);
    QVERIFY(answer.isDouble());
    QCOMPARE(answer.toInt(), 0);
}

void TestAnswerDrafter::testStructuredRowsCoerced()
{
    rc::RuleAnswerDrafter drafter;
    const QJsonValue answer = drafter.draft(
        structuredRun(QStringLiteral("list[{product:str, revenue:float}]"), productRows()));
    QVERIFY(answer.isArray());
    const QJsonArray rows = answer.toArray();
    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows.at(0).toObject().value(QStringLiteral("product")).toString(),
             QStringLiteral("Chang"));
    QCOMPARE(rows.at(1).toObject().value(QStringLiteral("revenue")).toDouble(), 372.0);
}

void TestAnswerDrafter::testFailedQueryGivesDefault()
{
    rc::RuleAnswerDrafter drafter;
    const QJsonValue failed = drafter.draft(structuredRun(
        QStringLiteral("float"), rc::QueryResult::failure(QStringLiteral("no such table"))));
    QVERIFY(failed.isDouble());
    QCOMPARE(failed.toDouble(), 0.0);

    const QJsonValue empty = drafter.draft(structuredRun(
        QStringLiteral("list[{product:str}]"),
        rc::QueryResult::fromRows({QStringLiteral("p")}, {})));
    QVERIFY(empty.isArray());
    QVERIFY(empty.toArray().isEmpty());
}

// ── Model drafting ───────────────────────────────────────────────

void TestAnswerDrafter::testModelAnswerUsed()
{
    auto fake = std::make_shared<rc::test::FakeGenerationService>();
    fake->enqueue(QStringLiteral("{\"answer\": 21}"));
    rc::ModelAnswerDrafter drafter(fake, rc::GenerationOptions{});

    const QJsonValue answer = drafter.draft(documentRun(
        QStringLiteral("Return window for unopened Beverages?"), QStringLiteral("int")));
    QCOMPARE(answer.toInt(), 21);
}

void TestAnswerDrafter::testModelForcesJsonOutput()
{
    auto fake = std::make_shared<rc::test::FakeGenerationService>();
    fake->setDefaultReply(QStringLiteral("{\"answer\": 1}"));
    rc::GenerationOptions options;
    options.jsonOutput = false;
    rc::ModelAnswerDrafter drafter(fake, options);

    drafter.draft(documentRun(QStringLiteral("x"), QStringLiteral("int")));
    QVERIFY(fake->lastOptions().jsonOutput);
}

void TestAnswerDrafter::testModelPromptCarriesEvidence()
{
    rc::RunState state = structuredRun(QStringLiteral("list[{product:str, revenue:float}]"),
                                       productRows());
    rc::Snippet snippet;
    snippet.id = QStringLiteral("kpi_definitions::chunk0");
    snippet.content = QStringLiteral("Revenue excludes discounts.");
    state.snippets.push_back(snippet);

    const QString prompt = rc::ModelAnswerDrafter::buildPrompt(state);
    QVERIFY(prompt.contains(QStringLiteral("Format hint: list[{product:str, revenue:float}]")));
    QVERIFY(prompt.contains(QStringLiteral("Chang")));
    QVERIFY(prompt.contains(QStringLiteral("[kpi_definitions::chunk0] Revenue excludes discounts.")));
}

void TestAnswerDrafter::testModelMismatchFallsBack()
{
    auto fake = std::make_shared<rc::test::FakeGenerationService>();
    fake->enqueue(QStringLiteral("{\"answer\": \"two weeks\"}"));
    rc::ModelAnswerDrafter drafter(fake, rc::GenerationOptions{});

    const QJsonValue answer = drafter.draft(documentRun(
        QStringLiteral("Return window for unopened Beverages?"), QStringLiteral("int")));
    QCOMPARE(answer.toInt(), 14);
}

void TestAnswerDrafter::testModelFailureFallsBack()
{
    auto fake = std::make_shared<rc::test::FakeGenerationService>();
    fake->enqueue(std::nullopt);
    fake->enqueue(QStringLiteral("I cannot answer that."));
    rc::ModelAnswerDrafter drafter(fake, rc::GenerationOptions{});

    const rc::RunState state = documentRun(
        QStringLiteral("Return window for unopened Beverages?"), QStringLiteral("int"));
    QCOMPARE(drafter.draft(state).toInt(), 14);
    QCOMPARE(drafter.draft(state).toInt(), 14);
    QCOMPARE(fake->callCount(), 2);
}

void TestAnswerDrafter::testModelSkippedForFailedQuery()
{
    auto fake = std::make_shared<rc::test::FakeGenerationService>();
    fake->setDefaultReply(QStringLiteral("{\"answer\": 42}"));
    rc::ModelAnswerDrafter drafter(fake, rc::GenerationOptions{});

    const QJsonValue answer = drafter.draft(structuredRun(
        QStringLiteral("int"), rc::QueryResult::failure(QStringLiteral("no such table"))));
    QVERIFY(answer.isDouble());
    QCOMPARE(answer.toInt(), 0);
    QCOMPARE(fake->callCount(), 0);
}

void TestAnswerDrafter::testModelSkippedForEmptyRows()
{
    auto fake = std::make_shared<rc::test::FakeGenerationService>();
    fake->setDefaultReply(QStringLiteral("{\"answer\": [{\"product\": \"Chai\"}]}"));
    rc::ModelAnswerDrafter drafter(fake, rc::GenerationOptions{});

    rc::RunState state = structuredRun(QStringLiteral("list[{product:str}]"),
                                       rc::QueryResult::fromRows({QStringLiteral("p")}, {}));
    state.route = rc::Route::Hybrid;
    const QJsonValue answer = drafter.draft(state);
    QVERIFY(answer.isArray());
    QVERIFY(answer.toArray().isEmpty());
    QCOMPARE(fake->callCount(), 0);
}

QTEST_MAIN(TestAnswerDrafter)
#include "test_answer_drafter.moc"
