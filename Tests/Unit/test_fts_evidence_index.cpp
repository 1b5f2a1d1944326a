#include <QtTest/QtTest>
#include "core/evidence/fts_evidence_index.h"
#include "Support/fixture_paths.h"

#include <QFile>
#include <QTemporaryDir>

class TestFtsEvidenceIndex : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // ── Construction ─────────────────────────────────────────────
    void testMissingDirectoryFails();
    void testDirectoryWithoutMarkdownFails();
    void testFixtureCorpusStats();

    // ── Retrieval ────────────────────────────────────────────────
    void testPolicyQuestionFindsPolicyChunk();
    void testTopKLimitsResults();
    void testScoresDescendingWithinUnitRange();
    void testMinScoreFilters();
    void testNoSearchableTermsReturnsEmpty();
    void testUnknownTermsReturnEmpty();
    void testRetrievalDeterministic();

    // ── Match expression ─────────────────────────────────────────
    void testMatchExpressionDropsStopwordsAndQuotes();
    void testNormalizeRank();

    // ── Lookup helpers ───────────────────────────────────────────
    void testChunkById();
    void testSearchByKeywords();

private:
    std::optional<rc::FtsEvidenceIndex> m_index;
};

void TestFtsEvidenceIndex::initTestCase()
{
    m_index = rc::FtsEvidenceIndex::open(rc::test::fixtureDocsDir());
    QVERIFY2(m_index.has_value(), "fixture corpus must load");
}

// ── Construction ─────────────────────────────────────────────────

void TestFtsEvidenceIndex::testMissingDirectoryFails()
{
    QVERIFY(!rc::FtsEvidenceIndex::open(QStringLiteral("/nonexistent/docs/dir")).has_value());
}

void TestFtsEvidenceIndex::testDirectoryWithoutMarkdownFails()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QFile file(dir.filePath(QStringLiteral("notes.txt")));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("This is not a markdown document at all.");
    file.close();

    QVERIFY(!rc::FtsEvidenceIndex::open(dir.path()).has_value());
}

void TestFtsEvidenceIndex::testFixtureCorpusStats()
{
    const rc::FtsEvidenceIndex::Stats stats = m_index->stats();
    QCOMPARE(stats.totalDocuments, 4);
    QVERIFY(stats.totalChunks >= 4);
    QVERIFY(stats.avgChunkLength > 0.0);
    QVERIFY(stats.documents.contains(QStringLiteral("product_policy.md")));
    QCOMPARE(stats.chunksPerDocument.at(QStringLiteral("product_policy.md")), 2);
}

// ── Retrieval ────────────────────────────────────────────────────

void TestFtsEvidenceIndex::testPolicyQuestionFindsPolicyChunk()
{
    const auto snippets = m_index->retrieve(
        QStringLiteral("According to the product policy, what is the return window for unopened Beverages?"),
        3);
    QVERIFY(!snippets.empty());
    QCOMPARE(snippets.front().id, QStringLiteral("product_policy::chunk0"));
    QCOMPARE(snippets.front().source, QStringLiteral("product_policy.md"));
    QVERIFY(snippets.front().content.contains(QStringLiteral("unopened: 14 days")));
}

void TestFtsEvidenceIndex::testTopKLimitsResults()
{
    QVERIFY(m_index->retrieve(QStringLiteral("beverages summer winter policy"), 2).size() <= 2);
    QVERIFY(m_index->retrieve(QStringLiteral("beverages"), 0).empty());
}

void TestFtsEvidenceIndex::testScoresDescendingWithinUnitRange()
{
    const auto snippets = m_index->retrieve(QStringLiteral("Beverages revenue summer 1997"), 5);
    QVERIFY(!snippets.empty());
    for (size_t i = 0; i < snippets.size(); ++i) {
        QVERIFY(snippets[i].score >= 0.0);
        QVERIFY(snippets[i].score < 1.0);
        if (i > 0) {
            QVERIFY(snippets[i - 1].score >= snippets[i].score);
        }
    }
}

void TestFtsEvidenceIndex::testMinScoreFilters()
{
    const auto all = m_index->retrieve(QStringLiteral("beverages"), 10);
    QVERIFY(!all.empty());
    QVERIFY(m_index->retrieve(QStringLiteral("beverages"), 10, 0.999).empty());
}

void TestFtsEvidenceIndex::testNoSearchableTermsReturnsEmpty()
{
    QVERIFY(m_index->retrieve(QStringLiteral("what is the"), 3).empty());
    QVERIFY(m_index->retrieve(QStringLiteral("  ?? "), 3).empty());
}

void TestFtsEvidenceIndex::testUnknownTermsReturnEmpty()
{
    QVERIFY(m_index->retrieve(QStringLiteral("zeppelin quantum"), 3).empty());
}

void TestFtsEvidenceIndex::testRetrievalDeterministic()
{
    const QString query = QStringLiteral("average order value definition");
    const auto a = m_index->retrieve(query, 3);
    const auto b = m_index->retrieve(query, 3);
    QCOMPARE(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        QCOMPARE(a[i].id, b[i].id);
        QCOMPARE(a[i].score, b[i].score);
    }
}

// ── Match expression ─────────────────────────────────────────────

void TestFtsEvidenceIndex::testMatchExpressionDropsStopwordsAndQuotes()
{
    QCOMPARE(rc::FtsEvidenceIndex::buildMatchExpression(
                 QStringLiteral("What is the \"return\" window, for the policy?")),
             QStringLiteral("\"window\" OR \"policy\""));
    QCOMPARE(rc::FtsEvidenceIndex::buildMatchExpression(QStringLiteral("AOV aov AOV")),
             QStringLiteral("\"aov\""));
}

void TestFtsEvidenceIndex::testNormalizeRank()
{
    QCOMPARE(rc::FtsEvidenceIndex::normalizeRank(0.0), 0.0);
    QCOMPARE(rc::FtsEvidenceIndex::normalizeRank(-1.0), 0.5);
    QVERIFY(rc::FtsEvidenceIndex::normalizeRank(-3.0) > rc::FtsEvidenceIndex::normalizeRank(-1.0));
}

// ── Lookup helpers ───────────────────────────────────────────────

void TestFtsEvidenceIndex::testChunkById()
{
    const auto chunk = m_index->chunkById(QStringLiteral("product_policy::chunk0"));
    QVERIFY(chunk.has_value());
    QCOMPARE(chunk->source, QStringLiteral("product_policy.md"));
    QVERIFY(!m_index->chunkById(QStringLiteral("product_policy::chunk99")).has_value());
}

void TestFtsEvidenceIndex::testSearchByKeywords()
{
    const auto results = m_index->searchByKeywords(
        {QStringLiteral("1997-12-01"), QStringLiteral("Holiday gifting")}, 3);
    QVERIFY(!results.empty());
    QCOMPARE(results.front().score, 1.0);
    QCOMPARE(results.front().source, QStringLiteral("marketing_calendar.md"));
    QVERIFY(m_index->searchByKeywords({}, 3).empty());
}

QTEST_MAIN(TestFtsEvidenceIndex)
#include "test_fts_evidence_index.moc"
