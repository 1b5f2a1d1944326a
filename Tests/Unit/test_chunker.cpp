#include <QtTest/QtTest>
#include "core/evidence/chunker.h"
#include "core/shared/chunk.h"

class TestChunker : public QObject {
    Q_OBJECT

private slots:
    // ── Basic behavior ───────────────────────────────────────────
    void testEmptyContentReturnsEmpty();
    void testParagraphsBecomeChunks();
    void testShortParagraphsSkipped();
    void testWindowsLineEndings();

    // ── Long paragraphs ──────────────────────────────────────────
    void testLongParagraphSplitBySentences();
    void testSentenceChunksStayBelowMax();

    // ── Chunk IDs ────────────────────────────────────────────────
    void testChunkIdUsesFileStem();
    void testChunkIdsSequentialPerDocument();
    void testChunkingDeterministic();
};

// ── Basic behavior ───────────────────────────────────────────────

void TestChunker::testEmptyContentReturnsEmpty()
{
    rc::Chunker chunker;
    QVERIFY(chunker.chunkContent(QStringLiteral("empty.md"), QString()).empty());
}

void TestChunker::testParagraphsBecomeChunks()
{
    rc::Chunker chunker;
    const QString content = QStringLiteral(
        "First paragraph has enough text to count.\n\n"
        "Second paragraph also has enough text.");
    const auto chunks = chunker.chunkContent(QStringLiteral("notes.md"), content);
    QCOMPARE(static_cast<int>(chunks.size()), 2);
    QCOMPARE(chunks[0].content, QStringLiteral("First paragraph has enough text to count."));
    QCOMPARE(chunks[1].chunkIndex, 1);
    QCOMPARE(chunks[1].source, QStringLiteral("notes.md"));
}

void TestChunker::testShortParagraphsSkipped()
{
    rc::Chunker chunker;
    const QString content = QStringLiteral(
        "# Title\n\n"
        "This paragraph is comfortably long enough.\n\n"
        "---");
    const auto chunks = chunker.chunkContent(QStringLiteral("doc.md"), content);
    QCOMPARE(static_cast<int>(chunks.size()), 1);
    QCOMPARE(chunks[0].chunkId, QStringLiteral("doc::chunk0"));
}

void TestChunker::testWindowsLineEndings()
{
    rc::Chunker chunker;
    const QString content = QStringLiteral(
        "A paragraph ending with CRLF markers.\r\n\r\n"
        "Another paragraph after the blank line.");
    QCOMPARE(static_cast<int>(chunker.chunkContent(QStringLiteral("crlf.md"), content).size()), 2);
}

// ── Long paragraphs ──────────────────────────────────────────────

void TestChunker::testLongParagraphSplitBySentences()
{
    rc::ChunkerConfig config;
    config.maxChunkSize = 60;
    rc::Chunker chunker(config);

    const QString content = QStringLiteral(
        "The first sentence is about returns. "
        "The second sentence is about beverages! "
        "Is the third sentence a question?");
    const auto chunks = chunker.chunkContent(QStringLiteral("long.md"), content);

    QVERIFY(chunks.size() >= 2);
    QVERIFY(chunks[0].content.startsWith(QStringLiteral("The first sentence")));
    QVERIFY(chunks[0].content.endsWith(QLatin1Char('.')));
}

void TestChunker::testSentenceChunksStayBelowMax()
{
    rc::ChunkerConfig config;
    config.maxChunkSize = 80;
    rc::Chunker chunker(config);

    QString paragraph;
    for (int i = 0; i < 20; ++i) {
        paragraph += QStringLiteral("Sentence number %1 is short. ").arg(i);
    }
    const auto chunks = chunker.chunkContent(QStringLiteral("many.md"), paragraph);

    QVERIFY(chunks.size() > 1);
    for (const rc::Chunk& chunk : chunks) {
        QVERIFY2(chunk.content.size() <= config.maxChunkSize,
                 qPrintable(QStringLiteral("chunk too long: %1").arg(chunk.content.size())));
    }
}

// ── Chunk IDs ────────────────────────────────────────────────────

void TestChunker::testChunkIdUsesFileStem()
{
    QCOMPARE(rc::computeChunkId(QStringLiteral("product_policy.md"), 2),
             QStringLiteral("product_policy::chunk2"));
    QCOMPARE(rc::computeChunkId(QStringLiteral("README"), 0), QStringLiteral("README::chunk0"));
}

void TestChunker::testChunkIdsSequentialPerDocument()
{
    rc::Chunker chunker;
    const QString content = QStringLiteral(
        "Paragraph one is long enough to keep.\n\n"
        "tiny\n\n"
        "Paragraph two is long enough to keep.\n\n"
        "Paragraph three is long enough to keep.");
    const auto chunks = chunker.chunkContent(QStringLiteral("kpi.md"), content);
    QCOMPARE(static_cast<int>(chunks.size()), 3);
    for (int i = 0; i < 3; ++i) {
        QCOMPARE(chunks[i].chunkId, QStringLiteral("kpi::chunk%1").arg(i));
        QCOMPARE(chunks[i].chunkIndex, i);
    }
}

void TestChunker::testChunkingDeterministic()
{
    rc::Chunker chunker;
    const QString content = QStringLiteral(
        "Repeatable paragraph number one here.\n\nRepeatable paragraph number two here.");
    const auto a = chunker.chunkContent(QStringLiteral("r.md"), content);
    const auto b = chunker.chunkContent(QStringLiteral("r.md"), content);
    QCOMPARE(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        QCOMPARE(a[i].chunkId, b[i].chunkId);
        QCOMPARE(a[i].content, b[i].content);
    }
}

QTEST_MAIN(TestChunker)
#include "test_chunker.moc"
