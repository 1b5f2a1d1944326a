#include <QtTest/QtTest>
#include "core/answer/format_coercion.h"

#include <QJsonArray>
#include <QJsonObject>

#include <limits>

namespace fc = rc::format_coercion;

class TestFormatCoercion : public QObject {
    Q_OBJECT

private slots:
    // ── Defaults ─────────────────────────────────────────────────
    void testDefaultValues();
    void testNoRowsGivesDefault();

    // ── Scalars ──────────────────────────────────────────────────
    void testIntFromFirstCell();
    void testIntTruncatesTowardZero();
    void testIntSaturatesOutOfRange();
    void testFloatRoundsToTwoDecimals();
    void testNullCellBecomesZero();
    void testGenericKeepsFirstCell();

    // ── Objects ──────────────────────────────────────────────────
    void testObjectUsesHintFieldsInColumnOrder();
    void testObjectWithEmptyFirstCellIsEmpty();
    void testObjectWithoutFieldsUsesColumnNames();

    // ── Lists ────────────────────────────────────────────────────
    void testListOfObjectsSkipsEmptyRows();
    void testListOfScalars();

    // ── JSON coercion ────────────────────────────────────────────
    void testCoerceJsonNumericString();
    void testCoerceJsonRejectsWrongShape();
    void testCoerceJsonObjectFields();
};

namespace {

std::vector<QVariantList> rows(std::initializer_list<QVariantList> list)
{
    return std::vector<QVariantList>(list);
}

} // namespace

// ── Defaults ─────────────────────────────────────────────────────

void TestFormatCoercion::testDefaultValues()
{
    QCOMPARE(fc::defaultValue(rc::FormatHint::parse(QStringLiteral("int"))), QJsonValue(0));
    QCOMPARE(fc::defaultValue(rc::FormatHint::parse(QStringLiteral("float"))), QJsonValue(0.0));
    QVERIFY(fc::defaultValue(rc::FormatHint::parse(QStringLiteral("{a:int}"))).isObject());
    QVERIFY(fc::defaultValue(rc::FormatHint::parse(QStringLiteral("list[int]"))).isArray());
    QVERIFY(fc::defaultValue(rc::FormatHint::parse(QStringLiteral("str"))).isNull());
}

void TestFormatCoercion::testNoRowsGivesDefault()
{
    const rc::FormatHint hint = rc::FormatHint::parse(QStringLiteral("list[{product:str}]"));
    const QJsonValue value = fc::coerceRows(hint, {QStringLiteral("ProductName")}, {});
    QVERIFY(value.isArray());
    QVERIFY(value.toArray().isEmpty());
}

// ── Scalars ──────────────────────────────────────────────────────

void TestFormatCoercion::testIntFromFirstCell()
{
    const QJsonValue value = fc::coerceRows(rc::FormatHint::parse(QStringLiteral("int")),
                                            {QStringLiteral("n")}, rows({{3}}));
    QCOMPARE(value.toInt(), 3);
}

void TestFormatCoercion::testIntTruncatesTowardZero()
{
    const rc::FormatHint hint = rc::FormatHint::parse(QStringLiteral("int"));
    QCOMPARE(fc::coerceRows(hint, {}, rows({{7.9}})).toInt(), 7);
    QCOMPARE(fc::coerceRows(hint, {}, rows({{-7.9}})).toInt(), -7);
}

void TestFormatCoercion::testIntSaturatesOutOfRange()
{
    const rc::FormatHint hint = rc::FormatHint::parse(QStringLiteral("int"));
    QCOMPARE(fc::coerceRows(hint, {}, rows({{1e30}})).toInteger(),
             std::numeric_limits<qint64>::max());
    QCOMPARE(fc::coerceRows(hint, {}, rows({{-1e30}})).toInteger(),
             std::numeric_limits<qint64>::min());

    const std::optional<QJsonValue> parsed =
        fc::coerceJson(hint, QJsonValue(QStringLiteral("9.3e18")));
    QVERIFY(parsed.has_value());
    QCOMPARE(parsed->toInteger(), std::numeric_limits<qint64>::max());
}

void TestFormatCoercion::testFloatRoundsToTwoDecimals()
{
    const QJsonValue value = fc::coerceRows(rc::FormatHint::parse(QStringLiteral("float")),
                                            {QStringLiteral("v")}, rows({{3.456}}));
    QCOMPARE(value.toDouble(), 3.46);
}

void TestFormatCoercion::testNullCellBecomesZero()
{
    const QJsonValue value = fc::coerceRows(rc::FormatHint::parse(QStringLiteral("float")),
                                            {QStringLiteral("v")}, rows({{QVariant()}}));
    QCOMPARE(value.toDouble(), 0.0);
}

void TestFormatCoercion::testGenericKeepsFirstCell()
{
    const QJsonValue value = fc::coerceRows(rc::FormatHint::parse(QString()),
                                            {QStringLiteral("name")},
                                            rows({{QStringLiteral("Chai"), 18.0}}));
    QCOMPARE(value.toString(), QStringLiteral("Chai"));
}

// ── Objects ──────────────────────────────────────────────────────

void TestFormatCoercion::testObjectUsesHintFieldsInColumnOrder()
{
    const rc::FormatHint hint =
        rc::FormatHint::parse(QStringLiteral("{category:str, quantity:int}"));
    const QJsonValue value = fc::coerceRows(
        hint, {QStringLiteral("CategoryName"), QStringLiteral("TotalQuantity")},
        rows({{QStringLiteral("Beverages"), 30.0}, {QStringLiteral("Seafood"), 2}}));

    QVERIFY(value.isObject());
    const QJsonObject obj = value.toObject();
    QCOMPARE(obj.value(QStringLiteral("category")).toString(), QStringLiteral("Beverages"));
    QCOMPARE(obj.value(QStringLiteral("quantity")).toInt(), 30);
}

void TestFormatCoercion::testObjectWithEmptyFirstCellIsEmpty()
{
    const rc::FormatHint hint = rc::FormatHint::parse(QStringLiteral("{customer:str, margin:float}"));
    const QJsonValue value = fc::coerceRows(hint, {}, rows({{QVariant(), 10.0}}));
    QVERIFY(value.isObject());
    QVERIFY(value.toObject().isEmpty());
}

void TestFormatCoercion::testObjectWithoutFieldsUsesColumnNames()
{
    const rc::FormatHint hint = rc::FormatHint::parse(QStringLiteral("{}"));
    const QJsonValue value = fc::coerceRows(hint,
                                            {QStringLiteral("CompanyName"), QStringLiteral("GrossMargin")},
                                            rows({{QStringLiteral("QUICK-Stop"), 120.004}}));
    const QJsonObject obj = value.toObject();
    QCOMPARE(obj.value(QStringLiteral("CompanyName")).toString(), QStringLiteral("QUICK-Stop"));
    QCOMPARE(obj.value(QStringLiteral("GrossMargin")).toDouble(), 120.0);
}

// ── Lists ────────────────────────────────────────────────────────

void TestFormatCoercion::testListOfObjectsSkipsEmptyRows()
{
    const rc::FormatHint hint =
        rc::FormatHint::parse(QStringLiteral("list[{product:str, revenue:float}]"));
    const QJsonValue value = fc::coerceRows(
        hint, {QStringLiteral("ProductName"), QStringLiteral("Revenue")},
        rows({{QStringLiteral("Chang"), 418.004},
              {QVariant(), 10.0},
              {QStringLiteral("Ikura"), 372.0}}));

    const QJsonArray list = value.toArray();
    QCOMPARE(list.size(), 2);
    QCOMPARE(list.at(0).toObject().value(QStringLiteral("product")).toString(), QStringLiteral("Chang"));
    QCOMPARE(list.at(0).toObject().value(QStringLiteral("revenue")).toDouble(), 418.0);
    QCOMPARE(list.at(1).toObject().value(QStringLiteral("product")).toString(), QStringLiteral("Ikura"));
}

void TestFormatCoercion::testListOfScalars()
{
    const QJsonValue value = fc::coerceRows(rc::FormatHint::parse(QStringLiteral("list[int]")),
                                            {QStringLiteral("n")}, rows({{1}, {2.7}, {3}}));
    const QJsonArray list = value.toArray();
    QCOMPARE(list.size(), 3);
    QCOMPARE(list.at(1).toInt(), 2);
}

// ── JSON coercion ────────────────────────────────────────────────

void TestFormatCoercion::testCoerceJsonNumericString()
{
    const auto value = fc::coerceJson(rc::FormatHint::parse(QStringLiteral("float")),
                                      QJsonValue(QStringLiteral(" 238.004 ")));
    QVERIFY(value.has_value());
    QCOMPARE(value->toDouble(), 238.0);
}

void TestFormatCoercion::testCoerceJsonRejectsWrongShape()
{
    QVERIFY(!fc::coerceJson(rc::FormatHint::parse(QStringLiteral("int")),
                            QJsonValue(QStringLiteral("fourteen"))).has_value());
    QVERIFY(!fc::coerceJson(rc::FormatHint::parse(QStringLiteral("list[int]")),
                            QJsonValue(3)).has_value());
    QVERIFY(!fc::coerceJson(rc::FormatHint::parse(QStringLiteral("{a:int}")),
                            QJsonObject{{QStringLiteral("b"), 1}}).has_value());
}

void TestFormatCoercion::testCoerceJsonObjectFields()
{
    const QJsonObject input{{QStringLiteral("category"), QStringLiteral("Beverages")},
                            {QStringLiteral("quantity"), QStringLiteral("30")},
                            {QStringLiteral("extra"), true}};
    const auto value = fc::coerceJson(
        rc::FormatHint::parse(QStringLiteral("{category:str, quantity:int}")), input);
    QVERIFY(value.has_value());
    const QJsonObject obj = value->toObject();
    QCOMPARE(obj.size(), 2);
    QCOMPARE(obj.value(QStringLiteral("quantity")).toInt(), 30);
}

QTEST_MAIN(TestFormatCoercion)
#include "test_format_coercion.moc"
