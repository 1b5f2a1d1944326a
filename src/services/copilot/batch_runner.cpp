#include "batch_runner.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <exception>

namespace rc {

namespace {

QString lineId(int lineNumber)
{
    return QStringLiteral("line-%1").arg(lineNumber);
}

QString idFromValue(const QJsonValue& value)
{
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble());
    }
    return {};
}

} // namespace

BatchRunner::BatchRunner(const Orchestrator& orchestrator, BatchOptions options)
    : m_orchestrator(orchestrator)
    , m_options(options)
{
}

std::optional<BatchRecord> BatchRunner::parseLine(const QByteArray& line, int lineNumber,
                                                  QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("line %1: invalid JSON (%2)")
                         .arg(lineNumber)
                         .arg(parseError.error != QJsonParseError::NoError
                                  ? parseError.errorString()
                                  : QStringLiteral("not an object"));
        }
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    const QJsonValue question = obj.value(QStringLiteral("question"));
    if (!question.isString() || question.toString().trimmed().isEmpty()) {
        if (error) {
            *error = QStringLiteral("line %1: missing question").arg(lineNumber);
        }
        return std::nullopt;
    }

    BatchRecord record;
    record.id = idFromValue(obj.value(QStringLiteral("id")));
    if (record.id.isEmpty()) {
        record.id = lineId(lineNumber);
    }
    record.question = question.toString();
    record.formatHint = obj.value(QStringLiteral("format_hint")).toString();
    return record;
}

QJsonObject BatchRunner::errorRecord(const QString& id, const QString& error)
{
    QJsonObject record;
    record[QStringLiteral("id")] = id;
    record[QStringLiteral("final_answer")] = QJsonValue(QJsonValue::Null);
    record[QStringLiteral("query")] = QString();
    record[QStringLiteral("confidence")] = 0.0;
    record[QStringLiteral("explanation")] = QStringLiteral("Error: ") + error;
    record[QStringLiteral("citations")] = QJsonArray();
    return record;
}

QJsonObject BatchRunner::processRecord(const BatchRecord& record) const
{
    Question question;
    question.text = record.question;
    question.formatHint = FormatHint::parse(record.formatHint);

    try {
        const RunState state = m_orchestrator.run(question);

        QJsonObject out;
        out[QStringLiteral("id")] = record.id;
        out[QStringLiteral("final_answer")] =
            state.finalAnswer.value_or(QJsonValue(QJsonValue::Null));
        out[QStringLiteral("query")] = state.query;
        out[QStringLiteral("confidence")] = state.confidence;
        out[QStringLiteral("explanation")] = m_options.explanationMaxChars > 0
            ? state.explanation.left(m_options.explanationMaxChars)
            : state.explanation;
        out[QStringLiteral("citations")] = QJsonArray::fromStringList(state.citations);
        if (m_options.includeTrace) {
            out[QStringLiteral("trace")] = state.trace.toJson();
        }
        return out;
    } catch (const std::exception& e) {
        LOG_ERROR(rcBatch, "Run failed for %s: %s", qUtf8Printable(record.id), e.what());
        return errorRecord(record.id, QString::fromUtf8(e.what()));
    }
}

BatchSummary BatchRunner::run(QIODevice& input, QIODevice& output,
                              const ProgressCallback& progress) const
{
    BatchSummary summary;
    int lineNumber = 0;

    while (!input.atEnd()) {
        const QByteArray line = input.readLine().trimmed();
        ++lineNumber;
        if (line.isEmpty()) {
            continue;
        }

        QJsonObject result;
        QString error;
        const std::optional<BatchRecord> record = parseLine(line, lineNumber, &error);
        if (record) {
            LOG_DEBUG(rcBatch, "Processing %s", qUtf8Printable(record->id));
            result = processRecord(*record);
        } else {
            LOG_WARN(rcBatch, "%s", qUtf8Printable(error));
            result = errorRecord(lineId(lineNumber), error);
        }

        ++summary.total;
        if (!result.value(QStringLiteral("final_answer")).isNull()) {
            ++summary.answered;
        }
        if (result.value(QStringLiteral("explanation")).toString()
                .startsWith(QLatin1String("Error: "))) {
            ++summary.errors;
        }

        output.write(QJsonDocument(result).toJson(QJsonDocument::Compact));
        output.write("\n");

        if (progress) {
            progress(result);
        }
    }

    LOG_INFO(rcBatch, "Batch finished: %d records, %d answered, %d errors",
             summary.total, summary.answered, summary.errors);
    return summary;
}

bool BatchRunner::runFiles(const QString& inputPath, const QString& outputPath,
                           BatchSummary* summary, QString* errorMessage,
                           const ProgressCallback& progress) const
{
    QFile input(inputPath);
    if (!input.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot read %1: %2").arg(inputPath, input.errorString());
        }
        return false;
    }

    QFile output(outputPath);
    if (!output.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write %1: %2").arg(outputPath, output.errorString());
        }
        return false;
    }

    const BatchSummary result = run(input, output, progress);
    if (summary) {
        *summary = result;
    }
    return true;
}

} // namespace rc
