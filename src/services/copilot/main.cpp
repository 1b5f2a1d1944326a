#include "batch_runner.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/workflow/copilot_factory.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <memory>

namespace {

QString answerText(const QJsonValue& value)
{
    if (value.isObject()) {
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }
    if (value.isArray()) {
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    }
    if (value.isNull()) {
        return QStringLiteral("null");
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble());
    }
    return value.toVariant().toString();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("retail-copilot"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Answers retail analytics questions from documents and a SQLite database."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption batchOption(QStringLiteral("batch"),
        QStringLiteral("Input JSONL file with questions."), QStringLiteral("file"));
    const QCommandLineOption outOption(QStringLiteral("out"),
        QStringLiteral("Output JSONL file for answers."), QStringLiteral("file"));
    const QCommandLineOption docsOption(QStringLiteral("docs-dir"),
        QStringLiteral("Markdown documents directory."), QStringLiteral("dir"));
    const QCommandLineOption dbOption(QStringLiteral("db-path"),
        QStringLiteral("SQLite database path."), QStringLiteral("file"));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Settings JSON file."), QStringLiteral("file"));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
        QStringLiteral("Include the stage trace in each output record."));
    const QCommandLineOption noGenerationOption(QStringLiteral("no-generation"),
        QStringLiteral("Disable the generation service; use rules everywhere."));
    parser.addOptions({batchOption, outOption, docsOption, dbOption, settingsOption,
                       traceOption, noGenerationOption});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    if (!parser.isSet(batchOption) || !parser.isSet(outOption)) {
        err << "Both --batch and --out are required.\n";
        err.flush();
        parser.showHelp(2);
    }

    rc::Settings settings;
    const QString settingsPath = parser.isSet(settingsOption)
        ? parser.value(settingsOption)
        : rc::SettingsManager::settingsFilePath();
    if (auto loaded = rc::SettingsManager::load(settingsPath)) {
        settings = *loaded;
    } else if (parser.isSet(settingsOption)) {
        err << "Cannot load settings from " << settingsPath << "\n";
        return 2;
    }

    if (parser.isSet(docsOption)) {
        settings.docsDir = parser.value(docsOption);
    }
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (parser.isSet(noGenerationOption)) {
        settings.generation.enabled = false;
    }

    out << "Retail Copilot\n"
        << "Input: " << parser.value(batchOption) << "\n"
        << "Output: " << parser.value(outOption) << "\n"
        << "Docs: " << settings.docsDir << ", DB: " << settings.dbPath << "\n";
    out.flush();

    QString error;
    const std::unique_ptr<rc::Orchestrator> orchestrator = rc::CopilotFactory::create(settings, &error);
    if (!orchestrator) {
        err << "Initialization failed: " << error << "\n";
        return 1;
    }

    rc::BatchOptions options;
    options.includeTrace = parser.isSet(traceOption);
    options.explanationMaxChars = settings.explanationMaxChars;
    const rc::BatchRunner runner(*orchestrator, options);

    rc::BatchSummary summary;
    const bool ok = runner.runFiles(
        parser.value(batchOption), parser.value(outOption), &summary, &error,
        [&out](const QJsonObject& record) {
            const bool failed = record.value(QStringLiteral("explanation")).toString()
                                    .startsWith(QLatin1String("Error: "));
            out << (failed ? "[error] " : "[ok] ")
                << record.value(QStringLiteral("id")).toString() << ": "
                << (failed ? record.value(QStringLiteral("explanation")).toString()
                           : answerText(record.value(QStringLiteral("final_answer"))))
                << "\n";
            out.flush();
        });
    if (!ok) {
        err << error << "\n";
        return 1;
    }

    const double rate = summary.total > 0 ? 100.0 * summary.answered / summary.total : 0.0;
    out << "Results written to " << parser.value(outOption) << "\n"
        << "Success rate: " << summary.answered << "/" << summary.total
        << " (" << QString::number(rate, 'f', 1) << "%)\n";
    return 0;
}
