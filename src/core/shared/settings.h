#pragma once

#include <QString>

namespace rc {

// Which implementation a model-or-rules decision point uses.
enum class StrategyMode {
    Model,
    Rules,
};

QString strategyModeToString(StrategyMode mode);
StrategyMode strategyModeFromString(const QString& str, StrategyMode fallback);

struct GenerationSettings {
    bool enabled = true;
    QString endpoint = QStringLiteral("http://localhost:11434");
    QString model = QStringLiteral("phi3.5:3.8b-mini-instruct-q4_K_M");
    int timeoutMs = 90000;
    double temperature = 0.1;
    int maxTokens = 1000;
};

struct Settings {
    // Data sources
    QString docsDir = QStringLiteral("docs");
    QString dbPath = QStringLiteral("data/northwind.sqlite");

    GenerationSettings generation;

    // Strategy selection per decision point
    StrategyMode routingMode = StrategyMode::Model;
    StrategyMode draftingMode = StrategyMode::Model;
    StrategyMode answerMode = StrategyMode::Rules;

    // Retrieval
    int retrievalTopK = 3;
    double minRelevance = 0.0;
    int chunkSize = 500;

    // Repair loop
    int maxRepairs = 2;
    bool repairBypassesTemplates = false;

    // Batch output
    int explanationMaxChars = 200;
};

} // namespace rc
