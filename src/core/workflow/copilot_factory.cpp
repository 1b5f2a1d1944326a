#include "core/workflow/copilot_factory.h"
#include "core/answer/answer_drafter.h"
#include "core/answer/answer_synthesizer.h"
#include "core/evidence/fts_evidence_index.h"
#include "core/generation/ollama_generation_service.h"
#include "core/query/query_drafter.h"
#include "core/query/route_classifier.h"
#include "core/shared/logging.h"
#include "core/store/sqlite_structured_store.h"

#include <memory>
#include <optional>
#include <utility>

namespace rc {

namespace {

void setError(QString* errorMessage, const QString& message)
{
    LOG_ERROR(rcCore, "%s", qUtf8Printable(message));
    if (errorMessage) {
        *errorMessage = message;
    }
}

} // namespace

GenerationOptions CopilotFactory::generationOptions(const GenerationSettings& settings)
{
    GenerationOptions options;
    options.temperature = settings.temperature;
    options.maxTokens = settings.maxTokens;
    options.timeoutMs = settings.timeoutMs;
    return options;
}

std::unique_ptr<Orchestrator> CopilotFactory::create(const Settings& settings,
                                                     QString* errorMessage)
{
    std::shared_ptr<GenerationService> generation;
    if (settings.generation.enabled) {
        generation = std::make_shared<OllamaGenerationService>(settings.generation.endpoint,
                                                               settings.generation.model);
    }
    return create(settings, std::move(generation), errorMessage);
}

std::unique_ptr<Orchestrator> CopilotFactory::create(const Settings& settings,
                                                     std::shared_ptr<GenerationService> generation,
                                                     QString* errorMessage)
{
    ChunkerConfig chunkerConfig;
    chunkerConfig.maxChunkSize = settings.chunkSize;
    std::optional<FtsEvidenceIndex> evidenceIndex =
        FtsEvidenceIndex::open(settings.docsDir, chunkerConfig);
    if (!evidenceIndex) {
        setError(errorMessage, QStringLiteral("Cannot load documents from '%1'")
                                   .arg(settings.docsDir));
        return nullptr;
    }

    std::optional<SqliteStructuredStore> opened = SqliteStructuredStore::open(settings.dbPath);
    if (!opened) {
        setError(errorMessage, QStringLiteral("Cannot open database '%1'").arg(settings.dbPath));
        return nullptr;
    }

    auto evidence = std::make_shared<FtsEvidenceIndex>(std::move(*evidenceIndex));
    auto store = std::make_shared<SqliteStructuredStore>(std::move(*opened));

    const GenerationOptions options = generationOptions(settings.generation);
    const bool useModel = static_cast<bool>(generation);

    std::shared_ptr<const RouteClassifier> classifier;
    if (useModel && settings.routingMode == StrategyMode::Model) {
        GenerationOptions routeOptions = options;
        routeOptions.jsonOutput = true;
        classifier = std::make_shared<ModelRouteClassifier>(generation, routeOptions);
    } else {
        classifier = std::make_shared<RuleRouteClassifier>();
    }

    std::shared_ptr<const QueryDrafter> drafter;
    if (useModel && settings.draftingMode == StrategyMode::Model) {
        drafter = std::make_shared<ModelQueryDrafter>(generation, store->schema(), options,
                                                      settings.repairBypassesTemplates);
    } else {
        drafter = std::make_shared<TemplateQueryDrafter>(settings.repairBypassesTemplates);
    }

    std::shared_ptr<const AnswerDrafter> answerDrafter;
    if (useModel && settings.answerMode == StrategyMode::Model) {
        answerDrafter = std::make_shared<ModelAnswerDrafter>(generation, options);
    } else {
        answerDrafter = std::make_shared<RuleAnswerDrafter>();
    }

    auto synthesizer = std::make_shared<AnswerSynthesizer>(answerDrafter, store->tableNames());

    OrchestratorConfig config;
    config.retrievalTopK = settings.retrievalTopK;
    config.minRelevance = settings.minRelevance;
    config.maxRepairs = settings.maxRepairs;

    LOG_INFO(rcCore, "Copilot ready: routing=%s drafting=%s answers=%s generation=%s",
             qUtf8Printable(strategyModeToString(settings.routingMode)),
             qUtf8Printable(strategyModeToString(settings.draftingMode)),
             qUtf8Printable(strategyModeToString(settings.answerMode)),
             useModel ? "on" : "off");

    return std::make_unique<Orchestrator>(std::move(classifier), std::move(evidence),
                                          std::move(drafter), std::move(store),
                                          std::move(synthesizer), config);
}

} // namespace rc
