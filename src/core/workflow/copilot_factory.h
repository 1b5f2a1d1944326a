#pragma once

#include "core/generation/generation_service.h"
#include "core/shared/settings.h"
#include "core/workflow/orchestrator.h"

#include <QString>

#include <memory>

namespace rc {

// Builds a ready Orchestrator from Settings.
//
// Missing data sources are fatal: create() returns nullptr and fills
// errorMessage when the docs directory is missing or has no markdown files,
// or when the database is missing, unopenable, or has no tables.
class CopilotFactory {
public:
    static std::unique_ptr<Orchestrator> create(const Settings& settings,
                                                QString* errorMessage = nullptr);

    // Same, with an externally owned generation service (nullptr disables
    // generation regardless of settings.generation.enabled).
    static std::unique_ptr<Orchestrator> create(const Settings& settings,
                                                std::shared_ptr<GenerationService> generation,
                                                QString* errorMessage = nullptr);

    static GenerationOptions generationOptions(const GenerationSettings& settings);
};

} // namespace rc
