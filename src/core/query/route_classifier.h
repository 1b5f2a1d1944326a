#pragma once

#include "core/generation/generation_service.h"
#include "core/shared/types.h"

#include <QString>

#include <memory>

namespace rc {

struct RouteDecision {
    Route route = Route::Structured;
    QString source;  // "model" or "rules"
};

// Decides which evidence a question needs.
class RouteClassifier {
public:
    virtual ~RouteClassifier() = default;
    virtual RouteDecision classify(const Question& question) const = 0;
};

// Deterministic keyword rules, evaluated in order:
//   1. "according to" together with "policy"        -> Document
//   2. campaign window or derived metric, together
//      with an aggregation target                    -> Hybrid
//   3. any other policy/definition language          -> Document
//   4. everything else                               -> Structured
class RuleRouteClassifier : public RouteClassifier {
public:
    RouteDecision classify(const Question& question) const override;

    static Route classifyText(const QString& text);
};

// Asks the generation service for a label and falls back to the rules when
// the service is unavailable, fails, or answers outside the vocabulary.
class ModelRouteClassifier : public RouteClassifier {
public:
    ModelRouteClassifier(std::shared_ptr<GenerationService> generation,
                         GenerationOptions options);

    RouteDecision classify(const Question& question) const override;

    static QString buildPrompt(const Question& question);

    // Label from a raw completion: a bare word or {"route": "..."}.
    static std::optional<Route> parseCompletion(const QString& completion);

private:
    std::shared_ptr<GenerationService> m_generation;
    GenerationOptions m_options;
    RuleRouteClassifier m_rules;
};

} // namespace rc
