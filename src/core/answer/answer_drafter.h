#pragma once

#include "core/generation/generation_service.h"
#include "core/shared/run_state.h"

#include <QJsonValue>
#include <QString>

#include <memory>

namespace rc {

// Produces the typed answer value of a run.
class AnswerDrafter {
public:
    virtual ~AnswerDrafter() = default;
    virtual QJsonValue draft(const RunState& state) const = 0;
};

// Deterministic extraction.
//   document route: "<qualifier>: N days" for the policy qualifier the
//                   question names, else the first "N days" in the snippets
//   otherwise:      coerced query rows, or the hint's zero value
class RuleAnswerDrafter : public AnswerDrafter {
public:
    QJsonValue draft(const RunState& state) const override;

    static std::optional<int> extractDays(const QString& question, const QString& evidence);
};

// Asks the generation service for {"answer": ...}; any failure or a value that
// does not fit the hint falls back to RuleAnswerDrafter.
class ModelAnswerDrafter : public AnswerDrafter {
public:
    ModelAnswerDrafter(std::shared_ptr<GenerationService> generation, GenerationOptions options);

    QJsonValue draft(const RunState& state) const override;

    static QString buildPrompt(const RunState& state);

private:
    std::shared_ptr<GenerationService> m_generation;
    GenerationOptions m_options;
    RuleAnswerDrafter m_rules;
};

} // namespace rc
