#pragma once

#include "core/generation/generation_service.h"
#include "core/shared/run_state.h"

#include <QString>
#include <QStringList>

#include <memory>

namespace rc {

struct DraftRequest {
    QString question;
    Constraints constraints;
    QStringList planningNotes;
    bool repairing = false;
    QString previousQuery;  // the query that just failed, when repairing
};

struct QueryDraft {
    QString query;
    QString source;  // "template:<name>", "model" or "fallback"
};

// Produces the candidate structured query for a run.
class QueryDrafter {
public:
    virtual ~QueryDrafter() = default;
    virtual QueryDraft draft(const DraftRequest& request) const = 0;
};

// Template table only; the delegate row yields the safe fallback query.
class TemplateQueryDrafter : public QueryDrafter {
public:
    explicit TemplateQueryDrafter(bool bypassTemplatesOnRepair = false);

    QueryDraft draft(const DraftRequest& request) const override;

private:
    bool m_bypassTemplatesOnRepair = false;
};

// Template table first; the delegate row asks the generation service.
class ModelQueryDrafter : public QueryDrafter {
public:
    static constexpr int kMinQueryLength = 10;

    ModelQueryDrafter(std::shared_ptr<GenerationService> generation,
                      QString schema,
                      GenerationOptions options,
                      bool bypassTemplatesOnRepair = false);

    QueryDraft draft(const DraftRequest& request) const override;

    QString buildPrompt(const DraftRequest& request) const;

private:
    QueryDraft generate(const DraftRequest& request) const;

    std::shared_ptr<GenerationService> m_generation;
    QString m_schema;
    GenerationOptions m_options;
    bool m_bypassTemplatesOnRepair = false;
};

} // namespace rc
