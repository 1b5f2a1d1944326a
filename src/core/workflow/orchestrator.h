#pragma once

#include "core/answer/answer_synthesizer.h"
#include "core/evidence/evidence_index.h"
#include "core/query/constraint_planner.h"
#include "core/query/query_drafter.h"
#include "core/query/route_classifier.h"
#include "core/shared/run_state.h"
#include "core/store/structured_store.h"

#include <QString>

#include <memory>

namespace rc {

enum class Stage {
    Route,
    Retrieve,
    Plan,
    DraftQuery,
    ExecuteQuery,
    Repair,
    Synthesize,
    Done,
};

QString stageToString(Stage stage);

struct OrchestratorConfig {
    int retrievalTopK = 3;
    double minRelevance = 0.0;
    int maxRepairs = 2;
};

// Orchestrator -- drives one question through the workflow:
//
//   route -> retrieve -> plan -> draft_query -> execute_query -> synthesize -> done
//              |           ^                        |    ^
//              |           |                        v    |
//              +-----------+  (structured skips)   repair (bounded)
//              document routes go retrieve -> synthesize
//
// run() is const: every mutable value lives in the returned RunState, so one
// Orchestrator can serve runs on several threads. Collaborator exceptions are
// caught per stage, logged, and replaced with a well-defined fallback, so a
// run always reaches Done.
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<const RouteClassifier> classifier,
                 std::shared_ptr<const EvidenceIndex> evidence,
                 std::shared_ptr<const QueryDrafter> drafter,
                 std::shared_ptr<const StructuredStore> store,
                 std::shared_ptr<const AnswerSynthesizer> synthesizer,
                 OrchestratorConfig config = {});

    RunState run(const Question& question) const;

    // Pure transition function.
    static Stage next(Stage stage, const RunState& state, int maxRepairs);

    const OrchestratorConfig& config() const { return m_config; }

private:
    void visit(Stage stage, RunState& state) const;

    void routeStage(RunState& state) const;
    void retrieveStage(RunState& state) const;
    void planStage(RunState& state) const;
    void draftQueryStage(RunState& state) const;
    void executeQueryStage(RunState& state) const;
    void repairStage(RunState& state) const;
    void synthesizeStage(RunState& state) const;

    std::shared_ptr<const RouteClassifier> m_classifier;
    std::shared_ptr<const EvidenceIndex> m_evidence;
    std::shared_ptr<const QueryDrafter> m_drafter;
    std::shared_ptr<const StructuredStore> m_store;
    std::shared_ptr<const AnswerSynthesizer> m_synthesizer;
    ConstraintPlanner m_planner;
    OrchestratorConfig m_config;
};

} // namespace rc
