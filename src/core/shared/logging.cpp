#include "core/shared/logging.h"

// Debug output is off by default; enable per area with e.g.
//   QT_LOGGING_RULES="retailcopilot.workflow.debug=true"
Q_LOGGING_CATEGORY(rcCore, "retailcopilot.core", QtInfoMsg)
Q_LOGGING_CATEGORY(rcWorkflow, "retailcopilot.workflow", QtInfoMsg)
Q_LOGGING_CATEGORY(rcRoute, "retailcopilot.route", QtInfoMsg)
Q_LOGGING_CATEGORY(rcEvidence, "retailcopilot.evidence", QtInfoMsg)
Q_LOGGING_CATEGORY(rcStore, "retailcopilot.store", QtInfoMsg)
Q_LOGGING_CATEGORY(rcGeneration, "retailcopilot.generation", QtInfoMsg)
Q_LOGGING_CATEGORY(rcPlanner, "retailcopilot.planner", QtInfoMsg)
Q_LOGGING_CATEGORY(rcSynthesis, "retailcopilot.synthesis", QtInfoMsg)
Q_LOGGING_CATEGORY(rcBatch, "retailcopilot.batch", QtInfoMsg)
