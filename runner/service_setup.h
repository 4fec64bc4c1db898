#pragma once

#include "caproute/adapters.h"
#include "caproute/approval.h"
#include "caproute/audit.h"
#include "caproute/catalog_adapter.h"
#include "caproute/catalog_store.h"
#include "caproute/config.h"
#include "caproute/credentials.h"
#include "caproute/dispatcher.h"
#include "caproute/enricher.h"
#include "caproute/scoring.h"
#include "caproute/selection.h"
#include "caproute/selection_cache.h"
#include "caproute/telemetry.h"
#include "caproute/tiebreak.h"

#include <json-c/json.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace caproute {

// Every long-lived component of one caproute process. Members are declared in
// dependency order so destruction runs dispatcher -> gateway -> catalog.
struct Service {
    ServiceConfig cfg;
    std::string instance_id;

    std::shared_ptr<FileCatalogStore> store;
    std::unique_ptr<CatalogAdapter> catalog;
    ScoringEngine scoring;
    std::shared_ptr<ITieBreakJudge> judge;
    std::unique_ptr<TieBreakEscalator> tiebreak;
    std::unique_ptr<Resolver> resolver;
    std::unique_ptr<SelectionGateway> gateway;
    PlanEnricher enricher;

    std::shared_ptr<ICredentialResolver> credentials;
    AdapterRegistry adapters;
    ApprovalLeaseManager approvals;
    std::unique_ptr<TelemetryRecorder> telemetry;
    std::unique_ptr<AuditLog> audit;
    std::unique_ptr<Dispatcher> dispatcher;
};

// Registers the shipped backends under their execution_location names:
// local, ssh, winrm (when a client is configured), http, database (when a
// client is configured). Sets the configured default backend.
void register_backends(Service& svc);

// Builds every component from svc.cfg. Returns "" on success.
std::string build_service(Service& svc);

// Stops background threads and flushes telemetry.
void shutdown_service(Service& svc);

// One step of a selection-driven plan, after selection and enrichment.
struct PlannedStep {
    std::string id;
    SelectionOutcome selection;
    std::optional<EnrichedExecutionStep> step;
    std::string error;             // selection or enrichment failure
};

struct PlanBuild {
    bool ok{false};
    ExecutionPlan plan;
    std::vector<PlannedStep> steps;
    std::string error;             // malformed document
};

// Body: {steps:[{id, request, targetHost?, inputs?, dependsOn?, credentialRef?,
//        approvalToken?}], failurePolicy?, timeoutMs?, maxConcurrency?, planId?}
// Each request goes through the selection gateway, then the enricher.
// ok is false when the document is malformed or any step failed to plan.
PlanBuild plan_from_requests(Service& svc, json_object* body);

json_object* plan_build_to_json(const PlanBuild& b);

// Audit helper; no-op when the service has no audit log.
void audit_event(Service& svc, const std::string& event, json_object* payload);

} // namespace caproute
