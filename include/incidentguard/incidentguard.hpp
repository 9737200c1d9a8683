#pragma once

// IncidentGuard: Byzantine-tolerant incident resolution core
//
// Fans an incident out to independent analysis agents, combines their
// findings by weighted consensus and either remediates autonomously or
// escalates to a human with the full audit trail.

// Core
#include "incidentguard/types.hpp"
#include "incidentguard/exceptions.hpp"
#include "incidentguard/config.hpp"
#include "incidentguard/agent.hpp"
#include "incidentguard/monitor.hpp"
#include "incidentguard/policy.hpp"

// Dispatch and failure isolation
#include "incidentguard/call_tracker.hpp"
#include "incidentguard/circuit_breaker.hpp"
#include "incidentguard/agent_harness.hpp"

// Decision and audit
#include "incidentguard/consensus_engine.hpp"
#include "incidentguard/incident_ledger.hpp"
#include "incidentguard/resolution_driver.hpp"
#include "incidentguard/orchestrator.hpp"
