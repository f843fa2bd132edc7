#pragma once

// Roundabout: hierarchical cognitive agents under a central resource governor
//
// Every agent runs the EMERGE -> ADAPT -> INTEGRATE loop and asks the
// ResourceGovernor before spawning children or calling a model. The
// governor enforces budgets and user quotas, and degrades the whole system
// through a circuit breaker and a tempo ladder.

// Core
#include "roundabout/types.hpp"
#include "roundabout/exceptions.hpp"
#include "roundabout/config.hpp"
#include "roundabout/clock.hpp"
#include "roundabout/random_source.hpp"
#include "roundabout/resource_budget.hpp"
#include "roundabout/monitor.hpp"

// Governance
#include "roundabout/resource_ledger.hpp"
#include "roundabout/circuit_breaker.hpp"
#include "roundabout/system_tempo.hpp"
#include "roundabout/quota_manager.hpp"
#include "roundabout/resource_governor.hpp"

// Agents
#include "roundabout/context_thread.hpp"
#include "roundabout/adaptation.hpp"
#include "roundabout/model_provider.hpp"
#include "roundabout/cognitive_agent.hpp"
#include "roundabout/agent_factory.hpp"
