#pragma once

// Composable orchestration primitives
//   - context.hpp: per-invocation ids, state, baggage and stop token
//   - primitive.hpp: the execute(input, context) contract and lambda leaves
//   - sequential/parallel/router: combinators
//   - retry/timeout/fallback/circuit_breaker/compensation: recovery decorators
//   - cache.hpp: memoization over a pluggable store
//   - instrumentation/metrics/instrumented: observability hooks

#include "primitives/cache.hpp"            // LRU + TTL memoization
#include "primitives/circuit_breaker.hpp"  // Fail-fast after repeated failures
#include "primitives/clock.hpp"            // Injectable time source
#include "primitives/compensation.hpp"     // Saga-style rollback
#include "primitives/config.hpp"           // Environment-driven defaults
#include "primitives/context.hpp"          // Execution context
#include "primitives/errors.hpp"           // Error taxonomy
#include "primitives/fallback.hpp"         // Ordered alternatives
#include "primitives/instrumentation.hpp"  // Sink interface, noop/logging/fanout sinks
#include "primitives/instrumented.hpp"     // User entry/exit/error hooks
#include "primitives/logging.hpp"          // Shared spdlog logger
#include "primitives/metrics.hpp"          // In-process counters and histograms
#include "primitives/parallel.hpp"         // Concurrent branches
#include "primitives/primitive.hpp"        // Base contract
#include "primitives/retry.hpp"            // Backoff retries
#include "primitives/router.hpp"           // Dynamic dispatch
#include "primitives/sequential.hpp"       // Ordered chains
#include "primitives/timeout.hpp"          // Soft deadlines
