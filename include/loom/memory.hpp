#pragma once

// Four-layer memory sharing one capability interface (memory_layer)
//   - session.hpp: per-session message history
//   - deep.hpp: ranked long-term records and the recent-window view
//   - facts.hpp: permanent architectural facts and validation
//   - store.hpp: backing stores (in-process, remote with fallback)

#include "memory/deep.hpp"
#include "memory/facts.hpp"
#include "memory/memory_primitive.hpp"
#include "memory/session.hpp"
#include "memory/store.hpp"
#include "memory/types.hpp"
