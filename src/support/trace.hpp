// File: support/trace.hpp
// Purpose: Environment-gated trace switch shared by the optimization passes.
// Key invariants: AETHER_MIR_TRACE is read once per process.
// Ownership/Lifetime: Process-wide flag; not synchronized (the optimizer is
//                     single-threaded).
// Links: DESIGN.md
#pragma once

namespace mir::support
{

/// @brief True when pass-local tracing is enabled, either because
///        AETHER_MIR_TRACE is set or because setTraceEnabled(true) was called.
bool traceEnabled();

/// @brief Force tracing on or off for the rest of the process.
void setTraceEnabled(bool enabled);

} // namespace mir::support
