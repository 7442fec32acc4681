//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Trace switch for pass-local diagnostics written to stderr.
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <cstdlib>
#include <optional>

namespace mir::support
{
namespace
{
std::optional<bool> &traceOverride()
{
    static std::optional<bool> value;
    return value;
}
} // namespace

bool traceEnabled()
{
    if (traceOverride())
        return *traceOverride();
    static const bool enabled = std::getenv("AETHER_MIR_TRACE") != nullptr;
    return enabled;
}

void setTraceEnabled(bool enabled)
{
    traceOverride() = enabled;
}

} // namespace mir::support
