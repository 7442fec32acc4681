//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// A direct-call inliner for MIR with a statement-count cost model.
//
// A callee is a candidate when its cost (statement count plus a per-terminator
// weight) stays within the threshold, it is not recursive, and it has few
// call sites. Callers that are themselves candidates are left alone in the
// same run so a body is never spliced while it is being rewritten.
//
// Splicing copies the arguments into fresh copies of the callee's parameter
// locals, renumbers the callee's locals and blocks into the caller's id
// space, turns each Return into a copy of the callee's return local into the
// call destination followed by a Goto to the continuation, and replaces the
// call with a Goto into the cloned entry block.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/transform/PassRegistry.hpp"

#include <functional>
#include <optional>
#include <string>

namespace mir::analysis
{
class CallGraph;
} // namespace mir::analysis

namespace mir::transform
{

/// @brief Knobs of the inline cost model.
struct InlineConfig
{
    /// Maximum callee cost.
    unsigned threshold = 20;

    /// Maximum number of direct call sites of a candidate.
    unsigned maxCallSites = 4;

    /// Terminator weights.
    unsigned callWeight = 5;
    unsigned switchWeight = 2;
    unsigned otherWeight = 1;
};

/// @brief Statement count plus terminator weights of @p fn.
unsigned inlineCost(const core::Function &fn, const InlineConfig &config);

/// @brief Cost within threshold, not recursive and few enough call sites.
bool isInlineCandidate(const core::Function &callee,
                       const analysis::CallGraph &cg,
                       const InlineConfig &config);

/// @brief Splice @p callee into @p caller at one call site.
/// @param block Block holding the call.
/// @param statement Index of a Call rvalue, or nullopt for the Call terminator.
/// @param diags Receives a note when the site has an unsupported shape.
/// @return True when the call was replaced.
bool inlineCallSite(core::Function &caller,
                    core::BlockId block,
                    std::optional<size_t> statement,
                    const core::Function &callee,
                    support::DiagnosticEngine *diags = nullptr);

/// @brief Inline every direct call in @p caller whose callee satisfies
///        @p shouldInline. Bodies spliced by this call are not rescanned.
/// @return Number of call sites replaced.
unsigned inlineCalls(core::Function &caller,
                     const core::Program &program,
                     const std::function<bool(const std::string &callee)> &shouldInline,
                     support::DiagnosticEngine *diags = nullptr);

class Inliner : public ProgramPass
{
  public:
    Inliner() = default;

    explicit Inliner(InlineConfig config) : config_(config) {}

    std::string_view id() const override;

    PassResult run(core::Program &program, PassContext &ctx) override;

    /// @brief One inlining round over @p program.
    bool inlineProgram(core::Program &program, support::DiagnosticEngine *diags = nullptr);

  private:
    InlineConfig config_;
};

void registerInlinePass(PassRegistry &registry, const InlineConfig *config);

} // namespace mir::transform
