//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Program-level rewrites driven by the call graph and effect summaries:
// global constant propagation, pure-call folding and dead-function
// elimination.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/analysis/EffectSummary.hpp"
#include "mir/transform/PassRegistry.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mir::transform
{

/// @brief Replace zero-argument calls to program constants by the constant.
bool propagateGlobalConstants(core::Program &program);

/// @brief Functions kept by dead-function elimination regardless of calls:
///        `main`, functions also declared external and functions whose name
///        is used as a value.
std::set<std::string> entryPoints(const core::Program &program);

/// @brief Erase functions unreachable from entryPoints().
/// @details A program without `main` is pruned from its external and
///          address-taken functions; with no entry point at all nothing is
///          removed.
bool eliminateDeadFunctions(core::Program &program, const analysis::CallGraph &cg);

/// @brief Step-bounded interpreter over scalar MIR used to fold pure calls.
class PureEvaluator
{
  public:
    static constexpr unsigned kStepBudget = 10000;
    static constexpr unsigned kMaxDepth = 16;

    PureEvaluator(const core::Program &program, const analysis::SummaryMap &summaries)
        : program_(program), summaries_(summaries)
    {
    }

    /// @brief Evaluate @p callee on constant @p args.
    /// @return nullopt when the callee is not pure, the budget runs out or the
    ///         body leaves the supported subset.
    std::optional<core::Constant> call(const std::string &callee,
                                       const std::vector<core::Constant> &args);

  private:
    std::optional<core::Constant> invoke(const std::string &callee,
                                         const std::vector<core::Constant> &args,
                                         unsigned depth);

    const core::Program &program_;
    const analysis::SummaryMap &summaries_;
    unsigned steps_ = 0;
};

/// @brief Fold direct calls of pure functions whose arguments are constants.
bool foldPureCalls(core::Program &program, const analysis::SummaryMap &summaries);

/// @brief All interprocedural rewrites, with analyses computed on the fly.
bool optimizeInterprocedural(core::Program &program);

class InterproceduralPass : public ProgramPass
{
  public:
    std::string_view id() const override;

    PassResult run(core::Program &program, PassContext &ctx) override;
};

void registerInterproceduralPass(PassRegistry &registry);

} // namespace mir::transform
