//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements cache invalidation for the MIR analysis manager. Preservation
// summaries returned by passes only name what stays valid; this file decides
// what to evict.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/AnalysisManager.hpp"

#include "mir/transform/PassRegistry.hpp"

namespace mir::transform
{
class AnalysisCacheInvalidator
{
  public:
    AnalysisCacheInvalidator(AnalysisManager &manager, const PreservedAnalyses &preserved)
        : manager_(manager), preserved_(preserved)
    {
    }

    /// @brief Evict program analyses not preserved by a program pass.
    /// @details Function results are dropped wholesale unless the pass
    ///          preserved every function analysis: a program pass may erase a
    ///          function and leave a dangling cache key behind.
    void afterProgramPass()
    {
        if (!preserved_.preservesAllFunctionAnalyses())
            manager_.functionCache_.clear();

        if (preserved_.preservesAllProgramAnalyses())
            return;
        if (!preserved_.hasProgramPreservations())
        {
            manager_.programCache_.clear();
            return;
        }
        for (auto it = manager_.programCache_.begin(); it != manager_.programCache_.end();)
        {
            if (preserved_.isProgramPreserved(it->first))
            {
                ++it;
                continue;
            }
            it = manager_.programCache_.erase(it);
        }
    }

    /// @brief Evict stale function analyses for @p fn.
    /// @details A changed function also invalidates program analyses that are
    ///          not explicitly preserved (call graph, effect summaries).
    void afterFunctionPass(core::Function &fn)
    {
        if (!preserved_.preservesAllProgramAnalyses())
        {
            for (auto it = manager_.programCache_.begin(); it != manager_.programCache_.end();)
            {
                if (preserved_.isProgramPreserved(it->first))
                    ++it;
                else
                    it = manager_.programCache_.erase(it);
            }
        }

        if (preserved_.preservesAllFunctionAnalyses())
            return;
        for (auto it = manager_.functionCache_.begin(); it != manager_.functionCache_.end();)
        {
            if (preserved_.isFunctionPreserved(it->first))
            {
                ++it;
                continue;
            }
            it->second.erase(&fn);
            if (it->second.empty())
                it = manager_.functionCache_.erase(it);
            else
                ++it;
        }
    }

  private:
    AnalysisManager &manager_;
    const PreservedAnalyses &preserved_;
};

AnalysisManager::AnalysisManager(core::Program &program, const AnalysisRegistry &registry)
    : program_(program), programAnalyses_(&registry.programAnalyses()),
      functionAnalyses_(&registry.functionAnalyses())
{
}

void AnalysisManager::invalidateAfterProgramPass(const PreservedAnalyses &preserved)
{
    AnalysisCacheInvalidator(*this, preserved).afterProgramPass();
}

void AnalysisManager::invalidateAfterFunctionPass(const PreservedAnalyses &preserved,
                                                  core::Function &fn)
{
    AnalysisCacheInvalidator(*this, preserved).afterFunctionPass(fn);
}

} // namespace mir::transform
