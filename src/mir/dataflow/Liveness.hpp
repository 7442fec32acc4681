// File: src/mir/dataflow/Liveness.hpp
// Purpose: Backward liveness of MIR locals built on the dataflow engine.
// Key invariants: StorageDead ends liveness; Return reads the return local.
// Ownership/Lifetime: Results are value snapshots of one function.
// Links: DESIGN.md
#pragma once

#include "mir/dataflow/Dataflow.hpp"

#include <set>

namespace mir::dataflow
{

using LiveSet = std::set<core::LocalId>;

/// @brief Liveness problem: fact = locals live at a point.
class LivenessAnalysis final : public Analysis<LiveSet>
{
  public:
    explicit LivenessAnalysis(const core::Function &fn) : fn_(fn) {}

    Direction direction() const override
    {
        return Direction::Backward;
    }

    LiveSet initialFact(const core::Function &) const override
    {
        return {};
    }

    LiveSet bottom() const override
    {
        return {};
    }

    LiveSet join(const std::vector<const LiveSet *> &facts) const override;

    void transferStatement(LiveSet &fact,
                           const core::Statement &stmt,
                           const Location &loc) const override;

    void transferTerminator(LiveSet &fact,
                            const core::Terminator &term,
                            const Location &loc) const override;

  private:
    const core::Function &fn_;
};

/// @brief Convenience view over a liveness solution.
class LivenessResult
{
  public:
    explicit LivenessResult(const core::Function &fn);

    /// @brief Locals live on entry to @p block.
    [[nodiscard]] LiveSet liveIn(core::BlockId block) const;

    /// @brief Locals live on exit from @p block.
    [[nodiscard]] LiveSet liveOut(core::BlockId block) const;

    /// @brief Locals live immediately before @p loc executes.
    [[nodiscard]] LiveSet liveBefore(const Location &loc) const;

    [[nodiscard]] const DataflowResults<LiveSet> &raw() const
    {
        return results_;
    }

  private:
    DataflowResults<LiveSet> results_;
};

} // namespace mir::dataflow
