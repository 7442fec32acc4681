// File: src/mir/analysis/LoopInfo.hpp
// Purpose: Describe natural loop structures discovered in MIR control-flow graphs.
// Key invariants: Loop headers dominate their bodies; loops sharing a header
//                 are merged; parents strictly contain their children.
// Ownership/Lifetime: Loops refer to blocks and to each other by id/index, so
//                     the forest outlives nothing but stays valid only until
//                     the CFG changes.
// Links: DESIGN.md
#pragma once

#include "mir/analysis/CFG.hpp"
#include "mir/analysis/Dominators.hpp"
#include "mir/core/Rvalue.hpp"

#include <optional>
#include <set>
#include <vector>

namespace mir::analysis
{

/// @brief Statically recognised iteration bounds of a counted loop.
struct LoopBounds
{
    core::LocalId inductionVar = 0;
    core::Int128 initial = 0;
    core::Int128 finalValue = 0; ///< Constant the IV is compared against.
    core::Int128 step = 0;
    core::BinOp comparison = core::BinOp::Lt; ///< Predicate that keeps the loop running, IV on the left.
    core::BlockId exitingBlock = 0;
    core::BlockId continueTarget = 0;         ///< In-loop successor of the exit test.
    core::BlockId exitTarget = 0;             ///< Out-of-loop successor of the exit test.
    uint64_t continuingTests = 0;             ///< Tests that keep the loop running before it leaves.
};

/// @brief Single natural loop.
struct Loop
{
    core::BlockId header = 0;
    std::optional<core::BlockId> preheader; ///< Unique outside predecessor of the header.
    std::set<core::BlockId> blocks;         ///< Header-inclusive body.
    std::set<core::BlockId> exits;          ///< Loop blocks with a successor outside the loop.
    std::set<core::BlockId> exitTargets;    ///< Outside blocks reached from the loop.
    std::vector<core::BlockId> latches;     ///< Tails of back edges to the header.
    unsigned depth = 1;                     ///< 1 for outermost loops.
    std::optional<size_t> parent;           ///< Index of the enclosing loop.
    std::vector<size_t> children;           ///< Indices of directly nested loops.
    std::optional<LoopBounds> bounds;
    std::optional<uint64_t> iterationCount; ///< Body executions when statically known.

    [[nodiscard]] bool contains(core::BlockId b) const
    {
        return blocks.count(b) != 0;
    }

    [[nodiscard]] bool isLatch(core::BlockId b) const;
};

/// @brief Loop nesting forest of one function.
class LoopForest
{
  public:
    /// @brief Analyse @p fn to discover natural loops and their bounds.
    static LoopForest compute(const core::Function &fn);

    static LoopForest compute(const core::Function &fn, const CFGInfo &cfg, const DomTree &dom);

    [[nodiscard]] const std::vector<Loop> &loops() const noexcept
    {
        return loops_;
    }

    /// @brief Indices of top-level loops.
    [[nodiscard]] const std::vector<size_t> &roots() const noexcept
    {
        return roots_;
    }

    /// @brief Innermost loop containing @p block or nullptr.
    [[nodiscard]] const Loop *loopFor(core::BlockId block) const noexcept;

    /// @brief Loop indices ordered so children precede their parents.
    [[nodiscard]] std::vector<size_t> innermostFirst() const;

    [[nodiscard]] bool empty() const noexcept
    {
        return loops_.empty();
    }

  private:
    std::vector<Loop> loops_;
    std::vector<size_t> roots_;
};

/// @brief Largest iteration count treated as statically known.
inline constexpr uint64_t kMaxKnownTripCount = uint64_t{1} << 20;

} // namespace mir::analysis
