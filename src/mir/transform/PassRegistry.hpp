//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the pass registration infrastructure and preservation
// tracking for the MIR optimization pipeline. Passes are registered under
// stable identifiers; pipelines name passes by identifier, and preservation
// metadata tells the analysis manager which cached results survive.
//
// Key Components:
// - PreservedAnalyses: which analysis results remain valid after a pass
// - PassResult: whether the pass changed the IR, plus its preservation set
// - PassContext: the analysis cache, diagnostics sink and optional profile a
//   pass may consult
// - ProgramPass / FunctionPass: the two pass scopes
// - PassRegistry: maps identifiers to pass factories
//
//===----------------------------------------------------------------------===//
#pragma once

#include "mir/core/fwd.hpp"
#include "support/diagnostics.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace mir::profile
{
struct ProfileData;
} // namespace mir::profile

namespace mir::transform
{

class AnalysisManager;

/// @brief Tracks which analyses are preserved by a pass execution.
class PreservedAnalyses
{
  public:
    static PreservedAnalyses all();

    static PreservedAnalyses none();

    PreservedAnalyses &preserveProgram(const std::string &id);

    PreservedAnalyses &preserveFunction(const std::string &id);

    PreservedAnalyses &preserveAllPrograms();

    PreservedAnalyses &preserveAllFunctions();

    bool preservesAllProgramAnalyses() const;

    bool preservesAllFunctionAnalyses() const;

    bool isProgramPreserved(const std::string &id) const;

    bool isFunctionPreserved(const std::string &id) const;

    /// @brief True when specific program analyses were named.
    bool hasProgramPreservations() const;

    /// @brief True when specific function analyses were named.
    bool hasFunctionPreservations() const;

  private:
    bool preserveAllPrograms_ = false;
    bool preserveAllFunctions_ = false;
    std::unordered_set<std::string> programAnalyses_;
    std::unordered_set<std::string> functionAnalyses_;
};

/// @brief Outcome of one pass invocation.
struct PassResult
{
    bool changed = false;
    PreservedAnalyses preserved = PreservedAnalyses::all();

    static PassResult unchanged()
    {
        return PassResult{};
    }

    /// @brief IR changed; by default nothing is preserved.
    static PassResult modified(PreservedAnalyses preserved = PreservedAnalyses::none())
    {
        return PassResult{true, std::move(preserved)};
    }

    /// @brief Map a changed flag onto unchanged() or modified().
    static PassResult from(bool changed)
    {
        return changed ? modified() : unchanged();
    }
};

/// @brief Everything a pass may consult besides the IR it rewrites.
struct PassContext
{
    AnalysisManager &analysis;
    support::DiagnosticEngine &diags;
    const profile::ProfileData *profile = nullptr;
};

/// @brief Pass operating on the whole program.
/// @details Program passes may add, rewrite or erase any function.
class ProgramPass
{
  public:
    virtual ~ProgramPass() = default;

    virtual std::string_view id() const = 0;

    virtual PassResult run(core::Program &program, PassContext &ctx) = 0;
};

/// @brief Pass operating on one function at a time.
class FunctionPass
{
  public:
    virtual ~FunctionPass() = default;

    virtual std::string_view id() const = 0;

    virtual PassResult run(core::Function &function, PassContext &ctx) = 0;
};

namespace detail
{
enum class PassKind
{
    Program,
    Function
};

struct PassFactory
{
    PassKind kind;
    std::function<std::unique_ptr<ProgramPass>()> makeProgram;
    std::function<std::unique_ptr<FunctionPass>()> makeFunction;
};
} // namespace detail

/// @brief Registry of the passes available to pipelines.
class PassRegistry
{
  public:
    using ProgramPassFactory = std::function<std::unique_ptr<ProgramPass>()>;
    using FunctionPassFactory = std::function<std::unique_ptr<FunctionPass>()>;
    using ProgramPassCallback = std::function<PassResult(core::Program &, PassContext &)>;
    using FunctionPassCallback = std::function<PassResult(core::Function &, PassContext &)>;

    void registerProgramPass(const std::string &id, ProgramPassFactory factory);

    void registerProgramPass(const std::string &id, ProgramPassCallback callback);

    /// @brief Register a plain rewrite returning whether it changed the program.
    void registerProgramPass(const std::string &id,
                             const std::function<bool(core::Program &)> &fn);

    void registerFunctionPass(const std::string &id, FunctionPassFactory factory);

    void registerFunctionPass(const std::string &id, FunctionPassCallback callback);

    /// @brief Register a plain rewrite returning whether it changed the function.
    void registerFunctionPass(const std::string &id,
                              const std::function<bool(core::Function &)> &fn);

    /// @return Factory registered under @p id or nullptr.
    const detail::PassFactory *lookup(std::string_view id) const;

  private:
    std::unordered_map<std::string, detail::PassFactory> registry_;
};

} // namespace mir::transform
