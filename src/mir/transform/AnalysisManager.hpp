//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the analysis manager, which handles registration, caching
// and invalidation of analysis results while a MIR pipeline runs. Analyses
// compute properties of a program or a single function (CFG, dominators, loop
// forest, liveness, call graph, effect summaries) that several passes reuse.
//
// Caching and Invalidation Model:
// - Registration: each analysis registers a compute function producing its
//   result from the program or from one function
// - On-demand computation: a request hits the cache or computes and stores
// - Preservation-based invalidation: after each pass the manager evicts every
//   analysis the pass did not declare preserved. A program pass that changed
//   anything also evicts function results, since it may have erased or
//   rewritten any function.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "mir/core/fwd.hpp"

#include <any>
#include <cassert>
#include <functional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace mir::transform
{

class PreservedAnalyses;
class AnalysisCacheInvalidator;

namespace detail
{
struct ProgramAnalysisRecord
{
    std::function<std::any(core::Program &)> compute;
    std::type_index type{typeid(void)};
};

struct FunctionAnalysisRecord
{
    std::function<std::any(core::Program &, core::Function &)> compute;
    std::type_index type{typeid(void)};
};
} // namespace detail

using ProgramAnalysisMap = std::unordered_map<std::string, detail::ProgramAnalysisRecord>;
using FunctionAnalysisMap = std::unordered_map<std::string, detail::FunctionAnalysisRecord>;

struct AnalysisCounts
{
    std::size_t programComputations = 0;
    std::size_t functionComputations = 0;
};

class AnalysisRegistry
{
  public:
    template <typename Result>
    void registerProgramAnalysis(const std::string &id, std::function<Result(core::Program &)> fn)
    {
        programAnalyses_[id] = detail::ProgramAnalysisRecord{
            [fn = std::move(fn)](core::Program &program) -> std::any { return fn(program); },
            std::type_index(typeid(Result))};
    }

    template <typename Result>
    void registerFunctionAnalysis(const std::string &id,
                                  std::function<Result(core::Program &, core::Function &)> fn)
    {
        functionAnalyses_[id] = detail::FunctionAnalysisRecord{
            [fn = std::move(fn)](core::Program &program, core::Function &fnRef) -> std::any
            { return fn(program, fnRef); },
            std::type_index(typeid(Result))};
    }

    const ProgramAnalysisMap &programAnalyses() const
    {
        return programAnalyses_;
    }

    const FunctionAnalysisMap &functionAnalyses() const
    {
        return functionAnalyses_;
    }

  private:
    ProgramAnalysisMap programAnalyses_;
    FunctionAnalysisMap functionAnalyses_;
};

/// @brief Computes and caches analysis results during pass execution.
class AnalysisManager
{
  public:
    AnalysisManager(core::Program &program, const AnalysisRegistry &registry);

    /// @brief Retrieve or compute a program-level analysis result.
    template <typename Result> Result &getProgramResult(const std::string &id)
    {
        auto it = programAnalyses_->find(id);
        assert(it != programAnalyses_->end() && "unknown program analysis");
        std::any &cache = programCache_[id];
        if (!cache.has_value())
        {
            cache = it->second.compute(program_);
            ++counts_.programComputations;
        }
        assert(it->second.type == std::type_index(typeid(Result)) &&
               "analysis result type mismatch");
        auto *value = std::any_cast<Result>(&cache);
        assert(value && "analysis result cast failed");
        return *value;
    }

    /// @brief Retrieve or compute a function-level analysis result.
    template <typename Result> Result &getFunctionResult(const std::string &id, core::Function &fn)
    {
        auto it = functionAnalyses_->find(id);
        assert(it != functionAnalyses_->end() && "unknown function analysis");
        std::any &cache = functionCache_[id][&fn];
        if (!cache.has_value())
        {
            cache = it->second.compute(program_, fn);
            ++counts_.functionComputations;
        }
        assert(it->second.type == std::type_index(typeid(Result)) &&
               "analysis result type mismatch");
        auto *value = std::any_cast<Result>(&cache);
        assert(value && "analysis result cast failed");
        return *value;
    }

    void invalidateAfterProgramPass(const PreservedAnalyses &preserved);

    void invalidateAfterFunctionPass(const PreservedAnalyses &preserved, core::Function &fn);

    core::Program &program()
    {
        return program_;
    }

    const core::Program &program() const
    {
        return program_;
    }

    /// @brief Number of program and function analyses computed so far.
    AnalysisCounts counts() const
    {
        return counts_;
    }

  private:
    core::Program &program_;
    const ProgramAnalysisMap *programAnalyses_ = nullptr;
    const FunctionAnalysisMap *functionAnalyses_ = nullptr;
    std::unordered_map<std::string, std::any> programCache_;
    std::unordered_map<std::string, std::unordered_map<const core::Function *, std::any>>
        functionCache_;
    AnalysisCounts counts_{};

    friend class AnalysisCacheInvalidator;
};

} // namespace mir::transform
