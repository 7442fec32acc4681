//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the MIR pass registry and preservation summaries. The registry
// decouples pass registration from pipeline execution so drivers look up
// factories by identifier.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/PassRegistry.hpp"

#include "mir/transform/AnalysisManager.hpp"

#include <utility>

namespace mir::transform
{

/// @brief Summary in which every registered analysis remains valid.
PreservedAnalyses PreservedAnalyses::all()
{
    PreservedAnalyses p;
    p.preserveAllPrograms_ = true;
    p.preserveAllFunctions_ = true;
    return p;
}

PreservedAnalyses PreservedAnalyses::none()
{
    return PreservedAnalyses{};
}

PreservedAnalyses &PreservedAnalyses::preserveProgram(const std::string &id)
{
    programAnalyses_.insert(id);
    return *this;
}

PreservedAnalyses &PreservedAnalyses::preserveFunction(const std::string &id)
{
    functionAnalyses_.insert(id);
    return *this;
}

PreservedAnalyses &PreservedAnalyses::preserveAllPrograms()
{
    preserveAllPrograms_ = true;
    return *this;
}

PreservedAnalyses &PreservedAnalyses::preserveAllFunctions()
{
    preserveAllFunctions_ = true;
    return *this;
}

bool PreservedAnalyses::preservesAllProgramAnalyses() const
{
    return preserveAllPrograms_;
}

bool PreservedAnalyses::preservesAllFunctionAnalyses() const
{
    return preserveAllFunctions_;
}

/// @return @c true when @p id was named or every program analysis is kept.
bool PreservedAnalyses::isProgramPreserved(const std::string &id) const
{
    return preserveAllPrograms_ || programAnalyses_.count(id) > 0;
}

/// @return @c true when @p id was named or every function analysis is kept.
bool PreservedAnalyses::isFunctionPreserved(const std::string &id) const
{
    return preserveAllFunctions_ || functionAnalyses_.count(id) > 0;
}

bool PreservedAnalyses::hasProgramPreservations() const
{
    return !programAnalyses_.empty();
}

bool PreservedAnalyses::hasFunctionPreservations() const
{
    return !functionAnalyses_.empty();
}

namespace
{
class LambdaProgramPass : public ProgramPass
{
  public:
    LambdaProgramPass(std::string id, PassRegistry::ProgramPassCallback cb)
        : id_(std::move(id)), callback_(std::move(cb))
    {
    }

    std::string_view id() const override
    {
        return id_;
    }

    PassResult run(core::Program &program, PassContext &ctx) override
    {
        return callback_(program, ctx);
    }

  private:
    std::string id_;
    PassRegistry::ProgramPassCallback callback_;
};

class LambdaFunctionPass : public FunctionPass
{
  public:
    LambdaFunctionPass(std::string id, PassRegistry::FunctionPassCallback cb)
        : id_(std::move(id)), callback_(std::move(cb))
    {
    }

    std::string_view id() const override
    {
        return id_;
    }

    PassResult run(core::Function &function, PassContext &ctx) override
    {
        return callback_(function, ctx);
    }

  private:
    std::string id_;
    PassRegistry::FunctionPassCallback callback_;
};
} // namespace

/// @brief Register a program pass factory under a stable identifier.
/// @details The factory must yield a fresh instance on each invocation.
void PassRegistry::registerProgramPass(const std::string &id, ProgramPassFactory factory)
{
    registry_[id] = detail::PassFactory{detail::PassKind::Program, std::move(factory), {}};
}

void PassRegistry::registerProgramPass(const std::string &id, ProgramPassCallback callback)
{
    registry_[id] =
        detail::PassFactory{detail::PassKind::Program,
                            [passId = std::string(id), cb = std::move(callback)]()
                            { return std::make_unique<LambdaProgramPass>(passId, cb); },
                            {}};
}

void PassRegistry::registerProgramPass(const std::string &id,
                                       const std::function<bool(core::Program &)> &fn)
{
    registerProgramPass(id,
                        ProgramPassCallback([fn](core::Program &program, PassContext &)
                                            { return PassResult::from(fn(program)); }));
}

void PassRegistry::registerFunctionPass(const std::string &id, FunctionPassFactory factory)
{
    registry_[id] = detail::PassFactory{detail::PassKind::Function, {}, std::move(factory)};
}

void PassRegistry::registerFunctionPass(const std::string &id, FunctionPassCallback callback)
{
    registry_[id] =
        detail::PassFactory{detail::PassKind::Function,
                            {},
                            [passId = std::string(id), cb = std::move(callback)]()
                            { return std::make_unique<LambdaFunctionPass>(passId, cb); }};
}

void PassRegistry::registerFunctionPass(const std::string &id,
                                        const std::function<bool(core::Function &)> &fn)
{
    registerFunctionPass(id,
                         FunctionPassCallback([fn](core::Function &function, PassContext &)
                                              { return PassResult::from(fn(function)); }));
}

const detail::PassFactory *PassRegistry::lookup(std::string_view id) const
{
    auto it = registry_.find(std::string(id));
    if (it == registry_.end())
        return nullptr;
    return &it->second;
}

} // namespace mir::transform
