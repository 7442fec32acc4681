//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Loop vectorization for single-block counted loops.
//
// Analysis classifies the scalar assignments of every self-looping block by
// operation and access pattern, checks that the loop carries no dependence
// other than its induction variables and touches no memory, scores the
// benefit and picks the narrowest lane count among the candidate types.
//
// The rewrite emits the scalar form of one W-lane operation: the block body
// is replicated W times ahead of the exit test, N mod W iterations are peeled
// into a prologue, and Function::vectorHints records the chosen width for the
// code generator.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Type.hpp"
#include "mir/transform/PassRegistry.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace mir::transform
{

struct VectorizeConfig
{
    /// SIMD lanes per element type; types absent from the table do not
    /// constrain the width.
    std::map<core::Type::Kind, uint32_t> lanes = {
        {core::Type::Kind::Integer, 4},
        {core::Type::Kind::Integer32, 4},
        {core::Type::Kind::Integer64, 2},
        {core::Type::Kind::Float, 4},
        {core::Type::Kind::Float32, 4},
        {core::Type::Kind::Float64, 2},
        {core::Type::Kind::Boolean, 16},
    };

    uint32_t maxWidth = 16;
};

enum class AccessPattern
{
    Sequential,
    Strided,
    Broadcast,
    Irregular,
};

enum class VectorOp
{
    Arithmetic,
    Unary,
    Load,
};

struct VectorCandidate
{
    size_t statement = 0;
    VectorOp op = VectorOp::Load;
    core::LocalId output = 0;
    core::Type type;
    AccessPattern pattern = AccessPattern::Sequential;
};

/// @brief Decision for one self-looping block.
struct LoopVectorization
{
    core::BlockId header = 0;
    std::optional<core::LocalId> inductionVar;
    std::optional<uint64_t> tripCount;
    std::vector<VectorCandidate> candidates;
    bool legal = false;
    double score = 0.0;
    uint32_t width = 1;

    [[nodiscard]] bool profitable() const
    {
        return legal && score > 1.0 && width > 1;
    }
};

const char *toString(AccessPattern pattern);

/// @brief Benefit of vectorizing @p candidates in a loop of @p tripCount.
double benefitScore(const std::vector<VectorCandidate> &candidates,
                    std::optional<uint64_t> tripCount);

/// @brief Smallest lane count among the candidates' types, at most maxWidth.
uint32_t vectorWidth(const std::vector<VectorCandidate> &candidates,
                     const VectorizeConfig &config);

/// @brief Analyse every block of @p fn whose SwitchInt branches to itself.
std::vector<LoopVectorization> analyzeVectorization(const core::Function &fn,
                                                    const VectorizeConfig &config);

/// @brief Rewrite the loop described by @p plan.
/// @return False when the loop shape or trip count rules out the rewrite.
bool vectorizeLoop(core::Function &fn, const LoopVectorization &plan);

bool vectorize(core::Function &fn, const VectorizeConfig &config = {});

void registerVectorizePass(PassRegistry &registry, const VectorizeConfig *config);

} // namespace mir::transform
